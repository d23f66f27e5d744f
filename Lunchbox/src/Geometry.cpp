#include "Geometry.hpp"
#include "LunchboxError.hpp"

#include <cmath>
#include <sstream>

namespace {

constexpr double CM3_PER_LITRE = 1000.0;

void requirePositive(double v, const char* what) {
    if (!std::isfinite(v) || v <= 0.0) {
        std::ostringstream oss;
        oss << what << " must be a positive length in cm, got " << v;
        throw LunchboxError(ErrorKind::InvalidDimension, oss.str());
    }
}

} // namespace

namespace Geometry {

double rectangularVolumeLitres(double width_cm, double height_cm, double length_cm) {
    requirePositive(width_cm,  "width");
    requirePositive(height_cm, "height");
    requirePositive(length_cm, "length");
    return width_cm * height_cm * length_cm / CM3_PER_LITRE;
}

double frustumVolumeLitres(double top_width_cm, double base_width_cm, double height_cm) {
    requirePositive(top_width_cm,  "top width");
    requirePositive(base_width_cm, "base width");
    requirePositive(height_cm,     "height");

    const double a = top_width_cm;
    const double b = base_width_cm;
    const double volume_cm3 = (height_cm / 3.0) * (a * a + a * b + b * b);
    return volume_cm3 / CM3_PER_LITRE;
}

double netVolumeLitres(double enclosure_litres, double pot_litres) {
    const double net = enclosure_litres - pot_litres;
    if (!(net > 0.0)) {
        std::ostringstream oss;
        oss << "pot volume " << pot_litres << " L does not fit in enclosure of "
            << enclosure_litres << " L";
        throw LunchboxError(ErrorKind::NegativeVolume, oss.str());
    }
    return net;
}

EnclosureGeometry::EnclosureGeometry(Shape shape, const std::array<double, 3>& dimensions_cm)
    : shape_(shape),
      dims_cm_(dimensions_cm),
      volume_l_(shape == Shape::Rectangular
                    ? rectangularVolumeLitres(dimensions_cm[0], dimensions_cm[1], dimensions_cm[2])
                    : frustumVolumeLitres(dimensions_cm[0], dimensions_cm[1], dimensions_cm[2])) {}

} // namespace Geometry
