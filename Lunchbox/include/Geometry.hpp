#ifndef LUNCHBOX_GEOMETRY_HPP
#define LUNCHBOX_GEOMETRY_HPP

// Enclosure volume helpers.
//
// All dimensions are in centimetres, all volumes in litres. Every function
// throws LunchboxError(InvalidDimension) if a dimension is not a finite,
// strictly positive number.

#include <array>

namespace Geometry {

enum class Shape { Rectangular, Frustum };

// width * height * length / 1000
double rectangularVolumeLitres(double width_cm, double height_cm, double length_cm);

// Truncated cone with the pot's top/base widths standing in for diameters:
//   (h / 3) * (top^2 + top*base + base^2) / 1000
double frustumVolumeLitres(double top_width_cm, double base_width_cm, double height_cm);

// Headspace left once a pot sits inside the enclosure.
// Throws LunchboxError(NegativeVolume) if the result is <= 0.
double netVolumeLitres(double enclosure_litres, double pot_litres);

// A shape plus its three dimensions. The volume is computed once in the
// constructor, so a constructed object always holds a valid volume.
//
// Dimension order:
//   Rectangular - width, height, length
//   Frustum     - top width, base width, height
class EnclosureGeometry {
public:
    EnclosureGeometry(Shape shape, const std::array<double, 3>& dimensions_cm);

    Shape shape() const { return shape_; }
    const std::array<double, 3>& dimensionsCm() const { return dims_cm_; }
    double volumeLitres() const { return volume_l_; }

private:
    Shape                 shape_;
    std::array<double, 3> dims_cm_;
    double                volume_l_;
};

} // namespace Geometry

#endif // LUNCHBOX_GEOMETRY_HPP
