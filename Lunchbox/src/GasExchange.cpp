#include "GasExchange.hpp"
#include "LunchboxError.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace {

constexpr double LITRES_PER_M3 = 1000.0;
constexpr double CM2_PER_M2    = 10000.0;

void requirePositive(double v, const char* what) {
    if (!std::isfinite(v) || v <= 0.0) {
        std::ostringstream oss;
        oss << what << " must be finite and > 0, got " << v;
        throw LunchboxError(ErrorKind::InvalidDimension, oss.str());
    }
}

// Sign flip and area normalisation, no soil correction.
double toAnetBasis(double flux, const GasExchange::ReportingBasis& basis) {
    if (basis.area_basis) {
        return -flux / (basis.leaf_area_cm2 / CM2_PER_M2);
    }
    return -flux;
}

} // namespace

namespace GasExchange {

double netAssimilation(double delta_ppm_per_s,
                       double volume_litres,
                       double temperature_k,
                       double pressure_pa,
                       double gas_constant) {
    if (!std::isfinite(delta_ppm_per_s)) {
        throw LunchboxError(ErrorKind::InvalidMeasurement,
                            "concentration rate is not finite");
    }
    validateConditions(volume_litres, temperature_k, pressure_pa);
    requirePositive(gas_constant, "gas_constant");

    const double volume_m3 = volume_litres / LITRES_PER_M3;
    const double flux = (delta_ppm_per_s * pressure_pa * volume_m3) /
                        (gas_constant * temperature_k);

    if (!std::isfinite(flux)) {
        throw LunchboxError(ErrorKind::InvalidMeasurement, "flux is not finite");
    }
    return flux;
}

void validateConditions(double volume_litres, double temperature_k, double pressure_pa) {
    requirePositive(volume_litres, "volume_litres");
    requirePositive(temperature_k, "temperature_k");
    requirePositive(pressure_pa,   "pressure_pa");
}

void validateBasis(const ReportingBasis& basis) {
    if (basis.area_basis) {
        requirePositive(basis.leaf_area_cm2, "leaf_area_cm2");
    }
    if (!std::isfinite(basis.soil_resp_correction)) {
        throw LunchboxError(ErrorKind::InvalidDimension,
                            "soil respiration correction is not finite");
    }
}

double reportedAnet(double headspace_flux, const ReportingBasis& basis) {
    double anet = toAnetBasis(headspace_flux, basis);
    if (anet < 0.0) {
        anet += basis.soil_resp_correction;
    }
    return anet;
}

AnetBand reportedBand(double headspace_flux,
                      double flux_bound_a,
                      double flux_bound_b,
                      const ReportingBasis& basis) {
    AnetBand band;
    band.anet = toAnetBasis(headspace_flux, basis);
    double a  = toAnetBasis(flux_bound_a, basis);
    double b  = toAnetBasis(flux_bound_b, basis);

    if (band.anet < 0.0) {
        band.anet += basis.soil_resp_correction;
        a         += basis.soil_resp_correction;
        b         += basis.soil_resp_correction;
    }

    band.lower = std::min(a, b);
    band.upper = std::max(a, b);
    return band;
}

const char* anetUnits(const ReportingBasis& basis) {
    return basis.area_basis ? "umol m-2 s-1" : "umol box-1 s-1";
}

} // namespace GasExchange
