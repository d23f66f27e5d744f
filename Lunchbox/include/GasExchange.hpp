#ifndef LUNCHBOX_GAS_EXCHANGE_HPP
#define LUNCHBOX_GAS_EXCHANGE_HPP

// Concentration-rate to flux conversion (ideal gas law) and the transform
// from raw headspace flux to the reported net assimilation rate.

namespace GasExchange {

constexpr double SEA_LEVEL_PRESSURE_PA = 101325.0;
constexpr double GAS_CONSTANT_J_MOL_K  = 8.314;
constexpr double ZERO_CELSIUS_K        = 273.15;

// Headspace CO2 flux for the whole enclosure (umol s^-1).
//
//            delta_ppm_per_s * p * V
//   flux = ---------------------------       V in m^3 (litres / 1000)
//                     R * T
//
// ppm is umol/mol, so n = pV/RT applied to the rate yields umol per second.
// Sign: rising concentration gives a positive value (CO2 released into the
// headspace). Use reportedAnet() to get the uptake-positive A_net.
//
// Throws LunchboxError:
//   InvalidMeasurement - delta_ppm_per_s (or the result) is not finite
//   InvalidDimension   - volume, temperature, pressure or R not finite and > 0
double netAssimilation(double delta_ppm_per_s,
                       double volume_litres,
                       double temperature_k,
                       double pressure_pa  = SEA_LEVEL_PRESSURE_PA,
                       double gas_constant = GAS_CONSTANT_J_MOL_K);

// Throws LunchboxError(InvalidDimension) unless volume, temperature and
// pressure are all finite and > 0.
void validateConditions(double volume_litres,
                        double temperature_k,
                        double pressure_pa = SEA_LEVEL_PRESSURE_PA);

// How A_net is reported to the user.
struct ReportingBasis {
    bool   area_basis           = true;  // true: per m^2 leaf, false: per box
    double leaf_area_cm2        = 25.0;  // only used when area_basis
    double soil_resp_correction = 0.0;   // added when A_net comes out negative
};

// Throws LunchboxError(InvalidDimension) for a non-positive leaf area on an
// area basis, or a non-finite correction.
void validateBasis(const ReportingBasis& basis);

// Reported A_net, uptake positive:
//   anet = -flux / leaf_area_m2   (area basis)
//   anet = -flux                  (per box)
// followed by anet += soil_resp_correction when anet < 0.
double reportedAnet(double headspace_flux, const ReportingBasis& basis);

struct AnetBand {
    double anet  = 0.0;
    double lower = 0.0;
    double upper = 0.0;
};

// Same transform applied to a central flux and two bound fluxes. The soil
// correction is decided by the central value and applied to all three. The
// sign flip swaps the bounds, so they are re-ordered to lower <= upper.
AnetBand reportedBand(double headspace_flux,
                      double flux_bound_a,
                      double flux_bound_b,
                      const ReportingBasis& basis);

// "umol m-2 s-1" or "umol box-1 s-1"
const char* anetUnits(const ReportingBasis& basis);

} // namespace GasExchange

#endif // LUNCHBOX_GAS_EXCHANGE_HPP
