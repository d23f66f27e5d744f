#pragma once
#include <cstddef>
#include <vector>

#include "FluxSample.hpp"
#include "GasExchange.hpp"

// Turns a logged concentration series into a flux series by first
// differences:
//
//   delta_t[i] = t[i] - t[i-1]
//   rate[i]    = (c[i] - c[i-1]) / delta_t[i]
//   flux[i]    = GasExchange::netAssimilation(rate[i], V, T, p)
//
// Sample 0 is SampleStatus::Initial. A zero/negative delta_t marks that
// sample DegenerateInterval and a non-finite value marks it
// InvalidMeasurement; in both cases flux stays empty and the remaining
// samples are still processed.
class BatchDifferencer {
public:
    // Throws LunchboxError(InvalidDimension) for bad volume/temperature/pressure.
    BatchDifferencer(double volume_litres,
                     double temperature_k,
                     double pressure_pa = GasExchange::SEA_LEVEL_PRESSURE_PA);

    // Input is stable-sorted by timestamp_s if it is not already ordered.
    // Timestamps must be finite. Output has the same length as the input.
    FluxSeries process(std::vector<GasSample> samples) const;

    double volumeLitres() const { return volume_l_; }
    double temperatureK() const { return temp_k_; }

private:
    double volume_l_;
    double temp_k_;
    double pressure_pa_;
};

struct SeriesSummary {
    std::size_t total       = 0;
    std::size_t with_flux   = 0;
    std::size_t degenerate  = 0;
    std::size_t invalid     = 0;
};

SeriesSummary summarize(const FluxSeries& series);

// Writes one BatchFlux.csv row per sample through Logger, with the reported
// A_net next to the raw flux. Undefined values are left as empty cells.
void log_flux_series(const FluxSeries& series, const GasExchange::ReportingBasis& basis);
