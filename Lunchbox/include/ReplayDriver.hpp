#pragma once
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <vector>

#include "AcquisitionDriver.hpp"
#include "FluxSample.hpp"
#include "GasExchange.hpp"
#include "SlopeEstimator.hpp"

struct ReplayOptions {
    std::size_t fit_window        = 41;
    bool        smoothing         = true;
    FitMethod   fit_method        = FitMethod::LeastSquares;
    double      sample_interval_s = 1.0;   // cadence the filters assume
    double      baseline_slope    = 0.0;   // ppm s^-1 from an empty-box run
    double      volume_litres     = 1.0;
    double      temperature_k = 298.15;
    double      pressure_pa   = GasExchange::SEA_LEVEL_PRESSURE_PA;
    GasExchange::ReportingBasis basis;
};

// Replays a datalogger CSV as if it were arriving live, one row per tick.
//
// Each row goes through the rolling SlopeEstimator; once the window is full
// the fitted slope and its 95 % band, less the baseline slope, are converted
// to A_net. Elapsed time is minutes since the first row's timestamp. CO2
// changes below 0.01 ppm are held at the previous value.
class ReplayDriver : public AcquisitionDriver {
public:
    ReplayDriver(std::filesystem::path file, ReplayOptions opts);

    void open() override;
    std::optional<TickRecord> read(const TickContext& ctx) override;
    bool exhausted() const override { return eof_; }
    void close() override;

    std::size_t rowsRead() const { return rows_read_; }

private:
    std::filesystem::path file_;
    ReplayOptions         opts_;
    std::ifstream         in_;
    SlopeEstimator        estimator_;

    bool        header_seen_ = false;
    bool        eof_         = false;
    std::size_t line_no_     = 0;
    std::size_t rows_read_   = 0;

    std::optional<double> first_time_s_;
    std::optional<double> last_time_s_;
    std::optional<double> last_co2_;
};

// Baseline drift of an empty, sealed enclosure: least squares slope (ppm s^-1)
// of CO2 against time over the first duration_s seconds of the run.
// std::nullopt if fewer than three samples fall in that span.
std::optional<double> zero_run_slope(const std::vector<GasSample>& samples,
                                     double duration_s = 30.0);
