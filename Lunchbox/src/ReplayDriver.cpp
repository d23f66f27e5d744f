#include "ReplayDriver.hpp"
#include "GasLogReader.hpp"
#include "LunchboxError.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>
#include <utility>

namespace {
constexpr double CO2_HOLD_PPM = 0.01;  // ignore jitter smaller than this
}

ReplayDriver::ReplayDriver(std::filesystem::path file, ReplayOptions opts)
    : file_(std::move(file)),
      opts_(opts),
      estimator_(opts.fit_window, opts.smoothing, opts.fit_method, opts.sample_interval_s) {
    GasExchange::validateBasis(opts_.basis);
    GasExchange::validateConditions(opts_.volume_litres, opts_.temperature_k, opts_.pressure_pa);
    if (!std::isfinite(opts_.baseline_slope)) {
        throw LunchboxError(ErrorKind::InvalidMeasurement, "baseline slope is not finite");
    }
}

void ReplayDriver::open() {
    in_.open(file_);
    if (!in_) {
        throw LunchboxError(ErrorKind::SourceUnavailable,
                            "cannot open replay log " + file_.string());
    }
    header_seen_ = false;
    eof_         = false;
    line_no_     = 0;
    rows_read_   = 0;
    first_time_s_.reset();
    last_time_s_.reset();
    last_co2_.reset();
    estimator_.clear();
}

std::optional<TickRecord> ReplayDriver::read(const TickContext& /*ctx*/) {
    if (eof_ || !in_.is_open()) return std::nullopt;

    std::string line;
    while (true) {
        if (!std::getline(in_, line)) {
            eof_ = true;
            return std::nullopt;
        }
        ++line_no_;
        if (is_skippable_line(line)) continue;
        if (!header_seen_) { header_seen_ = true; continue; }
        break;
    }

    auto row = parse_gas_log_row(line);
    if (!row) {
        std::ostringstream oss;
        oss << file_.filename().string() << ':' << line_no_
            << ": malformed row '" << line << "'";
        throw LunchboxError(ErrorKind::AcquisitionFailure, oss.str());
    }
    if (last_time_s_ && !(row->timestamp_s > *last_time_s_)) {
        std::ostringstream oss;
        oss << file_.filename().string() << ':' << line_no_
            << ": timestamp " << row->timestamp_s << " does not advance";
        throw LunchboxError(ErrorKind::AcquisitionFailure, oss.str());
    }
    ++rows_read_;
    last_time_s_ = row->timestamp_s;
    if (!first_time_s_) first_time_s_ = row->timestamp_s;

    double co2 = row->concentration_ppm;
    if (last_co2_ && std::fabs(co2 - *last_co2_) < CO2_HOLD_PPM) {
        co2 = *last_co2_;
    } else {
        last_co2_ = co2;
    }

    estimator_.push(row->timestamp_s, co2);
    auto fit = estimator_.fit();
    if (!fit) return std::nullopt;

    auto to_flux = [&](double slope) {
        return GasExchange::netAssimilation(slope - opts_.baseline_slope, opts_.volume_litres,
                                            opts_.temperature_k, opts_.pressure_pa);
    };

    const GasExchange::AnetBand band = GasExchange::reportedBand(
        to_flux(fit->slope), to_flux(fit->lower), to_flux(fit->upper), opts_.basis);

    TickRecord rec;
    rec.elapsed_min = (row->timestamp_s - *first_time_s_) / 60.0;
    rec.co2_ppm     = co2;
    rec.anet        = band.anet;
    rec.anet_lower  = band.lower;
    rec.anet_upper  = band.upper;
    return rec;
}

void ReplayDriver::close() {
    if (in_.is_open()) in_.close();
}

std::optional<double> zero_run_slope(const std::vector<GasSample>& samples, double duration_s) {
    if (samples.empty()) return std::nullopt;

    std::vector<GasSample> sorted(samples);
    std::stable_sort(sorted.begin(), sorted.end(), [](const GasSample& a, const GasSample& b) {
        return a.timestamp_s < b.timestamp_s;
    });

    const double t0 = sorted.front().timestamp_s;
    std::vector<double> x;
    std::vector<double> y;
    for (const auto& g : sorted) {
        if (g.timestamp_s - t0 > duration_s) break;
        x.push_back(g.timestamp_s - t0);
        y.push_back(g.concentration_ppm);
    }

    auto fit = SlopeEstimator::fitLeastSquares(x, y);
    if (!fit) return std::nullopt;
    return fit->slope;
}
