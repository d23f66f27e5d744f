#include "BatchDifferencer.hpp"
#include "LunchboxError.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cmath>

const char* sampleStatusName(SampleStatus s) {
    switch (s) {
        case SampleStatus::Ok:                 return "ok";
        case SampleStatus::Initial:            return "initial";
        case SampleStatus::DegenerateInterval: return "degenerate_interval";
        case SampleStatus::InvalidMeasurement: return "invalid_measurement";
    }
    return "unknown";
}

BatchDifferencer::BatchDifferencer(double volume_litres,
                                   double temperature_k,
                                   double pressure_pa)
    : volume_l_(volume_litres),
      temp_k_(temperature_k),
      pressure_pa_(pressure_pa) {
    GasExchange::validateConditions(volume_l_, temp_k_, pressure_pa_);
}

FluxSeries BatchDifferencer::process(std::vector<GasSample> samples) const {
    auto by_time = [](const GasSample& a, const GasSample& b) {
        return a.timestamp_s < b.timestamp_s;
    };
    if (!std::is_sorted(samples.begin(), samples.end(), by_time)) {
        std::stable_sort(samples.begin(), samples.end(), by_time);
    }

    FluxSeries out;
    out.reserve(samples.size());
    if (samples.empty()) return out;

    const double t0 = samples.front().timestamp_s;

    for (std::size_t i = 0; i < samples.size(); ++i) {
        const GasSample& cur = samples[i];

        FluxSample s;
        s.timestamp_s       = cur.timestamp_s;
        s.elapsed           = cur.timestamp_s - t0;
        s.concentration_ppm = cur.concentration_ppm;

        if (i == 0) {
            s.status = SampleStatus::Initial;
            out.push_back(s);
            continue;
        }

        const GasSample& prev = samples[i - 1];
        const double dt = cur.timestamp_s - prev.timestamp_s;
        const double dc = cur.concentration_ppm - prev.concentration_ppm;
        s.delta_seconds = dt;
        if (std::isfinite(dc)) s.delta_ppm = dc;

        if (!(dt > 0.0)) {
            s.status = SampleStatus::DegenerateInterval;
            out.push_back(s);
            continue;
        }

        try {
            const double rate = dc / dt;
            s.flux = GasExchange::netAssimilation(rate, volume_l_, temp_k_, pressure_pa_);
            s.rate_ppm_s = rate;
            s.status = SampleStatus::Ok;
        } catch (const LunchboxError& e) {
            if (e.kind() != ErrorKind::InvalidMeasurement) throw;
            s.flux.reset();
            s.status = SampleStatus::InvalidMeasurement;
        }
        out.push_back(s);
    }
    return out;
}

SeriesSummary summarize(const FluxSeries& series) {
    SeriesSummary sum;
    sum.total = series.size();
    for (const auto& s : series) {
        if (s.flux) ++sum.with_flux;
        if (s.status == SampleStatus::DegenerateInterval) ++sum.degenerate;
        if (s.status == SampleStatus::InvalidMeasurement) ++sum.invalid;
    }
    return sum;
}

void log_flux_series(const FluxSeries& series, const GasExchange::ReportingBasis& basis) {
    static const std::vector<std::string> cols = {
        "elapsed_s", "co2_ppm", "delta_seconds", "delta_ppm", "delta_ppm_s",
        "flux_umol_s", "anet", "status"
    };

    for (std::size_t i = 0; i < series.size(); ++i) {
        const FluxSample& s = series[i];

        std::optional<double> anet;
        if (s.flux) anet = GasExchange::reportedAnet(*s.flux, basis);

        Logger::instance().log_wide_optional(
            "BatchFlux",
            static_cast<int>(i),
            s.timestamp_s,
            cols,
            {
                s.elapsed, s.concentration_ppm, s.delta_seconds, s.delta_ppm,
                s.rate_ppm_s, s.flux, anet,
                static_cast<double>(static_cast<int>(s.status))
            }
        );
    }
}
