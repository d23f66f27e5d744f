#pragma once
#include <optional>
#include <string>
#include <vector>

// One raw concentration reading from the logger.
struct GasSample {
    double      timestamp_s       = 0.0;  // raw logger clock, used for deltas
    std::string local_time;               // "yyyy-MM-dd hh:mm:ss", may be empty
    double      concentration_ppm = 0.0;
};

enum class SampleStatus {
    Ok,                  // flux computed
    Initial,             // first sample, nothing to difference against
    DegenerateInterval,  // delta_t <= 0
    InvalidMeasurement   // non-finite concentration or rate
};

const char* sampleStatusName(SampleStatus s);

// A derived point on a flux time series.
//
// Batch series: elapsed is seconds since the first sample and flux is the raw
// headspace flux (umol s^-1); the delta fields are filled in.
// Live buffer:  elapsed is minutes since session start and flux/lower/upper
// hold the reported A_net band supplied by the acquisition driver.
struct FluxSample {
    double elapsed     = 0.0;
    double timestamp_s = 0.0;   // batch only

    std::optional<double> concentration_ppm;

    std::optional<double> delta_seconds;
    std::optional<double> delta_ppm;
    std::optional<double> rate_ppm_s;

    std::optional<double> flux;
    std::optional<double> flux_lower;
    std::optional<double> flux_upper;

    SampleStatus status = SampleStatus::Ok;
};

using FluxSeries = std::vector<FluxSample>;
