#include "SoilRespirationMonitor.hpp"
#include "LiveSession.hpp"
#include "LunchboxError.hpp"

#include <cmath>
#include <numeric>
#include <sstream>
#include <utility>

SoilRespirationMonitor::SoilRespirationMonitor(const LiveSession* session,
                                               double ignore_initial_min,
                                               LogFn log_fn)
    : Subsystem("SoilRespiration"),
      session_(session),
      ignore_initial_min_(ignore_initial_min),
      log_fn_(std::move(log_fn)) {}

double SoilRespirationMonitor::topAreaM2(double width_cm, double length_cm) {
    if (!std::isfinite(width_cm) || !std::isfinite(length_cm) ||
        width_cm <= 0.0 || length_cm <= 0.0) {
        throw LunchboxError(ErrorKind::InvalidDimension,
                            "soil top width and length must be > 0 cm");
    }
    return (width_cm / 100.0) * (length_cm / 100.0);
}

void SoilRespirationMonitor::add(double elapsed_min, double anet_per_box) {
    if (!std::isfinite(anet_per_box)) return;
    if (elapsed_min <= ignore_initial_min_) return;
    if (anet_per_box < 0.0) values_.push_back(anet_per_box);
}

std::optional<double> SoilRespirationMonitor::estimate(double top_area_m2) const {
    if (!std::isfinite(top_area_m2) || top_area_m2 <= 0.0) {
        throw LunchboxError(ErrorKind::InvalidDimension, "soil top area must be > 0");
    }
    if (values_.empty()) return std::nullopt;

    const double n    = static_cast<double>(values_.size());
    const double mean = std::accumulate(values_.begin(), values_.end(), 0.0) / n;
    double var = 0.0;
    for (double v : values_) var += (v - mean) * (v - mean);
    const double sd = std::sqrt(var / n);

    const double cutoff = mean - 3.0 * sd;
    double sum  = 0.0;
    std::size_t kept = 0;
    for (double v : values_) {
        if (v > cutoff) { sum += v; ++kept; }
    }
    // All values equal: sd is 0 and nothing lies strictly above the cutoff.
    if (kept == 0) return mean / top_area_m2;

    return (sum / static_cast<double>(kept)) / top_area_m2;
}

void SoilRespirationMonitor::initialize() {
    values_.clear();
    last_seen_appended_ = 0;
}

void SoilRespirationMonitor::tick(const TickContext& ctx) {
    if (!session_) return;

    const SessionState& st = session_->state();
    if (st.samples_appended == last_seen_appended_) return;
    last_seen_appended_ = st.samples_appended;

    auto latest = st.buffer.latest();
    if (!latest || !latest->flux) return;

    const std::size_t before = values_.size();
    add(latest->elapsed, *latest->flux);

    if (log_fn_ && values_.size() != before) {
        std::ostringstream oss;
        oss << "[soil] tick=" << ctx.tick_index
            << " elapsed=" << latest->elapsed << " min"
            << " soil_resp=" << *latest->flux << " umol box-1 s-1"
            << " (n=" << values_.size() << ")\n";
        log_fn_(oss.str());
    }
}
