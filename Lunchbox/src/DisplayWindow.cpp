#include "DisplayWindow.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>

namespace Display {

std::optional<DisplayWindow> computeWindow(const std::vector<FluxSample>& snapshot,
                                           double span_minutes,
                                           bool auto_y) {
    if (snapshot.empty()) return std::nullopt;

    DisplayWindow w;
    const double latest = snapshot.back().elapsed;
    const double start  = std::max(0.0, latest - span_minutes);
    w.x = AxisRange{start, start + span_minutes};

    double lower = std::numeric_limits<double>::infinity();
    double upper = -std::numeric_limits<double>::infinity();

    for (const auto& s : snapshot) {
        if (s.elapsed < start) continue;
        ++w.samples_in_window;

        std::optional<double> lo = s.flux_lower ? s.flux_lower : s.flux;
        std::optional<double> hi = s.flux_upper ? s.flux_upper : s.flux;
        if (lo && std::isfinite(*lo)) lower = std::min(lower, *lo);
        if (hi && std::isfinite(*hi)) upper = std::max(upper, *hi);
    }

    if (!auto_y) {
        w.y = AxisRange{FIXED_Y_LO, FIXED_Y_HI};
        return w;
    }
    if (!std::isfinite(lower) || !std::isfinite(upper)) {
        w.y = AxisRange{-FLAT_HALF_BAND, FLAT_HALF_BAND};
        return w;
    }

    const double yrange = upper - lower;
    if (yrange < 1.0) {
        const double mid = 0.5 * (upper + lower);
        w.y = AxisRange{std::max(Y_FLOOR, mid - FLAT_HALF_BAND), mid + FLAT_HALF_BAND};
    } else {
        const double margin = yrange * PAD_FRACTION;
        w.y = AxisRange{std::max(Y_FLOOR, lower - margin), upper + margin};
    }
    return w;
}

std::vector<FluxSample> samplesInWindow(const std::vector<FluxSample>& snapshot,
                                        const DisplayWindow& window) {
    std::vector<FluxSample> out;
    out.reserve(window.samples_in_window);
    std::copy_if(snapshot.begin(), snapshot.end(), std::back_inserter(out),
                 [&](const FluxSample& s) { return s.elapsed >= window.x.lo; });
    return out;
}

} // namespace Display
