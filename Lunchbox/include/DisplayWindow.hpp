#pragma once
#include <cstddef>
#include <optional>
#include <vector>

#include "FluxSample.hpp"

struct AxisRange {
    double lo = 0.0;
    double hi = 0.0;
};

// Axis ranges for one render of the live plot.
struct DisplayWindow {
    AxisRange   x;                      // elapsed minutes, always span wide
    AxisRange   y;                      // A_net
    std::size_t samples_in_window = 0;
};

namespace Display {

constexpr double Y_FLOOR        = -10.0; // lower y bound never goes below this
constexpr double FLAT_HALF_BAND = 1.0;   // +/- band used when span < 1
constexpr double PAD_FRACTION   = 0.1;   // headroom on each side otherwise
constexpr double FIXED_Y_LO     = -5.0;  // y range with auto scaling off
constexpr double FIXED_Y_HI     = 8.0;

// x: [max(0, latest - span), max(0, latest - span) + span]
// y: from min(lower|flux) .. max(upper|flux) of the samples in x, then
//    either mid +/- 1 (span < 1) or padded by 10 %, lower end floored at -10.
// std::nullopt for an empty snapshot. Non-finite values are ignored; if no
// finite value remains the y range is [-1, 1].
// With auto_y off the y range is always [FIXED_Y_LO, FIXED_Y_HI].
std::optional<DisplayWindow> computeWindow(const std::vector<FluxSample>& snapshot,
                                           double span_minutes,
                                           bool auto_y = true);

// Samples of the snapshot with elapsed >= window.x.lo, in order.
std::vector<FluxSample> samplesInWindow(const std::vector<FluxSample>& snapshot,
                                        const DisplayWindow& window);

} // namespace Display
