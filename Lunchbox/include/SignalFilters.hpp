#ifndef LUNCHBOX_SIGNAL_FILTERS_HPP
#define LUNCHBOX_SIGNAL_FILTERS_HPP

// Noise filters applied to a CO2 window before the slope fit.
//
// smoothCo2() chains three stages:
//   1) running median, kernel 5           (spikes)
//   2) Savitzky-Golay, window 19, order 2 (jitter)
//   3) Butterworth low-pass, 0.1 Hz, order 5, run forward and backward
//
// Every stage passes a straight line through unchanged, so smoothing never
// shifts the slope of a clean ramp.

#include <cstddef>
#include <vector>

namespace Filters {

constexpr std::size_t MEDIAN_KERNEL     = 5;
constexpr std::size_t SAVGOL_WINDOW     = 19;
constexpr int         SAVGOL_ORDER      = 2;
constexpr double      LOWPASS_CUTOFF_HZ = 0.1;
constexpr int         LOWPASS_ORDER     = 5;

// Running median. An even kernel is bumped to the next odd size. Samples
// closer than kernel/2 to either end are passed through unchanged.
std::vector<double> medianFilter(const std::vector<double>& values, std::size_t kernel);

// Least-squares polynomial of degree polyorder over a sliding window. Near
// the ends the window is pinned to the first/last `window` samples and the
// fit is evaluated off-centre. A window longer than the data shrinks to the
// longest odd length that fits; if that is not longer than polyorder the
// input is returned as is.
std::vector<double> savitzkyGolay(const std::vector<double>& values,
                                  std::size_t window, int polyorder);

// One second-order section, a0 normalised to 1. A first-order section has
// b2 = a2 = 0.
struct Biquad {
    double b0 = 1.0;
    double b1 = 0.0;
    double b2 = 0.0;
    double a1 = 0.0;
    double a2 = 0.0;
};

struct LowpassFilter {
    std::vector<Biquad> sections;
    int                 order = 0;
};

// Digital Butterworth low-pass by bilinear transform with pre-warping, as a
// cascade of second-order sections (plus one first-order section for odd
// orders). Unity gain at DC. Empty if the cutoff is not below Nyquist.
LowpassFilter butterworthLowpass(int order, double cutoff_hz, double sample_hz);

// Zero-phase filtering: forward then backward over the signal padded with
// odd reflections (3 * (order + 1) samples, fewer for short input). The
// straight line through the two end points is taken out before filtering
// and added back afterwards, and each section starts in its steady state.
std::vector<double> filtfilt(const LowpassFilter& filter, const std::vector<double>& values);

// Median -> Savitzky-Golay -> low-pass, for samples taken every
// sample_interval_s seconds. The low-pass stage is skipped when 0.1 Hz is
// at or above the Nyquist frequency.
std::vector<double> smoothCo2(const std::vector<double>& values, double sample_interval_s);

} // namespace Filters

#endif // LUNCHBOX_SIGNAL_FILTERS_HPP
