#include "SignalFilters.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace {

constexpr double PI = 3.14159265358979323846;

// Fit a degree-`degree` polynomial to (xs, ys) by the normal equations and
// evaluate it at x_eval.
double polyfitEval(const std::vector<double>& xs, const std::vector<double>& ys,
                   int degree, double x_eval) {
    const std::size_t m = static_cast<std::size_t>(degree) + 1;
    std::vector<std::vector<double>> a(m, std::vector<double>(m + 1, 0.0));

    for (std::size_t k = 0; k < xs.size(); ++k) {
        std::vector<double> pw(2 * m - 1, 1.0);
        for (std::size_t p = 1; p < pw.size(); ++p) pw[p] = pw[p - 1] * xs[k];
        for (std::size_t r = 0; r < m; ++r) {
            for (std::size_t c = 0; c < m; ++c) a[r][c] += pw[r + c];
            a[r][m] += pw[r] * ys[k];
        }
    }

    // Gaussian elimination with partial pivoting.
    for (std::size_t col = 0; col < m; ++col) {
        std::size_t piv = col;
        for (std::size_t r = col + 1; r < m; ++r) {
            if (std::fabs(a[r][col]) > std::fabs(a[piv][col])) piv = r;
        }
        std::swap(a[col], a[piv]);
        for (std::size_t r = col + 1; r < m; ++r) {
            const double f = a[r][col] / a[col][col];
            for (std::size_t c = col; c <= m; ++c) a[r][c] -= f * a[col][c];
        }
    }
    std::vector<double> coef(m, 0.0);
    for (std::size_t i = m; i-- > 0;) {
        double s = a[i][m];
        for (std::size_t c = i + 1; c < m; ++c) s -= a[i][c] * coef[c];
        coef[i] = s / a[i][i];
    }

    double y = 0.0;
    for (std::size_t i = m; i-- > 0;) y = y * x_eval + coef[i];
    return y;
}

// Run one section in place (transposed direct form II), starting from the
// state a constant input equal to the first sample would have settled into.
void runSection(const Filters::Biquad& s, std::vector<double>& x) {
    if (x.empty()) return;
    const double c = x.front();
    double z1 = (1.0 - s.b0) * c;
    double z2 = (s.b2 - s.a2) * c;
    for (double& v : x) {
        const double in  = v;
        const double out = s.b0 * in + z1;
        z1 = s.b1 * in - s.a1 * out + z2;
        z2 = s.b2 * in - s.a2 * out;
        v  = out;
    }
}

} // namespace

namespace Filters {

std::vector<double> medianFilter(const std::vector<double>& values, std::size_t kernel) {
    if (kernel % 2 == 0) ++kernel;
    const std::size_t half = kernel / 2;
    if (half == 0 || values.size() < kernel) return values;

    std::vector<double> out(values);
    std::vector<double> scratch(kernel);
    for (std::size_t i = half; i + half < values.size(); ++i) {
        std::copy(values.begin() + (i - half), values.begin() + (i + half + 1), scratch.begin());
        std::nth_element(scratch.begin(), scratch.begin() + half, scratch.end());
        out[i] = scratch[half];
    }
    return out;
}

std::vector<double> savitzkyGolay(const std::vector<double>& values,
                                  std::size_t window, int polyorder) {
    const std::size_t n = values.size();
    if (n < 3) return values;
    if (window > n) window = (n % 2 == 1) ? n : n - 1;
    if (window % 2 == 0) --window;
    if (polyorder < 0 || window < 3 || static_cast<int>(window) <= polyorder) return values;

    const std::size_t half = window / 2;
    std::vector<double> out(n);
    std::vector<double> xs(window);
    std::vector<double> ys(window);

    for (std::size_t i = 0; i < n; ++i) {
        const std::size_t lo = (i < half) ? 0 : std::min(i - half, n - window);
        const double centre = static_cast<double>(lo + half);
        for (std::size_t k = 0; k < window; ++k) {
            xs[k] = static_cast<double>(lo + k) - centre;
            ys[k] = values[lo + k];
        }
        out[i] = polyfitEval(xs, ys, polyorder, static_cast<double>(i) - centre);
    }
    return out;
}

LowpassFilter butterworthLowpass(int order, double cutoff_hz, double sample_hz) {
    LowpassFilter f;
    if (order < 1 || !(cutoff_hz > 0.0) || !(sample_hz > 0.0) ||
        !(cutoff_hz < 0.5 * sample_hz)) {
        return f;
    }
    f.order = order;

    const double k  = std::tan(PI * cutoff_hz / sample_hz);
    const double k2 = k * k;

    for (int i = 0; i < order / 2; ++i) {
        const double alpha = 2.0 * std::sin(PI * (2.0 * i + 1.0) / (2.0 * order));
        const double a0    = 1.0 + alpha * k + k2;
        Biquad s;
        s.b0 = k2 / a0;
        s.b1 = 2.0 * s.b0;
        s.b2 = s.b0;
        s.a1 = 2.0 * (k2 - 1.0) / a0;
        s.a2 = (1.0 - alpha * k + k2) / a0;
        f.sections.push_back(s);
    }
    if (order % 2 == 1) {
        const double a0 = 1.0 + k;
        Biquad s;
        s.b0 = k / a0;
        s.b1 = s.b0;
        s.a1 = (k - 1.0) / a0;
        f.sections.push_back(s);
    }
    return f;
}

std::vector<double> filtfilt(const LowpassFilter& filter, const std::vector<double>& values) {
    const std::size_t n = values.size();
    if (filter.sections.empty() || n < 3) return values;

    const double y0    = values.front();
    const double slope = (values.back() - y0) / static_cast<double>(n - 1);

    std::vector<double> r(n);
    for (std::size_t i = 0; i < n; ++i) r[i] = values[i] - (y0 + slope * static_cast<double>(i));

    const std::size_t pad = std::min<std::size_t>(3 * static_cast<std::size_t>(filter.order + 1), n - 1);

    std::vector<double> ext;
    ext.reserve(n + 2 * pad);
    for (std::size_t k = pad; k >= 1; --k) ext.push_back(2.0 * r.front() - r[k]);
    ext.insert(ext.end(), r.begin(), r.end());
    for (std::size_t k = 1; k <= pad; ++k) ext.push_back(2.0 * r.back() - r[n - 1 - k]);

    for (const auto& s : filter.sections) runSection(s, ext);
    std::reverse(ext.begin(), ext.end());
    for (const auto& s : filter.sections) runSection(s, ext);
    std::reverse(ext.begin(), ext.end());

    std::vector<double> out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = ext[pad + i] + y0 + slope * static_cast<double>(i);
    }
    return out;
}

std::vector<double> smoothCo2(const std::vector<double>& values, double sample_interval_s) {
    std::vector<double> y = medianFilter(values, MEDIAN_KERNEL);
    y = savitzkyGolay(y, SAVGOL_WINDOW, SAVGOL_ORDER);

    if (sample_interval_s > 0.0) {
        const LowpassFilter lp =
            butterworthLowpass(LOWPASS_ORDER, LOWPASS_CUTOFF_HZ, 1.0 / sample_interval_s);
        y = filtfilt(lp, y);
    }
    return y;
}

} // namespace Filters
