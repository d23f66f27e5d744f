#include "SlopeEstimator.hpp"
#include "SignalFilters.hpp"

#include <algorithm>
#include <cmath>

namespace {

constexpr double MAD_TO_SIGMA   = 0.6744897501960817;  // Phi^-1(3/4)
constexpr int    HUBER_MAX_ITER = 50;
constexpr double HUBER_TOL      = 1e-10;

struct Line {
    double intercept = 0.0;
    double slope     = 0.0;
};

double mean(const std::vector<double>& v) {
    double s = 0.0;
    for (double x : v) s += x;
    return s / static_cast<double>(v.size());
}

// Weighted least squares line; all weights 1 gives OLS.
std::optional<Line> weightedLine(const std::vector<double>& x, const std::vector<double>& y,
                                 const std::vector<double>& w) {
    double sw = 0.0, sx = 0.0, sy = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        sw += w[i];
        sx += w[i] * x[i];
        sy += w[i] * y[i];
    }
    if (!(sw > 0.0)) return std::nullopt;
    const double xm = sx / sw;
    const double ym = sy / sw;

    double sxx = 0.0, sxy = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        sxx += w[i] * (x[i] - xm) * (x[i] - xm);
        sxy += w[i] * (x[i] - xm) * (y[i] - ym);
    }
    if (!(sxx > 0.0)) return std::nullopt;

    Line l;
    l.slope     = sxy / sxx;
    l.intercept = ym - l.slope * xm;
    return l;
}

double medianAbs(const std::vector<double>& r) {
    std::vector<double> a(r.size());
    std::transform(r.begin(), r.end(), a.begin(), [](double v) { return std::fabs(v); });
    const std::size_t mid = a.size() / 2;
    std::nth_element(a.begin(), a.begin() + mid, a.end());
    double m = a[mid];
    if (a.size() % 2 == 0) {
        m = 0.5 * (m + *std::max_element(a.begin(), a.begin() + mid));
    }
    return m;
}

std::optional<SlopeFit> finish(double slope, double std_err, std::size_t n) {
    if (!std::isfinite(slope) || !std::isfinite(std_err)) return std::nullopt;
    SlopeFit f;
    f.n       = n;
    f.slope   = slope;
    f.std_err = std_err;
    f.lower   = slope - SlopeEstimator::Z_95 * std_err;
    f.upper   = slope + SlopeEstimator::Z_95 * std_err;
    return f;
}

} // namespace

SlopeEstimator::SlopeEstimator(std::size_t window_size, bool smoothing,
                               FitMethod method, double sample_interval_s)
    : window_size_(std::max<std::size_t>(window_size, 3)),
      smoothing_(smoothing),
      method_(method),
      sample_interval_s_(sample_interval_s) {}

void SlopeEstimator::push(double time_s, double co2_ppm) {
    times_.push_back(time_s);
    co2_.push_back(co2_ppm);
    while (times_.size() > window_size_) {
        times_.pop_front();
        co2_.pop_front();
    }
}

void SlopeEstimator::clear() {
    times_.clear();
    co2_.clear();
}

std::optional<SlopeFit> SlopeEstimator::fit() const {
    if (!ready()) return std::nullopt;

    const std::size_t n = times_.size();
    std::vector<double> x(n);
    std::vector<double> y(co2_.begin(), co2_.end());

    const double t0 = times_.front();
    for (std::size_t i = 0; i < n; ++i) {
        x[i] = std::round((times_[i] - t0) * 100.0) / 100.0;
    }
    const double xmean = mean(x);
    for (double& v : x) v -= xmean;

    if (smoothing_) {
        y = Filters::smoothCo2(y, sample_interval_s_);
    }

    return method_ == FitMethod::Huber ? fitHuber(x, y) : fitLeastSquares(x, y);
}

std::optional<SlopeFit> SlopeEstimator::fitLeastSquares(const std::vector<double>& x,
                                                        const std::vector<double>& y) {
    const std::size_t n = x.size();
    if (n < 3 || y.size() != n) return std::nullopt;

    auto line = weightedLine(x, y, std::vector<double>(n, 1.0));
    if (!line) return std::nullopt;

    const double xm = mean(x);
    double sxx = 0.0, ssr = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        sxx += (x[i] - xm) * (x[i] - xm);
        const double r = y[i] - (line->intercept + line->slope * x[i]);
        ssr += r * r;
    }

    const double var_x        = sxx / static_cast<double>(n - 1);
    const double residual_var = ssr / static_cast<double>(n - 2);
    const double std_err      = std::sqrt(residual_var / (static_cast<double>(n) * var_x));
    return finish(line->slope, std_err, n);
}

std::optional<SlopeFit> SlopeEstimator::fitHuber(const std::vector<double>& x,
                                                 const std::vector<double>& y) {
    const std::size_t n = x.size();
    if (n < 3 || y.size() != n) return std::nullopt;

    std::vector<double> w(n, 1.0);
    auto line = weightedLine(x, y, w);
    if (!line) return std::nullopt;

    std::vector<double> r(n);
    auto residuals = [&](const Line& l) {
        for (std::size_t i = 0; i < n; ++i) r[i] = y[i] - (l.intercept + l.slope * x[i]);
    };

    double scale = 0.0;
    for (int iter = 0; iter < HUBER_MAX_ITER; ++iter) {
        residuals(*line);
        scale = medianAbs(r) / MAD_TO_SIGMA;
        if (!(scale > 0.0)) break;  // exact fit on at least half the points

        for (std::size_t i = 0; i < n; ++i) {
            const double u = std::fabs(r[i] / scale);
            w[i] = (u <= HUBER_T) ? 1.0 : HUBER_T / u;
        }
        auto next = weightedLine(x, y, w);
        if (!next) return std::nullopt;

        const bool converged =
            std::fabs(next->slope - line->slope) <= HUBER_TOL * (1.0 + std::fabs(line->slope)) &&
            std::fabs(next->intercept - line->intercept) <= HUBER_TOL * (1.0 + std::fabs(line->intercept));
        line = next;
        if (converged) break;
    }

    residuals(*line);
    scale = medianAbs(r) / MAD_TO_SIGMA;
    if (!(scale > 0.0)) return finish(line->slope, 0.0, n);

    // H1 covariance: k^2 * [sum psi^2 / (n - p)] * scale^2 / m^2 * (X'X)^-1
    const double p = 2.0;
    double ss_psi = 0.0;
    double inliers = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double u = r[i] / scale;
        const double psi = std::max(-HUBER_T, std::min(HUBER_T, u));
        ss_psi += psi * psi;
        if (std::fabs(u) <= HUBER_T) inliers += 1.0;
    }
    const double nd = static_cast<double>(n);
    const double m  = inliers / nd;
    if (!(m > 0.0)) return std::nullopt;

    const double var_deriv = m * (1.0 - m);
    const double k = 1.0 + (p / nd) * var_deriv / (m * m);

    const double xm = mean(x);
    double sxx = 0.0;
    for (double v : x) sxx += (v - xm) * (v - xm);

    const double var_slope =
        k * k * (ss_psi / (nd - p)) * scale * scale / (m * m) / sxx;
    return finish(line->slope, std::sqrt(var_slope), n);
}
