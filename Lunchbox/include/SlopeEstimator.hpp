#pragma once
#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

// Result of one fit of CO2 against time.
struct SlopeFit {
    double      slope   = 0.0;  // ppm s^-1
    double      std_err = 0.0;  // standard error of the slope
    double      lower   = 0.0;  // slope - 1.96 * std_err
    double      upper   = 0.0;  // slope + 1.96 * std_err
    std::size_t n       = 0;
};

enum class FitMethod {
    LeastSquares,  // ordinary least squares
    Huber          // iteratively reweighted, Huber T norm (t = 1.345)
};

// Rolling window of (time, CO2) readings with a fitted slope and a 95 % band.
//
// Times are re-based to the first point of the window, rounded to 0.01 s and
// centred on their mean. With smoothing on, CO2 goes through
// Filters::smoothCo2() first.
//
// Least squares, with n points and SSR the residual sum of squares:
//
//   std_err = sqrt( (SSR / (n - 2)) / (n * var_x) ),   var_x sample variance
//
// Huber: IRLS starting from the least squares line, scale re-estimated each
// pass as median(|r|) / 0.6745; std_err from the H1 sandwich covariance.
class SlopeEstimator {
public:
    static constexpr double Z_95    = 1.96;
    static constexpr double HUBER_T = 1.345;

    // window_size below 3 is raised to 3.
    explicit SlopeEstimator(std::size_t window_size = 41,
                            bool smoothing = true,
                            FitMethod method = FitMethod::LeastSquares,
                            double sample_interval_s = 1.0);

    void push(double time_s, double co2_ppm);
    void clear();

    bool ready() const { return times_.size() >= window_size_; }
    std::size_t size() const { return times_.size(); }
    std::size_t windowSize() const { return window_size_; }
    FitMethod method() const { return method_; }

    // std::nullopt until the window is full, or if all times coincide.
    std::optional<SlopeFit> fit() const;

    // Fits on arbitrary (x, y) pairs, no smoothing. std::nullopt for fewer
    // than three points or no spread in x.
    static std::optional<SlopeFit> fitLeastSquares(const std::vector<double>& x,
                                                   const std::vector<double>& y);
    static std::optional<SlopeFit> fitHuber(const std::vector<double>& x,
                                            const std::vector<double>& y);

private:
    std::size_t        window_size_;
    bool               smoothing_;
    FitMethod          method_;
    double             sample_interval_s_;
    std::deque<double> times_;
    std::deque<double> co2_;
};
