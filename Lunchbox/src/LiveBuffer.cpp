#include "LiveBuffer.hpp"

#include <cmath>

LiveBuffer::LiveBuffer(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

std::size_t LiveBuffer::capacityFor(double window_minutes, double interval_s) {
    if (!std::isfinite(window_minutes) || !std::isfinite(interval_s) ||
        window_minutes <= 0.0 || interval_s <= 0.0) {
        return 1;
    }
    const double n = std::floor(window_minutes * 60.0 / interval_s);
    if (!(n >= 1.0)) return 1;
    if (n >= static_cast<double>(MAX_CAPACITY)) return MAX_CAPACITY;
    return static_cast<std::size_t>(n);
}

void LiveBuffer::append(const FluxSample& sample) {
    std::lock_guard<std::mutex> lock(mtx_);
    samples_.push_back(sample);
    while (samples_.size() > capacity_) {
        samples_.pop_front();
    }
}

std::vector<FluxSample> LiveBuffer::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return std::vector<FluxSample>(samples_.begin(), samples_.end());
}

std::optional<FluxSample> LiveBuffer::latest() const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (samples_.empty()) return std::nullopt;
    return samples_.back();
}

void LiveBuffer::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    samples_.clear();
}

std::size_t LiveBuffer::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return samples_.size();
}

bool LiveBuffer::empty() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return samples_.empty();
}
