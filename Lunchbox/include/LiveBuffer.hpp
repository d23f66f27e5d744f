#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "FluxSample.hpp"

// Bounded FIFO of the most recent live samples.
//
// append() is the only writer; once the buffer holds more than capacity()
// samples the oldest are dropped until size() == capacity(). Order is never
// changed. snapshot() copies under the lock, so a reader on another thread
// always sees a consistent sequence.
class LiveBuffer {
public:
    // One week of 1 s samples.
    static constexpr std::size_t MAX_CAPACITY = 7 * 24 * 3600;

    // A capacity of 0 is raised to 1.
    explicit LiveBuffer(std::size_t capacity);

    // floor(window_minutes * 60 / interval_s), within [1, MAX_CAPACITY].
    static std::size_t capacityFor(double window_minutes, double interval_s);

    void append(const FluxSample& sample);
    std::vector<FluxSample> snapshot() const;
    std::optional<FluxSample> latest() const;
    void clear();

    std::size_t size() const;
    bool empty() const;
    std::size_t capacity() const { return capacity_; }

private:
    mutable std::mutex     mtx_;
    std::deque<FluxSample> samples_;
    std::size_t            capacity_;
};
