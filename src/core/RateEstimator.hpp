#pragma once
#include <chrono>
#include <optional>

#include "data/bounded_history.hpp"

namespace TickBar {

using Clock = std::chrono::steady_clock;

class RateEstimator {
    public:
    // how many inter-tick durations are kept for the moving average
    static constexpr size_t MAX_ITERATION_TIMES = 250;
    // exponential smoothing factor, smaller values increase recency bias
    static constexpr double SMOOTHING = 0.8;

    explicit RateEstimator(size_t capacity = MAX_ITERATION_TIMES) : m_history(capacity) {}

    void record(Clock::duration delta) { m_history.push(delta.count()); }
    std::optional<double> estimate();

    // seconds per iteration
    std::optional<double> time_per_iteration() const { return m_time_per_iteration; }
    const bounded_history<Clock::rep>& history() const { return m_history; }

    private:
    bounded_history<Clock::rep> m_history;
    std::optional<double> m_time_per_iteration;
};

}
