/**
 * @file RateEstimator.cpp
 * @brief Smoothed time-per-iteration estimation.
 *
 * Two smoothing stages: a bounded moving average over the most recent
 * inter-tick durations absorbs jitter from bursty processing, and an
 * exponential layer on top damps shifts of that average between renders.
 */

#include "RateEstimator.hpp"

namespace TickBar {

/**
 * @brief Converts a mean clock tick count to seconds.
 */
static double ticks2seconds(double ticks) {
    return ticks * Clock::period::num / Clock::period::den;
}

/**
 * @brief Updates the smoothed time per iteration from the current history.
 *
 * Leaves the estimate unset while there are no samples. A zero moving
 * average (ticks closer together than the clock resolution) is not an
 * estimate either, so the stored value is always strictly positive.
 *
 * @return The smoothed seconds per iteration, or nullopt if none yet.
 */
std::optional<double> RateEstimator::estimate() {
    const auto avg = m_history.average();
    if( !avg ){
        return m_time_per_iteration;
    }

    const double moving_avg = ticks2seconds(*avg);
    if( moving_avg <= 0 ){
        return m_time_per_iteration;
    }

    if( m_time_per_iteration ){
        m_time_per_iteration = moving_avg * (1 - SMOOTHING) + *m_time_per_iteration * SMOOTHING;
    } else {
        m_time_per_iteration = moving_avg;
    }
    return m_time_per_iteration;
}

}
