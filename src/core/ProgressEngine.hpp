#pragma once
#include <cstdint>
#include <ostream>
#include <string>

#include "Options.hpp"
#include "RateEstimator.hpp"

namespace TickBar {

// Renders a single self-overwriting status line as items are ticked.
// Not thread-safe, one instance per iteration.
class ProgressEngine {
    public:
    enum class State { Idle, Running, Finished };

    ProgressEngine(uint64_t total, const Options& options, Clock::time_point start = Clock::now());

    void on_item() { on_item(Clock::now()); }
    void on_item(Clock::time_point now);

    // final render, then clear the line or leave it with a newline
    void finish() { finish(Clock::now()); }
    void finish(Clock::time_point now);

    State state() const { return m_state; }
    uint64_t count() const { return m_n; }
    uint64_t last_printed_count() const { return m_last_print_n; }
    uint64_t total() const { return m_total; }
    size_t last_printed_length() const { return m_last_printed_length; }
    size_t renders() const { return m_renders; }
    const std::string& prefix() const { return m_prefix; }
    std::optional<double> time_per_iteration() const { return m_estimator.time_per_iteration(); }

    private:
    void print_status(Clock::time_point now);
    void write(const std::string& text);

    const uint64_t m_total;
    const std::string m_prefix;
    const bool m_clear;
    std::ostream& m_device;
    const Clock::duration m_min_interval;
    const uint64_t m_min_iterations;
    const uint64_t m_total_segments;

    State m_state = State::Idle;
    uint64_t m_n = 0;
    uint64_t m_last_print_n = 0;
    Clock::time_point m_start_time, m_last_print_time, m_last_iteration_time;
    size_t m_last_printed_length = 0;
    size_t m_renders = 0;
    bool m_overflow_logged = false;
    RateEstimator m_estimator;
};

}
