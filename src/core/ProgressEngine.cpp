/**
 * @file ProgressEngine.cpp
 * @brief Stateful progress line renderer.
 *
 * The engine receives one tick per consumed item, keeps inter-tick timings
 * for the rate estimate, and decides when a render is due. Rendering is
 * throttled twice: the clock is not consulted until min_iterations items
 * have passed since the last render, and a render only happens when
 * min_interval has elapsed since the previous one. The first tick and
 * finish() always render.
 */

#include "ProgressEngine.hpp"
#include "Formatter.hpp"
#include "io/Logger.hpp"

#include <iostream>
#include <stdexcept>

namespace TickBar {

static std::string make_prefix(const std::string& description) {
    return description.empty() ? "" : description + ": ";
}

static double seconds_between(Clock::time_point from, Clock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

/**
 * @brief Constructs an idle engine.
 *
 * @param total Expected number of items, 0 if unknown.
 * @param options Rendering options, see Options.
 * @param start Start of the measured interval.
 * @throws std::invalid_argument If min_iterations or total_segments is 0.
 */
ProgressEngine::ProgressEngine(uint64_t total, const Options& options, Clock::time_point start)
    : m_total(total),
      m_prefix(make_prefix(options.description)),
      m_clear(options.clear),
      m_device(options.device ? *options.device : std::cerr),
      m_min_interval(options.min_interval),
      m_min_iterations(options.min_iterations),
      m_total_segments(options.total_segments),
      m_start_time(start),
      m_last_print_time(start),
      m_last_iteration_time(start)
{
    if( m_min_iterations == 0 ){
        throw std::invalid_argument("min_iterations must be at least 1");
    }
    if( m_total_segments == 0 ){
        throw std::invalid_argument("total_segments must be at least 1");
    }
    logger->debug("progress: total={} min_interval={}ms min_iterations={} segments={}",
        m_total, options.min_interval.count(), m_min_iterations, m_total_segments);
}

/**
 * @brief Registers one consumed item.
 *
 * The first item always renders and becomes the baseline for inter-tick
 * timings. Later items render only when both throttling conditions allow it.
 *
 * @param now Time of the tick.
 * @throws std::logic_error If called after finish().
 * @throws std::ios_base::failure If writing to the device fails.
 */
void ProgressEngine::on_item(Clock::time_point now) {
    switch( m_state ){
        case State::Finished:
            throw std::logic_error("progress: on_item() after finish()");

        case State::Idle:
            m_state = State::Running;
            m_n = 1;
            m_estimator.estimate(); // no samples yet, keeps the rate unset
            print_status(now);
            m_last_print_n = m_n;
            m_last_print_time = now;
            m_last_iteration_time = now;
            return;

        case State::Running:
            break;
    }

    m_n++;
    m_estimator.record(now - m_last_iteration_time);
    m_last_iteration_time = now;

    if( m_total != 0 && m_n == m_total + 1 && !m_overflow_logged ){
        m_overflow_logged = true;
        logger->debug("progress: count exceeded total {}, switching to indeterminate mode", m_total);
    }

    if( m_n - m_last_print_n < m_min_iterations ){
        return;
    }

    if( now - m_last_print_time >= m_min_interval ){
        m_estimator.estimate();
        print_status(now);
        m_last_print_n = m_n;
        m_last_print_time = now;
    }
}

/**
 * @brief Renders the final state and clears or keeps the line.
 *
 * The final render ignores throttling and uses a fresh rate estimate.
 * With clear enabled the whole line, description included, is overwritten
 * with spaces and the cursor returned to column 0. Otherwise a newline is
 * written so the last status stays visible.
 *
 * @param now Time of completion.
 * @throws std::logic_error If called twice.
 * @throws std::ios_base::failure If writing to the device fails.
 */
void ProgressEngine::finish(Clock::time_point now) {
    if( m_state == State::Finished ){
        throw std::logic_error("progress: finish() called twice");
    }
    m_state = State::Finished;

    m_estimator.estimate();
    print_status(now);

    if( m_clear ){
        const size_t total_bar_chars = utf8_length(m_prefix) + m_last_printed_length;
        write("\r" + std::string(total_bar_chars, ' ') + "\r");
    } else {
        write("\n");
    }

    logger->debug("progress: finished {} items in {}", m_n, format_interval(seconds_between(m_start_time, now)));
}

void ProgressEngine::print_status(Clock::time_point now) {
    Status status;
    status.n = m_n;
    status.total = m_total;
    status.total_segments = m_total_segments;
    status.elapsed = seconds_between(m_start_time, now);
    status.time_per_iteration = m_estimator.time_per_iteration();

    const std::string text = format_status(status);
    const size_t text_length = utf8_length(text);
    const size_t num_padding_chars = m_last_printed_length > text_length ? m_last_printed_length - text_length : 0;

    write("\r" + m_prefix + text + std::string(num_padding_chars, ' '));

    m_last_printed_length = text_length;
    m_renders++;
}

void ProgressEngine::write(const std::string& text) {
    m_device << text;
    m_device.flush();
    if( !m_device ){
        throw std::ios_base::failure("progress: failed to write status line");
    }
}

}
