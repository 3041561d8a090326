/**
 * @file Formatter.cpp
 * @brief Status line rendering.
 *
 * Pure functions turning a progress snapshot into the text of one status
 * line, either determinate:
 *
 *     |###-------| 392/1000 39% [elapsed: 00:00:04 left: 00:00:06, 100.00 iters/sec]
 *
 * or indeterminate, when the total is unknown or already exceeded:
 *
 *     296 [elapsed: 00:00:03, 84.57 iters/sec]
 */

#include "Formatter.hpp"

#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace TickBar {

bool is_determinate(uint64_t n, uint64_t total) {
    return total != 0 && n <= total;
}

/**
 * @brief Formats one status line, without the description prefix.
 * @param status Snapshot of the engine state.
 * @return The status text.
 */
std::string format_status(const Status& status) {
    const std::string elapsed = format_interval(status.elapsed);
    const std::string rate = format_rate(status.time_per_iteration);

    if( !is_determinate(status.n, status.total) ){
        return fmt::format("{} [elapsed: {}, {} iters/sec]", status.n, elapsed, rate);
    }

    const double progress = static_cast<double>(status.n) / status.total;
    const auto num_segments = static_cast<uint64_t>(progress * status.total_segments);

    return fmt::format("|{}| {}/{} {}% [elapsed: {} left: {}, {} iters/sec]",
        format_bar(num_segments, status.total_segments),
        status.n,
        status.total,
        std::llround(progress * 100),
        elapsed,
        format_left(status.time_per_iteration, status.n, status.total),
        rate);
}

static std::string format_time_component(int64_t value) {
    return value < 10 ? fmt::format("0{}", value) : std::to_string(value);
}

/**
 * @brief Formats a duration as HH:MM:SS.
 *
 * Components are truncated, not rounded: 59.9 seconds is "00:00:59".
 * Hours are zero-padded below 10 and otherwise printed in full, so 100+
 * hours are never cut.
 *
 * @param seconds Duration in seconds, negative values are treated as 0 and
 *        values above MAX_INTERVAL_SECONDS (infinity included) are clamped.
 * @return Formatted duration.
 */
std::string format_interval(double seconds) {
    if( !(seconds > 0) ){
        seconds = 0;
    }
    if( seconds > MAX_INTERVAL_SECONDS ){
        seconds = MAX_INTERVAL_SECONDS;
    }

    const auto total = static_cast<int64_t>(seconds);
    const int64_t hours = total / 3600;
    const int64_t minutes = total / 60 % 60;
    const int64_t secs = total % 60;

    return fmt::format("{}:{}:{}",
        format_time_component(hours),
        format_time_component(minutes),
        format_time_component(secs));
}

/**
 * @brief Formats iterations per second with two decimals, "0" without an estimate.
 */
std::string format_rate(std::optional<double> time_per_iteration) {
    if( !time_per_iteration || *time_per_iteration <= 0 ){
        return "0";
    }
    return fmt::format("{:.2f}", 1 / *time_per_iteration);
}

/**
 * @brief Formats the remaining time estimate, "?" without an estimate.
 */
std::string format_left(std::optional<double> time_per_iteration, uint64_t n, uint64_t total) {
    if( !time_per_iteration ){
        return "?";
    }
    const uint64_t remaining = total > n ? total - n : 0;
    return format_interval(*time_per_iteration * remaining);
}

std::string format_bar(uint64_t num_segments, uint64_t total_segments) {
    if( num_segments > total_segments ){
        num_segments = total_segments;
    }
    return std::string(num_segments, '#') + std::string(total_segments - num_segments, '-');
}

/**
 * @brief Counts UTF-8 code points, i.e. every byte that is not a continuation byte.
 */
size_t utf8_length(const std::string& str) {
    size_t len = 0;
    for( unsigned char c : str ){
        if( (c & 0xC0) != 0x80 ){
            len++;
        }
    }
    return len;
}

}
