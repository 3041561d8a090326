#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace TickBar {

struct Status {
    uint64_t n = 0;
    uint64_t total = 0;             // 0 = unknown
    uint64_t total_segments = 10;
    double elapsed = 0;             // seconds
    std::optional<double> time_per_iteration;
};

// longest duration format_interval() renders, about 31.7 billion years
constexpr double MAX_INTERVAL_SECONDS = 1e18;

bool is_determinate(uint64_t n, uint64_t total);

std::string format_status(const Status& status);
std::string format_interval(double seconds);
std::string format_rate(std::optional<double> time_per_iteration);
std::string format_left(std::optional<double> time_per_iteration, uint64_t n, uint64_t total);
std::string format_bar(uint64_t num_segments, uint64_t total_segments);

size_t utf8_length(const std::string& str);

}
