#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace TickBar {

struct Options {
    std::string description;            // shown as "<description>: " before the status
    std::optional<uint64_t> total;      // unset = count the range if it is multi-pass, 0 = unknown
    bool clear = true;                  // erase the line on finish instead of leaving it
    std::ostream* device = nullptr;     // nullptr = std::cerr
    std::chrono::milliseconds min_interval{100};
    uint64_t min_iterations = 1;        // ticks between clock checks
    uint64_t total_segments = 10;
};

}
