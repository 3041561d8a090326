/**
 * @file units.cpp
 * @brief Parsing of human-written durations and item counts.
 *
 * Durations accept "ms", "s", "m" and "h" suffixes ("100ms", "1.5s", "2m"),
 * a bare number means milliseconds. Counts accept decimal "k", "m" and "g"
 * multipliers ("10k" = 10000) and hexadecimal notation ("0x100").
 */

#include "units.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <stdexcept>

/**
 * @brief Splits "12.5ms" into the numeric part and the lowercase unit.
 */
static std::pair<std::string, std::string> split_number(const std::string& str, bool allow_fraction) {
    size_t i = 0;
    for (; i < str.length(); ++i) {
        if (!isdigit(static_cast<unsigned char>(str[i])) && !(allow_fraction && str[i] == '.')) {
            break;
        }
    }

    std::string numberPart = str.substr(0, i);
    std::string unitPart = i < str.length() ? str.substr(i) : "";
    std::transform(unitPart.begin(), unitPart.end(), unitPart.begin(), ::tolower);

    if (numberPart.empty()) {
        throw std::runtime_error("Not a number: \"" + str + "\"");
    }
    return {numberPart, unitPart};
}

/**
 * @brief Converts a human-readable duration to milliseconds.
 *
 * @param duration Duration string, e.g. "100ms", "2s", "0.5s", "1m", "250".
 * @return Duration in whole milliseconds, fractions truncated.
 * @throws std::runtime_error If the number or the unit is invalid.
 */
std::chrono::milliseconds human2duration(const std::string& duration) {
    static const std::map<std::string, double> units = {
        {"",   1},
        {"ms", 1},
        {"s",  1000},
        {"m",  60 * 1000},
        {"h",  60 * 60 * 1000},
    };

    const auto [numberPart, unitPart] = split_number(duration, true);

    auto it = units.find(unitPart);
    if (it == units.end()) {
        throw std::runtime_error("Unsupported duration unit: " + unitPart);
    }

    double number;
    try {
        number = std::stod(numberPart);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Not a number: \"" + duration + "\"");
    }

    return std::chrono::milliseconds(static_cast<int64_t>(std::floor(number * it->second)));
}

/**
 * @brief Converts a human-readable item count to a number.
 *
 * @param count Count string, e.g. "1000", "10k", "2M", "0x400".
 * @return The count.
 * @throws std::runtime_error If the unit is unsupported or the value overflows.
 */
uint64_t human2count(const std::string& count) {
    static const std::map<std::string, uint64_t> units = {
        {"k", 1000},
        {"m", 1000 * 1000},
        {"g", 1000 * 1000 * 1000},
    };

    // if count starts with "0x" then it's a hex number
    if (count.length() > 2 && count[0] == '0' && (count[1]|0x20) == 'x') {
        size_t pos = 0;
        uint64_t number;
        try {
            number = std::stoull(count, &pos, 16);
        } catch (const std::logic_error&) {
            throw std::runtime_error("Not a number: \"" + count + "\"");
        }
        if (pos != count.length()) {
            throw std::runtime_error("Not a number: \"" + count + "\"");
        }
        return number;
    }

    const auto [numberPart, unitPart] = split_number(count, false);

    if (!unitPart.empty() && units.find(unitPart) == units.end()) {
        throw std::runtime_error("Unsupported count unit: " + unitPart);
    }

    uint64_t number;
    try {
        number = std::stoull(numberPart);
    } catch (const std::out_of_range&) {
        throw std::runtime_error("Resulting value out of range.");
    }

    uint64_t multiplier = unitPart.empty() ? 1 : units.at(unitPart);
    uint64_t result = number * multiplier;

    // Simple overflow check, not comprehensive
    if (multiplier != 1 && result / multiplier != number) {
        throw std::runtime_error("Resulting value out of range.");
    }

    return result;
}
