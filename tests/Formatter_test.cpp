#include <gtest/gtest.h>
#include "core/Formatter.hpp"

#include <limits>

using namespace TickBar;

TEST(format_interval, zero) {
    EXPECT_EQ("00:00:00", format_interval(0));
}

TEST(format_interval, seconds) {
    EXPECT_EQ("00:00:05", format_interval(5.0));
}

TEST(format_interval, truncates) {
    EXPECT_EQ("00:00:59", format_interval(59.9));
    EXPECT_EQ("00:01:00", format_interval(60.0));
}

TEST(format_interval, hours_minutes_seconds) {
    EXPECT_EQ("01:01:01", format_interval(3661.0));
    EXPECT_EQ("10:00:00", format_interval(36000.0));
}

TEST(format_interval, hours_over_99_not_truncated) {
    EXPECT_EQ("100:00:00", format_interval(360000.0));
    EXPECT_EQ("1234:05:06", format_interval(1234 * 3600.0 + 5 * 60 + 6));
}

TEST(format_interval, huge_values_are_clamped) {
    EXPECT_EQ("277777777777777:46:40", format_interval(MAX_INTERVAL_SECONDS));
    EXPECT_EQ("277777777777777:46:40", format_interval(1e30));
    EXPECT_EQ("277777777777777:46:40", format_interval(std::numeric_limits<double>::infinity()));
}

TEST(format_interval, nan_is_zero) {
    EXPECT_EQ("00:00:00", format_interval(std::numeric_limits<double>::quiet_NaN()));
}

TEST(format_interval, negative_is_zero) {
    EXPECT_EQ("00:00:00", format_interval(-3.0));
}

TEST(format_rate, unset) {
    EXPECT_EQ("0", format_rate(std::nullopt));
}

TEST(format_rate, two_decimals) {
    EXPECT_EQ("100.00", format_rate(0.01));
    EXPECT_EQ("0.50", format_rate(2.0));
    EXPECT_EQ("3.33", format_rate(0.3));
}

TEST(format_left, unset) {
    EXPECT_EQ("?", format_left(std::nullopt, 10, 100));
}

TEST(format_left, remaining) {
    EXPECT_EQ("00:00:09", format_left(0.1, 10, 100));
    EXPECT_EQ("00:00:00", format_left(0.1, 100, 100));
}

TEST(format_bar, segments) {
    EXPECT_EQ("----------", format_bar(0, 10));
    EXPECT_EQ("###-------", format_bar(3, 10));
    EXPECT_EQ("##########", format_bar(10, 10));
    EXPECT_EQ("##---", format_bar(2, 5));
}

TEST(is_determinate, modes) {
    EXPECT_TRUE(is_determinate(0, 5));
    EXPECT_TRUE(is_determinate(5, 5));
    EXPECT_FALSE(is_determinate(6, 5));
    EXPECT_FALSE(is_determinate(0, 0));
    EXPECT_FALSE(is_determinate(7, 0));
}

TEST(format_status, determinate) {
    Status status;
    status.n = 392;
    status.total = 1000;
    status.elapsed = 3.93;
    status.time_per_iteration = 0.01;
    EXPECT_EQ("|###-------| 392/1000 39% [elapsed: 00:00:03 left: 00:00:06, 100.00 iters/sec]", format_status(status));
}

TEST(format_status, determinate_without_estimate) {
    Status status;
    status.n = 1;
    status.total = 1000;
    EXPECT_EQ("|----------| 1/1000 0% [elapsed: 00:00:00 left: ?, 0 iters/sec]", format_status(status));
}

TEST(format_status, percentage_rounds) {
    Status status;
    status.n = 2;
    status.total = 3;
    EXPECT_EQ("|######----| 2/3 67% [elapsed: 00:00:00 left: ?, 0 iters/sec]", format_status(status));
}

TEST(format_status, complete) {
    Status status;
    status.n = 5;
    status.total = 5;
    status.total_segments = 4;
    status.time_per_iteration = 0.5;
    EXPECT_EQ("|####| 5/5 100% [elapsed: 00:00:00 left: 00:00:00, 2.00 iters/sec]", format_status(status));
}

TEST(format_status, unknown_total) {
    Status status;
    status.n = 296;
    status.total = 0;
    status.elapsed = 3.5;
    status.time_per_iteration = 1 / 84.57;
    EXPECT_EQ("296 [elapsed: 00:00:03, 84.57 iters/sec]", format_status(status));
}

TEST(format_status, total_exceeded) {
    Status status;
    status.n = 6;
    status.total = 5;
    EXPECT_EQ("6 [elapsed: 00:00:00, 0 iters/sec]", format_status(status));
}

TEST(utf8_length, ascii) {
    EXPECT_EQ(0u, utf8_length(""));
    EXPECT_EQ(5u, utf8_length("hello"));
}

TEST(utf8_length, multibyte) {
    EXPECT_EQ(6u, utf8_length("Größe:"));
    EXPECT_EQ(2u, utf8_length("⠋⠙"));
}
