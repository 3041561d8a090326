#include "test_utils.hpp"
#include "commands/ProgressArgs.hpp"

using namespace std::chrono_literals;

class ProgressArgsTest : public ::testing::Test {
protected:
    argparse::ArgumentParser parser{"progress_args_test", "", argparse::default_arguments::none};
    std::ostringstream out, err;

    void SetUp() override {
        register_progress_args(parser);
    }
};

TEST_F(ProgressArgsTest, defaults) {
    parser.parse_args({"./app"});
    TickBar::Options options = progress_options(parser, out, err);

    EXPECT_EQ("", options.description);
    EXPECT_FALSE(options.total.has_value());
    EXPECT_TRUE(options.clear);
    EXPECT_EQ(&err, options.device);
    EXPECT_EQ(100ms, options.min_interval);
    EXPECT_EQ(1u, options.min_iterations);
    EXPECT_EQ(10u, options.total_segments);
}

TEST_F(ProgressArgsTest, all_set) {
    parser.parse_args({"./app", "-d", "Files", "-t", "10k", "--leave", "--stdout",
        "--min-interval", "2s", "--min-iters", "50", "--segments", "20"});
    TickBar::Options options = progress_options(parser, out, err);

    EXPECT_EQ("Files", options.description);
    ASSERT_TRUE(options.total.has_value());
    EXPECT_EQ(10000u, *options.total);
    EXPECT_FALSE(options.clear);
    EXPECT_EQ(&out, options.device);
    EXPECT_EQ(2000ms, options.min_interval);
    EXPECT_EQ(50u, options.min_iterations);
    EXPECT_EQ(20u, options.total_segments);
}

TEST_F(ProgressArgsTest, zero_total_is_explicit) {
    parser.parse_args({"./app", "--total", "0"});
    TickBar::Options options = progress_options(parser, out, err);
    ASSERT_TRUE(options.total.has_value());
    EXPECT_EQ(0u, *options.total);
}

TEST_F(ProgressArgsTest, malformed_duration) {
    parser.parse_args({"./app", "--min-interval", "quickly"});
    EXPECT_THROW(progress_options(parser, out, err), std::runtime_error);
}
