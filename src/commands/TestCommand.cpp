/**
 * @file TestCommand.cpp
 * @brief Implementation of the TestCommand for system self-testing.
 *
 * Verifies that the platform clock is monotonic and that status formatting
 * produces the expected text. Runs silently before every other command and
 * visibly when invoked as "tickbar test".
 */

#include "TestCommand.hpp"
#include "core/Formatter.hpp"
#include "core/RateEstimator.hpp"
#include "utils/common.hpp"

REGISTER_COMMAND(TestCommand);

/**
 * @brief Constructs a TestCommand with the specified registration status.
 * @param reg Boolean indicating whether to register this command with the command registry.
 */
TestCommand::TestCommand(bool reg) : Command(reg, TEST_CMD_NAME, "self-test") {
}

static bool expect_eq(const char* what, const std::string& actual, const std::string& expected) {
    logger->trace("selftest: {:<24} = \"{}\"", what, actual);
    if( actual != expected ){
        logger->critical("selftest: {} is \"{}\", expected \"{}\"", what, actual, expected);
        return false;
    }
    return true;
}

/**
 * @brief Executes the self-tests.
 * @return EXIT_SUCCESS (0) if all tests pass, EXIT_FAILURE (1) if any test fails.
 */
int TestCommand::run() {
    logger->trace("selftest: steady_clock::is_steady = {}", TickBar::Clock::is_steady);
    if( !TickBar::Clock::is_steady ){
        logger->critical("selftest: steady_clock is not monotonic");
        return 1;
    }

    bool ok = true;
    ok &= expect_eq("format_interval(3661)", TickBar::format_interval(3661.0), "01:01:01");
    ok &= expect_eq("format_interval(59.9)", TickBar::format_interval(59.9), "00:00:59");
    ok &= expect_eq("format_rate(0.01)", TickBar::format_rate(0.01), "100.00");
    ok &= expect_eq("format_bar(3, 10)", TickBar::format_bar(3, 10), "###-------");

    TickBar::Status status;
    status.n = 7;
    status.total = 5;
    status.elapsed = 2;
    ok &= expect_eq("format_status(7/5)", TickBar::format_status(status), "7 [elapsed: 00:00:02, 0 iters/sec]");

    if( !ok ){
        return 1;
    }

    logger->trace("selftest: OK");
    return 0;
}
