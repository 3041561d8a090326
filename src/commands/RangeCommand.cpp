/**
 * @file RangeCommand.cpp
 * @brief Implementation of the RangeCommand: a timed loop over 0..n-1.
 *
 * Useful to watch the rate estimate settle, or to benchmark the overhead of
 * rendering with --delay 0 and various --min-iters values.
 */

#include "RangeCommand.hpp"
#include "ProgressArgs.hpp"
#include "core/Tracked.hpp"

#include <ranges>
#include <thread>

REGISTER_COMMAND(RangeCommand);

/**
 * @brief Constructs a RangeCommand with the specified registration status.
 * @param reg Boolean indicating whether to register this command with the command registry.
 */
RangeCommand::RangeCommand(bool reg) : Command(reg, "range", "iterate over 0..n-1 with a fixed delay per item") {
    m_parser.add_argument("count").help("number of items (k, m, g suffixes)");
    m_parser.add_argument("--delay")
        .default_value(std::string("10ms"))
        .help("time spent on each item");
    m_parser.add_argument("--print")
        .default_value(false)
        .implicit_value(true)
        .help("print every item to stdout");
    register_progress_args(m_parser);
}

/**
 * @brief Executes the range command.
 *
 * Items are generated lazily. The total is counted from the view unless
 * --total is given, so a smaller --total demonstrates the switch to
 * indeterminate mode.
 *
 * @return EXIT_SUCCESS (0) on success.
 */
int RangeCommand::run() {
    const uint64_t count = human2count(m_parser.get<std::string>("count"));
    const auto delay = human2duration(m_parser.get<std::string>("--delay"));
    const bool print = m_parser.get<bool>("--print");
    TickBar::Options options = progress_options(m_parser, *m_out, *m_err);

    uint64_t sum = 0;
    for( uint64_t i : TickBar::tqdm(std::views::iota(uint64_t{0}, count), options) ){
        if( delay.count() > 0 ){
            std::this_thread::sleep_for(delay);
        }
        if( print ){
            *m_out << i << '\n';
        }
        sum += i;
    }

    logger->debug("range: {} items, sum = {}", count, sum);
    return 0;
}
