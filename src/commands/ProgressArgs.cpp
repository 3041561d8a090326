/**
 * @file ProgressArgs.cpp
 * @brief Command-line options shared by all commands that render progress.
 *
 * Every option maps to one field of TickBar::Options. Counts and durations
 * are given in human-readable form and parsed with the helpers from units.
 */

#include "ProgressArgs.hpp"

void register_progress_args(argparse::ArgumentParser &parser) {
    parser.add_argument("-d", "--desc")
        .default_value(std::string(""))
        .help("description shown before the progress bar");

    parser.add_argument("-t", "--total")
        .help("expected number of items, 0 = unknown [default: count the input if possible]");

    parser.add_argument("--leave")
        .default_value(false)
        .implicit_value(true)
        .help("keep the progress line on finish instead of clearing it");

    parser.add_argument("--stdout")
        .default_value(false)
        .implicit_value(true)
        .help("render progress to stdout instead of stderr");

    parser.add_argument("--min-interval")
        .default_value(std::string("100ms"))
        .help("minimum time between renders (ms, s, m suffixes)");

    parser.add_argument("--min-iters")
        .default_value(std::string("1"))
        .help("items to pass before checking the clock again");

    parser.add_argument("--segments")
        .default_value(std::string("10"))
        .help("progress bar width in segments");
}

/**
 * @brief Builds engine options from parsed arguments.
 *
 * @param parser Parser the progress arguments were registered on.
 * @param out Device used with --stdout.
 * @param err Default device.
 * @return Options for TickBar::tqdm().
 * @throws std::runtime_error On malformed counts or durations.
 */
TickBar::Options progress_options(const argparse::ArgumentParser &parser, std::ostream& out, std::ostream& err) {
    TickBar::Options options;

    options.description = parser.get<std::string>("--desc");
    if( auto total = parser.present("--total") ){
        options.total = human2count(*total);
    }
    options.clear = !parser.get<bool>("--leave");
    options.device = parser.get<bool>("--stdout") ? &out : &err;
    options.min_interval = human2duration(parser.get<std::string>("--min-interval"));
    options.min_iterations = human2count(parser.get<std::string>("--min-iters"));
    options.total_segments = human2count(parser.get<std::string>("--segments"));

    logger->debug("progress options: desc=\"{}\" total={} clear={} min_interval={}ms min_iters={} segments={}",
        options.description,
        options.total ? std::to_string(*options.total) : "auto",
        options.clear,
        options.min_interval.count(),
        options.min_iterations,
        options.total_segments);

    return options;
}
