/**
 * @file common.cpp
 * @brief Global command-line state and logging setup.
 *
 * Holds the top-level argument parser, the verbosity counter shared by all
 * subcommands, and the registration of arguments every command accepts.
 */

#include "common.hpp"
#include "version.h"

#include <stdexcept>

int verbosity = 0;

argparse::ArgumentParser program(APP_NAME, APP_VERSION, argparse::default_arguments::help);

/**
 * @brief Attaches a log file to the global logger and logs the session start.
 *
 * Runs once; later calls are ignored.
 *
 * @param log_fname Log file pathname.
 * @throws std::runtime_error If the log file can't be opened.
 */
void init_log(const std::string& log_fname){
    static bool inited = false;
    if( inited ){
        return;
    }
    inited = true;

    // explicit log pathname, can't continue without log
    if( !logger->add_file(log_fname) ){
        throw std::runtime_error("explicit log pathname is set, refusing to continue without log");
    }
    logger->start();
}

void register_common_args(argparse::ArgumentParser &parser) {
    parser.add_argument("-v", "--verbose")
        .help("increase verbosity")
        .action([&](const auto &) { ++verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-q", "--quiet")
        .help("decrease verbosity")
        .action([&](const auto &) { --verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-L", "--log")
        .help("log pathname");
    parser.add_argument("--log-dedup-limit")
        .default_value(100)
        .scan<'i', int>()
        .help("limit duplicate log messages, 0 = no limit");
}

void register_program_args(argparse::ArgumentParser &parser) {
    register_common_args(parser);

    parser.add_argument("--version")
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", APP_VERSION);
            exit(0);
        })
        .default_value(false)
        .help("print version information and exit")
        .implicit_value(true)
        .nargs(0);
}
