/**
 * @file main.cpp
 * @brief Main entry point for the tickbar command-line tool.
 *
 * Parses the command line, configures logging, runs the implicit self-test
 * and dispatches to the selected subcommand from the command registry.
 */

#include <argparse/argparse.hpp>

#include "utils/common.hpp"
#include "version.h"

#include "commands/TestCommand.hpp"

/**
 * @brief Main entry point for tickbar.
 *
 * Handles:
 * - Command-line argument parsing
 * - Logging initialization and configuration
 * - Automatic self-testing before command execution
 * - Command execution and error handling
 *
 * @param argc Argument count.
 * @param argv Argument vector.
 * @return EXIT_SUCCESS (0) on success, EXIT_FAILURE (1) on error.
 */
int main(int argc, char*argv[]) {
    register_program_args(program);

    for (const auto& [name, cmd] : Command::registry()) {
        program.add_subparser(cmd->parser());
    }

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    logger->set_arguments(argc, argv);
    logger->set_banner(APP_NAME " " APP_VERSION);
    logger->set_verbosity(verbosity); // should be before init_log() call
    logger->set_dedup_limit(program.get<int>("--log-dedup-limit"));

    auto& selfTestCmd = Command::registry()[TEST_CMD_NAME];
    for (const auto& [name, cmd] : Command::registry()) {
        if (!program.is_subcommand_used(name)) {
            continue;
        }

        try {
            if( name == TEST_CMD_NAME ){
                // explicit self-test, make it visible
                logger->set_verbosity(9);
            } else if( selfTestCmd->run() != 0 ){
                // implicit self-test, silent unless it fails
                logger->critical("self-test failed, exiting");
                return 1;
            }

            if( program.is_used("--log") ){
                init_log(program.get<std::string>("--log"));
            } else if( cmd->parser().is_used("--log") ){
                init_log(cmd->parser().get<std::string>("--log"));
            }
            if( cmd->parser().is_used("--log-dedup-limit") ){
                logger->set_dedup_limit(cmd->parser().get<int>("--log-dedup-limit"));
            }
            // warning: only use if all your loggers are thread-safe ("_mt" loggers)
            spdlog::flush_every(std::chrono::seconds(5));

            const int rc = cmd->run();
            logger->flush();
            return rc;
        } catch (const std::exception& err) {
            logger->critical("{}: {}", name, err.what());
            return 1;
        }
    }

    std::cout << program;
    return 0;
}
