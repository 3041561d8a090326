/**
 * @file PipeCommand.cpp
 * @brief Implementation of the PipeCommand: stdin to stdout with progress.
 *
 * Lines are copied unchanged while the progress line is rendered to stderr,
 * so the command can sit in the middle of a shell pipeline:
 *
 *     find / -type f | tickbar pipe -d files | wc -l
 *
 * Standard input can't be counted without consuming it, so the bar is
 * indeterminate unless --total is given, or --count buffers the input first.
 */

#include "PipeCommand.hpp"
#include "ProgressArgs.hpp"
#include "core/Tracked.hpp"
#include "io/LineReader.hpp"

#include <vector>

REGISTER_COMMAND(PipeCommand);

/**
 * @brief Constructs a PipeCommand with the specified registration status.
 * @param reg Boolean indicating whether to register this command with the command registry.
 */
PipeCommand::PipeCommand(bool reg) : Command(reg, "pipe", "copy stdin to stdout line by line, showing progress on stderr") {
    register_progress_args(m_parser);
    m_parser.add_argument("--count")
        .default_value(false)
        .implicit_value(true)
        .help("read the whole input first to know the total");
}

/**
 * @brief Copies every element of a tracked range to the output, one per line.
 * @return EXIT_SUCCESS, or EXIT_FAILURE if the output can't be written.
 */
template <typename Range>
int PipeCommand::copy_lines(Range&& range) {
    for( const std::string& line : range ){
        *m_out << line << '\n';
        if( !*m_out ){
            logger->error("pipe: failed to write output");
            return 1;
        }
    }
    range.close();
    m_out->flush();
    return 0;
}

/**
 * @brief Executes the pipe command.
 * @return EXIT_SUCCESS (0) on success, EXIT_FAILURE (1) on output error.
 */
int PipeCommand::run() {
    TickBar::Options options = progress_options(m_parser, *m_out, *m_err);
    if( options.device == m_out ){
        logger->warn("pipe: progress is rendered into the same stream as the data");
    }

    if( m_parser.get<bool>("--count") ){
        LineReader reader(*m_in);
        std::vector<std::string> buffered(reader.begin(), reader.end());
        logger->debug("pipe: buffered {} lines", buffered.size());
        return copy_lines(TickBar::tqdm(buffered, options));
    }

    return copy_lines(TickBar::tqdm(lines(*m_in), options));
}
