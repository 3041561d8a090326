/**
 * @file Logger.cpp
 * @brief Implementation of the Logger wrapper around spdlog.
 *
 * Diagnostics go to stderr so that stdout stays clean for data passed
 * through by the pipe command. A log file can be attached as a second
 * sink; it then records debug messages regardless of console verbosity.
 */

#include "Logger.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/fmt/ranges.h> // for fmt::join()
#include <fstream>

std::shared_ptr<Logger> logger = std::make_shared<Logger>(spdlog::stderr_color_mt("tickbar"));

/**
 * @brief Sets the logging verbosity level.
 *
 * Maps integer verbosity to spdlog levels:
 * -4 or less: off, -3: critical, -2: error, -1: warn, 0: info, 1: debug, 2+: trace
 *
 * @param verbosity Integer verbosity level.
 */
void Logger::set_verbosity(int verbosity){
    if( verbosity <= -4 ){
        m_logger->set_level(spdlog::level::off);
        return;
    }
    switch( verbosity ){
        case -3:
            m_logger->set_level(spdlog::level::critical);
            break;
        case -2:
            m_logger->set_level(spdlog::level::err);
            break;
        case -1:
            m_logger->set_level(spdlog::level::warn);
            break;
        case 0: // default level
            m_logger->set_level(spdlog::level::info);
            break;
        case 1:
            m_logger->set_level(spdlog::level::debug);
            break;
        default:
            m_logger->set_level(spdlog::level::trace);
            break;
    }
}

void Logger::set_arguments(int argc, char* argv[]){
    m_arguments.assign(argv, argv + argc);
}

void Logger::set_arguments(const std::vector<std::string>& args){
    m_arguments = args;
}

/**
 * @brief Quotes an argument string if it contains spaces.
 * @note Not a comprehensive shell-escape function.
 */
static std::string quote_if_needed(const std::string& arg) {
    if (arg.find(' ') != std::string::npos) {
        return "\"" + arg + "\"";
    }
    return arg;
}

/**
 * @brief Adds a file sink to the logger.
 *
 * The file is opened in append mode and receives DEBUG or higher, while the
 * console keeps its current level. A second call is ignored.
 *
 * @param fname Path to the log file.
 * @return True if the file sink was added, false if already logging to a file or on error.
 */
bool Logger::add_file(const std::filesystem::path& fname) {
    if( !m_fname.empty() ){
        return false;
    }

    std::ofstream file(fname, std::ios::app);
    if( !file.is_open() ){
        m_logger->error("Failed to open log file {}, no log will be saved!", fname);
        return false;
    }
    if( file.tellp() != 0 ){
        file.write("\n\n", 2); // visual sessions separator
    }
    file.close();

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(fname.string());

    // if current logger level is DEBUG or TRACE => file level just inherits it
    // otherwise, file level is DEBUG
    if( m_logger->level() != spdlog::level::debug && m_logger->level() != spdlog::level::trace ){
        file_sink->set_level(spdlog::level::debug);
        set_console_level(m_logger->level());
        m_logger->set_level(spdlog::level::debug);
    }

    m_logger->sinks().push_back(file_sink);
    m_fname = fname;
    return true;
}

/**
 * @brief Logs session start information: banner, arguments and log destination.
 */
void Logger::start(){
    if( !m_banner.empty() ){
        m_logger->debug("{}", m_banner);
    }

    std::vector<std::string> quoted;
    quoted.reserve(m_arguments.size());
    for( const auto& arg : m_arguments ){
        quoted.push_back(quote_if_needed(arg));
    }

    m_logger->debug("started as {}", fmt::join(quoted, " "));
    m_logger->debug("logging to {}", m_fname.empty() ? "console only" : m_fname.string());
}

void Logger::set_console_level(level lvl) {
    m_logger->sinks().front()->set_level(lvl); // first sink is the console
}

Logger::level Logger::console_level() const {
    return m_logger->sinks().front()->level();
}

int Logger::seen_count(std::string_view format) const {
    std::lock_guard<std::mutex> lock(m_mtx);
    auto it = m_logged_messages.find(format);
    return it == m_logged_messages.end() ? 0 : it->second;
}
