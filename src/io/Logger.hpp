#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

// spdlog wrapper: verbosity levels, optional log file, duplicate suppression
class Logger {
public:
    using level = spdlog::level::level_enum;

    explicit Logger(std::shared_ptr<spdlog::logger> logger)
        : m_logger(std::move(logger)) {}

    void set_verbosity(int verbosity);
    void set_banner(const std::string& banner){ m_banner = banner; }
    void set_arguments(int argc, char* argv[]);
    void set_arguments(const std::vector<std::string>&);
    void set_dedup_limit(int limit){ m_dedup_limit = limit; }

    template <typename... Args>
    inline void trace(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->trace(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void debug(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->debug(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void info(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->info(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void warn(fmt::format_string<Args...> format, Args&&... args) {
        log_dedup(level::warn, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void error(fmt::format_string<Args...> format, Args&&... args) {
        log_dedup(level::err, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void critical(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->critical(format, std::forward<Args>(args)...);
    }

    // add a second output stream to the logger
    bool add_file(const std::filesystem::path& fname);

    // show the banner and arguments
    void start();
    void flush() { m_logger->flush(); }

    level console_level() const;
    void set_console_level(level lvl);

    // how many times a format string was seen by warn()/error()
    int seen_count(std::string_view format) const;

private:
    // repeated messages are counted by format string, not by arguments
    template <typename... Args>
    void log_dedup(level lvl, fmt::format_string<Args...> format, Args&&... args) {
        if (m_dedup_limit > 0) {
            const fmt::string_view fsv = format;
            int n;
            {
                std::lock_guard<std::mutex> lock(m_mtx);
                n = m_logged_messages[std::string_view(fsv.data(), fsv.size())]++;
            }
            if (n >= m_dedup_limit) {
                if (n == m_dedup_limit) {
                    std::string message = fmt::format(format, std::forward<Args>(args)...);
                    m_logger->log(lvl, "{} [repeated {} times. suppressing]", message, m_dedup_limit);
                }
                return;
            }
        }
        m_logger->log(lvl, format, std::forward<Args>(args)...);
    }

    std::shared_ptr<spdlog::logger> m_logger;
    std::unordered_map<std::string_view, int> m_logged_messages; // keys are string literals
    mutable std::mutex m_mtx;
    std::string m_banner;
    std::filesystem::path m_fname;
    std::vector<std::string> m_arguments;
    int m_dedup_limit = 0;
};

extern std::shared_ptr<Logger> logger;

// spdlog has no formatter for std::filesystem::path
template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const std::filesystem::path& path, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(path.string(), ctx);
    }
};
