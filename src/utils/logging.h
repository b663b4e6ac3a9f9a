#pragma once

#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace utils {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
};

// Parses "trace" / "debug" / "info" / "warn" / "error" (any case).
// Returns std::nullopt for anything else.
std::optional<LogLevel> parse_log_level(const std::string& s);

// Process-wide logger.
// Lines go to stderr so that a snapshot printed on stdout stays clean.
class Logger {
public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel lvl);
    LogLevel level() const;

    // Redirect console output (tests capture it). nullptr silences the console.
    void set_stream(std::ostream* os);

    // Also append every line to a file.
    // If path empty -> disables file output
    bool set_log_file(const std::string& path);

    bool enabled(LogLevel lvl) const;

    void log(LogLevel lvl, const std::string& msg);

    void trace(const std::string& msg) { log(LogLevel::Trace, msg); }
    void debug(const std::string& msg) { log(LogLevel::Debug, msg); }
    void info (const std::string& msg) { log(LogLevel::Info,  msg); }
    void warn (const std::string& msg) { log(LogLevel::Warn,  msg); }
    void error(const std::string& msg) { log(LogLevel::Error, msg); }

private:
    Logger();

    static const char* level_name_(LogLevel lvl);

    mutable std::mutex mu_;
    LogLevel level_ = LogLevel::Warn;
    std::ostream* stream_ = nullptr;
    std::optional<std::ofstream> file_;
};

// The message expression is only evaluated when the level is enabled,
// the walker logs per entry at trace/debug.
#define LOG_AT_(lvl, msg)                                              \
    do {                                                               \
        if (::utils::Logger::instance().enabled(lvl))                  \
            ::utils::Logger::instance().log(lvl, msg);                 \
    } while (0)

#define LOG_TRACE(msg) LOG_AT_(::utils::LogLevel::Trace, msg)
#define LOG_DEBUG(msg) LOG_AT_(::utils::LogLevel::Debug, msg)
#define LOG_INFO(msg)  LOG_AT_(::utils::LogLevel::Info,  msg)
#define LOG_WARN(msg)  LOG_AT_(::utils::LogLevel::Warn,  msg)
#define LOG_ERROR(msg) LOG_AT_(::utils::LogLevel::Error, msg)

} // namespace utils
