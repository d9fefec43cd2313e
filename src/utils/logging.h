#pragma once

#include <fstream>
#include <mutex>
#include <optional>
#include <string>

namespace utils {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
};

// "trace" | "debug" | "info" | "warn" | "error" (case-insensitive).
// Anything else maps to Info.
LogLevel parse_log_level(const std::string& s);

class Logger {
public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel lvl);
    LogLevel level() const;
    bool enabled(LogLevel lvl) const;

    // Mirror every line into a file (append). Empty path disables it.
    bool set_log_file(const std::string& path);

    // Info and below go to stdout, Warn/Error to stderr.
    void log(LogLevel lvl, const std::string& msg);

    void trace(const std::string& msg) { log(LogLevel::Trace, msg); }
    void debug(const std::string& msg) { log(LogLevel::Debug, msg); }
    void info (const std::string& msg) { log(LogLevel::Info,  msg); }
    void warn (const std::string& msg) { log(LogLevel::Warn,  msg); }
    void error(const std::string& msg) { log(LogLevel::Error, msg); }

private:
    Logger() = default;

    static const char* level_name_(LogLevel lvl);

    mutable std::mutex mu_;
    LogLevel level_ = LogLevel::Info;
    std::optional<std::ofstream> file_;
};

#define EXTCHECK_LOG_TRACE(msg) ::utils::Logger::instance().trace(msg)
#define EXTCHECK_LOG_DEBUG(msg) ::utils::Logger::instance().debug(msg)
#define EXTCHECK_LOG_INFO(msg)  ::utils::Logger::instance().info(msg)
#define EXTCHECK_LOG_WARN(msg)  ::utils::Logger::instance().warn(msg)
#define EXTCHECK_LOG_ERROR(msg) ::utils::Logger::instance().error(msg)

} // namespace utils
