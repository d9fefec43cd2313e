#include "logging.h"

#include "time_utils.h"

#include <cctype>
#include <iostream>

namespace utils {

LogLevel parse_log_level(const std::string& s) {
    std::string v = s;
    for (char& c : v) c = (char)std::tolower((unsigned char)c);
    if (v == "trace") return LogLevel::Trace;
    if (v == "debug") return LogLevel::Debug;
    if (v == "warn" || v == "warning") return LogLevel::Warn;
    if (v == "error") return LogLevel::Error;
    return LogLevel::Info;
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::set_level(LogLevel lvl) {
    std::lock_guard<std::mutex> lock(mu_);
    level_ = lvl;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mu_);
    return level_;
}

bool Logger::enabled(LogLevel lvl) const {
    std::lock_guard<std::mutex> lock(mu_);
    return (int)lvl >= (int)level_;
}

bool Logger::set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mu_);
    if (path.empty()) {
        file_.reset();
        return true;
    }
    std::ofstream ofs(path, std::ios::out | std::ios::app);
    if (!ofs.is_open()) return false;
    file_.emplace(std::move(ofs));
    return true;
}

const char* Logger::level_name_(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "INFO";
    }
}

void Logger::log(LogLevel lvl, const std::string& msg) {
    std::lock_guard<std::mutex> lock(mu_);
    if ((int)lvl < (int)level_) return;

    std::string line =
        "[" + now_local_string() + "]" +
        "[" + level_name_(lvl) + "]" +
        "[tid=" + thread_id_string() + "] " +
        msg;

    std::ostream& out = ((int)lvl >= (int)LogLevel::Warn) ? std::cerr : std::cout;
    out << line << "\n";
    out.flush();

    if (file_.has_value()) {
        (*file_) << line << "\n";
        file_->flush();
    }
}

} // namespace utils
