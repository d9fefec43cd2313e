#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace utils {

using SteadyClock = std::chrono::steady_clock;
using SystemClock = std::chrono::system_clock;

// Wall time of a scan, reported in the summary.
struct Stopwatch {
    Stopwatch();

    void reset();

    std::int64_t elapsed_ms() const;

private:
    SteadyClock::time_point start_;
};

// "YYYY-MM-DD HH:MM:SS.mmm" in local time
std::string format_time_local(SystemClock::time_point tp);
std::string now_local_string();

// Thread id as string (for log lines)
std::string thread_id_string();

} // namespace utils
