#pragma once
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace dropshare {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

inline std::atomic<int>& log_threshold() {
    static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
    return level;
}

inline void set_log_level(LogLevel level) { log_threshold().store(static_cast<int>(level)); }

inline bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= log_threshold().load(std::memory_order_relaxed);
}

// Accepts "debug", "info", "warn", "error" (any case). Unknown names leave the level untouched.
inline bool parse_log_level(std::string name, LogLevel& out) {
    for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (name == "debug") out = LogLevel::Debug;
    else if (name == "info") out = LogLevel::Info;
    else if (name == "warn" || name == "warning") out = LogLevel::Warn;
    else if (name == "error") out = LogLevel::Error;
    else return false;
    return true;
}

inline std::string current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(3) << std::setfill('0') << ms.count() << "Z";
    return oss.str();
}

} // namespace dropshare

#define DROPSHARE_LOG(level, tag, stream, msg)                                              \
    do {                                                                                    \
        if (::dropshare::log_enabled(level))                                                \
            stream << "[" << ::dropshare::current_timestamp() << "][" tag "] " << msg << std::endl; \
    } while (0)

#define LOG_DEBUG(msg) DROPSHARE_LOG(::dropshare::LogLevel::Debug, "DEBUG", std::cout, msg)
#define LOG_INFO(msg)  DROPSHARE_LOG(::dropshare::LogLevel::Info, "INFO", std::cout, msg)
#define LOG_WARN(msg)  DROPSHARE_LOG(::dropshare::LogLevel::Warn, "WARN", std::cerr, msg)
#define LOG_ERROR(msg) DROPSHARE_LOG(::dropshare::LogLevel::Error, "ERROR", std::cerr, msg)
