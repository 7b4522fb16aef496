#pragma once
#include <cstdio>
#include <cstdarg>
#include <atomic>
#include <mutex>
#include <string>

namespace tftpwire {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

// Unknown names fall back to `fallback`.
LogLevel parse_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_.load(std::memory_order_relaxed); }
    // Lock-free; the mutex only serialises output.
    bool enabled(LogLevel lvl) const { return lvl >= level(); }
    void log(LogLevel lvl, const char* fmt, ...);
private:
    Logger() = default;
    std::mutex mtx_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
    const char* level_str(LogLevel lvl);
};

} // namespace tftpwire
