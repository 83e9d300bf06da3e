#pragma once
#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <string>

namespace tagchunk {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

// Accepts "trace", "debug", "info", "warn" or "error".
bool parse_log_level(const std::string& s, LogLevel& out);

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    void log(LogLevel lvl, const char* fmt, ...);
private:
    Logger() = default;
    std::mutex mtx_;
    LogLevel level_ = LogLevel::INFO;
    static const char* level_str(LogLevel lvl);
};

} // namespace tagchunk
