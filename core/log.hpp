// filename: core/log.hpp
#pragma once
#include <sstream>
#include <string>

// Line logging to stderr with a "[tag]" prefix.
// The level comes from JOBQ_LOG_LEVEL (error|warn|info|debug), default warn.

enum class LogLevel { error = 0, warn = 1, info = 2, debug = 3 };

bool log_enabled(LogLevel level);

// writes the whole line with a single stream insertion
void log_line(LogLevel level, const char* tag, const std::string& msg);

// One log line, written when the temporary goes away:
//   LogLine(LogLevel::warn, "net") << "lost " << host;
// Nothing is formatted when the level is off.
class LogLine {
public:
    LogLine(LogLevel level, const char* tag)
        : level_(level), tag_(tag), enabled_(log_enabled(level)) {}

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    ~LogLine() {
        if (enabled_) log_line(level_, tag_, os_.str());
    }

    template <typename T>
    LogLine& operator<<(const T& value) {
        if (enabled_) os_ << value;
        return *this;
    }

private:
    LogLevel level_;
    const char* tag_;
    bool enabled_;
    std::ostringstream os_;
};
