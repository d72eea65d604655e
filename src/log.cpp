// filename: src/log.cpp
#include <core/log.hpp>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace {

LogLevel pick_level() {
    const char* env = std::getenv("JOBQ_LOG_LEVEL");
    if (!env) return LogLevel::warn;
    std::string s{env};
    if (s == "error") return LogLevel::error;
    if (s == "info") return LogLevel::info;
    if (s == "debug") return LogLevel::debug;
    return LogLevel::warn;
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::error: return "error";
        case LogLevel::warn: return "warn";
        case LogLevel::info: return "info";
        case LogLevel::debug: return "debug";
    }
    return "?";
}

std::mutex g_log_mu;

} // namespace

bool log_enabled(LogLevel level) {
    static const LogLevel configured = pick_level();
    return static_cast<int>(level) <= static_cast<int>(configured);
}

void log_line(LogLevel level, const char* tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(g_log_mu);
    std::cerr << "[" << tag << "] " << level_name(level) << ": " << msg << "\n";
}
