#include "../include/log.hpp"
#include <iostream>
#include <chrono>
#include <ctime>
#include <cctype>
#include <cstdlib>
#include <algorithm>

namespace {
std::string utc_stamp() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
    }
    return "INFO";
}

LogLevel log_level_from_string(const std::string& s, LogLevel def) {
    std::string up = s;
    std::transform(up.begin(), up.end(), up.begin(), [](unsigned char c){ return (char)std::toupper(c); });
    if (up == "DEBUG") return LogLevel::Debug;
    if (up == "INFO") return LogLevel::Info;
    if (up == "WARNING" || up == "WARN") return LogLevel::Warning;
    if (up == "ERROR") return LogLevel::Error;
    if (up == "CRITICAL") return LogLevel::Critical;
    return def;
}

LogLevel log_level_from_env() {
    const char* v = std::getenv("LOG_LEVEL");
    return v ? log_level_from_string(v, LogLevel::Info) : LogLevel::Info;
}

Logger::Logger(std::string tag, LogLevel min_level)
    : tag_(std::move(tag)), min_level_(min_level) {}

void Logger::log(LogLevel level, const std::string& message) const {
    if (level < min_level_) return;
    // One write per line keeps output from concurrent threads readable.
    std::string line = utc_stamp() + " [" + tag_ + "] [" + to_string(level) + "]: " + message + "\n";
    if (level >= LogLevel::Warning) {
        std::cerr << line << std::flush;
    } else {
        std::cout << line << std::flush;
    }
}
