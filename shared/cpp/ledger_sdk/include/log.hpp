#pragma once
#include <string>

enum class LogLevel { Debug, Info, Warning, Error, Critical };

const char* to_string(LogLevel level);
LogLevel log_level_from_string(const std::string& s, LogLevel def);
// LOG_LEVEL environment variable, INFO when unset or unknown.
LogLevel log_level_from_env();

// Tagged line logger in the style "[tag] [LEVEL]: message".
// Debug/Info go to stdout, Warning and above to stderr.
class Logger {
public:
    explicit Logger(std::string tag, LogLevel min_level = log_level_from_env());

    void log(LogLevel level, const std::string& message) const;
    void debug(const std::string& message) const { log(LogLevel::Debug, message); }
    void info(const std::string& message) const { log(LogLevel::Info, message); }
    void warning(const std::string& message) const { log(LogLevel::Warning, message); }
    void error(const std::string& message) const { log(LogLevel::Error, message); }
    void critical(const std::string& message) const { log(LogLevel::Critical, message); }

    const std::string& tag() const { return tag_; }
    LogLevel min_level() const { return min_level_; }

private:
    std::string tag_;
    LogLevel min_level_;
};
