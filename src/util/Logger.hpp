#pragma once

#include <string>

namespace improver {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide diagnostic logger
 *
 * Every level writes to stderr; stdout is reserved for rendered help text.
 * The initial level comes from IMPROVER_LOG (error|warn|info|debug or 0..3).
 */
class Logger {
public:
    static Logger& instance();
    static LogLevel parseLevel(const char* value);
    void setLevel(LogLevel level);
    LogLevel level() const;
    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

private:
    Logger();
    LogLevel currentLevel;
};

// Restores the logger level captured at construction when it goes out of scope
class ScopedLogLevel {
public:
    ScopedLogLevel() : saved(Logger::instance().level()) {}
    ~ScopedLogLevel() { Logger::instance().setLevel(saved); }
    ScopedLogLevel(const ScopedLogLevel&) = delete;
    ScopedLogLevel& operator=(const ScopedLogLevel&) = delete;

private:
    LogLevel saved;
};

}
