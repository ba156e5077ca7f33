#pragma once

#include <optional>
#include <string>

namespace baretree {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide leveled logger
 *
 * Error and warn go to stderr, info and debug to stdout, each line tagged
 * with a fixed-width level ("[warn ] ..."). The initial level comes from
 * BARETREE_LOG (debug|info|warn|error or 0-3), default Info; `bt --verbose`
 * raises it to Debug.
 */
class Logger {
public:
    static Logger& instance();

    /// Parse "debug", "info", "warn", "error" or a digit 0-3
    static std::optional<LogLevel> parseLevel(const std::string& text);

    void setLevel(LogLevel level);
    LogLevel level() const;

    /// True when messages at level would be written
    bool enabled(LogLevel level) const;

    void log(LogLevel level, const std::string& msg) const;
    void error(const std::string& msg) const { log(LogLevel::Error, msg); }
    void warn(const std::string& msg) const { log(LogLevel::Warn, msg); }
    void info(const std::string& msg) const { log(LogLevel::Info, msg); }
    void debug(const std::string& msg) const { log(LogLevel::Debug, msg); }

private:
    Logger();
    LogLevel currentLevel;
};

}
