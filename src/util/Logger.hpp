#pragma once

#include <optional>
#include <string>

namespace oops {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide diagnostic logger
 *
 * Errors and warnings go to stderr, info and debug to stdout.
 * The initial level is read from the OOPS_LOG environment variable,
 * defaulting to info when it is unset or unrecognised.
 */
class Logger {
public:
    static Logger& instance();

    /// Accepts error|warn|info|debug or the numeric levels 0..3
    static std::optional<LogLevel> parseLevel(const std::string& text);

    void setLevel(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const { return level <= currentLevel; }

    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

private:
    Logger();
    LogLevel currentLevel;
};

}
