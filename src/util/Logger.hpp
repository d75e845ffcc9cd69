#pragma once

#include <string>

namespace promptline {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide leveled logger
 *
 * Every level writes to stderr: stdout is reserved for the prompt string
 * the shell splices into PS1/PROMPT.
 *
 * Initial level comes from PROMPTLINE_LOG (error|warn|info|debug or 0..3).
 */
class Logger {
public:
    static Logger& instance();
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

/**
 * @brief Map a PROMPTLINE_LOG value to a level; unknown values give Info
 */
LogLevel parseLogLevel(const std::string& value);

}
