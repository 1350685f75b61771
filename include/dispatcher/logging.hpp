#ifndef DISPATCHER_LOGGING_HPP
#define DISPATCHER_LOGGING_HPP

#include <functional>
#include <optional>
#include <string>

namespace dispatcher
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error,
    Off
};

/// Receives every record at or above the logger's level.
/// Note: called from forwarding and reaper threads - must be thread-safe.
using LogCallback = std::function<void(LogLevel level, const std::string& message)>;

const char* to_string(LogLevel level);

/// Accepts "debug", "info", "warning"/"warn", "error", "off" (case-insensitive)
std::optional<LogLevel> parse_log_level(const std::string& text);

/**
 * Leveled diagnostics for the dispatcher.
 *
 * stdout carries the relayed protocol stream, so records never go there. Without
 * a callback, records are written to std::cerr as
 * "<timestamp> - mcp_dispatcher - <LEVEL> - <message>".
 */
class Logger
{
  public:
    explicit Logger(LogLevel level = LogLevel::Info,
                    std::optional<LogCallback> callback = std::nullopt);

    void log(LogLevel level, const std::string& message) const;

    void debug(const std::string& message) const
    {
        log(LogLevel::Debug, message);
    }

    void info(const std::string& message) const
    {
        log(LogLevel::Info, message);
    }

    void warning(const std::string& message) const
    {
        log(LogLevel::Warning, message);
    }

    void error(const std::string& message) const
    {
        log(LogLevel::Error, message);
    }

    bool enabled(LogLevel level) const;

    LogLevel level() const
    {
        return level_;
    }

    void set_level(LogLevel level)
    {
        level_ = level;
    }

  private:
    LogLevel level_;
    std::optional<LogCallback> callback_;
};

} // namespace dispatcher

#endif // DISPATCHER_LOGGING_HPP
