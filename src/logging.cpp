#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <dispatcher/logging.hpp>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace dispatcher
{

namespace
{
// Serializes records from the forwarding, reaper and session threads
std::mutex& stderr_mutex()
{
    static std::mutex mutex;
    return mutex;
}

std::string timestamp()
{
    using namespace std::chrono;
    auto now = system_clock::now();
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t seconds = system_clock::to_time_t(now);

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << ',' << std::setw(3)
        << std::setfill('0') << millis.count();
    return oss.str();
}
} // namespace

const char* to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Off:
        return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> parse_log_level(const std::string& text)
{
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warning" || lower == "warn")
        return LogLevel::Warning;
    if (lower == "error")
        return LogLevel::Error;
    if (lower == "off" || lower == "none")
        return LogLevel::Off;
    return std::nullopt;
}

Logger::Logger(LogLevel level, std::optional<LogCallback> callback)
    : level_(level), callback_(std::move(callback))
{
}

bool Logger::enabled(LogLevel level) const
{
    return level != LogLevel::Off && level_ != LogLevel::Off && level >= level_;
}

void Logger::log(LogLevel level, const std::string& message) const
{
    if (!enabled(level))
        return;

    if (callback_.has_value())
    {
        (*callback_)(level, message);
        return;
    }

    std::ostringstream line;
    line << timestamp() << " - mcp_dispatcher - " << to_string(level) << " - " << message
         << '\n';

    std::lock_guard<std::mutex> lock(stderr_mutex());
    std::cerr << line.str() << std::flush;
}

} // namespace dispatcher
