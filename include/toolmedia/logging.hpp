#pragma once

#include <functional>
#include <string>

namespace toolmedia
{

enum class LogLevel
{
    Debug,
    Info,
    Warn,
    Error
};

std::string to_string(LogLevel level);

/// Parses DEBUG/INFO/WARN/WARNING/ERROR (case-insensitive); unknown values map to Info
LogLevel log_level_from_string(const std::string& s);

/// Level-filtered logger. Messages go to the callback, or to stderr as
/// "[toolmedia] LEVEL message" when no callback is given.
class Logger
{
  public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    explicit Logger(LogLevel min_level = LogLevel::Info, LogCallback callback = nullptr);

    void log(LogLevel level, const std::string& msg) const;
    void debug(const std::string& msg) const
    {
        log(LogLevel::Debug, msg);
    }
    void info(const std::string& msg) const
    {
        log(LogLevel::Info, msg);
    }
    void warn(const std::string& msg) const
    {
        log(LogLevel::Warn, msg);
    }
    void error(const std::string& msg) const
    {
        log(LogLevel::Error, msg);
    }

    LogLevel min_level() const
    {
        return min_level_;
    }

  private:
    LogLevel min_level_;
    LogCallback callback_;
};

} // namespace toolmedia
