#include "toolmedia/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace toolmedia
{

std::string to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

LogLevel log_level_from_string(const std::string& s)
{
    std::string upper = s;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG")
        return LogLevel::Debug;
    if (upper == "WARN" || upper == "WARNING")
        return LogLevel::Warn;
    if (upper == "ERROR")
        return LogLevel::Error;
    return LogLevel::Info;
}

Logger::Logger(LogLevel min_level, LogCallback callback)
    : min_level_(min_level), callback_(std::move(callback))
{
    if (!callback_)
    {
        callback_ = [](LogLevel level, const std::string& msg)
        {
            // Default: print to stderr
            std::cerr << "[toolmedia] " << to_string(level) << " " << msg << std::endl;
        };
    }
}

void Logger::log(LogLevel level, const std::string& msg) const
{
    if (static_cast<int>(level) < static_cast<int>(min_level_))
        return;
    callback_(level, msg);
}

} // namespace toolmedia
