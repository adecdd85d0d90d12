#pragma once

#include <string>

namespace toolmedia
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 4;
constexpr int VERSION_PATCH = 1;

inline std::string version_string()
{
    return std::to_string(VERSION_MAJOR) + "." + std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace toolmedia
