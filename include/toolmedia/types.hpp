#pragma once
#include <nlohmann/json.hpp>

#include <cstdint>
#include <vector>

namespace toolmedia
{

using Json = nlohmann::json;

/// Raw (decoded) image bytes
using Bytes = std::vector<std::uint8_t>;

} // namespace toolmedia
