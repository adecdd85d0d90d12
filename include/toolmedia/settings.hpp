#pragma once
#include "toolmedia/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace toolmedia
{

struct Settings
{
    std::string log_level{"INFO"};

    /// Backend override: "native" or "external-tool" (aliases: "sharp", "sips", "external")
    std::optional<std::string> image_backend;

    int max_dimension_px{2000};
    int resize_quality{85};

    std::string external_tool{"/usr/bin/sips"};
    int metadata_timeout_ms{10000};
    int resize_timeout_ms{20000};
    std::size_t metadata_max_output{512 * 1024};
    std::size_t resize_max_output{1024 * 1024};

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace toolmedia
