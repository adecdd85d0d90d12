#include "toolmedia/settings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace toolmedia
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static int getenv_int(const char* key, int defv)
{
    const char* v = std::getenv(key);
    if (!v || !*v)
        return defv;
    try
    {
        size_t pos = 0;
        int parsed = std::stoi(v, &pos, 10);
        if (pos != std::string(v).size() || parsed <= 0)
            return defv;
        return parsed;
    }
    catch (const std::exception&)
    {
        return defv;
    }
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("TOOLMEDIA_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    s.log_level = lvl;

    auto backend = getenv_str("TOOLMEDIA_IMAGE_BACKEND", "");
    if (!backend.empty())
        s.image_backend = backend;

    s.max_dimension_px = getenv_int("TOOLMEDIA_MAX_IMAGE_DIMENSION", s.max_dimension_px);
    s.resize_quality = std::min(100, getenv_int("TOOLMEDIA_RESIZE_QUALITY", s.resize_quality));
    s.external_tool = getenv_str("TOOLMEDIA_IMAGE_TOOL", s.external_tool);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    if (j.contains("image_backend") && j.at("image_backend").is_string())
        s.image_backend = j.at("image_backend").get<std::string>();
    if (j.contains("max_dimension_px"))
        s.max_dimension_px = j.at("max_dimension_px").get<int>();
    if (j.contains("resize_quality"))
        s.resize_quality = j.at("resize_quality").get<int>();
    if (j.contains("external_tool"))
        s.external_tool = j.at("external_tool").get<std::string>();
    if (j.contains("metadata_timeout_ms"))
        s.metadata_timeout_ms = j.at("metadata_timeout_ms").get<int>();
    if (j.contains("resize_timeout_ms"))
        s.resize_timeout_ms = j.at("resize_timeout_ms").get<int>();
    if (j.contains("metadata_max_output"))
        s.metadata_max_output = j.at("metadata_max_output").get<std::size_t>();
    if (j.contains("resize_max_output"))
        s.resize_max_output = j.at("resize_max_output").get<std::size_t>();
    return s;
}

} // namespace toolmedia
