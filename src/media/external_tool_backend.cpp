#include "toolmedia/media/external_tool_backend.hpp"

#include "../internal/process.hpp"
#include "toolmedia/exceptions.hpp"
#include "toolmedia/settings.hpp"
#include "toolmedia/util/temp_dir.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <regex>

namespace toolmedia::media
{

namespace
{

namespace fs = std::filesystem;

void write_file(const fs::path& path, const Bytes& data)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw BackendError("cannot write " + path.string());
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out)
        throw BackendError("short write to " + path.string());
}

Bytes read_file(const fs::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw BackendError("image tool produced no output file");
    return Bytes(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::optional<int> match_int(const std::string& text, const std::regex& re)
{
    std::smatch m;
    if (!std::regex_search(text, m, re) || m.size() < 2)
        return std::nullopt;
    try
    {
        return std::stoi(m[1].str());
    }
    catch (const std::exception&)
    {
        return std::nullopt;
    }
}

} // namespace

ExternalToolOptions ExternalToolOptions::from_settings(const Settings& settings)
{
    ExternalToolOptions o;
    o.executable = settings.external_tool;
    o.metadata_timeout = std::chrono::milliseconds(settings.metadata_timeout_ms);
    o.metadata_max_output = settings.metadata_max_output;
    o.resize_timeout = std::chrono::milliseconds(settings.resize_timeout_ms);
    o.resize_max_output = settings.resize_max_output;
    return o;
}

ExternalToolBackend::ExternalToolBackend(ExternalToolOptions options, Logger logger)
    : options_(std::move(options)), logger_(std::move(logger))
{
}

std::optional<ImageMetadata> ExternalToolBackend::query_dimensions(const Bytes& buffer) const
{
    util::ScopedTempDir dir(options_.temp_prefix);
    fs::path input = dir.path() / "in.img";
    write_file(input, buffer);

    process::RunOptions run;
    run.timeout = options_.metadata_timeout;
    run.max_output = options_.metadata_max_output;
    auto result = process::run(options_.executable,
                               {"-g", "pixelWidth", "-g", "pixelHeight", input.string()}, run);

    static const std::regex width_re(R"(pixelWidth:\s*([0-9]+))");
    static const std::regex height_re(R"(pixelHeight:\s*([0-9]+))");
    auto width = match_int(result.stdout_data, width_re);
    auto height = match_int(result.stdout_data, height_re);
    if (!width || !height || *width <= 0 || *height <= 0)
        return std::nullopt;
    return ImageMetadata{*width, *height};
}

std::optional<ImageMetadata> ExternalToolBackend::metadata(const Bytes& buffer) const
{
    try
    {
        return query_dimensions(buffer);
    }
    catch (const std::exception& e)
    {
        logger_.debug(std::string("image tool metadata failed: ") + e.what());
        return std::nullopt;
    }
}

Bytes ExternalToolBackend::resize_to_jpeg(const Bytes& buffer, int max_side, int quality) const
{
    util::ScopedTempDir dir(options_.temp_prefix);
    fs::path input = dir.path() / "in.img";
    fs::path output = dir.path() / "out.jpg";
    write_file(input, buffer);

    process::RunOptions run;
    run.timeout = options_.resize_timeout;
    run.max_output = options_.resize_max_output;
    process::run(options_.executable,
                 {"-Z", std::to_string(std::max(1, max_side)), "-s", "format", "jpeg", "-s",
                  "formatOptions", std::to_string(std::clamp(quality, 1, 100)), input.string(),
                  "--out", output.string()},
                 run);

    Bytes out = read_file(output);
    if (out.empty())
        throw BackendError("image tool produced an empty output file");
    return out;
}

Bytes ExternalToolBackend::resize(const Bytes& buffer, const ResizeOptions& options) const
{
    int target = options.max_side;
    if (options.without_enlargement)
    {
        if (auto meta = metadata(buffer))
        {
            int max_dim = std::max(meta->width, meta->height);
            if (max_dim > 0 && max_dim <= options.max_side)
                target = max_dim;
        }
    }
    logger_.debug("image tool resize to " + std::to_string(target) + "px");
    return resize_to_jpeg(buffer, target, options.quality);
}

} // namespace toolmedia::media
