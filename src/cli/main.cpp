#include "toolmedia/content.hpp"
#include "toolmedia/exceptions.hpp"
#include "toolmedia/logging.hpp"
#include "toolmedia/media/image_ops.hpp"
#include "toolmedia/media/mime.hpp"
#include "toolmedia/sanitize/content_sanitizer.hpp"
#include "toolmedia/sanitize/read_result.hpp"
#include "toolmedia/settings.hpp"
#include "toolmedia/version.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace
{

static int usage(int exit_code = 1)
{
    std::cout << "toolmedia " << toolmedia::version_string() << "\n";
    std::cout << "Usage:\n";
    std::cout << "  toolmedia --help\n";
    std::cout << "  toolmedia --version\n";
    std::cout << "  toolmedia sniff    <file>\n";
    std::cout << "  toolmedia probe    <file>\n";
    std::cout << "  toolmedia resize   <in> <out> [--max-side <n>] [--quality <q>] [--jpeg]\n";
    std::cout << "  toolmedia sanitize [--label <l>] [--max-dim <n>] [--read-path <p>] [file|-]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --verbose                      Log at DEBUG level\n";
    std::cout << "\n";
    std::cout << "Environment:\n";
    std::cout << "  TOOLMEDIA_LOG_LEVEL            DEBUG, INFO, WARN or ERROR\n";
    std::cout << "  TOOLMEDIA_IMAGE_BACKEND        native or external-tool\n";
    std::cout << "  TOOLMEDIA_MAX_IMAGE_DIMENSION  Default threshold for sanitize (2000)\n";
    std::cout << "  TOOLMEDIA_RESIZE_QUALITY       JPEG/WebP quality 1-100 (85)\n";
    std::cout << "  TOOLMEDIA_IMAGE_TOOL           External image tool (/usr/bin/sips)\n";
    return exit_code;
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static std::optional<int> parse_int(const std::string& s)
{
    try
    {
        size_t pos = 0;
        int v = std::stoi(s, &pos, 10);
        if (pos != s.size())
            return std::nullopt;
        return v;
    }
    catch (const std::exception&)
    {
        return std::nullopt;
    }
}

static std::string reject_unknown_flags(const std::vector<std::string>& args)
{
    for (const auto& a : args)
        if (a.size() > 1 && a[0] == '-')
            return a;
    return std::string();
}

static toolmedia::Bytes read_file(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw toolmedia::NotFoundError("cannot open " + path);
    return toolmedia::Bytes(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void write_file(const std::string& path, const toolmedia::Bytes& data)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw toolmedia::Error("cannot write " + path);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out)
        throw toolmedia::Error("short write to " + path);
}

static std::string read_text(const std::string& path)
{
    if (path == "-")
    {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        return ss.str();
    }
    auto bytes = read_file(path);
    return std::string(bytes.begin(), bytes.end());
}

static std::string sniff_bytes(const toolmedia::Bytes& data)
{
    auto mime = toolmedia::media::detect_mime(
        data.data(), std::min(data.size(), toolmedia::media::kSniffPrefixBytes));
    return mime ? *mime : std::string("unknown");
}

static int run_sniff(const std::vector<std::string>& args)
{
    if (args.size() != 1)
        return usage(2);
    std::cout << sniff_bytes(read_file(args[0])) << "\n";
    return 0;
}

static int run_probe(const std::vector<std::string>& args, const toolmedia::Settings& settings,
                     const toolmedia::Logger& logger)
{
    if (args.size() != 1)
        return usage(2);
    auto ops = toolmedia::media::ImageOps::from_settings(settings, logger);
    auto data = read_file(args[0]);
    auto meta = ops->get_image_metadata(data);
    if (!meta)
        throw toolmedia::ImageDecodeError("cannot read image dimensions of " + args[0]);

    toolmedia::Json out = {{"width", meta->width},
                           {"height", meta->height},
                           {"mimeType", sniff_bytes(data)},
                           {"backend", toolmedia::media::to_string(ops->preferred_backend())}};
    std::cout << out.dump() << "\n";
    return 0;
}

static int run_resize(std::vector<std::string> args, const toolmedia::Settings& settings,
                      const toolmedia::Logger& logger)
{
    toolmedia::media::ResizeOptions opts;
    opts.max_side = settings.max_dimension_px;
    opts.quality = settings.resize_quality;

    if (auto v = consume_flag_value(args, "--max-side"))
    {
        auto n = parse_int(*v);
        if (!n || *n < 1)
        {
            std::cerr << "Invalid --max-side: " << *v << "\n";
            return 2;
        }
        opts.max_side = *n;
    }
    if (auto v = consume_flag_value(args, "--quality"))
    {
        auto n = parse_int(*v);
        if (!n || *n < 1 || *n > 100)
        {
            std::cerr << "Invalid --quality: " << *v << "\n";
            return 2;
        }
        opts.quality = *n;
    }
    bool to_jpeg = consume_flag(args, "--jpeg");

    if (auto bad = reject_unknown_flags(args); !bad.empty())
    {
        std::cerr << "Unknown option: " << bad << "\n";
        return 2;
    }
    if (args.size() != 2)
        return usage(2);

    auto ops = toolmedia::media::ImageOps::from_settings(settings, logger);
    auto input = read_file(args[0]);

    toolmedia::media::ResizedImage result;
    if (to_jpeg)
    {
        result.data = ops->resize_to_jpeg(input, opts);
        result.mime_type = "image/jpeg";
    }
    else
    {
        result = ops->resize_image(input, sniff_bytes(input), opts);
    }
    write_file(args[1], result.data);

    toolmedia::Json out = {{"path", args[1]},
                           {"mimeType", result.mime_type},
                           {"bytes", result.data.size()}};
    if (auto meta = toolmedia::media::read_dimensions(result.data))
    {
        out["width"] = meta->width;
        out["height"] = meta->height;
    }
    std::cout << out.dump() << "\n";
    return 0;
}

static int run_sanitize(std::vector<std::string> args, const toolmedia::Settings& settings,
                        const toolmedia::Logger& logger)
{
    toolmedia::sanitize::SanitizeOptions opts;
    opts.max_dimension_px = settings.max_dimension_px;

    auto label = consume_flag_value(args, "--label");
    auto read_path = consume_flag_value(args, "--read-path");
    if (auto v = consume_flag_value(args, "--max-dim"))
    {
        auto n = parse_int(*v);
        if (!n)
        {
            std::cerr << "Invalid --max-dim: " << *v << "\n";
            return 2;
        }
        opts.max_dimension_px = *n;
    }

    std::vector<std::string> positional;
    for (const auto& a : args)
    {
        if (a != "-" && !a.empty() && a[0] == '-')
        {
            std::cerr << "Unknown option: " << a << "\n";
            return 2;
        }
        positional.push_back(a);
    }
    if (positional.size() > 1)
        return usage(2);

    toolmedia::Json raw = toolmedia::Json::parse(read_text(positional.empty() ? "-" : positional[0]));
    auto result = raw.get<toolmedia::ToolResult>();
    if (!toolmedia::has_media_blocks(result.content))
    {
        std::cout << raw.dump(2) << "\n";
        return 0;
    }

    std::string effective_label = label ? *label : "cli";
    if (read_path)
    {
        result = toolmedia::sanitize::normalize_read_image_result(result, *read_path);
        if (!label)
            effective_label = "read:" + *read_path;
    }

    auto sanitizer = toolmedia::sanitize::ContentSanitizer::from_settings(settings, logger);
    toolmedia::Json out;
    toolmedia::to_json(out, sanitizer->sanitize(result, effective_label, opts));
    std::cout << out.dump(2) << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
        return usage();

    std::vector<std::string> args(argv + 1, argv + argc);
    bool verbose = consume_flag(args, "--verbose");
    if (args.empty())
        return usage();

    std::string cmd = args.front();
    args.erase(args.begin());

    if (cmd == "--help" || cmd == "-h")
        return usage(0);
    if (cmd == "--version")
    {
        std::cout << toolmedia::version_string() << "\n";
        return 0;
    }

    try
    {
        auto settings = toolmedia::Settings::from_env();
        if (verbose)
            settings.log_level = "DEBUG";
        toolmedia::Logger logger(toolmedia::log_level_from_string(settings.log_level));

        if (cmd == "sniff")
            return run_sniff(args);
        if (cmd == "probe")
            return run_probe(args, settings, logger);
        if (cmd == "resize")
            return run_resize(args, settings, logger);
        if (cmd == "sanitize")
            return run_sanitize(args, settings, logger);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    return usage(2);
}
