#include "toolmedia/tools/media_tools.hpp"

#include "toolmedia/exceptions.hpp"
#include "toolmedia/sanitize/read_result.hpp"

namespace toolmedia::tools
{

namespace
{

bool has_media_json(const Json& result)
{
    if (!result.is_object())
        return false;
    auto content = result.find("content");
    if (content == result.end() || !content->is_array())
        return false;
    for (const auto& item : *content)
    {
        if (!item.is_object() || !item.contains("type"))
            continue;
        const auto& type = item["type"];
        if (type == "image" || type == "text")
            return true;
    }
    return false;
}

Json sanitize_json(const Json& raw, const sanitize::ContentSanitizer& sanitizer,
                   const std::string& label, const sanitize::SanitizeOptions& options)
{
    if (!has_media_json(raw))
        return raw;
    ToolResult result = raw.get<ToolResult>();
    Json out;
    to_json(out, sanitizer.sanitize(result, label, options));
    return out;
}

void require_sanitizer(const std::shared_ptr<const sanitize::ContentSanitizer>& sanitizer)
{
    if (!sanitizer)
        throw ValidationError("media tool wrapper requires a sanitizer");
}

} // namespace

std::string read_path_argument(const Json& args)
{
    if (args.is_object())
    {
        auto it = args.find("path");
        if (it != args.end() && it->is_string())
            return it->get<std::string>();
    }
    return "<unknown>";
}

Tool wrap_read_tool(Tool base, std::shared_ptr<const sanitize::ContentSanitizer> sanitizer,
                    sanitize::SanitizeOptions options)
{
    require_sanitizer(sanitizer);
    return base.with_fn(
        [base, sanitizer, options](const Json& args)
        {
            Json raw = base.invoke(args);
            if (!has_media_json(raw))
                return raw;

            std::string path = read_path_argument(args);
            ToolResult normalized =
                sanitize::normalize_read_image_result(raw.get<ToolResult>(), path);
            Json out;
            to_json(out, sanitizer->sanitize(normalized, "read:" + path, options));
            return out;
        });
}

Tool wrap_bash_tool(Tool base, std::shared_ptr<const sanitize::ContentSanitizer> sanitizer,
                    sanitize::SanitizeOptions options)
{
    require_sanitizer(sanitizer);
    return base.with_fn([base, sanitizer, options](const Json& args)
                        { return sanitize_json(base.invoke(args), *sanitizer, kBashToolName, options); });
}

std::vector<Tool> wrap_media_tools(const std::vector<Tool>& tools,
                                   std::shared_ptr<const sanitize::ContentSanitizer> sanitizer,
                                   sanitize::SanitizeOptions options)
{
    std::vector<Tool> out;
    out.reserve(tools.size());
    for (const auto& tool : tools)
    {
        if (tool.name() == kReadToolName)
            out.push_back(wrap_read_tool(tool, sanitizer, options));
        else if (tool.name() == kBashToolName)
            out.push_back(wrap_bash_tool(tool, sanitizer, options));
        else
            out.push_back(tool);
    }
    return out;
}

void wrap_media_tools(ToolManager& manager,
                      std::shared_ptr<const sanitize::ContentSanitizer> sanitizer,
                      sanitize::SanitizeOptions options)
{
    for (auto& tool : wrap_media_tools(manager.list(), std::move(sanitizer), options))
        manager.register_tool(tool);
}

} // namespace toolmedia::tools
