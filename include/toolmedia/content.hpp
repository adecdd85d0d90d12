#pragma once
#include "toolmedia/types.hpp"

#include <string>
#include <variant>
#include <vector>

namespace toolmedia
{

struct TextContent
{
    std::string type{"text"};
    std::string text;
    Json extra = Json::object(); // unrecognized keys, kept verbatim
};

struct ImageContent
{
    std::string type{"image"};
    std::string data;     // base64-encoded image bytes
    std::string mimeType; // e.g., "image/png"
    Json extra = Json::object();
};

/// Any block that is neither a well-formed image nor text block
struct OtherContent
{
    Json raw;
};

using ContentBlock = std::variant<TextContent, ImageContent, OtherContent>;

/// Result of one tool execution. Fields other than `content` live in `extra`.
struct ToolResult
{
    std::vector<ContentBlock> content;
    Json extra = Json::object();
};

inline bool is_image(const ContentBlock& block)
{
    return std::holds_alternative<ImageContent>(block);
}

inline bool is_text(const ContentBlock& block)
{
    return std::holds_alternative<TextContent>(block);
}

/// True when at least one image or text block is present
bool has_media_blocks(const std::vector<ContentBlock>& blocks);

TextContent make_text(std::string text);

ContentBlock content_block_from_json(const Json& j);

// nlohmann::json adapters
void to_json(Json& j, const TextContent& c);
void to_json(Json& j, const ImageContent& c);
void to_json(Json& j, const OtherContent& c);
void to_json(Json& j, const ContentBlock& block);
void to_json(Json& j, const ToolResult& r);
void from_json(const Json& j, ToolResult& r);

} // namespace toolmedia
