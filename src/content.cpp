#include "toolmedia/content.hpp"

#include <algorithm>
#include <initializer_list>

namespace toolmedia
{

namespace
{

Json strip_keys(const Json& j, std::initializer_list<const char*> keys)
{
    Json extra = j;
    for (const char* key : keys)
        extra.erase(std::string(key));
    return extra;
}

} // namespace

bool has_media_blocks(const std::vector<ContentBlock>& blocks)
{
    return std::any_of(blocks.begin(), blocks.end(),
                       [](const ContentBlock& b) { return is_image(b) || is_text(b); });
}

TextContent make_text(std::string text)
{
    TextContent t;
    t.text = std::move(text);
    return t;
}

ContentBlock content_block_from_json(const Json& j)
{
    if (!j.is_object())
        return OtherContent{j};

    auto type = j.find("type");
    if (type == j.end() || !type->is_string())
        return OtherContent{j};

    if (*type == "image")
    {
        auto data = j.find("data");
        auto mime = j.find("mimeType");
        if (data == j.end() || mime == j.end() || !data->is_string() || !mime->is_string())
            return OtherContent{j};

        ImageContent img;
        img.data = data->get<std::string>();
        img.mimeType = mime->get<std::string>();
        img.extra = strip_keys(j, {"type", "data", "mimeType"});
        return img;
    }

    if (*type == "text")
    {
        auto text = j.find("text");
        if (text == j.end() || !text->is_string())
            return OtherContent{j};

        TextContent t;
        t.text = text->get<std::string>();
        t.extra = strip_keys(j, {"type", "text"});
        return t;
    }

    return OtherContent{j};
}

void to_json(Json& j, const TextContent& c)
{
    j = c.extra.is_object() ? c.extra : Json::object();
    j["type"] = c.type;
    j["text"] = c.text;
}

void to_json(Json& j, const ImageContent& c)
{
    j = c.extra.is_object() ? c.extra : Json::object();
    j["type"] = c.type;
    j["data"] = c.data;
    j["mimeType"] = c.mimeType;
}

void to_json(Json& j, const OtherContent& c)
{
    j = c.raw;
}

void to_json(Json& j, const ContentBlock& block)
{
    std::visit([&j](const auto& b) { to_json(j, b); }, block);
}

void to_json(Json& j, const ToolResult& r)
{
    j = r.extra.is_object() ? r.extra : Json::object();
    Json content = Json::array();
    for (const auto& block : r.content)
    {
        Json item;
        to_json(item, block);
        content.push_back(std::move(item));
    }
    j["content"] = std::move(content);
}

void from_json(const Json& j, ToolResult& r)
{
    r.content.clear();
    r.extra = Json::object();
    if (!j.is_object())
        return;

    r.extra = strip_keys(j, {"content"});
    auto content = j.find("content");
    if (content == j.end() || !content->is_array())
        return;

    r.content.reserve(content->size());
    for (const auto& item : *content)
        r.content.push_back(content_block_from_json(item));
}

} // namespace toolmedia
