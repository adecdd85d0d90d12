#include "toolmedia/sanitize/read_result.hpp"

#include "toolmedia/exceptions.hpp"
#include "toolmedia/media/mime.hpp"
#include "toolmedia/util/base64.hpp"

namespace toolmedia::sanitize
{

namespace
{

const std::string kHeaderPrefix = "Read image file [";

bool is_read_image_header(const std::string& text)
{
    return text.size() > kHeaderPrefix.size() && text.compare(0, kHeaderPrefix.size(), kHeaderPrefix) == 0 &&
           text.back() == ']';
}

} // namespace

std::string read_image_header(const std::string& mime_type)
{
    return kHeaderPrefix + mime_type + "]";
}

ToolResult normalize_read_image_result(const ToolResult& result, const std::string& file_path)
{
    const ImageContent* image = nullptr;
    for (const auto& block : result.content)
    {
        if ((image = std::get_if<ImageContent>(&block)))
            break;
    }
    if (!image)
        return result;

    if (util::base64::trim(image->data).empty())
        throw ReadImageError("read: image payload is empty (" + file_path + ")");

    auto sniffed = media::sniff_mime_from_base64(image->data);
    if (!sniffed)
        return result;

    if (!media::is_image_mime(*sniffed))
        throw ReadImageError("read: file looks like " + *sniffed + " but was treated as " +
                             image->mimeType + " (" + file_path + ")");

    if (*sniffed == image->mimeType)
        return result;

    ToolResult next;
    next.extra = result.extra;
    next.content.reserve(result.content.size());
    for (const auto& block : result.content)
    {
        if (const auto* img = std::get_if<ImageContent>(&block))
        {
            ImageContent relabeled = *img;
            relabeled.mimeType = *sniffed;
            next.content.push_back(std::move(relabeled));
        }
        else if (const auto* text = std::get_if<TextContent>(&block))
        {
            TextContent rewritten = *text;
            if (is_read_image_header(text->text))
                rewritten.text = read_image_header(*sniffed);
            next.content.push_back(std::move(rewritten));
        }
        else
        {
            next.content.push_back(block);
        }
    }
    return next;
}

} // namespace toolmedia::sanitize
