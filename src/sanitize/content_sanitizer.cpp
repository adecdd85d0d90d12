#include "toolmedia/sanitize/content_sanitizer.hpp"

#include "toolmedia/exceptions.hpp"
#include "toolmedia/media/mime.hpp"
#include "toolmedia/settings.hpp"
#include "toolmedia/util/base64.hpp"

#include <algorithm>

namespace toolmedia::sanitize
{

ContentSanitizer::ContentSanitizer(std::shared_ptr<const media::ImageOps> ops, int quality,
                                   Logger logger)
    : ops_(std::move(ops)), quality_(std::clamp(quality, 1, 100)), logger_(std::move(logger))
{
    if (!ops_)
        throw ValidationError("ContentSanitizer requires ImageOps");
}

std::shared_ptr<ContentSanitizer> ContentSanitizer::from_settings(const Settings& settings,
                                                                  Logger logger)
{
    return std::make_shared<ContentSanitizer>(media::ImageOps::from_settings(settings, logger),
                                              settings.resize_quality, logger);
}

ContentBlock ContentSanitizer::sanitize_image(const ImageContent& block, const std::string& label,
                                              int max_dimension_px) const
{
    std::string data = util::base64::trim(block.data);
    if (data.empty())
        return make_text("[" + label + "] omitted empty image payload");

    try
    {
        Bytes buffer = util::base64::decode(data);
        auto meta = ops_->get_image_metadata(buffer);
        ImageContent out = block;
        out.data = data;

        auto sniffed = media::sniff_mime_from_base64(data);
        if (sniffed && media::is_image_mime(*sniffed) && *sniffed != block.mimeType)
        {
            logger_.debug("[" + label + "] declared " + block.mimeType + " but bytes are " +
                          *sniffed);
            out.mimeType = *sniffed;
        }

        if (!meta)
        {
            logger_.debug("[" + label + "] image size unknown, forwarding as is");
            return out;
        }
        if (meta->width <= max_dimension_px && meta->height <= max_dimension_px)
            return out;

        media::ResizeOptions opts;
        opts.max_side = max_dimension_px;
        opts.quality = quality_;
        opts.without_enlargement = true;
        auto resized = ops_->resize_image(buffer, block.mimeType, opts);

        logger_.debug("[" + label + "] resized " + std::to_string(meta->width) + "x" +
                      std::to_string(meta->height) + " " + block.mimeType + " -> " +
                      resized.mime_type + " (" + std::to_string(resized.data.size()) + " bytes)");
        out.data = util::base64::encode(resized.data);
        out.mimeType = resized.mime_type;
        return out;
    }
    catch (const std::exception& e)
    {
        logger_.warn("[" + label + "] omitted image payload: " + e.what());
        return make_text("[" + label + "] omitted image payload: " + e.what());
    }
}

std::vector<ContentBlock> ContentSanitizer::sanitize_blocks(const std::vector<ContentBlock>& blocks,
                                                            const std::string& label,
                                                            const SanitizeOptions& options) const
{
    int max_dimension_px = std::max(options.max_dimension_px, 1);

    std::vector<ContentBlock> out;
    out.reserve(blocks.size());
    for (const auto& block : blocks)
    {
        if (const auto* image = std::get_if<ImageContent>(&block))
            out.push_back(sanitize_image(*image, label, max_dimension_px));
        else
            out.push_back(block);
    }
    return out;
}

ToolResult ContentSanitizer::sanitize(const ToolResult& result, const std::string& label,
                                      const SanitizeOptions& options) const
{
    if (!has_media_blocks(result.content))
        return result;

    ToolResult next;
    next.extra = result.extra;
    next.content = sanitize_blocks(result.content, label, options);
    return next;
}

} // namespace toolmedia::sanitize
