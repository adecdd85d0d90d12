#include "toolmedia/media/image_ops.hpp"

#include "toolmedia/exceptions.hpp"
#include "toolmedia/media/external_tool_backend.hpp"
#include "toolmedia/media/mime.hpp"
#include "toolmedia/media/native_backend.hpp"
#include "toolmedia/settings.hpp"

#include <algorithm>

namespace toolmedia::media
{

ImageOps::ImageOps(BackendEnvironment env, std::shared_ptr<const ImageBackend> native,
                   std::shared_ptr<const ImageBackend> external, Logger logger)
    : env_(std::move(env)), native_(std::move(native)), external_(std::move(external)),
      logger_(std::move(logger))
{
    if (!native_ || !external_)
        throw ValidationError("ImageOps requires both a native and an external backend");
}

std::shared_ptr<ImageOps> ImageOps::from_settings(const Settings& settings, Logger logger)
{
    auto env = BackendEnvironment::detect(settings);
    logger.debug("image backend: " + to_string(select_backend(env)) + " (os=" + env.os +
                 ", native_loadable=" + (env.native_loadable ? "true" : "false") + ")");
    return std::make_shared<ImageOps>(
        env, std::make_shared<NativeBackend>(),
        std::make_shared<ExternalToolBackend>(ExternalToolOptions::from_settings(settings), logger),
        logger);
}

const ImageBackend& ImageOps::backend(BackendKind kind) const
{
    return kind == BackendKind::ExternalTool ? *external_ : *native_;
}

std::optional<ImageMetadata> ImageOps::get_image_metadata(const Bytes& buffer) const
{
    return get_image_metadata(buffer, env_);
}

std::optional<ImageMetadata> ImageOps::get_image_metadata(const Bytes& buffer,
                                                          const BackendEnvironment& env) const
{
    auto meta = backend(select_backend(env)).metadata(buffer);
    if (meta && (meta->width <= 0 || meta->height <= 0))
        return std::nullopt;
    return meta;
}

Bytes ImageOps::resize_to_jpeg(const Bytes& buffer, ResizeOptions options) const
{
    return resize_to_jpeg(buffer, options, env_);
}

Bytes ImageOps::resize_to_jpeg(const Bytes& buffer, ResizeOptions options,
                               const BackendEnvironment& env) const
{
    options.format = ImageFormat::Jpeg;
    return backend(select_backend(env)).resize(buffer, options);
}

ResizedImage ImageOps::resize_image(const Bytes& buffer, const std::string& mime_type,
                                    ResizeOptions options) const
{
    return resize_image(buffer, mime_type, options, env_);
}

ResizedImage ImageOps::resize_image(const Bytes& buffer, const std::string& mime_type,
                                    ResizeOptions options, const BackendEnvironment& env) const
{
    options.format = output_format_for_mime(mime_type);

    Bytes out;
    if (select_backend(env) == BackendKind::ExternalTool)
    {
        out = external_->resize(buffer, options);
    }
    else
    {
        try
        {
            out = native_->resize(buffer, options);
        }
        catch (const std::exception& e)
        {
            logger_.warn(std::string("native resize failed, falling back to ") +
                         external_->name() + ": " + e.what());
            out = external_->resize(buffer, options);
        }
    }

    auto sniffed = detect_mime(out.data(), std::min(out.size(), kSniffPrefixBytes));
    ResizedImage result;
    result.mime_type = (sniffed && is_image_mime(*sniffed)) ? *sniffed : mime_type;
    result.data = std::move(out);
    return result;
}

} // namespace toolmedia::media
