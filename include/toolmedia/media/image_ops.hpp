#pragma once
#include "toolmedia/logging.hpp"
#include "toolmedia/media/image_backend.hpp"

#include <memory>
#include <optional>
#include <string>

namespace toolmedia
{
struct Settings;
}

namespace toolmedia::media
{

struct ResizedImage
{
    Bytes data;
    std::string mime_type;
};

/// Entry point for metadata probing and resizing. The backend is chosen by
/// select_backend() on every call, from the stored environment or one passed
/// explicitly.
class ImageOps
{
  public:
    ImageOps(BackendEnvironment env, std::shared_ptr<const ImageBackend> native,
             std::shared_ptr<const ImageBackend> external, Logger logger = Logger{});

    /// NativeBackend + ExternalToolBackend configured from settings
    static std::shared_ptr<ImageOps> from_settings(const Settings& settings,
                                                   Logger logger = Logger{});

    const BackendEnvironment& environment() const
    {
        return env_;
    }

    BackendKind preferred_backend() const
    {
        return select_backend(env_);
    }

    const ImageBackend& backend(BackendKind kind) const;

    /// Dimensions or std::nullopt; never throws
    std::optional<ImageMetadata> get_image_metadata(const Bytes& buffer) const;
    std::optional<ImageMetadata> get_image_metadata(const Bytes& buffer,
                                                    const BackendEnvironment& env) const;

    /// Downscale and always re-encode as JPEG
    Bytes resize_to_jpeg(const Bytes& buffer, ResizeOptions options) const;
    Bytes resize_to_jpeg(const Bytes& buffer, ResizeOptions options,
                         const BackendEnvironment& env) const;

    /// Downscale keeping the format family of `mime_type` where the backend
    /// can (JPEG, WebP; PNG otherwise). A failing native backend falls back to
    /// the external tool. The returned MIME type is sniffed from the output.
    ResizedImage resize_image(const Bytes& buffer, const std::string& mime_type,
                              ResizeOptions options) const;
    ResizedImage resize_image(const Bytes& buffer, const std::string& mime_type,
                              ResizeOptions options, const BackendEnvironment& env) const;

  private:
    BackendEnvironment env_;
    std::shared_ptr<const ImageBackend> native_;
    std::shared_ptr<const ImageBackend> external_;
    Logger logger_;
};

} // namespace toolmedia::media
