#pragma once
#include "toolmedia/media/image_backend.hpp"

namespace toolmedia::media
{

/// libjpeg / libpng / libwebp, in process
class NativeBackend : public ImageBackend
{
  public:
    BackendKind kind() const override
    {
        return BackendKind::Native;
    }
    std::string name() const override
    {
        return "native";
    }

    std::optional<ImageMetadata> metadata(const Bytes& buffer) const override;
    Bytes resize(const Bytes& buffer, const ResizeOptions& options) const override;

    /// Encodes and decodes a 1x1 PNG; false if the codec libraries misbehave
    static bool runtime_available();
};

} // namespace toolmedia::media
