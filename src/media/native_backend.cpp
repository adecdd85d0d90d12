#include "toolmedia/media/native_backend.hpp"

#include "toolmedia/exceptions.hpp"

namespace toolmedia::media
{

std::optional<ImageMetadata> NativeBackend::metadata(const Bytes& buffer) const
{
    try
    {
        return read_dimensions(buffer);
    }
    catch (const std::exception&)
    {
        return std::nullopt;
    }
}

Bytes NativeBackend::resize(const Bytes& buffer, const ResizeOptions& options) const
{
    if (options.format == ImageFormat::Webp && !webp_supported())
        throw BackendError("native backend cannot encode webp: libwebp not available");

    Pixmap decoded = decode_image(buffer);
    auto [width, height] =
        fit_inside(decoded.width, decoded.height, options.max_side, options.without_enlargement);
    Pixmap resized = resize_area(decoded, width, height);
    return encode_image(resized, options.format, options.quality);
}

bool NativeBackend::runtime_available()
{
    try
    {
        Pixmap probe(1, 1);
        probe.rgba = {255, 0, 0, 255};
        Pixmap back = decode_image(encode_png(probe));
        return back.width == 1 && back.height == 1 && back.rgba[0] == 255;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

} // namespace toolmedia::media
