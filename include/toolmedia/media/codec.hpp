#pragma once
#include "toolmedia/types.hpp"

#include <optional>
#include <string>
#include <utility>

namespace toolmedia::media
{

struct ImageMetadata
{
    int width{0};
    int height{0};
};

/// Encodings the in-process codecs can write
enum class ImageFormat
{
    Jpeg,
    Png,
    Webp
};

std::string to_string(ImageFormat format);

/// JPEG for image/jpeg (and image/jpg), WebP for image/webp, PNG for everything else
ImageFormat output_format_for_mime(const std::string& mime_type);

/// Tightly packed 8-bit RGBA pixels
struct Pixmap
{
    int width{0};
    int height{0};
    Bytes rgba;

    Pixmap() = default;
    Pixmap(int w, int h) : width(w), height(h), rgba(static_cast<size_t>(w) * h * 4, 0) {}

    std::uint8_t* pixel(int x, int y)
    {
        return rgba.data() + (static_cast<size_t>(y) * width + x) * 4;
    }
    const std::uint8_t* pixel(int x, int y) const
    {
        return rgba.data() + (static_cast<size_t>(y) * width + x) * 4;
    }
};

/// True when the build links libwebp
bool webp_supported();

/// Decodes JPEG, PNG or WebP. Throws ImageDecodeError.
Pixmap decode_image(const Bytes& buffer);

/// Throws BackendError if the encoder fails or is unavailable
Bytes encode_image(const Pixmap& image, ImageFormat format, int quality);

Bytes encode_jpeg(const Pixmap& image, int quality);
Bytes encode_png(const Pixmap& image);
Bytes encode_webp(const Pixmap& image, int quality);

/// Reads declared dimensions from the header only (JPEG, PNG, WebP, GIF, BMP).
/// Returns std::nullopt on any error or non-positive dimension.
std::optional<ImageMetadata> read_dimensions(const Bytes& buffer);

/// Size that fits inside max_side x max_side keeping the aspect ratio.
/// With without_enlargement, images already inside the box keep their size.
std::pair<int, int> fit_inside(int width, int height, int max_side, bool without_enlargement);

/// Area-averaging resample through OpenCV INTER_AREA; premultiplies alpha
/// when any pixel is translucent
Pixmap resize_area(const Pixmap& src, int width, int height);

} // namespace toolmedia::media
