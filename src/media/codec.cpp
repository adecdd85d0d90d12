#include "toolmedia/media/codec.hpp"

#include "toolmedia/exceptions.hpp"
#include "toolmedia/media/mime.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <vector>

#include <jpeglib.h>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <png.h>

#ifdef TOOLMEDIA_HAS_WEBP
#include <webp/decode.h>
#include <webp/encode.h>
#endif

namespace toolmedia::media
{

namespace
{

// Refuse to allocate pixel buffers for absurd declared sizes
constexpr long long kMaxPixels = 50LL * 1000 * 1000;

void check_pixel_budget(long long width, long long height)
{
    if (width <= 0 || height <= 0)
        throw ImageDecodeError("image has invalid dimensions " + std::to_string(width) + "x" +
                               std::to_string(height));
    if (width * height > kMaxPixels)
        throw ImageDecodeError("image too large to decode: " + std::to_string(width) + "x" +
                               std::to_string(height));
}

uint16_t le16(const uint8_t* p)
{
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

int32_t le32(const uint8_t* p)
{
    return static_cast<int32_t>(static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
                                (static_cast<uint32_t>(p[2]) << 16) |
                                (static_cast<uint32_t>(p[3]) << 24));
}

// =============================================================================
// JPEG (libjpeg)
// =============================================================================

struct JpegErrorMgr
{
    jpeg_error_mgr pub;
    jmp_buf setjmp_buffer;
    char message[JMSG_LENGTH_MAX];
};

void jpeg_error_exit(j_common_ptr cinfo)
{
    auto* err = reinterpret_cast<JpegErrorMgr*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->message);
    longjmp(err->setjmp_buffer, 1);
}

void jpeg_silence(j_common_ptr, int) {}

// No objects with non-trivial destructors may live in these frames: longjmp
// skips them. Buffers are owned by the caller.
bool jpeg_read_size(const Bytes& buffer, int& width, int& height)
{
    jpeg_decompress_struct cinfo;
    JpegErrorMgr jerr;
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit;
    jerr.pub.emit_message = jpeg_silence;
    jerr.message[0] = '\0';

    if (setjmp(jerr.setjmp_buffer))
    {
        jpeg_destroy_decompress(&cinfo);
        return false;
    }

    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo, const_cast<unsigned char*>(buffer.data()),
                 static_cast<unsigned long>(buffer.size()));
    jpeg_read_header(&cinfo, TRUE);
    width = static_cast<int>(cinfo.image_width);
    height = static_cast<int>(cinfo.image_height);
    jpeg_destroy_decompress(&cinfo);
    return true;
}

bool jpeg_decode(const Bytes& buffer, Pixmap& out, std::vector<JSAMPLE>& row, char* message)
{
    jpeg_decompress_struct cinfo;
    JpegErrorMgr jerr;
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit;
    jerr.pub.emit_message = jpeg_silence;
    jerr.message[0] = '\0';

    if (setjmp(jerr.setjmp_buffer))
    {
        std::snprintf(message, JMSG_LENGTH_MAX, "%s", jerr.message);
        jpeg_destroy_decompress(&cinfo);
        return false;
    }

    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo, const_cast<unsigned char*>(buffer.data()),
                 static_cast<unsigned long>(buffer.size()));
    jpeg_read_header(&cinfo, TRUE);
    if (static_cast<long long>(cinfo.image_width) * cinfo.image_height > kMaxPixels)
    {
        std::snprintf(message, JMSG_LENGTH_MAX, "image too large to decode: %ux%u",
                      cinfo.image_width, cinfo.image_height);
        jpeg_destroy_decompress(&cinfo);
        return false;
    }
    cinfo.out_color_space = JCS_RGB;
    jpeg_start_decompress(&cinfo);

    out.width = static_cast<int>(cinfo.output_width);
    out.height = static_cast<int>(cinfo.output_height);
    out.rgba.assign(static_cast<size_t>(out.width) * out.height * 4, 255);
    row.resize(static_cast<size_t>(cinfo.output_width) * cinfo.output_components);

    while (cinfo.output_scanline < cinfo.output_height)
    {
        JSAMPROW rows[1] = {row.data()};
        int y = static_cast<int>(cinfo.output_scanline);
        jpeg_read_scanlines(&cinfo, rows, 1);
        uint8_t* dst = out.pixel(0, y);
        const JSAMPLE* src = row.data();
        for (int x = 0; x < out.width; ++x)
        {
            dst[0] = src[0];
            dst[1] = src[1];
            dst[2] = src[2];
            src += 3;
            dst += 4;
        }
    }

    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);
    return true;
}

bool jpeg_encode(const Pixmap& image, int quality, std::vector<JSAMPLE>& row, unsigned char** out,
                 unsigned long* out_size, char* message)
{
    jpeg_compress_struct cinfo;
    JpegErrorMgr jerr;
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit;
    jerr.pub.emit_message = jpeg_silence;
    jerr.message[0] = '\0';

    if (setjmp(jerr.setjmp_buffer))
    {
        std::snprintf(message, JMSG_LENGTH_MAX, "%s", jerr.message);
        jpeg_destroy_compress(&cinfo);
        return false;
    }

    jpeg_create_compress(&cinfo);
    jpeg_mem_dest(&cinfo, out, out_size);
    cinfo.image_width = static_cast<JDIMENSION>(image.width);
    cinfo.image_height = static_cast<JDIMENSION>(image.height);
    cinfo.input_components = 3;
    cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, quality, TRUE);
    cinfo.optimize_coding = TRUE;
    jpeg_start_compress(&cinfo, TRUE);

    while (cinfo.next_scanline < cinfo.image_height)
    {
        // Alpha is dropped; JPEG has no transparency
        const uint8_t* src = image.pixel(0, static_cast<int>(cinfo.next_scanline));
        JSAMPLE* dst = row.data();
        for (int x = 0; x < image.width; ++x)
        {
            dst[0] = src[0];
            dst[1] = src[1];
            dst[2] = src[2];
            src += 4;
            dst += 3;
        }
        JSAMPROW rows[1] = {row.data()};
        jpeg_write_scanlines(&cinfo, rows, 1);
    }

    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);
    return true;
}

// =============================================================================
// PNG (libpng simplified API)
// =============================================================================

Pixmap png_decode(const Bytes& buffer)
{
    png_image image;
    std::memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;

    if (!png_image_begin_read_from_memory(&image, buffer.data(), buffer.size()))
        throw ImageDecodeError(std::string("PNG decode failed: ") + image.message);

    if (static_cast<long long>(image.width) * image.height > kMaxPixels)
    {
        png_image_free(&image);
        check_pixel_budget(image.width, image.height);
    }

    image.format = PNG_FORMAT_RGBA;
    Pixmap out(static_cast<int>(image.width), static_cast<int>(image.height));
    if (!png_image_finish_read(&image, nullptr, out.rgba.data(), 0, nullptr))
    {
        std::string msg = image.message;
        png_image_free(&image);
        throw ImageDecodeError("PNG decode failed: " + msg);
    }
    return out;
}

bool png_read_size(const Bytes& buffer, int& width, int& height)
{
    png_image image;
    std::memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;
    if (!png_image_begin_read_from_memory(&image, buffer.data(), buffer.size()))
        return false;
    width = static_cast<int>(std::min<png_uint_32>(image.width, std::numeric_limits<int>::max()));
    height =
        static_cast<int>(std::min<png_uint_32>(image.height, std::numeric_limits<int>::max()));
    png_image_free(&image);
    return true;
}

// =============================================================================
// WebP (libwebp)
// =============================================================================

#ifdef TOOLMEDIA_HAS_WEBP
Pixmap webp_decode(const Bytes& buffer)
{
    int width = 0;
    int height = 0;
    if (!WebPGetInfo(buffer.data(), buffer.size(), &width, &height))
        throw ImageDecodeError("WebP decode failed: invalid header");
    check_pixel_budget(width, height);

    uint8_t* decoded = WebPDecodeRGBA(buffer.data(), buffer.size(), &width, &height);
    if (!decoded)
        throw ImageDecodeError("WebP decode failed");

    Pixmap out(width, height);
    std::memcpy(out.rgba.data(), decoded, out.rgba.size());
    WebPFree(decoded);
    return out;
}
#endif

} // namespace

std::string to_string(ImageFormat format)
{
    switch (format)
    {
    case ImageFormat::Jpeg:
        return "jpeg";
    case ImageFormat::Png:
        return "png";
    case ImageFormat::Webp:
        return "webp";
    }
    return "png";
}

ImageFormat output_format_for_mime(const std::string& mime_type)
{
    std::string mime = mime_type;
    std::transform(mime.begin(), mime.end(), mime.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (mime == "image/jpeg" || mime == "image/jpg")
        return ImageFormat::Jpeg;
    if (mime == "image/webp")
        return ImageFormat::Webp;
    return ImageFormat::Png;
}

bool webp_supported()
{
#ifdef TOOLMEDIA_HAS_WEBP
    return true;
#else
    return false;
#endif
}

Pixmap decode_image(const Bytes& buffer)
{
    auto mime = detect_mime(buffer.data(), std::min(buffer.size(), kSniffPrefixBytes));
    if (!mime)
        throw ImageDecodeError("unrecognized image format");

    if (*mime == "image/jpeg")
    {
        Pixmap out;
        std::vector<JSAMPLE> row;
        char message[JMSG_LENGTH_MAX] = {0};
        if (!jpeg_decode(buffer, out, row, message))
            throw ImageDecodeError(std::string("JPEG decode failed: ") + message);
        return out;
    }
    if (*mime == "image/png")
        return png_decode(buffer);
    if (*mime == "image/webp")
    {
#ifdef TOOLMEDIA_HAS_WEBP
        return webp_decode(buffer);
#else
        throw ImageDecodeError("WebP support is not compiled in");
#endif
    }
    throw ImageDecodeError("no in-process decoder for " + *mime);
}

Bytes encode_jpeg(const Pixmap& image, int quality)
{
    if (image.width <= 0 || image.height <= 0)
        throw BackendError("invalid image for JPEG encode");

    unsigned char* out = nullptr;
    unsigned long out_size = 0;
    std::vector<JSAMPLE> row(static_cast<size_t>(image.width) * 3);
    char message[JMSG_LENGTH_MAX] = {0};
    bool ok = jpeg_encode(image, std::clamp(quality, 1, 100), row, &out, &out_size, message);
    Bytes result;
    if (ok && out)
        result.assign(out, out + out_size);
    std::free(out);
    if (!ok)
        throw BackendError(std::string("JPEG encode failed: ") + message);
    return result;
}

Bytes encode_png(const Pixmap& image)
{
    if (image.width <= 0 || image.height <= 0)
        throw BackendError("invalid image for PNG encode");

    png_image png;
    std::memset(&png, 0, sizeof(png));
    png.version = PNG_IMAGE_VERSION;
    png.width = static_cast<png_uint_32>(image.width);
    png.height = static_cast<png_uint_32>(image.height);
    png.format = PNG_FORMAT_RGBA;

    png_alloc_size_t size = 0;
    if (!png_image_write_to_memory(&png, nullptr, &size, 0, image.rgba.data(), 0, nullptr))
        throw BackendError(std::string("PNG encode failed: ") + png.message);

    Bytes out(size);
    if (!png_image_write_to_memory(&png, out.data(), &size, 0, image.rgba.data(), 0, nullptr))
        throw BackendError(std::string("PNG encode failed: ") + png.message);
    out.resize(size);
    return out;
}

Bytes encode_webp(const Pixmap& image, int quality)
{
#ifdef TOOLMEDIA_HAS_WEBP
    if (image.width <= 0 || image.height <= 0)
        throw BackendError("invalid image for WebP encode");

    uint8_t* out = nullptr;
    size_t size = WebPEncodeRGBA(image.rgba.data(), image.width, image.height, image.width * 4,
                                 static_cast<float>(std::clamp(quality, 1, 100)), &out);
    if (size == 0 || !out)
        throw BackendError("WebP encode failed");
    Bytes result(out, out + size);
    WebPFree(out);
    return result;
#else
    (void)image;
    (void)quality;
    throw BackendError("WebP support is not compiled in");
#endif
}

Bytes encode_image(const Pixmap& image, ImageFormat format, int quality)
{
    switch (format)
    {
    case ImageFormat::Jpeg:
        return encode_jpeg(image, quality);
    case ImageFormat::Webp:
        return encode_webp(image, quality);
    case ImageFormat::Png:
        return encode_png(image);
    }
    return encode_png(image);
}

std::optional<ImageMetadata> read_dimensions(const Bytes& buffer)
{
    auto mime = detect_mime(buffer.data(), std::min(buffer.size(), kSniffPrefixBytes));
    if (!mime)
        return std::nullopt;

    int width = 0;
    int height = 0;
    const uint8_t* d = buffer.data();

    if (*mime == "image/jpeg")
    {
        if (!jpeg_read_size(buffer, width, height))
            return std::nullopt;
    }
    else if (*mime == "image/png")
    {
        if (!png_read_size(buffer, width, height))
            return std::nullopt;
    }
    else if (*mime == "image/webp")
    {
#ifdef TOOLMEDIA_HAS_WEBP
        if (!WebPGetInfo(buffer.data(), buffer.size(), &width, &height))
            return std::nullopt;
#else
        return std::nullopt;
#endif
    }
    else if (*mime == "image/gif")
    {
        if (buffer.size() < 10)
            return std::nullopt;
        width = le16(d + 6);
        height = le16(d + 8);
    }
    else if (*mime == "image/bmp")
    {
        if (buffer.size() < 26 || le32(d + 14) < 40)
            return std::nullopt;
        width = le32(d + 18);
        // Negative height marks a top-down bitmap
        int32_t h = le32(d + 22);
        if (h == std::numeric_limits<int32_t>::min())
            return std::nullopt;
        height = h < 0 ? -h : h;
    }
    else
    {
        return std::nullopt;
    }

    if (width <= 0 || height <= 0)
        return std::nullopt;
    return ImageMetadata{width, height};
}

std::pair<int, int> fit_inside(int width, int height, int max_side, bool without_enlargement)
{
    max_side = std::max(1, max_side);
    if (width <= 0 || height <= 0)
        return {0, 0};
    if (without_enlargement && width <= max_side && height <= max_side)
        return {width, height};

    double scale = std::min(static_cast<double>(max_side) / width,
                            static_cast<double>(max_side) / height);
    int w = static_cast<int>(std::lround(width * scale));
    int h = static_cast<int>(std::lround(height * scale));
    w = std::clamp(w, 1, max_side);
    h = std::clamp(h, 1, max_side);
    return {w, h};
}

Pixmap resize_area(const Pixmap& src, int width, int height)
{
    if (src.width <= 0 || src.height <= 0 || width <= 0 || height <= 0)
        throw BackendError("invalid resize geometry");
    if (width == src.width && height == src.height)
        return src;

    bool opaque = true;
    for (size_t i = 3; i < src.rgba.size(); i += 4)
    {
        if (src.rgba[i] != 255)
        {
            opaque = false;
            break;
        }
    }

    Pixmap dst(width, height);
    try
    {
        cv::Mat in(src.height, src.width, CV_8UC4, const_cast<std::uint8_t*>(src.rgba.data()));
        cv::Mat out(height, width, CV_8UC4, dst.rgba.data());
        if (opaque)
        {
            cv::resize(in, out, out.size(), 0, 0, cv::INTER_AREA);
        }
        else
        {
            // Premultiplied alpha keeps transparent pixels from bleeding color
            cv::Mat pre;
            cv::cvtColor(in, pre, cv::COLOR_RGBA2mRGBA);
            cv::Mat shrunk;
            cv::resize(pre, shrunk, out.size(), 0, 0, cv::INTER_AREA);
            cv::cvtColor(shrunk, out, cv::COLOR_mRGBA2RGBA);
        }
        if (out.data != dst.rgba.data())
            throw BackendError("resample wrote to an unexpected buffer");
    }
    catch (const cv::Exception& e)
    {
        throw BackendError(std::string("resample failed: ") + e.what());
    }
    return dst;
}

} // namespace toolmedia::media
