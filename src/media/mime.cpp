#include "toolmedia/media/mime.hpp"

#include "toolmedia/util/base64.hpp"

#include <algorithm>
#include <cstring>

namespace toolmedia::media
{

namespace
{

bool starts_with(const std::uint8_t* data, std::size_t size, const char* magic, std::size_t n,
                 std::size_t offset = 0)
{
    return size >= offset + n && std::memcmp(data + offset, magic, n) == 0;
}

/// ISO-BMFF: "ftyp" box at offset 4 followed by a major brand
std::optional<std::string> detect_ftyp(const std::uint8_t* data, std::size_t size)
{
    if (!starts_with(data, size, "ftyp", 4, 4) || size < 12)
        return std::nullopt;

    std::string brand(reinterpret_cast<const char*>(data + 8), 4);
    if (brand == "avif" || brand == "avis")
        return std::string("image/avif");
    if (brand == "heic" || brand == "heix" || brand == "hevc" || brand == "hevx")
        return std::string("image/heic");
    if (brand == "mif1" || brand == "msf1")
        return std::string("image/heif");
    return std::nullopt;
}

} // namespace

std::optional<std::string> detect_mime(const std::uint8_t* data, std::size_t size)
{
    if (data == nullptr || size < 2)
        return std::nullopt;

    if (starts_with(data, size, "\x89PNG\r\n\x1a\n", 8))
        return std::string("image/png");
    if (starts_with(data, size, "\xff\xd8\xff", 3))
        return std::string("image/jpeg");
    if (starts_with(data, size, "GIF87a", 6) || starts_with(data, size, "GIF89a", 6))
        return std::string("image/gif");
    if (starts_with(data, size, "RIFF", 4) && starts_with(data, size, "WEBP", 4, 8))
        return std::string("image/webp");
    if (starts_with(data, size, "II*\0", 4) || starts_with(data, size, "MM\0*", 4))
        return std::string("image/tiff");
    if (starts_with(data, size, "\0\0\1\0", 4) && size >= 6 && data[4] != 0)
        return std::string("image/x-icon");
    if (auto ftyp = detect_ftyp(data, size))
        return ftyp;
    if (starts_with(data, size, "%PDF-", 5))
        return std::string("application/pdf");
    if (starts_with(data, size, "PK\x03\x04", 4))
        return std::string("application/zip");
    if (starts_with(data, size, "\x1f\x8b", 2))
        return std::string("application/gzip");
    // BMP last: "BM" is a weak two-byte signature, so require a sane header
    if (starts_with(data, size, "BM", 2) && size >= 26 && data[6] == 0 && data[7] == 0 &&
        data[8] == 0 && data[9] == 0)
        return std::string("image/bmp");

    return std::nullopt;
}

std::optional<std::string> sniff_mime_from_base64(const std::string& base64)
{
    std::string trimmed = util::base64::trim(base64);
    if (trimmed.empty())
        return std::nullopt;

    std::size_t take = std::min<std::size_t>(kSniffPrefixBytes, trimmed.size());
    std::size_t slice_len = take - (take % 4);
    if (slice_len < 8)
        return std::nullopt;

    Bytes head = util::base64::decode(trimmed.substr(0, slice_len));
    return detect_mime(head);
}

} // namespace toolmedia::media
