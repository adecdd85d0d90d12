#pragma once
#include "toolmedia/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace toolmedia::media
{

/// Number of decoded bytes that signature matching looks at
constexpr std::size_t kSniffPrefixBytes = 256;

/// Classifies a buffer (or a prefix of one) by its magic bytes.
/// Returns std::nullopt when no known signature matches.
std::optional<std::string> detect_mime(const std::uint8_t* data, std::size_t size);

inline std::optional<std::string> detect_mime(const Bytes& buffer)
{
    return detect_mime(buffer.data(), buffer.size());
}

/// Classifies base64 text from its first 256 characters. The slice is aligned
/// down to a multiple of 4; fewer than 8 usable characters yields std::nullopt.
std::optional<std::string> sniff_mime_from_base64(const std::string& base64);

inline bool is_image_mime(const std::string& mime)
{
    return mime.rfind("image/", 0) == 0;
}

} // namespace toolmedia::media
