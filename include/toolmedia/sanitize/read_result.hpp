#pragma once
#include "toolmedia/content.hpp"

#include <string>

namespace toolmedia::sanitize
{

/// Header line the read tool puts in front of image payloads
std::string read_image_header(const std::string& mime_type);

/// Fixes the declared MIME type of a read-tool image result from its bytes.
///
/// The first image block decides: an empty payload, or bytes that sniff as a
/// non-image type, throw ReadImageError naming `file_path`. When the bytes
/// sniff as a different image type, every image block and every
/// "Read image file [...]" header is relabeled. Unknown formats and results
/// without images are returned unchanged.
ToolResult normalize_read_image_result(const ToolResult& result, const std::string& file_path);

} // namespace toolmedia::sanitize
