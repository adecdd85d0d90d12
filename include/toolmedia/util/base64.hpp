#pragma once
#include "toolmedia/types.hpp"

#include <string>

namespace toolmedia::util::base64
{

std::string encode(const Bytes& binary);

/// Lenient decode: characters outside the alphabet are skipped, decoding
/// stops at the first '='.
Bytes decode(const std::string& text);

/// Copy of `s` without leading/trailing ASCII whitespace
std::string trim(const std::string& s);

} // namespace toolmedia::util::base64
