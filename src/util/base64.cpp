#include "toolmedia/util/base64.hpp"

#include <cctype>

namespace toolmedia::util::base64
{

static const char* b64_chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string encode(const Bytes& binary)
{
    std::string b64;
    b64.reserve((binary.size() + 2) / 3 * 4);
    for (size_t i = 0; i < binary.size(); i += 3)
    {
        uint32_t n = static_cast<uint32_t>(binary[i]) << 16;
        if (i + 1 < binary.size())
            n |= static_cast<uint32_t>(binary[i + 1]) << 8;
        if (i + 2 < binary.size())
            n |= binary[i + 2];
        b64.push_back(b64_chars[(n >> 18) & 0x3F]);
        b64.push_back(b64_chars[(n >> 12) & 0x3F]);
        b64.push_back((i + 1 < binary.size()) ? b64_chars[(n >> 6) & 0x3F] : '=');
        b64.push_back((i + 2 < binary.size()) ? b64_chars[n & 0x3F] : '=');
    }
    return b64;
}

static int decode_char(char c)
{
    if (c >= 'A' && c <= 'Z')
        return c - 'A';
    if (c >= 'a' && c <= 'z')
        return c - 'a' + 26;
    if (c >= '0' && c <= '9')
        return c - '0' + 52;
    // URL-safe alphabet is accepted as well
    if (c == '+' || c == '-')
        return 62;
    if (c == '/' || c == '_')
        return 63;
    return -1;
}

Bytes decode(const std::string& text)
{
    Bytes decoded;
    decoded.reserve(text.size() / 4 * 3);
    int val = 0, valb = -8;
    for (char c : text)
    {
        if (c == '=')
            break;
        int pos = decode_char(c);
        if (pos < 0)
            continue;
        val = ((val << 6) + pos) & 0xFFFFFF;
        valb += 6;
        if (valb >= 0)
        {
            decoded.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    return decoded;
}

std::string trim(const std::string& s)
{
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return s.substr(begin, end - begin);
}

} // namespace toolmedia::util::base64
