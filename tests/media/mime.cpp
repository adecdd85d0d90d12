/// @file mime.cpp
/// @brief Magic-byte classification of raw and base64 payloads

#include "test_helpers.hpp"
#include "toolmedia/media/mime.hpp"

#include <cassert>
#include <iostream>

using namespace toolmedia;
using namespace toolmedia::media;

static std::optional<std::string> sniff(const std::string& raw)
{
    return detect_mime(test::bytes_of(raw));
}

void test_signatures()
{
    std::cout << "  test_signatures... " << std::flush;

    assert(sniff(std::string("\x89PNG\r\n\x1a\n\0\0\0\rIHDR", 16)) == "image/png");
    assert(sniff(std::string("\xff\xd8\xff\xe0\0\x10JFIF", 10)) == "image/jpeg");
    assert(sniff(std::string("GIF89a\x01\0\x01\0", 10)) == "image/gif");
    assert(sniff(std::string("GIF87a\x01\0\x01\0", 10)) == "image/gif");
    assert(sniff(std::string("RIFF\x24\0\0\0WEBPVP8 ", 16)) == "image/webp");
    assert(sniff(std::string("II*\0\x08\0\0\0", 8)) == "image/tiff");
    assert(sniff(std::string("MM\0*\0\0\0\x08", 8)) == "image/tiff");
    assert(sniff(std::string("\0\0\0\x1c" "ftypavif\0\0\0\0", 16)) == "image/avif");
    assert(sniff(std::string("\0\0\0\x18" "ftypheic\0\0\0\0", 16)) == "image/heic");
    assert(sniff("%PDF-1.7\n") == "application/pdf");
    assert(sniff("PK\x03\x04\x14\0") == "application/zip");
    assert(sniff("\x1f\x8b\x08\0") == "application/gzip");

    std::string bmp(54, '\0');
    bmp[0] = 'B';
    bmp[1] = 'M';
    bmp[14] = 40;
    assert(sniff(bmp) == "image/bmp");

    std::cout << "PASSED\n";
}

void test_unknown()
{
    std::cout << "  test_unknown... " << std::flush;

    assert(!sniff("hello world, plain text"));
    assert(!sniff(""));
    assert(!sniff("\x89"));
    // RIFF container that is not WebP
    assert(!sniff(std::string("RIFF\x24\0\0\0WAVEfmt ", 16)));
    // "BM" with garbage in the reserved header bytes
    assert(!sniff("BMxxxxxxxxxxxxxxxxxxxxxxxxxxxx"));
    assert(!detect_mime(nullptr, 10));

    std::cout << "PASSED\n";
}

void test_real_encodings()
{
    std::cout << "  test_real_encodings... " << std::flush;
    assert(detect_mime(test::png_bytes(4, 4)) == "image/png");
    assert(detect_mime(test::jpeg_bytes(4, 4)) == "image/jpeg");
    std::cout << "PASSED\n";
}

void test_sniff_base64()
{
    std::cout << "  test_sniff_base64... " << std::flush;

    // Only the prefix is decoded, the rest of the payload can be anything
    std::string png = test::png_base64(300, 300);
    assert(png.size() > 256);
    assert(sniff_mime_from_base64(png) == "image/png");
    assert(sniff_mime_from_base64(png.substr(0, 12)) == "image/png");
    assert(sniff_mime_from_base64(png.substr(0, 256) + "!!!! not base64 !!!!") == "image/png");
    assert(sniff_mime_from_base64("  \n" + test::jpeg_base64(8, 8) + "\n") == "image/jpeg");

    std::string gif = util::base64::encode(test::bytes_of(std::string("GIF89a\x01\0\x01\0", 10)));
    assert(sniff_mime_from_base64(gif) == "image/gif");

    std::string webp = util::base64::encode(test::bytes_of(std::string("RIFF\x24\0\0\0WEBPVP8 ", 16)));
    assert(sniff_mime_from_base64(webp) == "image/webp");

    std::string text = util::base64::encode(test::bytes_of("just some text here"));
    assert(!sniff_mime_from_base64(text));

    std::cout << "PASSED\n";
}

void test_sniff_base64_short_input()
{
    std::cout << "  test_sniff_base64_short_input... " << std::flush;

    assert(!sniff_mime_from_base64(""));
    assert(!sniff_mime_from_base64("   "));
    // 7 characters align down to 4, below the minimum of 8
    assert(!sniff_mime_from_base64("iVBORw0"));
    // 11 characters align down to 8: 6 bytes, not enough for the PNG magic
    assert(!sniff_mime_from_base64("iVBORw0KGgo"));
    // 8 characters decode to ff d8 ff ...
    assert(sniff_mime_from_base64("/9j/4AAQ") == "image/jpeg");

    std::cout << "PASSED\n";
}

void test_is_image_mime()
{
    std::cout << "  test_is_image_mime... " << std::flush;
    assert(is_image_mime("image/png"));
    assert(is_image_mime("image/x-icon"));
    assert(!is_image_mime("application/pdf"));
    assert(!is_image_mime("text/image/png"));
    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "MIME sniffing tests\n";
    test_signatures();
    test_unknown();
    test_real_encodings();
    test_sniff_base64();
    test_sniff_base64_short_input();
    test_is_image_mime();
    std::cout << "All MIME tests passed\n";
    return 0;
}
