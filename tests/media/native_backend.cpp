/// @file native_backend.cpp
/// @brief NativeBackend metadata and resize

#include "test_helpers.hpp"
#include "toolmedia/exceptions.hpp"
#include "toolmedia/media/mime.hpp"
#include "toolmedia/media/native_backend.hpp"

#include <cassert>
#include <iostream>

using namespace toolmedia;
using namespace toolmedia::media;

void test_metadata()
{
    std::cout << "  test_metadata... " << std::flush;
    NativeBackend backend;
    assert(backend.kind() == BackendKind::Native);

    auto meta = backend.metadata(test::png_bytes(320, 240));
    assert(meta && meta->width == 320 && meta->height == 240);
    assert(!backend.metadata(test::bytes_of("definitely not an image")));
    assert(!backend.metadata(Bytes{}));
    std::cout << "PASSED\n";
}

void test_resize_keeps_format_family()
{
    std::cout << "  test_resize_keeps_format_family... " << std::flush;
    NativeBackend backend;

    ResizeOptions opts;
    opts.max_side = 100;
    opts.format = ImageFormat::Jpeg;
    Bytes jpeg = backend.resize(test::jpeg_bytes(400, 200), opts);
    assert(detect_mime(jpeg) == "image/jpeg");
    auto jm = read_dimensions(jpeg);
    assert(jm && jm->width == 100 && jm->height == 50);

    opts.format = ImageFormat::Png;
    Bytes png = backend.resize(test::png_bytes(150, 300), opts);
    assert(detect_mime(png) == "image/png");
    auto pm = read_dimensions(png);
    assert(pm && pm->width == 50 && pm->height == 100);

    // PNG input, JPEG requested: re-encoded
    opts.format = ImageFormat::Jpeg;
    assert(detect_mime(backend.resize(test::png_bytes(200, 200), opts)) == "image/jpeg");

    std::cout << "PASSED\n";
}

void test_without_enlargement()
{
    std::cout << "  test_without_enlargement... " << std::flush;
    NativeBackend backend;

    ResizeOptions opts;
    opts.max_side = 500;
    opts.format = ImageFormat::Png;
    auto small = read_dimensions(backend.resize(test::png_bytes(40, 30), opts));
    assert(small && small->width == 40 && small->height == 30);

    opts.without_enlargement = false;
    auto grown = read_dimensions(backend.resize(test::png_bytes(40, 30), opts));
    assert(grown && grown->width == 500 && grown->height == 375);

    std::cout << "PASSED\n";
}

void test_failures_throw()
{
    std::cout << "  test_failures_throw... " << std::flush;
    NativeBackend backend;
    ResizeOptions opts;

    bool threw = false;
    try
    {
        backend.resize(test::bytes_of("GIF89a\x10\x10\x10\x10garbage"), opts);
    }
    catch (const Error&)
    {
        threw = true;
    }
    assert(threw);

    if (!webp_supported())
    {
        threw = false;
        opts.format = ImageFormat::Webp;
        try
        {
            backend.resize(test::png_bytes(10, 10), opts);
        }
        catch (const BackendError&)
        {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "PASSED\n";
}

void test_runtime_available()
{
    std::cout << "  test_runtime_available... " << std::flush;
    assert(NativeBackend::runtime_available());
    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "Native backend tests\n";
    test_metadata();
    test_resize_keeps_format_family();
    test_without_enlargement();
    test_failures_throw();
    test_runtime_available();
    std::cout << "All native backend tests passed\n";
    return 0;
}
