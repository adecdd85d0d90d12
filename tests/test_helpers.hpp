/// @file test_helpers.hpp
/// @brief Image fixtures and a fake image tool shared by the tests

#pragma once

#include "toolmedia/content.hpp"
#include "toolmedia/media/codec.hpp"
#include "toolmedia/util/base64.hpp"
#include "toolmedia/util/temp_dir.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace toolmedia::test
{

/// Opaque gradient, so encoders have something non-trivial to work with
inline media::Pixmap gradient(int width, int height)
{
    media::Pixmap img(width, height);
    for (int y = 0; y < height; ++y)
    {
        for (int x = 0; x < width; ++x)
        {
            auto* p = img.pixel(x, y);
            p[0] = static_cast<std::uint8_t>((x * 255) / std::max(1, width - 1));
            p[1] = static_cast<std::uint8_t>((y * 255) / std::max(1, height - 1));
            p[2] = 128;
            p[3] = 255;
        }
    }
    return img;
}

inline Bytes png_bytes(int width, int height)
{
    return media::encode_png(gradient(width, height));
}

inline Bytes jpeg_bytes(int width, int height, int quality = 90)
{
    return media::encode_jpeg(gradient(width, height), quality);
}

inline std::string png_base64(int width, int height)
{
    return util::base64::encode(png_bytes(width, height));
}

inline std::string jpeg_base64(int width, int height)
{
    return util::base64::encode(jpeg_bytes(width, height));
}

/// Small real JPEG whose SOF0 header claims width x height
inline Bytes jpeg_with_declared_size(int width, int height)
{
    Bytes data = jpeg_bytes(8, 8);
    size_t i = 2;
    while (i + 9 < data.size() && data[i] == 0xFF)
    {
        std::uint8_t marker = data[i + 1];
        size_t length = (static_cast<size_t>(data[i + 2]) << 8) | data[i + 3];
        if (marker == 0xC0)
        {
            data[i + 5] = static_cast<std::uint8_t>(height >> 8);
            data[i + 6] = static_cast<std::uint8_t>(height & 0xFF);
            data[i + 7] = static_cast<std::uint8_t>(width >> 8);
            data[i + 8] = static_cast<std::uint8_t>(width & 0xFF);
            return data;
        }
        i += 2 + length;
    }
    return Bytes();
}

inline Bytes bytes_of(const std::string& s)
{
    return Bytes(s.begin(), s.end());
}

inline ImageContent image_block(std::string data, std::string mime)
{
    ImageContent img;
    img.data = std::move(data);
    img.mimeType = std::move(mime);
    return img;
}

inline void write_file(const std::filesystem::path& path, const Bytes& data)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

inline std::string read_text(const std::filesystem::path& path)
{
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/// Shell script that speaks the subset of the sips command line used by
/// ExternalToolBackend. Query mode prints fixed dimensions; resize mode
/// records the requested side in `calls.log` and copies a fixture JPEG to
/// the --out path.
class FakeImageTool
{
  public:
    enum class Mode
    {
        Ok,       ///< answers queries, writes output
        Fail,     ///< exits 3 with a message on stderr
        Hang,     ///< sleeps past any test timeout
        NoOutput, ///< exits 0 without writing the output file
        Garbage   ///< query mode prints nothing useful
    };

    FakeImageTool(int width, int height, Mode mode = Mode::Ok,
                  const Bytes& output = jpeg_bytes(64, 32))
        : dir_("toolmedia-fake-tool-")
    {
        namespace fs = std::filesystem;
        script_ = dir_.path() / "fake-sips";
        log_ = dir_.path() / "calls.log";
        fs::path fixture = dir_.path() / "fixture.jpg";
        write_file(fixture, output);

        std::string body = "#!/bin/sh\n";
        switch (mode)
        {
        case Mode::Fail:
            body += "echo 'Error: cannot process image' >&2\nexit 3\n";
            break;
        case Mode::Hang:
            body += "exec sleep 5\n";
            break;
        case Mode::Garbage:
            body += "echo 'nothing to see here'\nexit 0\n";
            break;
        case Mode::Ok:
        case Mode::NoOutput:
            body += "if [ \"$1\" = \"-g\" ]; then\n";
            body += "  echo \"$5\"\n";
            body += "  echo \"  pixelWidth: " + std::to_string(width) + "\"\n";
            body += "  echo \"  pixelHeight: " + std::to_string(height) + "\"\n";
            body += "  exit 0\n";
            body += "fi\n";
            body += "if [ \"$1\" = \"-Z\" ]; then\n";
            body += "  echo \"$2 $5 $8\" >> '" + log_.string() + "'\n";
            body += "  out=''\n";
            body += "  while [ $# -gt 0 ]; do\n";
            body += "    if [ \"$1\" = \"--out\" ]; then out=\"$2\"; fi\n";
            body += "    shift\n";
            body += "  done\n";
            if (mode == Mode::Ok)
                body += "  cp '" + fixture.string() + "' \"$out\" || exit 4\n";
            body += "  exit 0\n";
            body += "fi\n";
            body += "exit 2\n";
            break;
        }

        std::ofstream out(script_, std::ios::trunc);
        out << body;
        out.close();
        fs::permissions(script_, fs::perms::owner_all | fs::perms::group_read |
                                     fs::perms::group_exec | fs::perms::others_read |
                                     fs::perms::others_exec);
    }

    std::string path() const
    {
        return script_.string();
    }

    /// One line per resize call: "<side> <format> <quality>"
    std::string calls() const
    {
        return read_text(log_);
    }

  private:
    util::ScopedTempDir dir_;
    std::filesystem::path script_;
    std::filesystem::path log_;
};

} // namespace toolmedia::test
