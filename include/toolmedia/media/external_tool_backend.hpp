#pragma once
#include "toolmedia/logging.hpp"
#include "toolmedia/media/image_backend.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace toolmedia
{
struct Settings;
}

namespace toolmedia::media
{

struct ExternalToolOptions
{
    /// Executable speaking the sips command line
    std::string executable{"/usr/bin/sips"};
    std::chrono::milliseconds metadata_timeout{10000};
    std::size_t metadata_max_output{512 * 1024};
    std::chrono::milliseconds resize_timeout{20000};
    std::size_t resize_max_output{1024 * 1024};
    std::string temp_prefix{"toolmedia-img-"};

    static ExternalToolOptions from_settings(const Settings& settings);
};

/// Runs the image tool on a copy of the buffer inside a scoped temp directory.
/// Output is always JPEG.
class ExternalToolBackend : public ImageBackend
{
  public:
    explicit ExternalToolBackend(ExternalToolOptions options = {}, Logger logger = Logger{});

    BackendKind kind() const override
    {
        return BackendKind::ExternalTool;
    }
    std::string name() const override
    {
        return "external-tool";
    }

    std::optional<ImageMetadata> metadata(const Bytes& buffer) const override;

    /// Without-enlargement is emulated: the tool cannot express it, so images
    /// already inside the box are re-encoded at their current size.
    Bytes resize(const Bytes& buffer, const ResizeOptions& options) const override;

    const ExternalToolOptions& options() const
    {
        return options_;
    }

  private:
    /// Throws ProcessError / ProcessTimeoutError on tool failure
    std::optional<ImageMetadata> query_dimensions(const Bytes& buffer) const;
    Bytes resize_to_jpeg(const Bytes& buffer, int max_side, int quality) const;

    ExternalToolOptions options_;
    Logger logger_;
};

} // namespace toolmedia::media
