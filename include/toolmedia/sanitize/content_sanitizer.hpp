#pragma once
#include "toolmedia/content.hpp"
#include "toolmedia/logging.hpp"
#include "toolmedia/media/image_ops.hpp"

#include <memory>
#include <string>
#include <vector>

namespace toolmedia
{
struct Settings;
}

namespace toolmedia::sanitize
{

/// Default dimension limit of the downstream consumer
constexpr int kMaxImageDimensionPx = 2000;

struct SanitizeOptions
{
    int max_dimension_px{kMaxImageDimensionPx};
};

/// Re-checks every image block of a tool result: oversized images are
/// downscaled, broken or empty ones are replaced by a text block saying why.
/// Per-block failures never escape.
class ContentSanitizer
{
  public:
    explicit ContentSanitizer(std::shared_ptr<const media::ImageOps> ops, int quality = 85,
                              Logger logger = Logger{});

    static std::shared_ptr<ContentSanitizer> from_settings(const Settings& settings,
                                                           Logger logger = Logger{});

    std::vector<ContentBlock> sanitize_blocks(const std::vector<ContentBlock>& blocks,
                                              const std::string& label,
                                              const SanitizeOptions& options = {}) const;

    /// Returns `result` unchanged when it holds no image or text block
    ToolResult sanitize(const ToolResult& result, const std::string& label,
                        const SanitizeOptions& options = {}) const;

    const media::ImageOps& image_ops() const
    {
        return *ops_;
    }

  private:
    ContentBlock sanitize_image(const ImageContent& block, const std::string& label,
                                int max_dimension_px) const;

    std::shared_ptr<const media::ImageOps> ops_;
    int quality_;
    Logger logger_;
};

} // namespace toolmedia::sanitize
