#pragma once
#include "toolmedia/media/codec.hpp"
#include "toolmedia/types.hpp"

#include <optional>
#include <string>

namespace toolmedia
{
struct Settings;
}

namespace toolmedia::media
{

enum class BackendKind
{
    Native,      ///< In-process codec libraries
    ExternalTool ///< Command-line image tool run as a subprocess
};

std::string to_string(BackendKind kind);

/// "native"/"sharp" -> Native, "external-tool"/"external"/"sips" -> ExternalTool
std::optional<BackendKind> backend_kind_from_string(const std::string& s);

/// Operating system identifier of the build target ("darwin", "linux", ...)
std::string current_os();

/// Inputs of the backend selection policy
struct BackendEnvironment
{
    std::optional<BackendKind> override_kind;
    bool native_loadable{true};
    std::string os{current_os()};

    /// Override from settings, codec self-test, build target OS
    static BackendEnvironment detect(const Settings& settings);
};

/// External tool when explicitly requested, or when nothing forces native,
/// the native codecs are unusable and the OS ships the tool (darwin).
/// Native otherwise.
BackendKind select_backend(const BackendEnvironment& env);

struct ResizeOptions
{
    int max_side{2000};
    int quality{85};
    bool without_enlargement{true};
    /// Honored by the native backend; the external tool always writes JPEG
    ImageFormat format{ImageFormat::Jpeg};
};

class ImageBackend
{
  public:
    virtual ~ImageBackend() = default;

    virtual BackendKind kind() const = 0;
    virtual std::string name() const = 0;

    /// Declared dimensions, or std::nullopt on any failure. Never throws.
    virtual std::optional<ImageMetadata> metadata(const Bytes& buffer) const = 0;

    /// Encoded, resized image. Throws on failure.
    virtual Bytes resize(const Bytes& buffer, const ResizeOptions& options) const = 0;
};

} // namespace toolmedia::media
