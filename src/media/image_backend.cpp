#include "toolmedia/media/image_backend.hpp"

#include "toolmedia/media/native_backend.hpp"
#include "toolmedia/settings.hpp"

#include <algorithm>
#include <cctype>

namespace toolmedia::media
{

std::string to_string(BackendKind kind)
{
    switch (kind)
    {
    case BackendKind::Native:
        return "native";
    case BackendKind::ExternalTool:
        return "external-tool";
    }
    return "native";
}

std::optional<BackendKind> backend_kind_from_string(const std::string& s)
{
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "native" || v == "sharp")
        return BackendKind::Native;
    if (v == "external-tool" || v == "external" || v == "sips")
        return BackendKind::ExternalTool;
    return std::nullopt;
}

std::string current_os()
{
#if defined(__APPLE__)
    return "darwin";
#elif defined(__linux__)
    return "linux";
#elif defined(_WIN32)
    return "win32";
#elif defined(__FreeBSD__)
    return "freebsd";
#else
    return "unknown";
#endif
}

BackendEnvironment BackendEnvironment::detect(const Settings& settings)
{
    BackendEnvironment env;
    if (settings.image_backend)
        env.override_kind = backend_kind_from_string(*settings.image_backend);
    env.native_loadable = NativeBackend::runtime_available();
    env.os = current_os();
    return env;
}

BackendKind select_backend(const BackendEnvironment& env)
{
    if (env.override_kind == BackendKind::ExternalTool)
        return BackendKind::ExternalTool;
    if (env.override_kind != BackendKind::Native && !env.native_loadable && env.os == "darwin")
        return BackendKind::ExternalTool;
    return BackendKind::Native;
}

} // namespace toolmedia::media
