#include "toolmedia/media/image_backend.hpp"
#include "toolmedia/settings.hpp"

#include <cassert>
#include <iostream>

using namespace toolmedia;
using namespace toolmedia::media;

static BackendEnvironment env(std::optional<BackendKind> override_kind, bool loadable,
                              const std::string& os)
{
    BackendEnvironment e;
    e.override_kind = override_kind;
    e.native_loadable = loadable;
    e.os = os;
    return e;
}

int main()
{
    // Explicit override wins everywhere
    assert(select_backend(env(BackendKind::ExternalTool, true, "linux")) ==
           BackendKind::ExternalTool);
    assert(select_backend(env(BackendKind::ExternalTool, true, "darwin")) ==
           BackendKind::ExternalTool);
    assert(select_backend(env(BackendKind::Native, false, "darwin")) == BackendKind::Native);
    std::cout << "[OK] override\n";

    // Without override: external tool only where it ships and native is unusable
    assert(select_backend(env(std::nullopt, false, "darwin")) == BackendKind::ExternalTool);
    assert(select_backend(env(std::nullopt, true, "darwin")) == BackendKind::Native);
    assert(select_backend(env(std::nullopt, false, "linux")) == BackendKind::Native);
    assert(select_backend(env(std::nullopt, true, "linux")) == BackendKind::Native);
    std::cout << "[OK] detection\n";

    assert(backend_kind_from_string("native") == BackendKind::Native);
    assert(backend_kind_from_string("sharp") == BackendKind::Native);
    assert(backend_kind_from_string("External-Tool") == BackendKind::ExternalTool);
    assert(backend_kind_from_string("sips") == BackendKind::ExternalTool);
    assert(!backend_kind_from_string("imagemagick"));
    assert(to_string(BackendKind::ExternalTool) == "external-tool");
    std::cout << "[OK] parsing\n";

    // detect() reads the override from settings and self-tests the codecs
    Settings s;
    s.image_backend = "external-tool";
    auto detected = BackendEnvironment::detect(s);
    assert(detected.override_kind == BackendKind::ExternalTool);
    assert(detected.native_loadable);
    assert(detected.os == current_os());
    assert(select_backend(detected) == BackendKind::ExternalTool);

    s.image_backend = "bogus";
    assert(!BackendEnvironment::detect(s).override_kind);
#if defined(__linux__)
    assert(current_os() == "linux");
#endif
    std::cout << "[OK] detect\n";

    return 0;
}
