#include "toolmedia/settings.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>

static void set_env(const char* name, const char* value)
{
    setenv(name, value, 1);
}

int main()
{
    using namespace toolmedia;

    // Defaults
    Settings d;
    assert(d.log_level == "INFO");
    assert(!d.image_backend);
    assert(d.max_dimension_px == 2000);
    assert(d.resize_quality == 85);
    assert(d.external_tool == "/usr/bin/sips");
    assert(d.metadata_timeout_ms == 10000);
    assert(d.resize_timeout_ms == 20000);
    assert(d.metadata_max_output == 512 * 1024);
    assert(d.resize_max_output == 1024 * 1024);

    // JSON parse
    auto s = Settings::from_json(Json{{"log_level", "debug"},
                                      {"image_backend", "external-tool"},
                                      {"max_dimension_px", 1200},
                                      {"resize_quality", 70},
                                      {"external_tool", "/opt/bin/sips"},
                                      {"resize_timeout_ms", 500}});
    assert(s.log_level == "debug");
    assert(s.image_backend && *s.image_backend == "external-tool");
    assert(s.max_dimension_px == 1200);
    assert(s.resize_quality == 70);
    assert(s.external_tool == "/opt/bin/sips");
    assert(s.resize_timeout_ms == 500);
    assert(s.metadata_timeout_ms == 10000);
    std::cout << "[OK] from_json\n";

    // Env parse (set locally)
    set_env("TOOLMEDIA_LOG_LEVEL", "warn");
    set_env("TOOLMEDIA_IMAGE_BACKEND", "native");
    set_env("TOOLMEDIA_MAX_IMAGE_DIMENSION", "1024");
    set_env("TOOLMEDIA_RESIZE_QUALITY", "60");
    set_env("TOOLMEDIA_IMAGE_TOOL", "/tmp/fake-sips");
    auto e = Settings::from_env();
    assert(e.log_level == "WARN"); // uppercased
    assert(e.image_backend && *e.image_backend == "native");
    assert(e.max_dimension_px == 1024);
    assert(e.resize_quality == 60);
    assert(e.external_tool == "/tmp/fake-sips");
    std::cout << "[OK] from_env\n";

    // Invalid numbers keep the defaults
    set_env("TOOLMEDIA_MAX_IMAGE_DIMENSION", "big");
    set_env("TOOLMEDIA_RESIZE_QUALITY", "-5");
    auto bad = Settings::from_env();
    assert(bad.max_dimension_px == 2000);
    assert(bad.resize_quality == 85);

    set_env("TOOLMEDIA_RESIZE_QUALITY", "400");
    assert(Settings::from_env().resize_quality == 100);
    std::cout << "[OK] invalid values\n";

    return 0;
}
