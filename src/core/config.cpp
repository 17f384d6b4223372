#include <shelter/core/config.h>

namespace shelter::core {

EngineConfig::EngineConfig()
    : precache_manifest(default_precache_manifest()) {}

std::string EngineConfig::cache_name() const {
    return cache_prefix + "-" + cache_version;
}

std::vector<std::string> default_precache_manifest() {
    return {
        "/",
        "/static/icon-192.png",
        "/static/icon-512.png",
        "/manifest.json",
        "https://cdnjs.cloudflare.com/ajax/libs/socket.io/4.7.2/socket.io.js",
    };
}

}  // namespace shelter::core
