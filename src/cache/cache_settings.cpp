#include "cache_settings.hpp"
#include <algorithm>
#include <cstdlib>
#include <limits>

namespace blast::cache {

std::filesystem::path CacheSettings::default_cache_dir() {
    const char* xdg = std::getenv("XDG_CACHE_HOME");
    if (xdg && *xdg) {
        return std::filesystem::path(xdg) / "blast";
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return std::filesystem::path(home) / ".cache" / "blast";
    }
    return std::filesystem::path(".cache") / "blast";
}

CacheSettings CacheSettings::from_config(const utils::Config& config) {
    CacheSettings settings;

    if (auto dir = config.get<std::string>("cache_dir")) {
        settings.cache_dir = *dir;
    }
    settings.max_size = config.get_or<uint64_t>("max_size", settings.max_size);
    if (auto ttl = config.get<uint64_t>("ttl")) {
        constexpr auto max_ttl = static_cast<uint64_t>(std::numeric_limits<std::chrono::seconds::rep>::max());
        settings.ttl = std::chrono::seconds(static_cast<std::chrono::seconds::rep>(std::min(*ttl, max_ttl)));
    }
    settings.use_hardlinks = config.get_or<bool>("use_hardlinks", settings.use_hardlinks);
    settings.use_cow = config.get_or<bool>("use_cow", settings.use_cow);

    return settings;
}

utils::Config CacheSettings::to_config() const {
    utils::Config config;
    config.set("cache_dir", cache_dir.string());
    config.set("max_size", max_size);
    config.set("ttl", static_cast<uint64_t>(ttl.count()));
    config.set("use_hardlinks", use_hardlinks);
    config.set("use_cow", use_cow);
    return config;
}

} // namespace blast::cache
