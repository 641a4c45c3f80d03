#pragma once

#include "blast/common.hpp"
#include "utils/config.hpp"
#include <chrono>
#include <filesystem>

namespace blast::cache {

/**
 * Settings for a Cache directory
 *
 * use_hardlinks and use_cow are carried for callers that materialize cached
 * payloads into environments; the cache itself does not act on them.
 */
struct CacheSettings {
    std::filesystem::path cache_dir = default_cache_dir();
    uint64_t max_size = constants::DEFAULT_MAX_CACHE_SIZE;
    std::chrono::seconds ttl{constants::DEFAULT_TTL_SECONDS};
    bool use_hardlinks = true;
    bool use_cow = true;

    /**
     * $XDG_CACHE_HOME/blast, else $HOME/.cache/blast, else ./.cache/blast
     */
    static std::filesystem::path default_cache_dir();

    /**
     * Read cache_dir, max_size, ttl (seconds), use_hardlinks and use_cow,
     * keeping defaults for missing keys. A ttl beyond seconds::max() is
     * clamped to it.
     */
    static CacheSettings from_config(const utils::Config& config);

    utils::Config to_config() const;
};

} // namespace blast::cache
