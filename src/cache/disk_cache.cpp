#include "cache/disk_cache.hpp"
#include "crypto/blake3.hpp"
#include "utils/logger.hpp"

namespace blast::cache {

DiskCache::DiskCache(const std::filesystem::path& path)
    : storage_(path)
{}

ContentHash DiskCache::address(const std::string& layer_hash) {
    return ContentHash(crypto::Blake3::hash(layer_hash));
}

Result<std::optional<bytes>> DiskCache::get_layer(const std::string& layer_hash) {
    auto data = storage_.load(address(layer_hash));
    if (data.is_err()) {
        if (data.error().code() != ErrorCode::HashNotFound) {
            return data.error().with_context("Failed to read layer " + layer_hash);
        }
        misses_++;
        return Result<std::optional<bytes>>::Ok(std::nullopt);
    }

    hits_++;
    return Result<std::optional<bytes>>::Ok(data.unwrap());
}

Result<void> DiskCache::put_layer(const std::string& layer_hash, const bytes& data) {
    auto stored = storage_.store(address(layer_hash), data);
    if (stored.is_err()) {
        return stored.error().with_context("Failed to write layer " + layer_hash);
    }
    BLAST_LOG_DEBUG("Stored layer {} ({} bytes)", layer_hash, data.size());
    return Result<void>::Ok();
}

Result<void> DiskCache::remove_layer(const std::string& layer_hash) {
    return storage_.remove(address(layer_hash));
}

Result<void> DiskCache::cleanup() {
    return storage_.clear();
}

DiskCacheStats DiskCache::stats() const {
    DiskCacheStats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.total_size = storage_.total_size();
    stats.items = storage_.list_hashes().size();
    return stats;
}

} // namespace blast::cache
