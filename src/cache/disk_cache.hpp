#pragma once

#include "storage/storage.hpp"
#include <atomic>
#include <optional>
#include <string>

namespace blast::cache {

struct DiskCacheStats {
    uint64_t hits{0};
    uint64_t misses{0};
    uint64_t total_size{0};
    size_t items{0};
};

/**
 * Layer store addressed by layer identifiers.
 *
 * A layer identifier is an arbitrary string; its BLAKE3 hash is the blob
 * address in the underlying FileStorage.
 */
class DiskCache {
public:
    /**
     * @throws StorageException if the directory cannot be created
     */
    explicit DiskCache(const std::filesystem::path& path);

    /**
     * @return nullopt if no layer is stored under the identifier
     */
    Result<std::optional<bytes>> get_layer(const std::string& layer_hash);

    Result<void> put_layer(const std::string& layer_hash, const bytes& data);

    Result<void> remove_layer(const std::string& layer_hash);

    // Drop every stored layer
    Result<void> cleanup();

    DiskCacheStats stats() const;

private:
    static ContentHash address(const std::string& layer_hash);

    storage::FileStorage storage_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

} // namespace blast::cache
