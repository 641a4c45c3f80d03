#pragma once

#include "blast/common.hpp"
#include "blast/error.hpp"
#include "cache/cache_index.hpp"
#include "cache/cache_settings.hpp"
#include "storage/storage.hpp"
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace blast::cache {

struct CacheStats {
    size_t total_entries{0};
    uint64_t total_size{0};
    uint64_t total_compressed_size{0};
    double compression_ratio{1.0};  // compressed / raw
};

/**
 * Persistent content-addressed cache keyed by logical names.
 *
 * Payloads are hashed with BLAKE3, compressed with zlib and written to a
 * sharded FileStorage under their hash; a CacheIndex maps each key to its
 * entry and is saved after every mutation. Reads verify the hash and treat
 * missing, undecodable or mismatching blobs as corruption: the entry is
 * evicted and the read reports a miss.
 *
 * All operations are thread-safe. get() reads and verifies the blob outside
 * the index lock. One process owns a cache directory.
 */
class Cache {
public:
    /**
     * Open or create the cache in settings.cache_dir
     * @throws StorageException if the directory cannot be created
     * @throws CacheException if an existing index cannot be read
     */
    explicit Cache(const CacheSettings& settings);
    ~Cache();

    BLAST_DISALLOW_COPY(Cache);

    /**
     * Store a payload under a key, replacing any previous payload
     * @return ErrorCode::SizeLimitExceeded if the compressed payload alone
     *         exceeds max_size
     */
    Result<void> store(const std::string& key, const bytes& data);

    /**
     * Fetch the payload for a key
     * @return nullopt on a miss, including TTL expiry and detected corruption
     */
    Result<std::optional<bytes>> get(const std::string& key);

    /**
     * Remove a key. Removing an absent key succeeds.
     */
    Result<void> remove(const std::string& key);

    /**
     * Remove every key and blob
     */
    Result<void> clear();

    Result<CacheStats> stats() const;

    bool contains(const std::string& key) const;

    std::vector<std::string> keys() const;

    /**
     * Evict every entry whose TTL has elapsed
     * @return Number of entries removed
     */
    Result<size_t> purge_expired();

    /**
     * Delete blobs on disk that no entry references
     * @return Number of blobs removed
     */
    Result<size_t> collect_garbage();

    const CacheSettings& settings() const { return settings_; }

private:
    bool is_expired(const CacheEntry& entry, time::TimePoint now) const;

    /**
     * Load, decompress and hash-check a blob
     * @return nullopt with problem set when the blob is missing or corrupt
     */
    Result<std::optional<bytes>> read_verified(const ContentHash& hash, std::string& problem) const;

    // Callers hold mutex_ exclusively
    Result<void> release_blob_locked(const ContentHash& hash);
    void evict_locked(const std::string& key, const char* reason);
    void enforce_size_limit_locked(const std::string& keep_key);

    CacheSettings settings_;
    std::shared_ptr<storage::FileStorage> storage_;

    mutable std::shared_mutex mutex_;
    CacheIndex index_;
};

} // namespace blast::cache
