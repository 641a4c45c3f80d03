#pragma once

#include "storage/storage.hpp"
#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace blast::cache {

/**
 * Storage decorator adding an in-memory string key -> content hash table.
 *
 * The table is not persisted. Re-using a key overwrites its mapping; the
 * blob it pointed to stays in the inner storage and is only reachable by
 * hash or through another key.
 */
class IndexedStorage : public storage::CacheStorage {
public:
    explicit IndexedStorage(std::shared_ptr<storage::CacheStorage> inner);

    Result<void> store(const ContentHash& hash, const bytes& data) override;
    Result<bytes> load(const ContentHash& hash) override;
    Result<void> remove(const ContentHash& hash) override;

    /**
     * Clear the inner storage and the key table
     */
    Result<void> clear() override;

    std::filesystem::path hash_path(const ContentHash& hash) const override;

    /**
     * Store a blob by hash, then map key to it
     */
    Result<void> store_with_key(const std::string& key, const ContentHash& hash, const bytes& data);

    /**
     * Load the blob a key maps to
     * @return ErrorCode::KeyNotFound if the key is not mapped
     */
    Result<bytes> load_by_key(const std::string& key);

    /**
     * Drop a key's mapping, then delete the blob it pointed to
     */
    Result<void> remove_by_key(const std::string& key);

    std::optional<ContentHash> hash_for_key(const std::string& key) const;

    size_t key_count() const;

private:
    std::shared_ptr<storage::CacheStorage> inner_;

    mutable std::shared_mutex keys_mutex_;
    std::unordered_map<std::string, ContentHash> keys_;
};

} // namespace blast::cache
