#pragma once

#include "storage/storage.hpp"
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace blast::cache {

/**
 * Storage decorator bounding membership to the N most recently used hashes.
 *
 * Only hashes stored through this decorator are loadable; content already
 * present in the inner storage stays invisible until stored here. When a new
 * hash arrives at capacity, the least recently used hash is evicted and its
 * blob removed from the inner storage.
 */
class LruStorage : public storage::CacheStorage {
public:
    /**
     * @throws CacheException if capacity is zero
     */
    LruStorage(std::shared_ptr<storage::CacheStorage> inner, size_t capacity);

    Result<void> store(const ContentHash& hash, const bytes& data) override;
    Result<bytes> load(const ContentHash& hash) override;
    Result<void> remove(const ContentHash& hash) override;
    Result<void> clear() override;
    std::filesystem::path hash_path(const ContentHash& hash) const override;

    size_t capacity() const { return capacity_; }
    size_t size() const;
    bool contains(const ContentHash& hash) const;
    uint64_t evictions() const;

private:
    void touch_locked(std::list<ContentHash>::iterator it);

    std::shared_ptr<storage::CacheStorage> inner_;
    const size_t capacity_;

    // Most recently used at the front
    mutable std::mutex mutex_;
    std::list<ContentHash> order_;
    std::unordered_map<ContentHash, std::list<ContentHash>::iterator> members_;
    uint64_t evictions_ = 0;
};

} // namespace blast::cache
