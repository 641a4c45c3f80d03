#pragma once

#include "storage/storage.hpp"
#include <shared_mutex>
#include <unordered_map>

namespace blast::storage {

/**
 * Volatile in-process backend.
 *
 * The optional size limit applies to each blob individually, it is not an
 * aggregate budget.
 */
class MemoryStorage : public CacheStorage {
public:
    MemoryStorage() = default;
    explicit MemoryStorage(size_t size_limit);

    Result<void> store(const ContentHash& hash, const bytes& data) override;
    Result<bytes> load(const ContentHash& hash) override;
    Result<void> remove(const ContentHash& hash) override;
    Result<void> clear() override;

    // Memory storage doesn't use paths
    std::filesystem::path hash_path(const ContentHash& hash) const override;

    /**
     * Set per-blob size limit in bytes
     */
    void set_size_limit(size_t limit);

    std::optional<size_t> size_limit() const;

    /**
     * Current total payload size in bytes
     */
    size_t size() const;

    size_t item_count() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<ContentHash, bytes> data_;
    std::optional<size_t> size_limit_;
    size_t current_size_ = 0;
};

} // namespace blast::storage
