#pragma once

#include "cache/compression.hpp"
#include "cache/indexed_storage.hpp"
#include "cache/layered_cache.hpp"
#include <filesystem>
#include <memory>
#include <optional>

namespace blast::cache {

/**
 * A composed chain of storage decorators built by StorageBuilder
 */
class StorageStack {
public:
    Result<void> store(const ContentHash& hash, const bytes& data);
    Result<bytes> load(const ContentHash& hash);
    Result<void> remove(const ContentHash& hash);
    Result<void> clear();

    /**
     * Key-addressed access
     * @return ErrorCode::NotSupported when the stack was built without indexing
     */
    Result<void> store_with_key(const std::string& key, const ContentHash& hash, const bytes& data);
    Result<bytes> load_by_key(const std::string& key);
    Result<void> remove_by_key(const std::string& key);

    bool is_compression_enabled() const { return compression_; }
    bool is_indexed() const { return indexed_ != nullptr; }

    LayeredCache::Stats layer_stats() const { return layers_->stats(); }

private:
    friend class StorageBuilder;

    StorageStack(std::shared_ptr<storage::CacheStorage> top,
                 std::shared_ptr<LayeredCache> layers,
                 std::shared_ptr<IndexedStorage> indexed,
                 bool compression);

    std::shared_ptr<storage::CacheStorage> top_;
    std::shared_ptr<LayeredCache> layers_;
    std::shared_ptr<IndexedStorage> indexed_;
    bool compression_;
};

/**
 * Builder for a StorageStack.
 *
 * The stack is LayeredCache(MemoryStorage, FileStorage(path)), wrapped in
 * CompressedStorage when compression is on, then LruStorage when a memory
 * size is set, then IndexedStorage when indexing is on.
 */
class StorageBuilder {
public:
    StorageBuilder& path(const std::filesystem::path& path);

    // LRU membership bound, in entries
    StorageBuilder& memory_size(size_t entries);

    StorageBuilder& compression(bool enabled);
    StorageBuilder& indexed(bool enabled);

    /**
     * @return ErrorCode::InvalidArgument if no path was set
     */
    Result<StorageStack> build() const;

private:
    std::optional<std::filesystem::path> path_;
    std::optional<size_t> memory_size_;
    bool compression_ = false;
    bool indexed_ = false;
};

} // namespace blast::cache
