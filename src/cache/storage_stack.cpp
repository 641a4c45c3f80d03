#include "cache/storage_stack.hpp"
#include "cache/lru_storage.hpp"
#include "storage/memory_storage.hpp"
#include "utils/logger.hpp"

namespace blast::cache {

namespace {

Error indexing_disabled() {
    return Error(ErrorCode::NotSupported, "Indexing not enabled");
}

} // anonymous namespace

StorageStack::StorageStack(std::shared_ptr<storage::CacheStorage> top,
                           std::shared_ptr<LayeredCache> layers,
                           std::shared_ptr<IndexedStorage> indexed,
                           bool compression)
    : top_(std::move(top))
    , layers_(std::move(layers))
    , indexed_(std::move(indexed))
    , compression_(compression)
{}

Result<void> StorageStack::store(const ContentHash& hash, const bytes& data) {
    return top_->store(hash, data);
}

Result<bytes> StorageStack::load(const ContentHash& hash) {
    return top_->load(hash);
}

Result<void> StorageStack::remove(const ContentHash& hash) {
    return top_->remove(hash);
}

Result<void> StorageStack::clear() {
    return top_->clear();
}

Result<void> StorageStack::store_with_key(const std::string& key, const ContentHash& hash,
                                          const bytes& data) {
    if (!indexed_) {
        return indexing_disabled();
    }
    return indexed_->store_with_key(key, hash, data);
}

Result<bytes> StorageStack::load_by_key(const std::string& key) {
    if (!indexed_) {
        return indexing_disabled();
    }
    return indexed_->load_by_key(key);
}

Result<void> StorageStack::remove_by_key(const std::string& key) {
    if (!indexed_) {
        return indexing_disabled();
    }
    return indexed_->remove_by_key(key);
}

StorageBuilder& StorageBuilder::path(const std::filesystem::path& path) {
    path_ = path;
    return *this;
}

StorageBuilder& StorageBuilder::memory_size(size_t entries) {
    memory_size_ = entries;
    return *this;
}

StorageBuilder& StorageBuilder::compression(bool enabled) {
    compression_ = enabled;
    return *this;
}

StorageBuilder& StorageBuilder::indexed(bool enabled) {
    indexed_ = enabled;
    return *this;
}

Result<StorageStack> StorageBuilder::build() const {
    if (!path_) {
        return Error(ErrorCode::InvalidArgument, "Cache path not specified");
    }

    try {
        auto disk = std::make_shared<storage::FileStorage>(*path_);
        auto memory = std::make_shared<storage::MemoryStorage>();
        auto layers = std::make_shared<LayeredCache>(memory, disk);

        std::shared_ptr<storage::CacheStorage> top = layers;
        if (compression_) {
            top = std::make_shared<CompressedStorage>(top);
        }
        if (memory_size_) {
            top = std::make_shared<LruStorage>(top, *memory_size_);
        }

        std::shared_ptr<IndexedStorage> indexed;
        if (indexed_) {
            indexed = std::make_shared<IndexedStorage>(top);
            top = indexed;
        }

        BLAST_LOG_DEBUG("Built storage stack at {} (compression: {}, lru: {}, indexed: {})",
                        path_->string(), compression_, memory_size_.value_or(0), indexed_);
        return Result<StorageStack>::Ok(StorageStack(top, layers, indexed, compression_));
    } catch (const BlastException& e) {
        return Error(e.code(), "Failed to build storage stack", e.what());
    }
}

} // namespace blast::cache
