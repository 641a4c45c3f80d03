#include "indexed_storage.hpp"
#include "utils/logger.hpp"
#include <mutex>

namespace blast::cache {

IndexedStorage::IndexedStorage(std::shared_ptr<storage::CacheStorage> inner)
    : inner_(std::move(inner))
{}

Result<void> IndexedStorage::store(const ContentHash& hash, const bytes& data) {
    return inner_->store(hash, data);
}

Result<bytes> IndexedStorage::load(const ContentHash& hash) {
    return inner_->load(hash);
}

Result<void> IndexedStorage::remove(const ContentHash& hash) {
    return inner_->remove(hash);
}

Result<void> IndexedStorage::clear() {
    {
        std::unique_lock<std::shared_mutex> lock(keys_mutex_);
        keys_.clear();
    }
    return inner_->clear();
}

std::filesystem::path IndexedStorage::hash_path(const ContentHash& hash) const {
    return inner_->hash_path(hash);
}

Result<void> IndexedStorage::store_with_key(const std::string& key,
                                            const ContentHash& hash,
                                            const bytes& data) {
    auto stored = inner_->store(hash, data);
    if (stored.is_err()) {
        return stored;
    }

    std::unique_lock<std::shared_mutex> lock(keys_mutex_);
    bool inserted = keys_.insert_or_assign(key, hash).second;
    if (!inserted) {
        BLAST_LOG_DEBUG("Key '{}' remapped to {}", key, hash.to_string());
    }
    return Result<void>::Ok();
}

Result<bytes> IndexedStorage::load_by_key(const std::string& key) {
    auto hash = hash_for_key(key);
    if (!hash) {
        return Error(ErrorCode::KeyNotFound, "Key not found: " + key);
    }
    return inner_->load(*hash);
}

Result<void> IndexedStorage::remove_by_key(const std::string& key) {
    ContentHash hash;
    {
        std::unique_lock<std::shared_mutex> lock(keys_mutex_);
        auto it = keys_.find(key);
        if (it == keys_.end()) {
            return Error(ErrorCode::KeyNotFound, "Key not found: " + key);
        }
        hash = it->second;
        keys_.erase(it);
    }
    return inner_->remove(hash);
}

std::optional<ContentHash> IndexedStorage::hash_for_key(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(keys_mutex_);
    auto it = keys_.find(key);
    if (it == keys_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t IndexedStorage::key_count() const {
    std::shared_lock<std::shared_mutex> lock(keys_mutex_);
    return keys_.size();
}

} // namespace blast::cache
