#include "lru_storage.hpp"
#include "utils/logger.hpp"

namespace blast::cache {

LruStorage::LruStorage(std::shared_ptr<storage::CacheStorage> inner, size_t capacity)
    : inner_(std::move(inner))
    , capacity_(capacity)
{
    if (capacity_ == 0) {
        throw CacheException(ErrorCode::InvalidArgument, "LRU capacity must be greater than zero");
    }
}

void LruStorage::touch_locked(std::list<ContentHash>::iterator it) {
    order_.splice(order_.begin(), order_, it);
}

Result<void> LruStorage::store(const ContentHash& hash, const bytes& data) {
    // Held for the whole call so concurrent stores observe each other's evictions
    std::lock_guard<std::mutex> lock(mutex_);

    auto stored = inner_->store(hash, data);
    if (stored.is_err()) {
        return stored;
    }

    auto existing = members_.find(hash);
    if (existing != members_.end()) {
        touch_locked(existing->second);
        return Result<void>::Ok();
    }

    if (members_.size() >= capacity_) {
        ContentHash victim = order_.back();
        order_.pop_back();
        members_.erase(victim);
        ++evictions_;

        auto removed = inner_->remove(victim);
        if (removed.is_err() && removed.error().code() != ErrorCode::HashNotFound) {
            BLAST_LOG_WARN("Failed to remove evicted blob {}: {}",
                           victim.to_string(), removed.error().to_string());
        } else {
            BLAST_LOG_DEBUG("Evicted least recently used blob {}", victim.to_string());
        }
    }

    order_.push_front(hash);
    members_.emplace(hash, order_.begin());
    return Result<void>::Ok();
}

Result<bytes> LruStorage::load(const ContentHash& hash) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = members_.find(hash);
    if (it == members_.end()) {
        return Error(ErrorCode::HashNotFound, "Data not found: " + hash.to_string());
    }

    auto data = inner_->load(hash);
    if (data.is_err()) {
        if (data.error().code() == ErrorCode::HashNotFound) {
            // Inner storage lost the blob behind our back
            order_.erase(it->second);
            members_.erase(it);
        }
        return data;
    }

    touch_locked(it->second);
    return data;
}

Result<void> LruStorage::remove(const ContentHash& hash) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = members_.find(hash);
    if (it != members_.end()) {
        order_.erase(it->second);
        members_.erase(it);
    }
    return inner_->remove(hash);
}

Result<void> LruStorage::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    order_.clear();
    members_.clear();
    return inner_->clear();
}

std::filesystem::path LruStorage::hash_path(const ContentHash& hash) const {
    return inner_->hash_path(hash);
}

size_t LruStorage::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return members_.size();
}

bool LruStorage::contains(const ContentHash& hash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return members_.count(hash) > 0;
}

uint64_t LruStorage::evictions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evictions_;
}

} // namespace blast::cache
