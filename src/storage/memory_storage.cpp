#include "memory_storage.hpp"
#include <mutex>

namespace blast::storage {

MemoryStorage::MemoryStorage(size_t size_limit)
    : size_limit_(size_limit)
{}

Result<void> MemoryStorage::store(const ContentHash& hash, const bytes& data) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (size_limit_ && data.size() > *size_limit_) {
        return Error(ErrorCode::SizeLimitExceeded,
                     "Data exceeds size limit",
                     std::to_string(data.size()) + " > " + std::to_string(*size_limit_) + " bytes");
    }

    auto it = data_.find(hash);
    if (it != data_.end()) {
        current_size_ -= it->second.size();
        it->second = data;
    } else {
        data_.emplace(hash, data);
    }
    current_size_ += data.size();

    return Result<void>::Ok();
}

Result<bytes> MemoryStorage::load(const ContentHash& hash) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = data_.find(hash);
    if (it == data_.end()) {
        return Error(ErrorCode::HashNotFound, "Data not found: " + hash.to_string());
    }
    return Result<bytes>::Ok(it->second);
}

Result<void> MemoryStorage::remove(const ContentHash& hash) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = data_.find(hash);
    if (it == data_.end()) {
        return Error(ErrorCode::HashNotFound, "Data not found: " + hash.to_string());
    }
    current_size_ -= it->second.size();
    data_.erase(it);

    return Result<void>::Ok();
}

Result<void> MemoryStorage::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    data_.clear();
    current_size_ = 0;
    return Result<void>::Ok();
}

std::filesystem::path MemoryStorage::hash_path(const ContentHash&) const {
    return {};
}

void MemoryStorage::set_size_limit(size_t limit) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_limit_ = limit;
}

std::optional<size_t> MemoryStorage::size_limit() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return size_limit_;
}

size_t MemoryStorage::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return current_size_;
}

size_t MemoryStorage::item_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return data_.size();
}

} // namespace blast::storage
