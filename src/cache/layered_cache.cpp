#include "layered_cache.hpp"
#include "utils/logger.hpp"

namespace blast::cache {

LayeredCache::LayeredCache(std::shared_ptr<storage::CacheStorage> fast,
                           std::shared_ptr<storage::CacheStorage> durable)
    : fast_(std::move(fast))
    , durable_(std::move(durable))
{}

Result<void> LayeredCache::store(const ContentHash& hash, const bytes& data) {
    auto durable = durable_->store(hash, data);
    if (durable.is_err()) {
        return durable;
    }

    auto fast = fast_->store(hash, data);
    if (fast.is_err()) {
        BLAST_LOG_WARN("Fast tier store failed for {}: {}",
                       hash.to_string(), fast.error().to_string());
    }
    return Result<void>::Ok();
}

Result<bytes> LayeredCache::load(const ContentHash& hash) {
    auto fast = fast_->load(hash);
    if (fast.is_ok()) {
        fast_hits_++;
        return fast;
    }
    if (fast.error().code() != ErrorCode::HashNotFound) {
        BLAST_LOG_DEBUG("Fast tier load failed for {}: {}",
                        hash.to_string(), fast.error().to_string());
    }

    auto durable = durable_->load(hash);
    if (durable.is_err()) {
        return durable;
    }
    durable_hits_++;

    auto promoted = fast_->store(hash, durable.value());
    if (promoted.is_err()) {
        failed_promotions_++;
        BLAST_LOG_WARN("Failed to promote {} to fast tier: {}",
                       hash.to_string(), promoted.error().to_string());
    } else {
        promotions_++;
    }
    return durable;
}

Result<void> LayeredCache::remove(const ContentHash& hash) {
    auto fast = fast_->remove(hash);
    if (fast.is_err() && fast.error().code() != ErrorCode::HashNotFound) {
        BLAST_LOG_WARN("Fast tier remove failed for {}: {}",
                       hash.to_string(), fast.error().to_string());
    }
    return durable_->remove(hash);
}

Result<void> LayeredCache::clear() {
    auto fast = fast_->clear();
    if (fast.is_err()) {
        BLAST_LOG_WARN("Fast tier clear failed: {}", fast.error().to_string());
    }
    return durable_->clear();
}

std::filesystem::path LayeredCache::hash_path(const ContentHash& hash) const {
    return durable_->hash_path(hash);
}

LayeredCache::Stats LayeredCache::stats() const {
    Stats s;
    s.fast_hits = fast_hits_.load();
    s.durable_hits = durable_hits_.load();
    s.promotions = promotions_.load();
    s.failed_promotions = failed_promotions_.load();
    return s;
}

} // namespace blast::cache
