#pragma once

#include "storage/storage.hpp"
#include <atomic>
#include <memory>

namespace blast::cache {

/**
 * Two-tier storage: a fast volatile tier in front of a durable tier.
 *
 * Writes go through to both tiers, durable first. Reads try the fast tier and
 * fall back to the durable tier, promoting what they find. Only durable-tier
 * failures fail a call; fast-tier failures are logged and ignored.
 */
class LayeredCache : public storage::CacheStorage {
public:
    struct Stats {
        uint64_t fast_hits{0};
        uint64_t durable_hits{0};
        uint64_t promotions{0};
        uint64_t failed_promotions{0};
    };

    LayeredCache(std::shared_ptr<storage::CacheStorage> fast,
                 std::shared_ptr<storage::CacheStorage> durable);

    Result<void> store(const ContentHash& hash, const bytes& data) override;
    Result<bytes> load(const ContentHash& hash) override;
    Result<void> remove(const ContentHash& hash) override;
    Result<void> clear() override;

    // Address in the durable tier
    std::filesystem::path hash_path(const ContentHash& hash) const override;

    Stats stats() const;

private:
    std::shared_ptr<storage::CacheStorage> fast_;
    std::shared_ptr<storage::CacheStorage> durable_;

    std::atomic<uint64_t> fast_hits_{0};
    std::atomic<uint64_t> durable_hits_{0};
    std::atomic<uint64_t> promotions_{0};
    std::atomic<uint64_t> failed_promotions_{0};
};

} // namespace blast::cache
