#pragma once

#include "blast/error.hpp"
#include "utils/logger.hpp"
#include <chrono>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace blast::cache {

/**
 * Cached value with its bookkeeping
 */
template<typename V>
struct LruEntry {
    V value;
    std::chrono::steady_clock::time_point created;
    std::optional<std::chrono::milliseconds> ttl;
    uint64_t hits{0};

    bool is_expired(std::chrono::steady_clock::time_point now) const {
        return ttl.has_value() && now - created >= *ttl;
    }
};

struct MemoryCacheStats {
    uint64_t hits{0};
    uint64_t misses{0};
    uint64_t evictions{0};
    size_t items{0};
    size_t memory_usage{0};  // Approximate, entry footprint only
};

/**
 * Thread-safe in-process cache bounded by entry count with optional
 * per-entry TTL.
 *
 * Expired entries are dropped lazily on get() or in bulk by cleanup().
 * Inserting a new key at capacity evicts the least recently used entry.
 */
template<typename K, typename V, typename Hash = std::hash<K>>
class MemoryCache {
public:
    using Ttl = std::chrono::milliseconds;

    /**
     * @throws CacheException if capacity is zero
     */
    explicit MemoryCache(size_t capacity)
        : capacity_(capacity)
    {
        if (capacity_ == 0) {
            throw CacheException(ErrorCode::InvalidArgument, "Memory cache capacity must be greater than zero");
        }
    }

    BLAST_DISALLOW_COPY(MemoryCache);

    /**
     * Look up a value, refreshing its recency on a hit
     */
    std::optional<V> get(const K& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = entries_.find(key);
        if (it == entries_.end()) {
            ++stats_.misses;
            return std::nullopt;
        }

        if (it->second.entry.is_expired(std::chrono::steady_clock::now())) {
            erase_locked(it);
            ++stats_.misses;
            ++stats_.evictions;
            return std::nullopt;
        }

        order_.splice(order_.begin(), order_, it->second.position);
        ++it->second.entry.hits;
        ++stats_.hits;
        return it->second.entry.value;
    }

    /**
     * Read an entry without touching counters or recency
     */
    std::optional<LruEntry<V>> peek(const K& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second.entry;
    }

    void put(const K& key, V value, std::optional<Ttl> ttl = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);

        LruEntry<V> entry{std::move(value), std::chrono::steady_clock::now(), ttl, 0};

        auto it = entries_.find(key);
        if (it != entries_.end()) {
            it->second.entry = std::move(entry);
            order_.splice(order_.begin(), order_, it->second.position);
            return;
        }

        if (entries_.size() >= capacity_) {
            auto victim = entries_.find(order_.back());
            erase_locked(victim);
            ++stats_.evictions;
        }

        order_.push_front(key);
        entries_.emplace(key, Slot{std::move(entry), order_.begin()});
    }

    /**
     * @return true if the key was present
     */
    bool remove(const K& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return false;
        }
        erase_locked(it);
        ++stats_.evictions;
        return true;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.evictions += entries_.size();
        entries_.clear();
        order_.clear();
    }

    /**
     * Drop every expired entry
     * @return Number of entries removed
     */
    size_t cleanup() {
        std::lock_guard<std::mutex> lock(mutex_);

        auto now = std::chrono::steady_clock::now();
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second.entry.is_expired(now)) {
                order_.erase(it->second.position);
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }

        stats_.evictions += removed;
        if (removed > 0) {
            BLAST_LOG_DEBUG("Memory cache cleanup removed {} expired entries", removed);
        }
        return removed;
    }

    MemoryCacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        MemoryCacheStats snapshot = stats_;
        snapshot.items = entries_.size();
        snapshot.memory_usage = entries_.size() * (sizeof(K) + sizeof(LruEntry<V>));
        return snapshot;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    struct Slot {
        LruEntry<V> entry;
        typename std::list<K>::iterator position;
    };
    using Map = std::unordered_map<K, Slot, Hash>;

    void erase_locked(typename Map::iterator it) {
        order_.erase(it->second.position);
        entries_.erase(it);
    }

    const size_t capacity_;

    mutable std::mutex mutex_;
    std::list<K> order_;  // Most recently used at the front
    Map entries_;
    MemoryCacheStats stats_;
};

} // namespace blast::cache
