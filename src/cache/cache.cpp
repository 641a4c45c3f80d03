#include "cache.hpp"
#include "cache/compression.hpp"
#include "crypto/blake3.hpp"
#include "utils/logger.hpp"
#include <mutex>
#include <unordered_set>

namespace blast::cache {

namespace {

CacheIndex open_index(const std::filesystem::path& cache_dir) {
    auto index = CacheIndex::load_or_create(cache_dir);
    if (index.is_err()) {
        throw CacheException(index.error().code(), index.error().to_string());
    }
    return index.unwrap();
}

} // anonymous namespace

Cache::Cache(const CacheSettings& settings)
    : settings_(settings)
    , storage_(std::make_shared<storage::FileStorage>(settings.cache_dir))
    , index_(open_index(settings.cache_dir))
{
    BLAST_LOG_INFO("Opened cache at {} ({} entries)", settings_.cache_dir.string(), index_.size());
}

Cache::~Cache() = default;

bool Cache::is_expired(const CacheEntry& entry, time::TimePoint now) const {
    // Compared in whole seconds: converting a large TTL to clock ticks overflows
    auto age = std::chrono::duration_cast<std::chrono::seconds>(now - entry.created);
    return age >= settings_.ttl;
}

Result<void> Cache::release_blob_locked(const ContentHash& hash) {
    if (index_.references(hash) > 0) {
        return Result<void>::Ok();
    }

    auto removed = storage_->remove(hash);
    if (removed.is_err() && removed.error().code() != ErrorCode::HashNotFound) {
        return removed;
    }
    return Result<void>::Ok();
}

void Cache::evict_locked(const std::string& key, const char* reason) {
    auto entry = index_.remove(key);
    if (!entry) {
        return;
    }

    BLAST_LOG_DEBUG("Evicting '{}' ({})", key, reason);
    auto released = release_blob_locked(entry->hash);
    if (released.is_err()) {
        BLAST_LOG_WARN("Failed to delete blob {} of evicted key '{}': {}",
                       entry->hash.to_string(), key, released.error().to_string());
    }
}

void Cache::enforce_size_limit_locked(const std::string& keep_key) {
    while (index_.total_compressed_size() > settings_.max_size) {
        auto victim = index_.least_recently_accessed(keep_key);
        if (!victim) {
            break;
        }
        evict_locked(*victim, "size limit");
    }
}

Result<void> Cache::store(const std::string& key, const bytes& data) {
    ContentHash hash = crypto::Blake3::content_hash(data);

    auto compressed = compress(data, CompressionLevel::Default);
    if (compressed.is_err()) {
        return compressed.error().with_context("Failed to compress payload for '" + key + "'");
    }

    uint64_t compressed_size = compressed.value().size();
    if (compressed_size > settings_.max_size) {
        return Error(ErrorCode::SizeLimitExceeded, "Payload for '" + key + "' exceeds cache size limit",
                     std::to_string(compressed_size) + " > " + std::to_string(settings_.max_size));
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto stored = storage_->store(hash, compressed.value());
    if (stored.is_err()) {
        return stored.error().with_context("Failed to store payload for '" + key + "'");
    }

    std::optional<ContentHash> previous;
    if (const CacheEntry* existing = index_.get(key)) {
        previous = existing->hash;
    }

    auto now = time::now();
    CacheEntry entry;
    entry.hash = hash;
    entry.size = data.size();
    entry.compressed_size = compressed_size;
    entry.path = storage_->hash_path(hash).string();
    entry.accessed = now;
    entry.created = now;
    index_.insert(key, std::move(entry));

    if (previous && *previous != hash) {
        auto released = release_blob_locked(*previous);
        if (released.is_err()) {
            BLAST_LOG_WARN("Failed to delete replaced blob {}: {}",
                           previous->to_string(), released.error().to_string());
        }
    }

    enforce_size_limit_locked(key);

    auto saved = index_.save();
    if (saved.is_err()) {
        return saved.error().with_context("Failed to save cache index");
    }

    BLAST_LOG_DEBUG("Stored '{}' as {} ({} -> {} bytes)", key, hash.to_string(),
                    data.size(), compressed_size);
    return Result<void>::Ok();
}

Result<std::optional<bytes>> Cache::read_verified(const ContentHash& hash, std::string& problem) const {
    using ReadResult = Result<std::optional<bytes>>;

    auto blob = storage_->load(hash);
    if (blob.is_err()) {
        if (blob.error().code() != ErrorCode::HashNotFound) {
            return blob.error();
        }
        problem = "blob " + hash.to_string() + " is missing";
        return ReadResult::Ok(std::nullopt);
    }

    auto decompressed = decompress(blob.value());
    if (decompressed.is_err()) {
        problem = decompressed.error().to_string();
        return ReadResult::Ok(std::nullopt);
    }
    if (crypto::Blake3::content_hash(decompressed.value()) != hash) {
        problem = "content does not match " + hash.to_string();
        return ReadResult::Ok(std::nullopt);
    }
    return ReadResult::Ok(decompressed.unwrap());
}

Result<std::optional<bytes>> Cache::get(const std::string& key) {
    using GetResult = Result<std::optional<bytes>>;

    ContentHash hash;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        CacheEntry* entry = index_.get_mut(key);
        if (!entry) {
            return GetResult::Ok(std::nullopt);
        }

        auto now = time::now();
        if (is_expired(*entry, now)) {
            evict_locked(key, "expired");
            BLAST_TRY(index_.save());
            return GetResult::Ok(std::nullopt);
        }
        entry->accessed = now;
        hash = entry->hash;
        BLAST_TRY(index_.save());
    }

    // Read, inflate and verify without holding the index lock
    std::string problem;
    auto data = read_verified(hash, problem);
    if (data.is_ok() && data.value()) {
        return data;
    }

    // Confirm under the lock before treating the entry as corrupt; a writer
    // may have replaced or released the blob since it was looked up
    std::unique_lock<std::shared_mutex> lock(mutex_);

    const CacheEntry* entry = index_.get(key);
    if (!entry) {
        return GetResult::Ok(std::nullopt);
    }
    hash = entry->hash;

    data = read_verified(hash, problem);
    if (data.is_err()) {
        return data.error().with_context("Failed to read payload for '" + key + "'");
    }
    if (!data.value()) {
        BLAST_LOG_WARN("Cache entry '{}' is corrupt: {}", key, problem);
        evict_locked(key, "corrupted");
        BLAST_TRY(index_.save());
    }
    return data;
}

Result<void> Cache::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto entry = index_.remove(key);
    if (!entry) {
        return Result<void>::Ok();
    }

    // Index first: a failed blob delete leaves an orphan, never a dangling entry
    auto saved = index_.save();
    if (saved.is_err()) {
        return saved.error().with_context("Failed to save cache index");
    }

    auto released = release_blob_locked(entry->hash);
    if (released.is_err()) {
        return released.error().with_context("Failed to delete payload for '" + key + "'");
    }

    BLAST_LOG_DEBUG("Removed '{}'", key);
    return Result<void>::Ok();
}

Result<void> Cache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    index_.clear();

    auto cleared = storage_->clear();
    if (cleared.is_err()) {
        return cleared.error().with_context("Failed to clear cache storage");
    }

    auto saved = index_.save();
    if (saved.is_err()) {
        return saved.error().with_context("Failed to save cache index");
    }

    BLAST_LOG_INFO("Cleared cache at {}", settings_.cache_dir.string());
    return Result<void>::Ok();
}

Result<CacheStats> Cache::stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    CacheStats stats;
    stats.total_entries = index_.size();
    stats.total_size = index_.total_size();
    stats.total_compressed_size = index_.total_compressed_size();
    stats.compression_ratio = index_.compression_ratio();
    return Result<CacheStats>::Ok(stats);
}

bool Cache::contains(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return index_.get(key) != nullptr;
}

std::vector<std::string> Cache::keys() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<std::string> result;
    result.reserve(index_.size());
    for (const auto& [key, entry] : index_.entries()) {
        result.push_back(key);
    }
    return result;
}

Result<size_t> Cache::purge_expired() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto now = time::now();
    std::vector<std::string> expired;
    for (const auto& [key, entry] : index_.entries()) {
        if (is_expired(entry, now)) {
            expired.push_back(key);
        }
    }

    for (const auto& key : expired) {
        evict_locked(key, "expired");
    }

    if (!expired.empty()) {
        BLAST_TRY(index_.save());
        BLAST_LOG_INFO("Purged {} expired cache entries", expired.size());
    }
    return Result<size_t>::Ok(expired.size());
}

Result<size_t> Cache::collect_garbage() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::unordered_set<ContentHash> referenced;
    for (const auto& [key, entry] : index_.entries()) {
        referenced.insert(entry.hash);
    }

    size_t removed = 0;
    for (const auto& hash : storage_->list_hashes()) {
        if (referenced.count(hash) > 0) {
            continue;
        }
        auto result = storage_->remove(hash);
        if (result.is_err() && result.error().code() != ErrorCode::HashNotFound) {
            return result.error().with_context("Failed to delete orphaned blob");
        }
        ++removed;
    }

    if (removed > 0) {
        BLAST_LOG_INFO("Removed {} orphaned blobs", removed);
    }
    return Result<size_t>::Ok(removed);
}

} // namespace blast::cache
