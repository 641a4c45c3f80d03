#pragma once

#include "blast/common.hpp"
#include "blast/error.hpp"
#include "blast/time_utils.hpp"
#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace blast::cache {

// On-disk timestamp form: {"secs_since_epoch", "nanos_since_epoch"}
nlohmann::json timestamp_to_json(const time::TimePoint& tp);
time::TimePoint timestamp_from_json(const nlohmann::json& j);

/**
 * Pretty-print j to temp_path, then rename it over path
 */
Result<void> write_json_file(const nlohmann::json& j, const std::filesystem::path& path,
                             const std::filesystem::path& temp_path);

/**
 * Metadata for one cached key
 */
struct CacheEntry {
    ContentHash hash;
    uint64_t size{0};             // Original payload bytes
    uint64_t compressed_size{0};  // Bytes on disk
    std::string path;             // Blob location
    time::TimePoint accessed;
    time::TimePoint created;
};

/**
 * Durable key -> CacheEntry table stored as <cache_dir>/index.json.
 *
 * Not thread-safe; the owning Cache serializes access.
 */
class CacheIndex {
public:
    using EntryMap = std::map<std::string, CacheEntry>;

    /**
     * Load <cache_dir>/index.json, or start empty if it does not exist
     * @return ErrorCode::DeserializationFailed if the file is not a valid index
     */
    static Result<CacheIndex> load_or_create(const std::filesystem::path& cache_dir);

    /**
     * Write the index to index.tmp, then rename it over index.json
     */
    Result<void> save() const;

    void insert(const std::string& key, CacheEntry entry);
    const CacheEntry* get(const std::string& key) const;
    CacheEntry* get_mut(const std::string& key);
    std::optional<CacheEntry> remove(const std::string& key);
    void clear();

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    uint64_t total_size() const;
    uint64_t total_compressed_size() const;

    /**
     * compressed / raw, 1.0 when nothing is stored
     */
    double compression_ratio() const;

    /**
     * Number of keys whose entry points at a hash
     */
    size_t references(const ContentHash& hash) const;

    /**
     * Key of the entry with the oldest access time, if any
     * @param skip Key never to return
     */
    std::optional<std::string> least_recently_accessed(
        const std::optional<std::string>& skip = std::nullopt) const;

    const EntryMap& entries() const { return entries_; }
    time::TimePoint last_modified() const { return last_modified_; }
    const std::filesystem::path& path() const { return path_; }

private:
    explicit CacheIndex(std::filesystem::path path);

    void touch();

    std::filesystem::path path_;
    EntryMap entries_;
    time::TimePoint last_modified_;
};

} // namespace blast::cache
