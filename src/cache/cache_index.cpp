#include "cache_index.hpp"
#include "utils/logger.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <system_error>

namespace blast::cache {

using json = nlohmann::json;

json timestamp_to_json(const time::TimePoint& tp) {
    auto [secs, nanos] = time::to_epoch_parts(tp);
    json j;
    j["secs_since_epoch"] = secs;
    j["nanos_since_epoch"] = nanos;
    return j;
}

time::TimePoint timestamp_from_json(const json& j) {
    return time::from_epoch_parts(j.at("secs_since_epoch").get<uint64_t>(),
                                  j.at("nanos_since_epoch").get<uint32_t>());
}

Result<void> write_json_file(const json& j, const std::filesystem::path& path,
                             const std::filesystem::path& temp_path) {
    std::string data;
    try {
        data = j.dump(2);
    } catch (const json::exception& e) {
        return Error(ErrorCode::SerializationFailed, "Failed to serialize " + path.filename().string(), e.what());
    }

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return Error(ErrorCode::IoError, "Failed to write index", temp_path.string());
        }
        file << data;
        if (!file.good()) {
            return Error(ErrorCode::IoError, "Failed to write index", temp_path.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        return Error(ErrorCode::IoError, "Failed to rename index", ec.message());
    }
    return Result<void>::Ok();
}

namespace {

json entry_to_json(const CacheEntry& entry) {
    json j;
    j["hash"] = entry.hash.to_string();
    j["size"] = entry.size;
    j["compressed_size"] = entry.compressed_size;
    j["path"] = entry.path;
    j["accessed"] = timestamp_to_json(entry.accessed);
    j["created"] = timestamp_to_json(entry.created);
    return j;
}

CacheEntry entry_from_json(const json& j) {
    CacheEntry entry;
    entry.hash = ContentHash::from_string(j.at("hash").get<std::string>());
    entry.size = j.at("size").get<uint64_t>();
    entry.compressed_size = j.at("compressed_size").get<uint64_t>();
    entry.path = j.at("path").get<std::string>();
    entry.accessed = timestamp_from_json(j.at("accessed"));
    entry.created = timestamp_from_json(j.at("created"));
    return entry;
}

} // anonymous namespace

CacheIndex::CacheIndex(std::filesystem::path path)
    : path_(std::move(path))
    , last_modified_(time::now())
{}

Result<CacheIndex> CacheIndex::load_or_create(const std::filesystem::path& cache_dir) {
    CacheIndex index(cache_dir / constants::INDEX_FILE_NAME);

    std::error_code ec;
    if (!std::filesystem::exists(index.path_, ec)) {
        BLAST_LOG_DEBUG("No index at {}, starting empty", index.path_.string());
        return Result<CacheIndex>::Ok(std::move(index));
    }

    std::ifstream file(index.path_);
    if (!file.is_open()) {
        return Error(ErrorCode::IoError, "Failed to read index", index.path_.string());
    }

    try {
        json j;
        file >> j;

        const auto& entries = j.at("entries");
        if (!entries.is_object()) {
            return Error(ErrorCode::InvalidFormat, "Index entries are not an object", index.path_.string());
        }
        for (auto it = entries.begin(); it != entries.end(); ++it) {
            index.entries_.emplace(it.key(), entry_from_json(it.value()));
        }
        if (j.contains("last_modified")) {
            index.last_modified_ = timestamp_from_json(j.at("last_modified"));
        }
    } catch (const std::exception& e) {
        return Error(ErrorCode::DeserializationFailed, "Failed to parse index", e.what());
    }

    BLAST_LOG_DEBUG("Loaded index with {} entries from {}", index.entries_.size(), index.path_.string());
    return Result<CacheIndex>::Ok(std::move(index));
}

Result<void> CacheIndex::save() const {
    json j;
    json entries = json::object();
    for (const auto& [key, entry] : entries_) {
        entries[key] = entry_to_json(entry);
    }
    j["entries"] = entries;
    j["last_modified"] = timestamp_to_json(last_modified_);

    return write_json_file(j, path_, path_.parent_path() / constants::INDEX_TEMP_FILE_NAME);
}

void CacheIndex::touch() {
    last_modified_ = time::now();
}

void CacheIndex::insert(const std::string& key, CacheEntry entry) {
    entries_.insert_or_assign(key, std::move(entry));
    touch();
}

const CacheEntry* CacheIndex::get(const std::string& key) const {
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second;
}

CacheEntry* CacheIndex::get_mut(const std::string& key) {
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second;
}

std::optional<CacheEntry> CacheIndex::remove(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    CacheEntry entry = std::move(it->second);
    entries_.erase(it);
    touch();
    return entry;
}

void CacheIndex::clear() {
    entries_.clear();
    touch();
}

uint64_t CacheIndex::total_size() const {
    uint64_t total = 0;
    for (const auto& [key, entry] : entries_) {
        total += entry.size;
    }
    return total;
}

uint64_t CacheIndex::total_compressed_size() const {
    uint64_t total = 0;
    for (const auto& [key, entry] : entries_) {
        total += entry.compressed_size;
    }
    return total;
}

double CacheIndex::compression_ratio() const {
    uint64_t raw = total_size();
    if (raw == 0) {
        return 1.0;
    }
    return static_cast<double>(total_compressed_size()) / static_cast<double>(raw);
}

size_t CacheIndex::references(const ContentHash& hash) const {
    size_t count = 0;
    for (const auto& [key, entry] : entries_) {
        if (entry.hash == hash) {
            ++count;
        }
    }
    return count;
}

std::optional<std::string> CacheIndex::least_recently_accessed(
    const std::optional<std::string>& skip) const {
    auto oldest = entries_.end();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (skip && it->first == *skip) {
            continue;
        }
        if (oldest == entries_.end() || it->second.accessed < oldest->second.accessed) {
            oldest = it;
        }
    }
    if (oldest == entries_.end()) {
        return std::nullopt;
    }
    return oldest->first;
}

} // namespace blast::cache
