#include "layer_store.hpp"
#include "cache/cache_index.hpp"
#include "crypto/blake3.hpp"
#include "utils/logger.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <type_traits>

namespace blast::cache {

using json = nlohmann::json;

const char* layer_kind_to_string(LayerKind kind) {
    switch (kind) {
        case LayerKind::Package: return "package";
        case LayerKind::Build: return "build";
        case LayerKind::Environment: return "environment";
        case LayerKind::Resolution: return "resolution";
        case LayerKind::Image: return "image";
    }
    return "unknown";
}

std::optional<LayerKind> layer_kind_from_string(const std::string& name) {
    if (name == "package") return LayerKind::Package;
    if (name == "build") return LayerKind::Build;
    if (name == "environment") return LayerKind::Environment;
    if (name == "resolution") return LayerKind::Resolution;
    if (name == "image") return LayerKind::Image;
    return std::nullopt;
}

CompressionLevel compression_for(LayerKind kind) {
    switch (kind) {
        case LayerKind::Package: return CompressionLevel::Maximum;
        case LayerKind::Build: return CompressionLevel::Default;
        case LayerKind::Environment: return CompressionLevel::Fast;
        case LayerKind::Resolution: return CompressionLevel::Maximum;
        case LayerKind::Image: return CompressionLevel::Default;
    }
    return CompressionLevel::Default;
}

const char* image_layer_type_to_string(ImageLayerType type) {
    switch (type) {
        case ImageLayerType::Base: return "base";
        case ImageLayerType::Packages: return "packages";
        case ImageLayerType::Config: return "config";
        case ImageLayerType::Files: return "files";
    }
    return "unknown";
}

std::optional<ImageLayerType> image_layer_type_from_string(const std::string& name) {
    if (name == "base") return ImageLayerType::Base;
    if (name == "packages") return ImageLayerType::Packages;
    if (name == "config") return ImageLayerType::Config;
    if (name == "files") return ImageLayerType::Files;
    return std::nullopt;
}

LayerKind layer_kind(const CacheLayer& layer) {
    return std::visit([](const auto& l) {
        using L = std::decay_t<decltype(l)>;
        if constexpr (std::is_same_v<L, PackageLayer>) {
            return LayerKind::Package;
        } else if constexpr (std::is_same_v<L, BuildLayer>) {
            return LayerKind::Build;
        } else if constexpr (std::is_same_v<L, EnvironmentLayer>) {
            return LayerKind::Environment;
        } else if constexpr (std::is_same_v<L, ResolutionLayer>) {
            return LayerKind::Resolution;
        } else {
            return LayerKind::Image;
        }
    }, layer);
}

namespace {

json layer_to_json(const CacheLayer& layer) {
    json j;
    j["kind"] = layer_kind_to_string(layer_kind(layer));

    std::visit([&j](const auto& l) {
        using L = std::decay_t<decltype(l)>;
        if constexpr (std::is_same_v<L, PackageLayer>) {
            j["name"] = l.name;
            j["version"] = l.version;
            j["hash"] = l.hash;
        } else if constexpr (std::is_same_v<L, BuildLayer>) {
            j["package"] = l.package;
            j["version"] = l.version;
            j["platform"] = l.platform;
            j["python_version"] = l.python_version;
        } else if constexpr (std::is_same_v<L, EnvironmentLayer>) {
            j["name"] = l.name;
            j["python_version"] = l.python_version;
            j["timestamp"] = timestamp_to_json(l.timestamp);
        } else if constexpr (std::is_same_v<L, ResolutionLayer>) {
            j["requirements"] = l.requirements;
            j["python_version"] = l.python_version;
            j["platform"] = l.platform;
        } else {
            j["hash"] = l.hash;
            j["layer_type"] = image_layer_type_to_string(l.layer_type);
            j["parent"] = l.parent ? json(*l.parent) : json(nullptr);
        }
    }, layer);

    return j;
}

std::optional<std::string> optional_string(const json& j, const char* field) {
    if (!j.contains(field) || j.at(field).is_null()) {
        return std::nullopt;
    }
    return j.at(field).get<std::string>();
}

CacheLayer layer_from_json(const json& j) {
    auto kind = layer_kind_from_string(j.at("kind").get<std::string>());
    if (!kind) {
        throw std::invalid_argument("Unknown layer kind: " + j.at("kind").get<std::string>());
    }

    switch (*kind) {
        case LayerKind::Package:
            return PackageLayer{j.at("name").get<std::string>(),
                                j.at("version").get<std::string>(),
                                j.at("hash").get<std::string>()};
        case LayerKind::Build:
            return BuildLayer{j.at("package").get<std::string>(),
                              j.at("version").get<std::string>(),
                              j.at("platform").get<std::string>(),
                              j.at("python_version").get<std::string>()};
        case LayerKind::Environment:
            return EnvironmentLayer{j.at("name").get<std::string>(),
                                    j.at("python_version").get<std::string>(),
                                    timestamp_from_json(j.at("timestamp"))};
        case LayerKind::Resolution:
            return ResolutionLayer{j.at("requirements").get<std::vector<std::string>>(),
                                   j.at("python_version").get<std::string>(),
                                   j.at("platform").get<std::string>()};
        case LayerKind::Image: {
            auto type = image_layer_type_from_string(j.at("layer_type").get<std::string>());
            if (!type) {
                throw std::invalid_argument("Unknown image layer type: " + j.at("layer_type").get<std::string>());
            }
            return ImageLayer{j.at("hash").get<std::string>(), *type, optional_string(j, "parent")};
        }
    }
    throw std::invalid_argument("Unhandled layer kind");
}

json entry_to_json(const LayerEntry& entry) {
    json j;
    j["layer"] = layer_to_json(entry.layer);
    j["hash"] = entry.hash.to_string();
    j["size"] = entry.size;
    j["compressed_size"] = entry.compressed_size;
    j["compression"] = compression_level_to_string(entry.compression);
    j["path"] = entry.path;
    j["accessed"] = timestamp_to_json(entry.accessed);
    j["created"] = timestamp_to_json(entry.created);
    j["access_count"] = entry.access_count;
    j["parent"] = entry.parent ? json(*entry.parent) : json(nullptr);
    return j;
}

LayerEntry entry_from_json(const json& j) {
    auto compression = compression_level_from_string(j.at("compression").get<std::string>());
    if (!compression) {
        throw std::invalid_argument("Unknown compression level: " + j.at("compression").get<std::string>());
    }

    LayerEntry entry;
    entry.layer = layer_from_json(j.at("layer"));
    entry.hash = ContentHash::from_string(j.at("hash").get<std::string>());
    entry.size = j.at("size").get<uint64_t>();
    entry.compressed_size = j.at("compressed_size").get<uint64_t>();
    entry.compression = *compression;
    entry.path = j.at("path").get<std::string>();
    entry.accessed = timestamp_from_json(j.at("accessed"));
    entry.created = timestamp_from_json(j.at("created"));
    entry.access_count = j.at("access_count").get<uint64_t>();
    entry.parent = optional_string(j, "parent");
    return entry;
}

} // anonymous namespace

LayerStore::LayerStore(const std::filesystem::path& root,
                       std::shared_ptr<storage::CacheStorage> storage,
                       LayerSizeLimits limits)
    : root_(root)
    , storage_(std::move(storage))
    , limits_(std::move(limits))
{
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        throw CacheException(ErrorCode::IoError,
            "Failed to create layer cache directory " + root_.string() + ": " + ec.message());
    }

    auto loaded = load_index();
    if (loaded.is_err()) {
        throw CacheException(loaded.error().code(), loaded.error().to_string());
    }

    BLAST_LOG_INFO("Opened layer cache at {} ({} layers)", root_.string(), entries_.size());
}

Result<void> LayerStore::load_index() {
    auto path = root_ / constants::LAYER_INDEX_FILE_NAME;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Result<void>::Ok();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return Error(ErrorCode::IoError, "Failed to read layer index", path.string());
    }

    try {
        json j;
        file >> j;

        const auto& entries = j.at("entries");
        if (!entries.is_object()) {
            return Error(ErrorCode::InvalidFormat, "Layer index entries are not an object", path.string());
        }

        std::unordered_map<ContentHash, LayerEntry> parsed;
        for (auto it = entries.begin(); it != entries.end(); ++it) {
            LayerEntry entry = entry_from_json(it.value());
            ContentHash hash = entry.hash;
            parsed.emplace(hash, std::move(entry));
        }

        // Recency as saved, most recent first; entries it does not mention go last
        if (j.contains("lru")) {
            for (const auto& hex : j.at("lru")) {
                auto found = parsed.find(ContentHash::from_string(hex.get<std::string>()));
                if (found != parsed.end()) {
                    insert_locked(std::move(found->second), false);
                    parsed.erase(found);
                }
            }
        }
        for (auto& [hash, entry] : parsed) {
            insert_locked(std::move(entry), false);
        }
    } catch (const std::exception& e) {
        entries_.clear();
        recency_.clear();
        total_size_ = 0;
        layer_sizes_.clear();
        return Error(ErrorCode::DeserializationFailed, "Failed to parse layer index", e.what());
    }

    BLAST_LOG_DEBUG("Loaded {} layers from {}", entries_.size(), path.string());
    return Result<void>::Ok();
}

Result<void> LayerStore::save_locked() const {
    json entries = json::object();
    for (const auto& [hash, slot] : entries_) {
        entries[hash.to_string()] = entry_to_json(slot.entry);
    }

    json lru = json::array();
    for (const auto& hash : recency_) {
        lru.push_back(hash.to_string());
    }

    json sizes = json::object();
    for (const auto& [kind, size] : layer_sizes_) {
        sizes[layer_kind_to_string(kind)] = size;
    }

    json j;
    j["entries"] = entries;
    j["lru"] = lru;
    j["total_size"] = total_size_;
    j["layer_sizes"] = sizes;

    return write_json_file(j, root_ / constants::LAYER_INDEX_FILE_NAME,
                           root_ / constants::LAYER_INDEX_TEMP_FILE_NAME);
}

void LayerStore::insert_locked(LayerEntry entry, bool most_recent) {
    ContentHash hash = entry.hash;
    LayerKind kind = layer_kind(entry.layer);

    total_size_ += entry.compressed_size;
    layer_sizes_[kind] += entry.compressed_size;

    auto position = most_recent ? recency_.insert(recency_.begin(), hash)
                                : recency_.insert(recency_.end(), hash);
    entries_.emplace(hash, Slot{std::move(entry), position});
}

Result<void> LayerStore::erase_locked(const ContentHash& hash) {
    auto it = entries_.find(hash);
    if (it == entries_.end()) {
        return Result<void>::Ok();
    }

    const LayerEntry& entry = it->second.entry;
    total_size_ -= entry.compressed_size;
    layer_sizes_[layer_kind(entry.layer)] -= entry.compressed_size;
    recency_.erase(it->second.position);
    entries_.erase(it);

    auto removed = storage_->remove(hash);
    if (removed.is_err() && removed.error().code() != ErrorCode::HashNotFound) {
        return removed.error().with_context("Failed to delete layer blob " + hash.to_string());
    }
    return Result<void>::Ok();
}

std::optional<ContentHash> LayerStore::oldest_locked(std::optional<LayerKind> kind,
                                                     const ContentHash& keep) const {
    for (auto it = recency_.rbegin(); it != recency_.rend(); ++it) {
        if (*it == keep) {
            continue;
        }
        if (kind && layer_kind(entries_.at(*it).entry.layer) != *kind) {
            continue;
        }
        return *it;
    }
    return std::nullopt;
}

Result<void> LayerStore::evict_locked(const ContentHash& keep) {
    if (total_size_ > limits_.max_total_size) {
        BLAST_LOG_DEBUG("Layer cache size {} exceeds limit {}, evicting",
                        total_size_, limits_.max_total_size);
        while (total_size_ > limits_.target_size) {
            auto victim = oldest_locked(std::nullopt, keep);
            if (!victim) {
                break;
            }
            BLAST_TRY(erase_locked(*victim));
        }
    }

    for (const auto& [kind, limit] : limits_.max_layer_sizes) {
        if (layer_sizes_[kind] <= limit) {
            continue;
        }

        BLAST_LOG_DEBUG("Layer kind {} size {} exceeds limit {}, evicting",
                        layer_kind_to_string(kind), layer_sizes_[kind], limit);
        auto target = static_cast<uint64_t>(static_cast<double>(limit) * 0.8);
        while (layer_sizes_[kind] > target) {
            auto victim = oldest_locked(kind, keep);
            if (!victim) {
                break;
            }
            BLAST_TRY(erase_locked(*victim));
        }
    }

    return Result<void>::Ok();
}

Result<ContentHash> LayerStore::store_layer(const CacheLayer& layer, const bytes& data) {
    ContentHash hash = crypto::Blake3::content_hash(data);
    LayerKind kind = layer_kind(layer);
    CompressionLevel level = compression_for(kind);

    auto compressed = compress(data, level);
    if (compressed.is_err()) {
        return compressed.error().with_context("Failed to compress layer " + hash.to_string());
    }

    uint64_t compressed_size = compressed.value().size();
    auto kind_limit = limits_.max_layer_sizes.find(kind);
    if (compressed_size > limits_.max_total_size ||
        (kind_limit != limits_.max_layer_sizes.end() && compressed_size > kind_limit->second)) {
        return Error(ErrorCode::SizeLimitExceeded,
                     std::string("Layer exceeds the ") + layer_kind_to_string(kind) + " size limit",
                     std::to_string(compressed_size) + " bytes");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto stored = storage_->store(hash, compressed.value());
    if (stored.is_err()) {
        return stored.error().with_context("Failed to store layer " + hash.to_string());
    }

    // Same payload stored again: replace the descriptor, the blob is shared
    auto existing = entries_.find(hash);
    if (existing != entries_.end()) {
        const LayerEntry& old = existing->second.entry;
        total_size_ -= old.compressed_size;
        layer_sizes_[layer_kind(old.layer)] -= old.compressed_size;
        recency_.erase(existing->second.position);
        entries_.erase(existing);
    }

    auto now = time::now();
    LayerEntry entry;
    entry.layer = layer;
    entry.hash = hash;
    entry.size = data.size();
    entry.compressed_size = compressed_size;
    entry.compression = level;
    entry.path = storage_->hash_path(hash).string();
    entry.accessed = now;
    entry.created = now;
    if (const auto* image = std::get_if<ImageLayer>(&layer)) {
        entry.parent = image->parent;
    }
    insert_locked(std::move(entry), true);

    BLAST_TRY(evict_locked(hash));
    BLAST_TRY(save_locked());

    BLAST_LOG_DEBUG("Stored {} layer {} ({} -> {} bytes, {})", layer_kind_to_string(kind),
                    hash.to_string(), data.size(), compressed_size, compression_level_to_string(level));
    return Result<ContentHash>::Ok(hash);
}

Result<std::optional<bytes>> LayerStore::read_verified(const ContentHash& hash, std::string& problem) const {
    using ReadResult = Result<std::optional<bytes>>;

    auto blob = storage_->load(hash);
    if (blob.is_err()) {
        if (blob.error().code() != ErrorCode::HashNotFound) {
            return blob.error();
        }
        problem = "blob is missing";
        return ReadResult::Ok(std::nullopt);
    }

    auto decompressed = decompress(blob.value());
    if (decompressed.is_err()) {
        problem = decompressed.error().to_string();
        return ReadResult::Ok(std::nullopt);
    }
    if (crypto::Blake3::content_hash(decompressed.value()) != hash) {
        problem = "content does not match its hash";
        return ReadResult::Ok(std::nullopt);
    }
    return ReadResult::Ok(decompressed.unwrap());
}

Result<std::optional<std::pair<CacheLayer, bytes>>> LayerStore::get_layer(const ContentHash& hash) {
    using GetResult = Result<std::optional<std::pair<CacheLayer, bytes>>>;

    CacheLayer layer;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto it = entries_.find(hash);
        if (it == entries_.end()) {
            return GetResult::Ok(std::nullopt);
        }
        it->second.entry.accessed = time::now();
        ++it->second.entry.access_count;
        recency_.splice(recency_.begin(), recency_, it->second.position);
        layer = it->second.entry.layer;
    }

    std::string problem;
    auto data = read_verified(hash, problem);
    if (data.is_ok() && data.value()) {
        return GetResult::Ok(std::make_pair(std::move(layer), std::move(*data.value())));
    }

    // Confirm under the lock; the layer may have been removed meanwhile
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (entries_.find(hash) == entries_.end()) {
        return GetResult::Ok(std::nullopt);
    }

    data = read_verified(hash, problem);
    if (data.is_err()) {
        return data.error().with_context("Failed to read layer " + hash.to_string());
    }
    if (!data.value()) {
        BLAST_LOG_WARN("Layer {} is corrupt: {}", hash.to_string(), problem);
        auto erased = erase_locked(hash);
        if (erased.is_err()) {
            BLAST_LOG_WARN("{}", erased.error().to_string());
        }
        BLAST_TRY(save_locked());
        return GetResult::Ok(std::nullopt);
    }
    return GetResult::Ok(std::make_pair(std::move(layer), std::move(*data.value())));
}

Result<void> LayerStore::remove_layer(const ContentHash& hash) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (entries_.find(hash) == entries_.end()) {
        return Result<void>::Ok();
    }

    auto erased = erase_locked(hash);
    BLAST_TRY(save_locked());
    if (erased.is_err()) {
        return erased;
    }

    BLAST_LOG_DEBUG("Removed layer {}", hash.to_string());
    return Result<void>::Ok();
}

Result<void> LayerStore::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    entries_.clear();
    recency_.clear();
    total_size_ = 0;
    layer_sizes_.clear();

    BLAST_TRY(save_locked());

    auto cleared = storage_->clear();
    if (cleared.is_err()) {
        return cleared.error().with_context("Failed to clear layer storage");
    }

    BLAST_LOG_INFO("Cleared layer cache at {}", root_.string());
    return Result<void>::Ok();
}

LayerStoreStats LayerStore::stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    LayerStoreStats stats;
    stats.total_entries = entries_.size();
    stats.total_size = total_size_;
    stats.layer_sizes = layer_sizes_;

    uint64_t raw = 0;
    for (const auto& [hash, slot] : entries_) {
        raw += slot.entry.size;
    }
    if (raw > 0) {
        stats.compression_ratio = static_cast<double>(total_size_) / static_cast<double>(raw);
    }
    return stats;
}

std::optional<LayerEntry> LayerStore::entry(const ContentHash& hash) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = entries_.find(hash);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.entry;
}

} // namespace blast::cache
