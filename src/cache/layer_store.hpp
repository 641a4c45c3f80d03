#pragma once

#include "blast/common.hpp"
#include "blast/error.hpp"
#include "blast/time_utils.hpp"
#include "cache/compression.hpp"
#include "storage/storage.hpp"
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace blast::cache {

enum class LayerKind {
    Package,
    Build,
    Environment,
    Resolution,
    Image
};

const char* layer_kind_to_string(LayerKind kind);
std::optional<LayerKind> layer_kind_from_string(const std::string& name);

/**
 * Compression applied to blobs of a kind: archives and resolutions are
 * packed hardest, environment snapshots fastest
 */
CompressionLevel compression_for(LayerKind kind);

enum class ImageLayerType {
    Base,       // Interpreter
    Packages,   // Installed packages
    Config,     // Environment configuration
    Files       // User files
};

const char* image_layer_type_to_string(ImageLayerType type);
std::optional<ImageLayerType> image_layer_type_from_string(const std::string& name);

// Wheel or source distribution
struct PackageLayer {
    std::string name;
    std::string version;
    std::string hash;
};

// Package built for one platform and interpreter
struct BuildLayer {
    std::string package;
    std::string version;
    std::string platform;
    std::string python_version;
};

struct EnvironmentLayer {
    std::string name;
    std::string python_version;
    time::TimePoint timestamp;
};

// Solved dependency set
struct ResolutionLayer {
    std::vector<std::string> requirements;
    std::string python_version;
    std::string platform;
};

struct ImageLayer {
    std::string hash;
    ImageLayerType layer_type{ImageLayerType::Base};
    std::optional<std::string> parent;
};

using CacheLayer = std::variant<PackageLayer, BuildLayer, EnvironmentLayer, ResolutionLayer, ImageLayer>;

LayerKind layer_kind(const CacheLayer& layer);

struct LayerEntry {
    CacheLayer layer;
    ContentHash hash;
    uint64_t size{0};
    uint64_t compressed_size{0};
    CompressionLevel compression{CompressionLevel::Default};
    std::string path;
    time::TimePoint accessed;
    time::TimePoint created;
    uint64_t access_count{0};
    std::optional<std::string> parent;  // Parent image layer, image layers only
};

struct LayerSizeLimits {
    uint64_t max_total_size = 20ULL * 1024 * 1024 * 1024;
    std::map<LayerKind, uint64_t> max_layer_sizes = {
        {LayerKind::Package, 1ULL * 1024 * 1024 * 1024},
        {LayerKind::Build, 2ULL * 1024 * 1024 * 1024},
        {LayerKind::Environment, 5ULL * 1024 * 1024 * 1024},
        {LayerKind::Resolution, 100ULL * 1024 * 1024},
        {LayerKind::Image, 10ULL * 1024 * 1024 * 1024},
    };
    // Total to shrink to once max_total_size is exceeded
    uint64_t target_size = 16ULL * 1024 * 1024 * 1024;
};

struct LayerStoreStats {
    size_t total_entries{0};
    uint64_t total_size{0};  // Compressed bytes
    std::map<LayerKind, uint64_t> layer_sizes;
    double compression_ratio{1.0};  // compressed / raw
};

/**
 * Typed layer cache addressed by the BLAKE3 hash of each layer's payload.
 *
 * Blobs are compressed at the level of their kind and written to the
 * given storage; descriptors, sizes and recency are kept in
 * <root>/layers.json. After every store, the least recently used layers are
 * evicted until the total drops to target_size (when max_total_size is
 * exceeded) and each kind over its limit drops to 80% of that limit. The
 * layer just stored is never evicted.
 *
 * Access times and counts are persisted with the next mutation. Give the
 * store its own root; it owns every blob in its storage.
 */
class LayerStore {
public:
    /**
     * @throws CacheException if an existing layers.json cannot be read
     */
    LayerStore(const std::filesystem::path& root,
               std::shared_ptr<storage::CacheStorage> storage,
               LayerSizeLimits limits = LayerSizeLimits());

    BLAST_DISALLOW_COPY(LayerStore);

    /**
     * @return Hash addressing the layer
     * @return ErrorCode::SizeLimitExceeded if the compressed layer alone
     *         exceeds the total or per-kind limit
     */
    Result<ContentHash> store_layer(const CacheLayer& layer, const bytes& data);

    /**
     * @return nullopt if the layer is unknown or its blob is missing or corrupt
     */
    Result<std::optional<std::pair<CacheLayer, bytes>>> get_layer(const ContentHash& hash);

    // Removing an unknown layer succeeds
    Result<void> remove_layer(const ContentHash& hash);

    Result<void> clear();

    LayerStoreStats stats() const;

    std::optional<LayerEntry> entry(const ContentHash& hash) const;

    const LayerSizeLimits& limits() const { return limits_; }

private:
    using Recency = std::list<ContentHash>;  // Most recently used at the front

    struct Slot {
        LayerEntry entry;
        Recency::iterator position;
    };

    Result<void> load_index();
    Result<void> save_locked() const;

    void insert_locked(LayerEntry entry, bool most_recent);
    Result<void> erase_locked(const ContentHash& hash);
    Result<void> evict_locked(const ContentHash& keep);
    std::optional<ContentHash> oldest_locked(std::optional<LayerKind> kind, const ContentHash& keep) const;

    Result<std::optional<bytes>> read_verified(const ContentHash& hash, std::string& problem) const;

    std::filesystem::path root_;
    std::shared_ptr<storage::CacheStorage> storage_;
    LayerSizeLimits limits_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<ContentHash, Slot> entries_;
    Recency recency_;
    uint64_t total_size_{0};
    std::map<LayerKind, uint64_t> layer_sizes_;
};

} // namespace blast::cache
