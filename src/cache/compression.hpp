#pragma once

#include "storage/storage.hpp"
#include <memory>
#include <optional>
#include <string>

namespace blast::cache {

/**
 * Compression level for cache entries
 */
enum class CompressionLevel {
    None,       // Stored zlib blocks, no compression
    Fast,       // Fast compression with moderate ratio
    Default,    // Balanced
    Maximum     // Best ratio, slowest
};

/**
 * Numeric zlib level for a compression level
 */
int to_zlib_level(CompressionLevel level);

const char* compression_level_to_string(CompressionLevel level);
std::optional<CompressionLevel> compression_level_from_string(const std::string& name);

/**
 * Compress data into a self-describing zlib stream
 */
Result<bytes> compress(const bytes& data, CompressionLevel level = CompressionLevel::Default);

/**
 * Decompress a zlib stream produced by compress() at any level
 * @return ErrorCode::DecompressionFailed on malformed or truncated input
 */
Result<bytes> decompress(const bytes& data);

/**
 * Storage decorator that compresses blobs on the way in and decompresses
 * them on the way out. Hashes always address the uncompressed bytes.
 */
class CompressedStorage : public storage::CacheStorage {
public:
    explicit CompressedStorage(std::shared_ptr<storage::CacheStorage> inner,
                               CompressionLevel level = CompressionLevel::Default);

    Result<void> store(const ContentHash& hash, const bytes& data) override;
    Result<bytes> load(const ContentHash& hash) override;
    Result<void> remove(const ContentHash& hash) override;
    Result<void> clear() override;
    std::filesystem::path hash_path(const ContentHash& hash) const override;

    CompressionLevel level() const { return level_; }

private:
    std::shared_ptr<storage::CacheStorage> inner_;
    CompressionLevel level_;
};

} // namespace blast::cache
