#pragma once

#include "blast/common.hpp"
#include "blast/error.hpp"
#include <optional>
#include <string>
#include <vector>
#include <filesystem>

namespace blast::storage {

/**
 * Storage backend interface for content-addressed blobs.
 *
 * Every backend and every decorator implements this contract identically:
 * blobs are addressed only by their content hash and know nothing about
 * logical names. Implementations must be safe to call from several threads.
 */
class CacheStorage {
public:
    virtual ~CacheStorage() = default;

    /**
     * Store a blob under its hash, overwriting any previous copy
     */
    virtual Result<void> store(const ContentHash& hash, const bytes& data) = 0;

    /**
     * Load the blob stored under a hash
     * @return The blob, or ErrorCode::HashNotFound if nothing is stored there
     */
    virtual Result<bytes> load(const ContentHash& hash) = 0;

    /**
     * Delete the blob stored under a hash
     * @return ErrorCode::HashNotFound if nothing is stored there
     */
    virtual Result<void> remove(const ContentHash& hash) = 0;

    /**
     * Remove every stored blob
     */
    virtual Result<void> clear() = 0;

    /**
     * Location of the blob for a hash. Empty for backends without paths.
     */
    virtual std::filesystem::path hash_path(const ContentHash& hash) const = 0;
};

/**
 * Filesystem backend. Blobs live at root/<hex[0:2]>/<hex[2:]>.
 */
class FileStorage : public CacheStorage {
public:
    /**
     * Initialize storage with a root directory
     * @param root Directory for blobs (created if it doesn't exist)
     * @throws StorageException if the directory cannot be created
     */
    explicit FileStorage(const std::filesystem::path& root);
    ~FileStorage() override;

    // Disable copy, allow move
    FileStorage(const FileStorage&) = delete;
    FileStorage& operator=(const FileStorage&) = delete;
    FileStorage(FileStorage&&) noexcept;
    FileStorage& operator=(FileStorage&&) noexcept;

    Result<void> store(const ContentHash& hash, const bytes& data) override;
    Result<bytes> load(const ContentHash& hash) override;
    Result<void> remove(const ContentHash& hash) override;

    /**
     * Recursively remove every shard directory under the root.
     * Plain files at the top level (the cache index) are left in place.
     */
    Result<void> clear() override;

    std::filesystem::path hash_path(const ContentHash& hash) const override;

    /**
     * Check if a blob exists
     */
    bool contains(const ContentHash& hash) const;

    /**
     * List all stored hashes
     */
    std::vector<ContentHash> list_hashes() const;

    /**
     * Total size of stored blobs in bytes
     */
    uint64_t total_size() const;

    const std::filesystem::path& root() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace blast::storage
