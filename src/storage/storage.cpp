#include "storage.hpp"
#include "utils/logger.hpp"
#include "crypto/blake3.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

namespace blast::storage {

namespace fs = std::filesystem;

namespace {
    Error io_error(const std::string& message, const std::error_code& ec) {
        auto code = ec == std::errc::permission_denied
            ? ErrorCode::PermissionDenied
            : ErrorCode::IoError;
        return Error(code, message, ec.message());
    }

    Error io_error(const std::string& message, int err) {
        return io_error(message, std::error_code(err, std::generic_category()));
    }
}

class FileStorage::Impl {
public:
    explicit Impl(const fs::path& root)
        : root_(root)
    {
        std::error_code ec;
        fs::create_directories(root_, ec);
        if (ec) {
            throw StorageException(ErrorCode::IoError,
                "Failed to create storage directory " + root_.string() + ": " + ec.message());
        }

        BLAST_LOG_DEBUG("File storage initialized at: {}", root_.string());
    }

    fs::path hash_path(const ContentHash& hash) const {
        std::string hex = hash.to_string();
        // Use first 2 chars as subdirectory to bound per-directory fanout
        return root_ / hex.substr(0, constants::SHARD_PREFIX_LENGTH)
                     / hex.substr(constants::SHARD_PREFIX_LENGTH);
    }

    Result<void> store(const ContentHash& hash, const bytes& data) {
        auto path = hash_path(hash);

        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return io_error("Failed to create directory " + path.parent_path().string(), ec);
        }

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return io_error("Failed to create blob file " + path.string(), errno);
        }

        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        file.close();
        if (!file) {
            return io_error("Failed to write blob file " + path.string(), errno);
        }

        BLAST_LOG_DEBUG("Stored blob: {} ({} bytes)", hash.to_string(), data.size());
        return Result<void>::Ok();
    }

    Result<bytes> load(const ContentHash& hash) const {
        auto path = hash_path(hash);

        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            if (ec && ec != std::errc::no_such_file_or_directory) {
                return io_error("Failed to stat blob file " + path.string(), ec);
            }
            return Error(ErrorCode::HashNotFound, "Blob not found: " + hash.to_string());
        }

        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file) {
            return io_error("Failed to open blob file " + path.string(), errno);
        }

        auto size = static_cast<size_t>(file.tellg());
        file.seekg(0, std::ios::beg);

        bytes data(size);
        file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
        if (!file) {
            return io_error("Failed to read blob file " + path.string(), errno);
        }

        return Result<bytes>::Ok(std::move(data));
    }

    Result<void> remove(const ContentHash& hash) {
        auto path = hash_path(hash);

        std::error_code ec;
        if (!fs::exists(path, ec)) {
            if (ec && ec != std::errc::no_such_file_or_directory) {
                return io_error("Failed to stat blob file " + path.string(), ec);
            }
            return Error(ErrorCode::HashNotFound, "Blob not found: " + hash.to_string());
        }

        if (!fs::remove(path, ec) || ec) {
            return io_error("Failed to remove blob file " + path.string(), ec);
        }

        // Drop the shard directory once its last blob is gone
        auto shard = path.parent_path();
        if (fs::is_empty(shard, ec) && !ec) {
            fs::remove(shard, ec);
        }
        if (ec) {
            BLAST_LOG_WARN("Failed to remove empty shard directory {}: {}",
                           shard.string(), ec.message());
        }

        return Result<void>::Ok();
    }

    Result<void> clear() {
        std::error_code ec;
        std::vector<fs::path> shards;
        for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->is_directory(ec)) {
                shards.push_back(it->path());
            }
        }
        if (ec) {
            return io_error("Failed to enumerate storage directory " + root_.string(), ec);
        }

        for (const auto& shard : shards) {
            fs::remove_all(shard, ec);
            if (ec) {
                return io_error("Failed to clear shard directory " + shard.string(), ec);
            }
        }

        BLAST_LOG_DEBUG("Cleared {} shard directories under {}", shards.size(), root_.string());
        return Result<void>::Ok();
    }

    bool contains(const ContentHash& hash) const {
        std::error_code ec;
        return fs::is_regular_file(hash_path(hash), ec);
    }

    std::vector<ContentHash> list_hashes() const {
        std::vector<ContentHash> hashes;

        std::error_code ec;
        for (fs::directory_iterator shard(root_, ec), end; !ec && shard != end; shard.increment(ec)) {
            if (!shard->is_directory(ec)) continue;

            std::string prefix = shard->path().filename().string();
            std::error_code inner_ec;
            for (fs::directory_iterator entry(shard->path(), inner_ec);
                 !inner_ec && entry != end; entry.increment(inner_ec)) {
                if (!entry->is_regular_file(inner_ec)) continue;

                auto hash = crypto::Blake3::hash_from_hex(prefix + entry->path().filename().string());
                if (hash) {
                    hashes.emplace_back(*hash);
                }
            }
        }

        return hashes;
    }

    uint64_t total_size() const {
        uint64_t total = 0;

        std::error_code ec;
        for (fs::recursive_directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
            // Only count blobs, not the index sitting at the top level
            if (it.depth() > 0 && it->is_regular_file(ec)) {
                total += it->file_size(ec);
            }
        }

        return total;
    }

    const fs::path& root() const { return root_; }

private:
    fs::path root_;
};

// FileStorage implementation
FileStorage::FileStorage(const fs::path& root)
    : impl_(std::make_unique<Impl>(root))
{}

FileStorage::~FileStorage() = default;
FileStorage::FileStorage(FileStorage&&) noexcept = default;
FileStorage& FileStorage::operator=(FileStorage&&) noexcept = default;

Result<void> FileStorage::store(const ContentHash& hash, const bytes& data) {
    return impl_->store(hash, data);
}

Result<bytes> FileStorage::load(const ContentHash& hash) {
    return impl_->load(hash);
}

Result<void> FileStorage::remove(const ContentHash& hash) {
    return impl_->remove(hash);
}

Result<void> FileStorage::clear() {
    return impl_->clear();
}

fs::path FileStorage::hash_path(const ContentHash& hash) const {
    return impl_->hash_path(hash);
}

bool FileStorage::contains(const ContentHash& hash) const {
    return impl_->contains(hash);
}

std::vector<ContentHash> FileStorage::list_hashes() const {
    return impl_->list_hashes();
}

uint64_t FileStorage::total_size() const {
    return impl_->total_size();
}

const fs::path& FileStorage::root() const {
    return impl_->root();
}

} // namespace blast::storage
