#include "compression.hpp"
#include "utils/logger.hpp"
#include <zlib.h>
#include <limits>

namespace blast::cache {

namespace {
    constexpr size_t INFLATE_CHUNK = 64 * 1024;
}

int to_zlib_level(CompressionLevel level) {
    switch (level) {
        case CompressionLevel::None: return Z_NO_COMPRESSION;
        case CompressionLevel::Fast: return Z_BEST_SPEED;
        case CompressionLevel::Default: return 6;
        case CompressionLevel::Maximum: return Z_BEST_COMPRESSION;
    }
    return 6;
}

const char* compression_level_to_string(CompressionLevel level) {
    switch (level) {
        case CompressionLevel::None: return "none";
        case CompressionLevel::Fast: return "fast";
        case CompressionLevel::Default: return "default";
        case CompressionLevel::Maximum: return "maximum";
    }
    return "unknown";
}

std::optional<CompressionLevel> compression_level_from_string(const std::string& name) {
    if (name == "none") return CompressionLevel::None;
    if (name == "fast") return CompressionLevel::Fast;
    if (name == "default") return CompressionLevel::Default;
    if (name == "maximum") return CompressionLevel::Maximum;
    return std::nullopt;
}

Result<bytes> compress(const bytes& data, CompressionLevel level) {
    if (data.size() > std::numeric_limits<uLong>::max()) {
        return Error(ErrorCode::CompressionFailed, "Payload too large to compress",
                     std::to_string(data.size()) + " bytes");
    }

    uLongf out_len = compressBound(static_cast<uLong>(data.size()));
    bytes out(out_len);

    int rc = compress2(out.data(), &out_len,
                       data.data(), static_cast<uLong>(data.size()),
                       to_zlib_level(level));
    if (rc != Z_OK) {
        return Error(ErrorCode::CompressionFailed, "Failed to compress data", zError(rc));
    }

    out.resize(out_len);
    return Result<bytes>::Ok(std::move(out));
}

Result<bytes> decompress(const bytes& data) {
    z_stream stream{};
    int rc = inflateInit(&stream);
    if (rc != Z_OK) {
        return Error(ErrorCode::DecompressionFailed, "Failed to create zlib decoder", zError(rc));
    }

    bytes out;
    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());

    do {
        size_t offset = out.size();
        out.resize(offset + INFLATE_CHUNK);
        stream.next_out = out.data() + offset;
        stream.avail_out = static_cast<uInt>(INFLATE_CHUNK);

        rc = inflate(&stream, Z_NO_FLUSH);
        out.resize(offset + INFLATE_CHUNK - stream.avail_out);

        if (rc == Z_NEED_DICT || rc == Z_DATA_ERROR || rc == Z_MEM_ERROR) {
            std::string reason = stream.msg ? stream.msg : zError(rc);
            inflateEnd(&stream);
            return Error(ErrorCode::DecompressionFailed, "Failed to decompress data", reason);
        }
        if (rc == Z_BUF_ERROR && stream.avail_in == 0) {
            // Input exhausted before the end of the stream
            break;
        }
    } while (rc != Z_STREAM_END);

    inflateEnd(&stream);

    if (rc != Z_STREAM_END) {
        return Error(ErrorCode::DecompressionFailed, "Failed to decompress data",
                     "truncated zlib stream");
    }

    return Result<bytes>::Ok(std::move(out));
}

CompressedStorage::CompressedStorage(std::shared_ptr<storage::CacheStorage> inner,
                                     CompressionLevel level)
    : inner_(std::move(inner))
    , level_(level)
{}

Result<void> CompressedStorage::store(const ContentHash& hash, const bytes& data) {
    auto compressed = compress(data, level_);
    if (compressed.is_err()) {
        return compressed.error().with_context("Failed to compress blob " + hash.to_string());
    }

    BLAST_LOG_TRACE("Compressed {} -> {} bytes ({})", data.size(),
                    compressed.value().size(), compression_level_to_string(level_));
    return inner_->store(hash, compressed.value());
}

Result<bytes> CompressedStorage::load(const ContentHash& hash) {
    auto compressed = inner_->load(hash);
    if (compressed.is_err()) {
        return compressed.error();
    }

    auto data = decompress(compressed.value());
    if (data.is_err()) {
        return data.error().with_context("Failed to decompress blob " + hash.to_string());
    }
    return data;
}

Result<void> CompressedStorage::remove(const ContentHash& hash) {
    return inner_->remove(hash);
}

Result<void> CompressedStorage::clear() {
    return inner_->clear();
}

std::filesystem::path CompressedStorage::hash_path(const ContentHash& hash) const {
    return inner_->hash_path(hash);
}

} // namespace blast::cache
