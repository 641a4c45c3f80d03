#include "blake3.hpp"
#include <blake3.h>
#include <cctype>

namespace blast::crypto {

namespace {
    bool hex_to_bytes(const std::string& hex, byte* out, size_t out_len) {
        if (hex.length() != out_len * 2) return false;

        for (char c : hex) {
            if (!std::isxdigit(static_cast<unsigned char>(c))) {
                return false;
            }
        }

        for (size_t i = 0; i < out_len; ++i) {
            out[i] = static_cast<byte>(std::stoul(hex.substr(i * 2, 2), nullptr, 16));
        }
        return true;
    }

    Hash256 hash_raw(const void* data, size_t len) {
        Hash256 result;
        blake3_hasher hasher;
        blake3_hasher_init(&hasher);
        blake3_hasher_update(&hasher, data, len);
        blake3_hasher_finalize(&hasher, result.data(), result.size());
        return result;
    }
}

Hash256 Blake3::hash(const bytes& data) {
    return hash_raw(data.data(), data.size());
}

Hash256 Blake3::hash(const std::string& str) {
    return hash_raw(str.data(), str.size());
}

ContentHash Blake3::content_hash(const bytes& data) {
    return ContentHash(hash(data));
}

std::string Blake3::hash_to_hex(const Hash256& hash) {
    return blast::hash_to_hex(hash);
}

std::optional<Hash256> Blake3::hash_from_hex(const std::string& hex) {
    Hash256 hash;
    if (!hex_to_bytes(hex, hash.data(), hash.size())) {
        return std::nullopt;
    }
    return hash;
}

} // namespace blast::crypto
