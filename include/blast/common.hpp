#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <memory>
#include <optional>

// Blast cache version
#define BLAST_VERSION_MAJOR 0
#define BLAST_VERSION_MINOR 1
#define BLAST_VERSION_PATCH 0
#define BLAST_VERSION_STRING "0.1.0"

// Platform detection
#if defined(_WIN32) || defined(_WIN64)
    #ifndef BLAST_PLATFORM_WINDOWS
        #define BLAST_PLATFORM_WINDOWS
    #endif
#elif defined(__linux__)
    #ifndef BLAST_PLATFORM_LINUX
        #define BLAST_PLATFORM_LINUX
    #endif
#elif defined(__APPLE__)
    #ifndef BLAST_PLATFORM_MACOS
        #define BLAST_PLATFORM_MACOS
    #endif
#endif

// Utility macros
#define BLAST_DISALLOW_COPY(TypeName) \
    TypeName(const TypeName&) = delete; \
    TypeName& operator=(const TypeName&) = delete

// Constants
namespace blast {
namespace constants {

// Hashing
constexpr size_t BLAKE3_HASH_SIZE = 32;

// On-disk layout
constexpr size_t SHARD_PREFIX_LENGTH = 2;       // root/<hex[0:2]>/<hex[2:]>
constexpr const char* INDEX_FILE_NAME = "index.json";
constexpr const char* INDEX_TEMP_FILE_NAME = "index.tmp";
constexpr const char* LAYER_INDEX_FILE_NAME = "layers.json";
constexpr const char* LAYER_INDEX_TEMP_FILE_NAME = "layers.tmp";

// Cache defaults
constexpr uint64_t DEFAULT_MAX_CACHE_SIZE = 10ULL * 1024 * 1024 * 1024; // 10 GB
constexpr uint64_t DEFAULT_TTL_SECONDS = 30ULL * 24 * 60 * 60;          // 30 days

} // namespace constants
} // namespace blast

// Core types
namespace blast {

// Basic types
using byte = uint8_t;
using bytes = std::vector<byte>;

template<size_t N>
using fixed_bytes = std::array<byte, N>;

using Hash256 = fixed_bytes<32>;

/**
 * ContentHash - BLAKE3 digest of a payload, used as its storage address
 */
struct ContentHash {
    Hash256 hash{};

    ContentHash() = default;
    explicit ContentHash(const Hash256& h) : hash(h) {}

    std::string to_string() const;
    static ContentHash from_string(const std::string& str);

    bool operator==(const ContentHash& other) const { return hash == other.hash; }
    bool operator!=(const ContentHash& other) const { return hash != other.hash; }
    bool operator<(const ContentHash& other) const { return hash < other.hash; }
};

// Utility functions
std::string hash_to_hex(const Hash256& hash);
Hash256 hex_to_hash(const std::string& hex);

} // namespace blast

// Hash support for std::unordered_map
namespace std {
template<>
struct hash<blast::Hash256> {
    size_t operator()(const blast::Hash256& h) const noexcept {
        // BLAKE3 output is uniform, the first 8 bytes are enough
        size_t result = 0;
        for (size_t i = 0; i < 8 && i < h.size(); ++i) {
            result = (result << 8) | h[i];
        }
        return result;
    }
};

template<>
struct hash<blast::ContentHash> {
    size_t operator()(const blast::ContentHash& h) const noexcept {
        return hash<blast::Hash256>()(h.hash);
    }
};
} // namespace std
