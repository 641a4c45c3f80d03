#include "cache/compression.hpp"
#include "storage/memory_storage.hpp"
#include "crypto/blake3.hpp"
#include <gtest/gtest.h>
#include <memory>

using namespace blast;
using namespace blast::cache;

namespace {

bytes repeated_text(size_t size) {
    const std::string pattern = "requests==2.28.2 certifi charset-normalizer idna urllib3\n";
    bytes out;
    out.reserve(size);
    while (out.size() < size) {
        out.push_back(static_cast<byte>(pattern[out.size() % pattern.size()]));
    }
    return out;
}

} // anonymous namespace

TEST(CompressionTest, LevelMapping) {
    EXPECT_EQ(to_zlib_level(CompressionLevel::None), 0);
    EXPECT_EQ(to_zlib_level(CompressionLevel::Fast), 1);
    EXPECT_EQ(to_zlib_level(CompressionLevel::Default), 6);
    EXPECT_EQ(to_zlib_level(CompressionLevel::Maximum), 9);
}

TEST(CompressionTest, EveryLevelDecodesWithoutKnowingIt) {
    auto data = repeated_text(10000);

    for (auto level : {CompressionLevel::None, CompressionLevel::Fast,
                       CompressionLevel::Default, CompressionLevel::Maximum}) {
        auto compressed = compress(data, level);
        ASSERT_TRUE(compressed.is_ok()) << compression_level_to_string(level);

        auto restored = decompress(compressed.value());
        ASSERT_TRUE(restored.is_ok()) << compression_level_to_string(level);
        EXPECT_EQ(restored.value(), data);
    }
}

TEST(CompressionTest, RepetitiveDataShrinks) {
    auto data = repeated_text(10000);
    auto compressed = compress(data);
    ASSERT_TRUE(compressed.is_ok());
    EXPECT_LT(compressed.value().size(), data.size());
}

TEST(CompressionTest, EmptyPayload) {
    auto compressed = compress(bytes{});
    ASSERT_TRUE(compressed.is_ok());

    auto restored = decompress(compressed.value());
    ASSERT_TRUE(restored.is_ok());
    EXPECT_TRUE(restored.value().empty());
}

TEST(CompressionTest, GarbageFailsToDecompress) {
    bytes garbage = {'n', 'o', 't', ' ', 'z', 'l', 'i', 'b'};
    auto restored = decompress(garbage);
    ASSERT_TRUE(restored.is_err());
    EXPECT_EQ(restored.error().code(), ErrorCode::DecompressionFailed);
}

TEST(CompressionTest, TruncatedStreamFails) {
    auto compressed = compress(repeated_text(4096)).value();
    compressed.resize(compressed.size() / 2);

    auto restored = decompress(compressed);
    ASSERT_TRUE(restored.is_err());
    EXPECT_EQ(restored.error().code(), ErrorCode::DecompressionFailed);
}

TEST(CompressedStorageTest, StoresCompressedLoadsOriginal) {
    auto inner = std::make_shared<storage::MemoryStorage>();
    CompressedStorage storage(inner, CompressionLevel::Maximum);
    EXPECT_EQ(storage.level(), CompressionLevel::Maximum);

    auto data = repeated_text(8192);
    auto hash = crypto::Blake3::content_hash(data);

    ASSERT_TRUE(storage.store(hash, data).is_ok());

    // Inner storage holds the compressed form under the original hash
    auto raw = inner->load(hash);
    ASSERT_TRUE(raw.is_ok());
    EXPECT_LT(raw.value().size(), data.size());

    auto loaded = storage.load(hash);
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value(), data);
}

TEST(CompressedStorageTest, CorruptInnerBlobFails) {
    auto inner = std::make_shared<storage::MemoryStorage>();
    CompressedStorage storage(inner);

    auto data = repeated_text(100);
    auto hash = crypto::Blake3::content_hash(data);
    ASSERT_TRUE(inner->store(hash, data).is_ok());  // bypasses compression

    auto loaded = storage.load(hash);
    ASSERT_TRUE(loaded.is_err());
    EXPECT_EQ(loaded.error().code(), ErrorCode::DecompressionFailed);
}

TEST(CompressedStorageTest, DelegatesRemoveAndClear) {
    auto inner = std::make_shared<storage::MemoryStorage>();
    CompressedStorage storage(inner);

    auto data = repeated_text(64);
    auto hash = crypto::Blake3::content_hash(data);
    ASSERT_TRUE(storage.store(hash, data).is_ok());

    ASSERT_TRUE(storage.remove(hash).is_ok());
    EXPECT_EQ(storage.load(hash).error().code(), ErrorCode::HashNotFound);

    ASSERT_TRUE(storage.store(hash, data).is_ok());
    ASSERT_TRUE(storage.clear().is_ok());
    EXPECT_EQ(inner->item_count(), 0u);
}
