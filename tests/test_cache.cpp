#include "cache/cache.hpp"
#include "cache/compression.hpp"
#include "crypto/blake3.hpp"
#include "utils/config.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using namespace blast;
using namespace blast::cache;

namespace fs = std::filesystem;

namespace {

bytes payload(const std::string& text) {
    return bytes(text.begin(), text.end());
}

bytes repeated_text(size_t size) {
    const std::string pattern = "Name: requests\nVersion: 2.28.2\nRequires-Dist: urllib3\n";
    bytes out;
    out.reserve(size);
    while (out.size() < size) {
        out.push_back(static_cast<byte>(pattern[out.size() % pattern.size()]));
    }
    return out;
}

void overwrite_file(const fs::path& path, const bytes& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

} // anonymous namespace

class CacheTest : public ::testing::Test {
protected:
    std::string test_dir;
    CacheSettings settings;

    void SetUp() override {
        test_dir = std::string("./test_cache_") +
                   ::testing::UnitTest::GetInstance()->current_test_info()->name();
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
        settings.cache_dir = test_dir;
    }

    void TearDown() override {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }
};

TEST_F(CacheTest, RoundTrip) {
    Cache cache(settings);

    auto data = payload("resolved dependency set");
    ASSERT_TRUE(cache.store("deps:project", data).is_ok());

    auto loaded = cache.get("deps:project");
    ASSERT_TRUE(loaded.is_ok());
    ASSERT_TRUE(loaded.value().has_value());
    EXPECT_EQ(*loaded.value(), data);
    EXPECT_TRUE(cache.contains("deps:project"));
}

TEST_F(CacheTest, MissingKeyIsAMiss) {
    Cache cache(settings);

    auto loaded = cache.get("nothing");
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_FALSE(loaded.value().has_value());
    EXPECT_TRUE(cache.remove("nothing").is_ok());
}

TEST_F(CacheTest, RequestsScenario) {
    Cache cache(settings);

    auto data = repeated_text(10000);
    ASSERT_TRUE(cache.store("pkg:requests-2.28.2", data).is_ok());

    auto stats = cache.stats().unwrap();
    EXPECT_EQ(stats.total_entries, 1u);
    EXPECT_EQ(stats.total_size, 10000u);
    EXPECT_LT(stats.total_compressed_size, 10000u);

    auto loaded = cache.get("pkg:requests-2.28.2").unwrap();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, data);

    ASSERT_TRUE(cache.remove("pkg:requests-2.28.2").is_ok());
    EXPECT_FALSE(cache.get("pkg:requests-2.28.2").unwrap().has_value());
}

TEST_F(CacheTest, BlobIsCompressedOnDisk) {
    Cache cache(settings);

    auto data = repeated_text(4096);
    ASSERT_TRUE(cache.store("key", data).is_ok());

    auto hash = crypto::Blake3::content_hash(data);
    std::string hex = hash.to_string();
    auto blob_path = fs::path(test_dir) / hex.substr(0, 2) / hex.substr(2);
    ASSERT_TRUE(fs::exists(blob_path));
    EXPECT_LT(fs::file_size(blob_path), data.size());
}

TEST_F(CacheTest, ClearIsIdempotent) {
    Cache cache(settings);

    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(cache.store("key-" + std::to_string(i), payload("value-" + std::to_string(i))).is_ok());
    }

    ASSERT_TRUE(cache.clear().is_ok());
    auto first = cache.stats().unwrap();
    ASSERT_TRUE(cache.clear().is_ok());
    auto second = cache.stats().unwrap();

    EXPECT_EQ(first.total_entries, 0u);
    EXPECT_EQ(second.total_entries, 0u);
    EXPECT_DOUBLE_EQ(second.compression_ratio, 1.0);
    EXPECT_FALSE(cache.get("key-0").unwrap().has_value());
    EXPECT_TRUE(fs::exists(fs::path(test_dir) / "index.json"));
}

TEST_F(CacheTest, ZeroTtlAlwaysExpires) {
    settings.ttl = std::chrono::seconds(0);
    Cache cache(settings);

    ASSERT_TRUE(cache.store("ephemeral", payload("gone")).is_ok());
    EXPECT_FALSE(cache.get("ephemeral").unwrap().has_value());
    EXPECT_FALSE(cache.contains("ephemeral"));
}

TEST_F(CacheTest, HugeTtlNeverExpires) {
    settings.ttl = std::chrono::seconds::max();
    Cache cache(settings);

    ASSERT_TRUE(cache.store("forever", payload("kept")).is_ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(2));

    auto loaded = cache.get("forever");
    ASSERT_TRUE(loaded.is_ok());
    ASSERT_TRUE(loaded.value().has_value());
    EXPECT_EQ(*loaded.value(), payload("kept"));
    EXPECT_EQ(cache.purge_expired().unwrap(), 0u);
}

TEST_F(CacheTest, TtlFromConfigBeyondRangeNeverExpires) {
    auto config = utils::Config::load_from_json(R"({"ttl": 18446744073709551615})");
    auto configured = CacheSettings::from_config(config);
    configured.cache_dir = test_dir;
    Cache cache(configured);

    ASSERT_TRUE(cache.store("forever", payload("kept")).is_ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    EXPECT_TRUE(cache.get("forever").unwrap().has_value());
}

TEST_F(CacheTest, CorruptionSelfHeals) {
    Cache cache(settings);

    auto data = repeated_text(2048);
    ASSERT_TRUE(cache.store("victim", data).is_ok());

    auto hash = crypto::Blake3::content_hash(data);
    std::string hex = hash.to_string();
    overwrite_file(fs::path(test_dir) / hex.substr(0, 2) / hex.substr(2), payload("garbage bytes"));

    auto first = cache.get("victim");
    ASSERT_TRUE(first.is_ok());
    EXPECT_FALSE(first.value().has_value());

    auto second = cache.get("victim");
    ASSERT_TRUE(second.is_ok());
    EXPECT_FALSE(second.value().has_value());

    EXPECT_FALSE(cache.contains("victim"));
}

TEST_F(CacheTest, HashMismatchIsCorruption) {
    Cache cache(settings);

    auto data = payload("original payload");
    ASSERT_TRUE(cache.store("key", data).is_ok());

    // A well-formed zlib stream of different bytes
    auto hash = crypto::Blake3::content_hash(data);
    std::string hex = hash.to_string();
    overwrite_file(fs::path(test_dir) / hex.substr(0, 2) / hex.substr(2),
                   compress(payload("tampered payload")).value());

    EXPECT_FALSE(cache.get("key").unwrap().has_value());
    EXPECT_FALSE(cache.contains("key"));
}

TEST_F(CacheTest, MissingBlobIsCorruption) {
    Cache cache(settings);

    auto data = payload("will vanish");
    ASSERT_TRUE(cache.store("key", data).is_ok());

    auto hash = crypto::Blake3::content_hash(data);
    std::string hex = hash.to_string();
    fs::remove(fs::path(test_dir) / hex.substr(0, 2) / hex.substr(2));

    EXPECT_FALSE(cache.get("key").unwrap().has_value());
    EXPECT_FALSE(cache.contains("key"));
}

TEST_F(CacheTest, CompressionRatio) {
    Cache cache(settings);
    EXPECT_DOUBLE_EQ(cache.stats().unwrap().compression_ratio, 1.0);

    ASSERT_TRUE(cache.store("a", repeated_text(5000)).is_ok());
    ASSERT_TRUE(cache.store("b", payload("short")).is_ok());

    auto stats = cache.stats().unwrap();
    EXPECT_EQ(stats.total_entries, 2u);
    EXPECT_DOUBLE_EQ(stats.compression_ratio,
                     static_cast<double>(stats.total_compressed_size) / static_cast<double>(stats.total_size));
}

TEST_F(CacheTest, PersistsAcrossReopen) {
    auto data = payload("survives restart");
    {
        Cache cache(settings);
        ASSERT_TRUE(cache.store("durable", data).is_ok());
    }

    Cache reopened(settings);
    EXPECT_TRUE(reopened.contains("durable"));
    auto loaded = reopened.get("durable").unwrap();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, data);
}

TEST_F(CacheTest, CorruptIndexFailsToOpen) {
    fs::create_directories(test_dir);
    std::ofstream(fs::path(test_dir) / "index.json") << "not an index";

    EXPECT_THROW(Cache cache(settings), CacheException);
}

TEST_F(CacheTest, SharedBlobSurvivesRemovalOfOneKey) {
    Cache cache(settings);

    auto data = payload("same bytes");
    ASSERT_TRUE(cache.store("first", data).is_ok());
    ASSERT_TRUE(cache.store("second", data).is_ok());

    ASSERT_TRUE(cache.remove("first").is_ok());
    auto loaded = cache.get("second").unwrap();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, data);
}

TEST_F(CacheTest, OverwriteReleasesOldBlob) {
    Cache cache(settings);

    auto old_data = payload("old version");
    ASSERT_TRUE(cache.store("key", old_data).is_ok());
    ASSERT_TRUE(cache.store("key", payload("new version")).is_ok());

    auto old_hash = crypto::Blake3::content_hash(old_data);
    std::string hex = old_hash.to_string();
    EXPECT_FALSE(fs::exists(fs::path(test_dir) / hex.substr(0, 2) / hex.substr(2)));
    EXPECT_EQ(*cache.get("key").unwrap(), payload("new version"));
}

TEST_F(CacheTest, RejectsPayloadLargerThanLimit) {
    settings.max_size = 16;
    Cache cache(settings);

    auto stored = cache.store("big", payload(std::string(1000, 'x') + "unique tail 0123456789"));
    ASSERT_TRUE(stored.is_err());
    EXPECT_EQ(stored.error().code(), ErrorCode::SizeLimitExceeded);
    EXPECT_FALSE(cache.contains("big"));
}

TEST_F(CacheTest, EvictsLeastRecentlyAccessedToFitLimit) {
    // Measure one compressed entry, then allow room for two
    uint64_t entry_size = compress(repeated_text(3000)).value().size();
    settings.max_size = entry_size * 2 + entry_size / 2;
    Cache cache(settings);

    auto make = [](char tag) {
        auto data = repeated_text(3000);
        data[0] = static_cast<byte>(tag);
        return data;
    };

    ASSERT_TRUE(cache.store("a", make('a')).is_ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    ASSERT_TRUE(cache.store("b", make('b')).is_ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    // Touch "a" so "b" is the least recently accessed
    ASSERT_TRUE(cache.get("a").unwrap().has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    ASSERT_TRUE(cache.store("c", make('c')).is_ok());

    EXPECT_TRUE(cache.contains("a"));
    EXPECT_FALSE(cache.contains("b"));
    EXPECT_TRUE(cache.contains("c"));
    EXPECT_LE(cache.stats().unwrap().total_compressed_size, settings.max_size);
}

TEST_F(CacheTest, KeysAreSorted) {
    Cache cache(settings);
    ASSERT_TRUE(cache.store("zeta", payload("z")).is_ok());
    ASSERT_TRUE(cache.store("alpha", payload("a")).is_ok());

    std::vector<std::string> expected = {"alpha", "zeta"};
    EXPECT_EQ(cache.keys(), expected);
}

TEST_F(CacheTest, PurgeExpired) {
    settings.ttl = std::chrono::seconds(0);
    Cache cache(settings);

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(cache.store("key-" + std::to_string(i), payload("v" + std::to_string(i))).is_ok());
    }

    EXPECT_EQ(cache.purge_expired().unwrap(), 3u);
    EXPECT_TRUE(cache.keys().empty());
    EXPECT_EQ(cache.purge_expired().unwrap(), 0u);
}

TEST_F(CacheTest, CollectGarbageRemovesOrphans) {
    Cache cache(settings);

    auto kept = payload("referenced");
    ASSERT_TRUE(cache.store("kept", kept).is_ok());

    // Blob written behind the index's back
    storage::FileStorage raw(test_dir);
    auto orphan = payload("orphan");
    ASSERT_TRUE(raw.store(crypto::Blake3::content_hash(orphan), orphan).is_ok());

    EXPECT_EQ(cache.collect_garbage().unwrap(), 1u);
    EXPECT_FALSE(raw.contains(crypto::Blake3::content_hash(orphan)));
    EXPECT_TRUE(cache.get("kept").unwrap().has_value());
    EXPECT_EQ(cache.collect_garbage().unwrap(), 0u);
}

TEST_F(CacheTest, ConcurrentStoresAndGets) {
    Cache cache(settings);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t]() {
            for (int i = 0; i < 10; ++i) {
                std::string key = "t" + std::to_string(t) + "-" + std::to_string(i);
                auto data = payload(key);
                EXPECT_TRUE(cache.store(key, data).is_ok());
                auto loaded = cache.get(key);
                ASSERT_TRUE(loaded.is_ok());
                ASSERT_TRUE(loaded.value().has_value());
                EXPECT_EQ(*loaded.value(), data);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(cache.stats().unwrap().total_entries, 40u);
}

TEST_F(CacheTest, GetDuringOverwriteNeverMisses) {
    Cache cache(settings);

    const std::vector<bytes> versions = {payload("version one"), payload("version two"),
                                         payload("version three")};
    ASSERT_TRUE(cache.store("hot", versions[0]).is_ok());

    std::atomic<bool> done{false};
    std::thread writer([&]() {
        for (int i = 0; i < 60; ++i) {
            EXPECT_TRUE(cache.store("hot", versions[i % versions.size()]).is_ok());
        }
        done = true;
    });

    std::thread observer([&]() {
        while (!done) {
            EXPECT_TRUE(cache.contains("hot"));
            EXPECT_EQ(cache.stats().unwrap().total_entries, 1u);
        }
    });

    size_t reads = 0;
    while (!done || reads == 0) {
        auto loaded = cache.get("hot");
        if (!loaded.is_ok() || !loaded.value().has_value()) {
            ADD_FAILURE() << "hot key missed while being overwritten";
            break;
        }
        EXPECT_NE(std::find(versions.begin(), versions.end(), *loaded.value()), versions.end());
        ++reads;
    }

    writer.join();
    observer.join();
    EXPECT_TRUE(cache.contains("hot"));
}
