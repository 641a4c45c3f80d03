#include <gtest/gtest.h>
#include "blast/error.hpp"
#include "blast/time_utils.hpp"
#include "cache/cache_settings.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"
#include <cstdlib>
#include <filesystem>

using namespace blast;

namespace fs = std::filesystem;

namespace {

Result<int> parse_positive(int value) {
    if (value <= 0) {
        return Error(ErrorCode::InvalidArgument, "not positive");
    }
    return Result<int>::Ok(value);
}

Result<int> doubled(int value) {
    BLAST_TRY_UNWRAP(v, parse_positive(value));
    return Result<int>::Ok(v * 2);
}

Result<void> check(int value) {
    BLAST_TRY(parse_positive(value));
    return Result<void>::Ok();
}

} // anonymous namespace

TEST(ErrorTest, ResultOk) {
    Result<int> ok_result = Result<int>::Ok(42);
    EXPECT_TRUE(ok_result.is_ok());
    EXPECT_EQ(ok_result.value(), 42);
    EXPECT_EQ(ok_result.value_or(7), 42);
}

TEST(ErrorTest, ResultErr) {
    Result<int> err_result = Result<int>::Err(ErrorCode::InvalidArgument, "Test error");
    EXPECT_TRUE(err_result.is_err());
    EXPECT_EQ(err_result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(err_result.value_or(7), 7);
    EXPECT_THROW(err_result.value(), std::runtime_error);
}

TEST(ErrorTest, ResultVoid) {
    Result<void> void_ok = Result<void>::Ok();
    EXPECT_TRUE(void_ok.is_ok());

    Result<void> void_err = Result<void>::Err(ErrorCode::Unknown, "Test");
    EXPECT_TRUE(void_err.is_err());
    EXPECT_THROW(void_err.unwrap(), std::runtime_error);
}

TEST(ErrorTest, MapAndMapErr) {
    auto mapped = Result<int>::Ok(21).map([](int v) { return v * 2; });
    ASSERT_TRUE(mapped.is_ok());
    EXPECT_EQ(mapped.value(), 42);

    auto remapped = Result<int>::Err(ErrorCode::IoError, "disk").map_err([](const Error& e) {
        return e.with_context("Failed to read");
    });
    ASSERT_TRUE(remapped.is_err());
    EXPECT_EQ(remapped.error().code(), ErrorCode::IoError);
    EXPECT_EQ(remapped.error().message(), "Failed to read");
    EXPECT_EQ(remapped.error().details(), "disk");
}

TEST(ErrorTest, PropagationMacros) {
    EXPECT_EQ(doubled(4).value(), 8);
    EXPECT_EQ(doubled(-1).error().code(), ErrorCode::InvalidArgument);
    EXPECT_TRUE(check(3).is_ok());
    EXPECT_TRUE(check(0).is_err());
}

TEST(ErrorTest, ContextKeepsDetails) {
    Error inner(ErrorCode::DecompressionFailed, "Failed to decompress data", "truncated zlib stream");
    Error outer = inner.with_context("Failed to load blob");

    EXPECT_EQ(outer.code(), ErrorCode::DecompressionFailed);
    EXPECT_EQ(outer.message(), "Failed to load blob");
    EXPECT_EQ(outer.details(), "Failed to decompress data: truncated zlib stream");
    EXPECT_NE(outer.to_string().find("Decompression failed"), std::string::npos);
}

TEST(ErrorTest, ErrorCodeStrings) {
    EXPECT_STREQ(error_code_to_string(ErrorCode::HashNotFound), "Hash not found");
    EXPECT_STREQ(error_code_to_string(ErrorCode::SizeLimitExceeded), "Size limit exceeded");
}

TEST(ErrorTest, ExceptionHierarchy) {
    try {
        throw CacheException(ErrorCode::InvalidArgument, "bad capacity");
    } catch (const BlastException& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
        EXPECT_EQ(std::string(e.what()), "Cache error: bad capacity");
    }
}

TEST(TimeTest, Timestamps) {
    uint64_t ts1 = time::timestamp_seconds();
    time::sleep_milliseconds(10);
    uint64_t ts2 = time::timestamp_seconds();
    EXPECT_GE(ts2, ts1);
    EXPECT_EQ(time::to_timestamp(time::from_timestamp(1700000000)), 1700000000u);
}

TEST(TimeTest, EpochPartsRoundTrip) {
    auto tp = time::from_epoch_parts(1700000000, 123456789);
    auto [secs, nanos] = time::to_epoch_parts(tp);
    EXPECT_EQ(secs, 1700000000u);
    EXPECT_EQ(nanos, 123456789u);
}

TEST(TimeTest, IsoStrings) {
    auto tp = time::from_timestamp(0);
    EXPECT_EQ(time::to_string(tp), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(time::to_timestamp(time::from_string("2023-11-14T22:13:20.000Z")), 1700000000u);
    EXPECT_THROW(time::from_string("not a time"), std::runtime_error);
}

class ConfigTest : public ::testing::Test {
protected:
    std::string test_file;

    void SetUp() override {
        test_file = std::string("./test_config_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json";
    }

    void TearDown() override {
        if (fs::exists(test_file)) {
            fs::remove(test_file);
        }
    }
};

TEST_F(ConfigTest, GetSetAndDefaults) {
    utils::Config config;
    config.set("name", std::string("blast"));
    config.set("limit", 5);

    EXPECT_TRUE(config.has("name"));
    EXPECT_EQ(config.get<std::string>("name").value(), "blast");
    EXPECT_EQ(config.get_or<int>("limit", 0), 5);
    EXPECT_EQ(config.get_or<int>("missing", 9), 9);

    // Wrong type reads as absent
    EXPECT_FALSE(config.get<int>("name").has_value());
}

TEST_F(ConfigTest, FileRoundTrip) {
    utils::Config config;
    config.set("ttl", 60);
    config.save_to_file(test_file);

    auto loaded = utils::Config::load_from_file(test_file);
    EXPECT_EQ(loaded.get<int>("ttl").value(), 60);
}

TEST_F(ConfigTest, RejectsInvalidInput) {
    EXPECT_THROW(utils::Config::load_from_json("{not json"), std::runtime_error);
    EXPECT_THROW(utils::Config::load_from_json("[1, 2]"), std::runtime_error);
    EXPECT_THROW(utils::Config::load_from_file("./does_not_exist.json"), std::runtime_error);
}

TEST(CacheSettingsTest, Defaults) {
    cache::CacheSettings settings;
    EXPECT_EQ(settings.max_size, 10ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(settings.ttl, std::chrono::seconds(30 * 24 * 60 * 60));
    EXPECT_TRUE(settings.use_hardlinks);
    EXPECT_TRUE(settings.use_cow);
    EXPECT_EQ(settings.cache_dir.filename(), "blast");
}

TEST(CacheSettingsTest, FromConfig) {
    auto config = utils::Config::load_from_json(R"({
        "cache_dir": "/tmp/blast-settings",
        "max_size": 1048576,
        "ttl": 3600,
        "use_cow": false
    })");

    auto settings = cache::CacheSettings::from_config(config);
    EXPECT_EQ(settings.cache_dir, fs::path("/tmp/blast-settings"));
    EXPECT_EQ(settings.max_size, 1048576u);
    EXPECT_EQ(settings.ttl, std::chrono::seconds(3600));
    EXPECT_TRUE(settings.use_hardlinks);
    EXPECT_FALSE(settings.use_cow);

    auto back = cache::CacheSettings::from_config(settings.to_config());
    EXPECT_EQ(back.cache_dir, settings.cache_dir);
    EXPECT_EQ(back.max_size, settings.max_size);
    EXPECT_EQ(back.ttl, settings.ttl);
    EXPECT_EQ(back.use_cow, settings.use_cow);
}

TEST(CacheSettingsTest, OversizedTtlIsClamped) {
    auto config = utils::Config::load_from_json(R"({"ttl": 18446744073709551615})");
    auto settings = cache::CacheSettings::from_config(config);
    EXPECT_EQ(settings.ttl, std::chrono::seconds::max());

    config = utils::Config::load_from_json(R"({"ttl": 10000000000})");
    EXPECT_EQ(cache::CacheSettings::from_config(config).ttl, std::chrono::seconds(10000000000LL));
}

TEST(CacheSettingsTest, DefaultDirFollowsXdg) {
    const char* previous = std::getenv("XDG_CACHE_HOME");
    std::string saved = previous ? previous : "";

    setenv("XDG_CACHE_HOME", "/tmp/xdg-cache", 1);
    EXPECT_EQ(cache::CacheSettings::default_cache_dir(), fs::path("/tmp/xdg-cache/blast"));

    if (previous) {
        setenv("XDG_CACHE_HOME", saved.c_str(), 1);
    } else {
        unsetenv("XDG_CACHE_HOME");
    }
}

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(utils::Logger::parse_level("debug"), spdlog::level::debug);
    EXPECT_EQ(utils::Logger::parse_level("warn"), spdlog::level::warn);
    EXPECT_EQ(utils::Logger::parse_level("off"), spdlog::level::off);
    EXPECT_EQ(utils::Logger::parse_level("bogus"), spdlog::level::info);

    utils::Logger::init("warn");
    EXPECT_EQ(utils::Logger::get()->level(), spdlog::level::warn);
}
