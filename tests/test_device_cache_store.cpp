// =============================================================================
// Unit tests for DeviceCacheStore (src/device_cache_store.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include "device_cache_store.hpp"

using namespace emu;
namespace fs = std::filesystem;

class DeviceCacheStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("emu_cache_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        config_.enabled = true;
        config_.max_age_secs = 300;
        config_.cache_path = (dir_ / "cache" / "devices.json").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void writeRaw(const std::string& content) {
        fs::create_directories(fs::path(config_.cache_path).parent_path());
        std::ofstream f(config_.cache_path);
        f << content;
    }

    static std::vector<AndroidDevice> androidDevices() {
        AndroidDevice running("Pixel_7_API_34", "pixel_7", 34, DeviceStatus::Running);
        AndroidDevice stopped("Pixel_Tablet_API_33", "pixel_tablet", 33);
        return {running, stopped};
    }

    static std::vector<IosDevice> iosDevices() {
        IosDevice d("iPhone 15", "AAAA-1111", "com.apple.CoreSimulator.SimDeviceType.iPhone-15", "17.0",
                    DeviceStatus::Running);
        d.runtime_version = "iOS 17.0";
        return {d};
    }

    fs::path dir_;
    config::CacheConfig config_;
};

// ---------------------------------------------------------------------------
// Save / load
// ---------------------------------------------------------------------------
TEST_F(DeviceCacheStoreTest, SaveCreatesDirectoriesAndLoads) {
    DeviceCacheStore store(config_);
    EXPECT_FALSE(store.exists());

    ASSERT_TRUE(store.save(androidDevices(), iosDevices()).is_ok());
    EXPECT_TRUE(store.exists());
    EXPECT_FALSE(fs::exists(config_.cache_path + ".tmp"));

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->version, 1u);
    EXPECT_EQ(loaded->android_devices, androidDevices());
    EXPECT_EQ(loaded->ios_devices, iosDevices());
    EXPECT_TRUE(loaded->android_devices[0].isRunning());
}

TEST_F(DeviceCacheStoreTest, TimestampSurvivesRoundTrip) {
    DeviceCacheStore store(config_);
    PersistedDeviceCache cache;
    cache.last_updated = std::chrono::system_clock::now();
    cache.android_devices = androidDevices();

    ASSERT_TRUE(store.save(cache).is_ok());
    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, cache);
}

TEST_F(DeviceCacheStoreTest, FileLayout) {
    DeviceCacheStore store(config_);
    ASSERT_TRUE(store.save(androidDevices(), {}).is_ok());

    std::ifstream in(config_.cache_path);
    nlohmann::json j = nlohmann::json::parse(in);
    EXPECT_EQ(j["version"].get<int>(), 1);
    EXPECT_TRUE(j["last_updated"].contains("secs_since_epoch"));
    EXPECT_TRUE(j["last_updated"].contains("nanos_since_epoch"));
    EXPECT_EQ(j["android_devices"].size(), 2u);
    EXPECT_TRUE(j["ios_devices"].is_array());
}

// ---------------------------------------------------------------------------
// Rejected caches
// ---------------------------------------------------------------------------
TEST_F(DeviceCacheStoreTest, MissingFileIsNoCache) {
    DeviceCacheStore store(config_);
    EXPECT_FALSE(store.load().has_value());
}

TEST_F(DeviceCacheStoreTest, ExpiredCacheIsIgnored) {
    DeviceCacheStore store(config_);
    PersistedDeviceCache cache;
    cache.last_updated = std::chrono::system_clock::now() - std::chrono::seconds(301);
    cache.android_devices = androidDevices();
    ASSERT_TRUE(store.save(cache).is_ok());

    EXPECT_FALSE(store.load().has_value());
}

TEST_F(DeviceCacheStoreTest, ForeignVersionIsIgnored) {
    DeviceCacheStore store(config_);
    PersistedDeviceCache cache;
    cache.last_updated = std::chrono::system_clock::now();
    cache.version = 2;
    ASSERT_TRUE(store.save(cache).is_ok());

    EXPECT_FALSE(store.load().has_value());
}

TEST_F(DeviceCacheStoreTest, CorruptFileIsIgnored) {
    writeRaw("{\"version\": 1, \"android_devices\": [");
    DeviceCacheStore store(config_);
    EXPECT_FALSE(store.load().has_value());

    writeRaw("{\"version\": 1}");
    EXPECT_FALSE(store.load().has_value());
}

TEST_F(DeviceCacheStoreTest, DisabledStoreNeverTouchesDisk) {
    config_.enabled = false;
    DeviceCacheStore store(config_);
    ASSERT_TRUE(store.save(androidDevices(), iosDevices()).is_ok());
    EXPECT_FALSE(store.exists());
    EXPECT_FALSE(store.load().has_value());
}

TEST_F(DeviceCacheStoreTest, ClearRemovesFile) {
    DeviceCacheStore store(config_);
    ASSERT_TRUE(store.save(androidDevices(), {}).is_ok());
    ASSERT_TRUE(store.clear().is_ok());
    EXPECT_FALSE(store.exists());
    EXPECT_TRUE(store.clear().is_ok());
}

// ---------------------------------------------------------------------------
// Validity window
// ---------------------------------------------------------------------------
TEST(PersistedDeviceCacheTest, ValidStrictlyBelowMaxAge) {
    const auto now = std::chrono::system_clock::now();
    PersistedDeviceCache cache;
    cache.last_updated = now - std::chrono::seconds(299);
    EXPECT_TRUE(cache.isValid(std::chrono::seconds(300), now));

    cache.last_updated = now - std::chrono::seconds(300);
    EXPECT_FALSE(cache.isValid(std::chrono::seconds(300), now));

    cache.last_updated = now + std::chrono::seconds(10);
    EXPECT_FALSE(cache.isValid(std::chrono::seconds(300), now));
}
