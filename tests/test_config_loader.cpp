// =============================================================================
// Unit tests for config_loader.hpp
// Tests: defaults, file loading, partial files, malformed JSON, guards
// =============================================================================
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>
#include "config_loader.hpp"

using namespace emu::config;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static std::string tmpPath(const char* name) {
    return std::string("/tmp/emu_cfg_") + std::to_string(::getpid()) + "_" + name;
}

static void writeTmpJson(const std::string& path, const char* content) {
    std::ofstream f(path);
    f << content;
}

// ---------------------------------------------------------------------------
// Defaults
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, DefaultValues) {
    AppConfig cfg;
    EXPECT_EQ(cfg.android.default_ram, "2048");
    EXPECT_EQ(cfg.android.default_storage, "8192");
    EXPECT_EQ(cfg.android.default_api_level, 0);
    EXPECT_EQ(cfg.android.default_tag, "google_apis_playstore");
    EXPECT_EQ(cfg.ui.auto_refresh_ms, 3000);
    EXPECT_EQ(cfg.ui.fast_refresh_ms, 1000);
    EXPECT_EQ(cfg.ui.max_log_entries, 1000);
    EXPECT_EQ(cfg.ui.max_notifications, 10);
    EXPECT_EQ(cfg.ui.notification_dismiss_ms, 5000);
    EXPECT_TRUE(cfg.cache.enabled);
    EXPECT_EQ(cfg.cache.max_age_secs, 300);
    EXPECT_EQ(cfg.command.timeout_ms, 30000);
    EXPECT_EQ(cfg.command.retries, 2);
    EXPECT_EQ(cfg.log.level, "info");
    EXPECT_TRUE(cfg.log.log_path.empty());
}

TEST(ConfigLoaderTest, MissingFileReturnsDefaultsWithCachePath) {
    AppConfig cfg = loadConfig("__nonexistent_emu_config.json", true);
    EXPECT_EQ(cfg.android.default_ram, "2048");
    EXPECT_EQ(cfg.cache.cache_path, defaultCachePath());
}

TEST(ConfigLoaderTest, DefaultPathsLiveUnderConfigDirectory) {
    const std::string dir = configDirectory();
    EXPECT_EQ(defaultConfigPath(), dir + "/config.json");
    EXPECT_EQ(defaultCachePath(), dir + "/cache/devices.json");
}

// ---------------------------------------------------------------------------
// File loading
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, LoadsAllSections) {
    const std::string path = tmpPath("full.json");
    writeTmpJson(path, R"({
        "android": {"default_ram": "4096", "default_api_level": 34, "default_tag": "google_apis"},
        "ios": {"default_device_type": "com.apple.CoreSimulator.SimDeviceType.iPhone-15"},
        "ui": {"auto_refresh_ms": 5000, "max_notifications": 3},
        "cache": {"enabled": false, "max_age_secs": 60, "cache_path": "/tmp/emu_devices.json"},
        "command": {"timeout_ms": 1000, "retries": 0},
        "log": {"log_path": "/tmp/emu.log", "level": "debug"}
    })");

    AppConfig cfg = loadConfig(path, true);
    EXPECT_EQ(cfg.android.default_ram, "4096");
    EXPECT_EQ(cfg.android.default_storage, "8192");      // not in file
    EXPECT_EQ(cfg.android.default_api_level, 34);
    EXPECT_EQ(cfg.android.default_tag, "google_apis");
    EXPECT_EQ(cfg.ios.default_device_type, "com.apple.CoreSimulator.SimDeviceType.iPhone-15");
    EXPECT_EQ(cfg.ui.auto_refresh_ms, 5000);
    EXPECT_EQ(cfg.ui.max_notifications, 3);
    EXPECT_FALSE(cfg.cache.enabled);
    EXPECT_EQ(cfg.cache.max_age_secs, 60);
    EXPECT_EQ(cfg.cache.cache_path, "/tmp/emu_devices.json");
    EXPECT_EQ(cfg.command.timeout_ms, 1000);
    EXPECT_EQ(cfg.command.retries, 0);
    EXPECT_EQ(cfg.log.log_path, "/tmp/emu.log");
    EXPECT_EQ(cfg.log.level, "debug");

    std::remove(path.c_str());
}

TEST(ConfigLoaderTest, WrongTypeFallsBackToDefault) {
    const std::string path = tmpPath("types.json");
    writeTmpJson(path, R"({"ui": {"auto_refresh_ms": "fast"}, "android": {"default_ram": 1024}})");

    AppConfig cfg = loadConfig(path, true);
    EXPECT_EQ(cfg.ui.auto_refresh_ms, 3000);
    EXPECT_EQ(cfg.android.default_ram, "2048");

    std::remove(path.c_str());
}

TEST(ConfigLoaderTest, MalformedJsonReturnsDefaults) {
    const std::string path = tmpPath("broken.json");
    writeTmpJson(path, "{ \"ui\": { \"auto_refresh_ms\": 10 ");

    AppConfig cfg = loadConfig(path, true);
    EXPECT_EQ(cfg.ui.auto_refresh_ms, 3000);
    EXPECT_EQ(cfg.cache.cache_path, defaultCachePath());

    std::remove(path.c_str());
}

TEST(ConfigLoaderTest, NonPositiveBuffersAreGuarded) {
    const std::string path = tmpPath("guards.json");
    writeTmpJson(path, R"({"ui": {"max_log_entries": 0, "max_notifications": -4}, "command": {"retries": -1}})");

    AppConfig cfg = loadConfig(path, true);
    EXPECT_EQ(cfg.ui.max_log_entries, 1000);
    EXPECT_EQ(cfg.ui.max_notifications, 10);
    EXPECT_EQ(cfg.command.retries, 0);

    std::remove(path.c_str());
}

// ---------------------------------------------------------------------------
// jsonGet
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, JsonGetMissingSectionOrKey) {
    nlohmann::json j = nlohmann::json::parse(R"({"ui": {"debounce_ms": 20}, "cache": 5})");
    EXPECT_EQ(jsonGet<int>(j, "ui", "debounce_ms", 10), 20);
    EXPECT_EQ(jsonGet<int>(j, "ui", "navigation_batch_ms", 50), 50);
    EXPECT_EQ(jsonGet<int>(j, "missing", "x", 7), 7);
    EXPECT_EQ(jsonGet<int>(j, "cache", "max_age_secs", 300), 300);   // section not an object
}
