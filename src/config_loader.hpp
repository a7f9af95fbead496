#pragma once
// =============================================================================
// emu Config Loader
// =============================================================================
// Loads settings from config.json with nlohmann/json. Missing keys keep their
// defaults; a missing or malformed file yields the defaults.
// =============================================================================

#include <string>
#include <fstream>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include "emu_constants.hpp"
#include "emu_log.hpp"

namespace emu {
namespace config {

struct AndroidConfig {
    std::string default_ram = "2048";
    std::string default_storage = "8192";
    int default_api_level = 0;                        // 0 = newest installed
    std::string default_tag = "google_apis_playstore";
};

struct IosConfig {
    std::string default_device_type;
    std::string default_ios_version;
};

struct UiConfig {
    int auto_refresh_ms = 3000;
    int fast_refresh_ms = 1000;
    int max_log_entries = 1000;
    int max_notifications = 10;
    int notification_dismiss_ms = 5000;
    int debounce_ms = 10;
    int navigation_batch_ms = 50;
};

struct CacheConfig {
    bool enabled = true;
    int max_age_secs = 300;
    std::string cache_path;        // empty = <config dir>/cache/devices.json
};

struct CommandConfig {
    int timeout_ms = 30000;
    int retries = 2;
};

struct LogConfig {
    std::string log_path;          // empty = no log file
    std::string level = "info";
};

struct AppConfig {
    AndroidConfig android;
    IosConfig ios;
    UiConfig ui;
    CacheConfig cache;
    CommandConfig command;
    LogConfig log;
};

// $XDG_CONFIG_HOME/emu, else $HOME/.config/emu, else ./.emu
inline std::string configDirectory() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::string(xdg) + "/emu";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::string(home) + "/.config/emu";
    }
    return ".emu";
}

inline std::string defaultConfigPath() { return configDirectory() + "/config.json"; }
inline std::string defaultCachePath() { return configDirectory() + "/cache/devices.json"; }

// Safe JSON accessor with section/key and default value
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    if (!j.contains(section) || !j[section].is_object() || !j[section].contains(key)) {
        return def;
    }
    try {
        return j[section][key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        ELOG_WARN("config", "%s.%s: %s (using default)", section.c_str(), key.c_str(), e.what());
    }
    return def;
}

// @param configPath  Path to config file
// @param strict      If true, only try the exact path (no fallback search)
inline AppConfig loadConfig(const std::string& configPath = defaultConfigPath(),
                            bool strict = false) {
    AppConfig config;

    std::ifstream file(configPath);
    if (!file.is_open() && !strict) {
        file.open("emu.json");
    }
    if (!file.is_open()) {
        ELOG_DEBUG("config", "%s not found, using defaults", configPath.c_str());
        config.cache.cache_path = defaultCachePath();
        return config;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);

        config.android.default_ram = jsonGet<std::string>(j, "android", "default_ram", "2048");
        config.android.default_storage = jsonGet<std::string>(j, "android", "default_storage", "8192");
        config.android.default_api_level = jsonGet<int>(j, "android", "default_api_level", 0);
        config.android.default_tag = jsonGet<std::string>(j, "android", "default_tag", "google_apis_playstore");

        config.ios.default_device_type = jsonGet<std::string>(j, "ios", "default_device_type", "");
        config.ios.default_ios_version = jsonGet<std::string>(j, "ios", "default_ios_version", "");

        config.ui.auto_refresh_ms = jsonGet<int>(j, "ui", "auto_refresh_ms", 3000);
        config.ui.fast_refresh_ms = jsonGet<int>(j, "ui", "fast_refresh_ms", 1000);
        config.ui.max_log_entries = jsonGet<int>(j, "ui", "max_log_entries", 1000);
        config.ui.max_notifications = jsonGet<int>(j, "ui", "max_notifications", 10);
        config.ui.notification_dismiss_ms = jsonGet<int>(j, "ui", "notification_dismiss_ms", 5000);
        config.ui.debounce_ms = jsonGet<int>(j, "ui", "debounce_ms", 10);
        config.ui.navigation_batch_ms = jsonGet<int>(j, "ui", "navigation_batch_ms", 50);

        config.cache.enabled = jsonGet<bool>(j, "cache", "enabled", true);
        config.cache.max_age_secs = jsonGet<int>(j, "cache", "max_age_secs", 300);
        config.cache.cache_path = jsonGet<std::string>(j, "cache", "cache_path", "");

        config.command.timeout_ms = jsonGet<int>(j, "command", "timeout_ms", 30000);
        config.command.retries = jsonGet<int>(j, "command", "retries", 2);

        config.log.log_path = jsonGet<std::string>(j, "log", "log_path", "");
        config.log.level = jsonGet<std::string>(j, "log", "level", "info");

    } catch (const nlohmann::json::exception& e) {
        ELOG_ERROR("config", "JSON parse error in %s: %s", configPath.c_str(), e.what());
        config = AppConfig{};
    }

    // Guard against values that would break bounded buffers
    if (config.ui.max_log_entries <= 0) config.ui.max_log_entries = 1000;
    if (config.ui.max_notifications <= 0) config.ui.max_notifications = 10;
    if (config.command.retries < 0) config.command.retries = 0;
    if (config.cache.cache_path.empty()) config.cache.cache_path = defaultCachePath();

    ELOG_INFO("config", "Loaded %s: refresh=%dms cache=%s (%ds)",
              configPath.c_str(), config.ui.auto_refresh_ms,
              config.cache.enabled ? "on" : "off", config.cache.max_age_secs);

    return config;
}

} // namespace config
} // namespace emu
