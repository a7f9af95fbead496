#include "device_cache_store.hpp"
#include "emu_constants.hpp"
#include "emu_log.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace emu {

namespace fs = std::filesystem;

bool PersistedDeviceCache::isValid(std::chrono::seconds max_age,
                                   std::chrono::system_clock::time_point now) const {
    if (now < last_updated) return false;
    return now - last_updated < max_age;
}

bool PersistedDeviceCache::operator==(const PersistedDeviceCache& o) const {
    return last_updated == o.last_updated && android_devices == o.android_devices &&
           ios_devices == o.ios_devices && version == o.version;
}

void to_json(nlohmann::json& j, const PersistedDeviceCache& c) {
    using namespace std::chrono;
    const auto since_epoch = duration_cast<nanoseconds>(c.last_updated.time_since_epoch());
    const auto secs = duration_cast<seconds>(since_epoch);
    j = nlohmann::json{
        {"version", c.version},
        {"last_updated", {
            {"secs_since_epoch", secs.count()},
            {"nanos_since_epoch", (since_epoch - secs).count()},
        }},
        {"android_devices", c.android_devices},
        {"ios_devices", c.ios_devices},
    };
}

void from_json(const nlohmann::json& j, PersistedDeviceCache& c) {
    using namespace std::chrono;
    c.version = j.at("version").get<uint32_t>();
    const auto& ts = j.at("last_updated");
    const auto since_epoch = seconds(ts.at("secs_since_epoch").get<int64_t>()) +
                             nanoseconds(ts.value("nanos_since_epoch", int64_t(0)));
    c.last_updated = system_clock::time_point(duration_cast<system_clock::duration>(since_epoch));
    c.android_devices = j.at("android_devices").get<std::vector<AndroidDevice>>();
    c.ios_devices = j.at("ios_devices").get<std::vector<IosDevice>>();
}

DeviceCacheStore::DeviceCacheStore(config::CacheConfig config) : config_(std::move(config)) {
    if (config_.cache_path.empty()) config_.cache_path = config::defaultCachePath();
}

std::optional<PersistedDeviceCache> DeviceCacheStore::load() const {
    if (!config_.enabled) return std::nullopt;

    std::ifstream in(config_.cache_path);
    if (!in) {
        ELOG_DEBUG("cache", "No device cache at %s", config_.cache_path.c_str());
        return std::nullopt;
    }

    PersistedDeviceCache cache;
    try {
        nlohmann::json j;
        in >> j;
        cache = j.get<PersistedDeviceCache>();
    } catch (const nlohmann::json::exception& e) {
        ELOG_WARN("cache", "Ignoring unreadable device cache %s: %s",
                  config_.cache_path.c_str(), e.what());
        return std::nullopt;
    }

    if (cache.version != constants::DEVICE_CACHE_VERSION) {
        ELOG_INFO("cache", "Ignoring device cache version %u (expected %u)",
                  cache.version, constants::DEVICE_CACHE_VERSION);
        return std::nullopt;
    }
    if (!cache.isValid(std::chrono::seconds(config_.max_age_secs))) {
        ELOG_DEBUG("cache", "Device cache expired");
        return std::nullopt;
    }

    ELOG_INFO("cache", "Loaded device cache (%zu Android, %zu iOS)",
              cache.android_devices.size(), cache.ios_devices.size());
    return cache;
}

Result<void> DeviceCacheStore::save(const std::vector<AndroidDevice>& android_devices,
                                    const std::vector<IosDevice>& ios_devices) {
    PersistedDeviceCache cache;
    cache.last_updated = std::chrono::system_clock::now();
    cache.android_devices = android_devices;
    cache.ios_devices = ios_devices;
    cache.version = constants::DEVICE_CACHE_VERSION;
    return save(cache);
}

Result<void> DeviceCacheStore::save(const PersistedDeviceCache& cache) {
    if (!config_.enabled) return Ok();

    const fs::path path(config_.cache_path);
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return IoError("Cannot create " + path.parent_path().string() + ": " + ec.message(),
                           IoError::Kind::PermissionDenied);
        }
    }

    // Write-then-rename so a reader never sees a half-written file
    const std::string tmp = config_.cache_path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return IoError("Cannot write " + tmp, IoError::Kind::PermissionDenied);
        }
        // Tool output is not guaranteed UTF-8
        out << nlohmann::json(cache).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
        if (!out) {
            return IoError("Write failed: " + tmp);
        }
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return IoError("Cannot replace " + config_.cache_path);
    }

    ELOG_DEBUG("cache", "Saved device cache to %s", config_.cache_path.c_str());
    return Ok();
}

Result<void> DeviceCacheStore::clear() {
    std::error_code ec;
    fs::remove(config_.cache_path, ec);
    if (ec) {
        return IoError("Cannot remove " + config_.cache_path + ": " + ec.message());
    }
    return Ok();
}

bool DeviceCacheStore::exists() const {
    std::error_code ec;
    return fs::exists(config_.cache_path, ec);
}

} // namespace emu
