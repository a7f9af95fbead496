#pragma once
// =============================================================================
// emu - Persistent Device List Cache
// =============================================================================
// Flat JSON file holding the last device lists so the UI has something to
// show before the first refresh completes.
//
//   {"version": 1,
//    "last_updated": {"secs_since_epoch": ..., "nanos_since_epoch": ...},
//    "android_devices": [...], "ios_devices": [...]}
//
// load() answers "no cache" for a missing, unreadable, foreign-version or
// expired file; it never tries to interpret such data.
// =============================================================================
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include "config_loader.hpp"
#include "device.hpp"
#include "result.hpp"

namespace emu {

struct PersistedDeviceCache {
    std::chrono::system_clock::time_point last_updated;
    std::vector<AndroidDevice> android_devices;
    std::vector<IosDevice> ios_devices;
    uint32_t version = 1;

    // Age strictly below max_age
    bool isValid(std::chrono::seconds max_age,
                 std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    bool operator==(const PersistedDeviceCache& o) const;
};

void to_json(nlohmann::json& j, const PersistedDeviceCache& c);
void from_json(const nlohmann::json& j, PersistedDeviceCache& c);

class DeviceCacheStore {
public:
    explicit DeviceCacheStore(config::CacheConfig config);

    std::optional<PersistedDeviceCache> load() const;

    // Stamped with the current time; no-op when caching is disabled
    Result<void> save(const std::vector<AndroidDevice>& android_devices,
                      const std::vector<IosDevice>& ios_devices);
    Result<void> save(const PersistedDeviceCache& cache);

    Result<void> clear();
    bool exists() const;

    const std::string& path() const { return config_.cache_path; }
    bool enabled() const { return config_.enabled; }

private:
    config::CacheConfig config_;
};

} // namespace emu
