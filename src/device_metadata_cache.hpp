#pragma once
// =============================================================================
// emu - Device Metadata Cache
// =============================================================================
// In-memory, time-boxed copy of the slow catalogs (device types and API
// levels / runtimes), one independent entry per platform.
//
// - Readers take a shared lock only; the loading flag is atomic so a UI
//   frame can poll it without touching the lock.
// - tryBeginRefresh() is the single gate for starting a background refresh.
// - update() replaces catalogs, timestamp and loading together.
// - failRefresh() clears loading and keeps whatever data was there.
// =============================================================================
#include <atomic>
#include <chrono>
#include <optional>
#include <shared_mutex>
#include "device.hpp"
#include "emu_constants.hpp"

namespace emu {

class DeviceMetadataCache {
public:
    using Clock = std::chrono::steady_clock;

    struct Snapshot {
        Catalog device_types;
        Catalog versions;                           // API levels / runtimes
        std::optional<Clock::time_point> last_updated;
        bool loading = false;
    };

    explicit DeviceMetadataCache(std::chrono::seconds ttl = constants::METADATA_CACHE_TTL)
        : ttl_(ttl) {}

    // Never-updated entries are stale
    bool isStale(Platform p) const { return isStale(p, Clock::now()); }
    bool isStale(Platform p, Clock::time_point now) const;

    bool isLoading(Platform p) const;
    bool hasData(Platform p) const;

    // Sets loading; false when a refresh for p is already in flight
    bool tryBeginRefresh(Platform p);

    void update(Platform p, Catalog device_types, Catalog versions) {
        update(p, std::move(device_types), std::move(versions), Clock::now());
    }
    void update(Platform p, Catalog device_types, Catalog versions, Clock::time_point now);

    void failRefresh(Platform p);

    Snapshot snapshot(Platform p) const;
    Catalog deviceTypes(Platform p) const;
    Catalog versions(Platform p) const;

    std::chrono::seconds ttl() const { return ttl_; }

private:
    struct Entry {
        Catalog device_types;
        Catalog versions;
        std::optional<Clock::time_point> last_updated;
        std::atomic<bool> loading{false};
    };

    Entry& entry(Platform p) { return p == Platform::Android ? android_ : ios_; }
    const Entry& entry(Platform p) const { return p == Platform::Android ? android_ : ios_; }

    std::chrono::seconds ttl_;
    mutable std::shared_mutex mutex_;
    Entry android_;
    Entry ios_;
};

} // namespace emu
