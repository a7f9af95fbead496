#include "device_metadata_cache.hpp"
#include "emu_log.hpp"

#include <mutex>

namespace emu {

bool DeviceMetadataCache::isStale(Platform p, Clock::time_point now) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const Entry& e = entry(p);
    if (!e.last_updated) return true;
    return now - *e.last_updated > ttl_;
}

bool DeviceMetadataCache::isLoading(Platform p) const {
    return entry(p).loading.load(std::memory_order_acquire);
}

bool DeviceMetadataCache::hasData(Platform p) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const Entry& e = entry(p);
    return !e.device_types.empty() || !e.versions.empty();
}

bool DeviceMetadataCache::tryBeginRefresh(Platform p) {
    bool expected = false;
    const bool started = entry(p).loading.compare_exchange_strong(expected, true,
                                                                  std::memory_order_acq_rel);
    if (!started) {
        ELOG_DEBUG("cache", "%s metadata refresh already in flight", platformStr(p));
    }
    return started;
}

void DeviceMetadataCache::update(Platform p, Catalog device_types, Catalog versions,
                                 Clock::time_point now) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        Entry& e = entry(p);
        e.device_types = std::move(device_types);
        e.versions = std::move(versions);
        e.last_updated = now;
        e.loading.store(false, std::memory_order_release);
    }
    ELOG_DEBUG("cache", "%s metadata updated", platformStr(p));
}

void DeviceMetadataCache::failRefresh(Platform p) {
    entry(p).loading.store(false, std::memory_order_release);
    ELOG_WARN("cache", "%s metadata refresh failed, keeping previous data", platformStr(p));
}

DeviceMetadataCache::Snapshot DeviceMetadataCache::snapshot(Platform p) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const Entry& e = entry(p);
    Snapshot s;
    s.device_types = e.device_types;
    s.versions = e.versions;
    s.last_updated = e.last_updated;
    s.loading = e.loading.load(std::memory_order_acquire);
    return s;
}

Catalog DeviceMetadataCache::deviceTypes(Platform p) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entry(p).device_types;
}

Catalog DeviceMetadataCache::versions(Platform p) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entry(p).versions;
}

} // namespace emu
