// =============================================================================
// emu - Event Bus
// =============================================================================
// Thread-safe, type-erased publish/subscribe event system.
// Background tasks announce finished refreshes and device operations here;
// the front end and the log sink subscribe.
// Usage:
//   auto sub = emu::bus().subscribe<DeviceOperationEvent>([](const auto& e) { ... });
//   emu::bus().publish(DeviceOperationEvent{...});
// =============================================================================
#pragma once
#include <functional>
#include <mutex>
#include <vector>
#include <unordered_map>
#include <typeindex>
#include <memory>
#include <string>
#include <cstdint>
#include <algorithm>
#include "device.hpp"
#include "emu_log.hpp"

namespace emu {

// =============================================================================
// Event Types
// =============================================================================

struct Event {
    virtual ~Event() = default;
};

enum class DeviceOperation { Create, Start, Stop, Wipe, Delete };

inline const char* deviceOperationStr(DeviceOperation op) {
    switch (op) {
        case DeviceOperation::Create: return "create";
        case DeviceOperation::Start:  return "start";
        case DeviceOperation::Stop:   return "stop";
        case DeviceOperation::Wipe:   return "wipe";
        case DeviceOperation::Delete: return "delete";
    }
    return "?";
}

// Device list replaced in AppState
struct DeviceListRefreshedEvent : Event {
    Platform platform = Platform::Android;
    size_t device_count = 0;
    bool from_cache = false;       // seeded from the persisted cache file
};

// Lifecycle operation resolved (one per user action)
struct DeviceOperationEvent : Event {
    Platform platform = Platform::Android;
    DeviceOperation operation = DeviceOperation::Start;
    std::string device_name;
    bool success = false;
    std::string message;           // notification text
};

// Device-type / version catalogs reloaded (or failed to)
struct MetadataRefreshedEvent : Event {
    Platform platform = Platform::Android;
    bool success = false;
    size_t device_type_count = 0;
    size_t version_count = 0;
};

// System
struct ShutdownEvent : Event {};

// =============================================================================
// SubscriptionHandle - RAII unsubscribe
// =============================================================================

class SubscriptionHandle {
public:
    SubscriptionHandle() = default;
    explicit SubscriptionHandle(std::function<void()> unsub) : unsub_(std::move(unsub)) {}
    ~SubscriptionHandle() { if (unsub_) unsub_(); }

    SubscriptionHandle(SubscriptionHandle&& o) noexcept : unsub_(std::move(o.unsub_)) { o.unsub_ = nullptr; }
    SubscriptionHandle& operator=(SubscriptionHandle&& o) noexcept {
        if (unsub_) unsub_();
        unsub_ = std::move(o.unsub_);
        o.unsub_ = nullptr;
        return *this;
    }
    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    void release() { unsub_ = nullptr; } // detach: subscription lives forever

private:
    std::function<void()> unsub_;
};

// =============================================================================
// EventBus - Thread-safe publish/subscribe
// =============================================================================

class EventBus {
public:
    using HandlerId = uint64_t;

    template<typename T>
    SubscriptionHandle subscribe(std::function<void(const T&)> handler) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::lock_guard<std::mutex> lock(mutex_);
        auto id = next_id_++;
        auto key = std::type_index(typeid(T));

        handlers_[key].push_back({id, [handler](const Event& e) {
            handler(static_cast<const T&>(e));
        }});

        ELOG_DEBUG("eventbus", "Subscribed handler %llu for %s",
                   (unsigned long long)id, typeid(T).name());

        return SubscriptionHandle([this, key, id]() {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(key);
            if (it != handlers_.end()) {
                auto& vec = it->second;
                vec.erase(std::remove_if(vec.begin(), vec.end(),
                    [id](const HandlerEntry& h) { return h.id == id; }), vec.end());
            }
        });
    }

    // Handlers run on the publishing thread, outside the bus lock
    template<typename T>
    void publish(const T& event) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::vector<HandlerEntry> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto key = std::type_index(typeid(T));
            auto it = handlers_.find(key);
            if (it != handlers_.end()) {
                snapshot = it->second;
            }
        }

        for (auto& entry : snapshot) {
            try {
                entry.fn(event);
            } catch (const std::exception& e) {
                ELOG_ERROR("eventbus", "Handler %llu threw: %s",
                           (unsigned long long)entry.id, e.what());
            }
        }
    }

    template<typename T>
    bool has_subscribers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto key = std::type_index(typeid(T));
        auto it = handlers_.find(key);
        return it != handlers_.end() && !it->second.empty();
    }

private:
    struct HandlerEntry {
        HandlerId id;
        std::function<void(const Event&)> fn;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, std::vector<HandlerEntry>> handlers_;
    HandlerId next_id_ = 1;
};

// Process-wide bus used by the bootstrap; tests construct their own
inline EventBus& bus() {
    static EventBus instance;
    return instance;
}

} // namespace emu
