#pragma once
// =============================================================================
// emu - Application Controller
// =============================================================================
// Owns AppState and drives it from two directions:
//   - the input loop calls handleIntent() / tick() on its own thread
//   - device operations and refreshes run as std::async background tasks
//
// Locking rule: state_mutex_ is taken for one state transition at a time and
// is never held across a device-manager call. Background tasks read what
// they need, release, call the manager, then write the result back.
//
// Every user action ends with exactly one notification and the operation
// status indicator cleared, whatever the outcome.
//
// The log of the selected running device is followed on a dedicated thread
// (it never ends by itself), so waitForBackgroundTasks() does not wait on it.
// =============================================================================
#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>
#include "app_state.hpp"
#include "config_loader.hpp"
#include "device_cache_store.hpp"
#include "device_manager.hpp"
#include "device_metadata_cache.hpp"
#include "event_bus.hpp"
#include "event_processing.hpp"

namespace emu {

enum class Intent {
    // Navigation (batched)
    MoveUp, MoveDown, NextPanel, FocusAndroid, FocusIos, FocusDetails,
    // Device actions (debounced)
    ToggleDevice, StartDevice, StopDevice, RequestDelete, RequestWipe,
    OpenCreateForm, OpenApiLevels, Refresh,
    // Dialog / form
    Confirm, Cancel, NextField, PrevField, SelectNext, SelectPrev,
    // Misc
    ShowHelp, DismissNotifications, ToggleFullscreenLogs, ToggleAutoScroll, ClearLogs, Quit,
};

const char* intentStr(Intent i);

class AppController {
public:
    using Clock = std::chrono::steady_clock;

    // ios may be null or unavailable on hosts without simulator tooling
    AppController(std::shared_ptr<AndroidDeviceManager> android,
                  std::shared_ptr<IosDeviceManager> ios,
                  const config::AppConfig& config,
                  EventBus& bus = emu::bus());
    ~AppController();

    AppController(const AppController&) = delete;
    AppController& operator=(const AppController&) = delete;

    // Seeds the lists from the persisted cache, then starts the first
    // device refresh and the Android catalog load in the background
    void initialize();

    // --- State access ---
    template<typename F>
    auto withRead(F&& f) const {
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        return f(static_cast<const AppState&>(state_));
    }

    template<typename F>
    auto withWrite(F&& f) {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        return f(state_);
    }

    // --- Input loop ---
    void handleIntent(Intent intent) { handleIntent(intent, Clock::now()); }
    void handleIntent(Intent intent, Clock::time_point now);

    // Text typed into the active create-form field; RAM / storage take digits only
    void inputText(const std::string& text);
    void deleteChar();

    // Applies settled navigation, expires notifications, schedules the
    // periodic refresh and retargets the log stream. Called once per frame.
    void tick() { tick(Clock::now()); }
    void tick(Clock::time_point now);

    bool shouldQuit() const { return quit_.load(); }

    // --- Background work ---
    void refreshDevicesAsync();
    // No-op when a refresh for p is already running
    void refreshMetadataAsync(Platform p);
    // Starts a catalog refresh when the cached one is stale
    void ensureMetadataFresh(Platform p);
    void loadSelectedDeviceDetailsAsync();

    // Operations by identifier; each runs on a background task
    void startDevice(Platform p, const std::string& id, const std::string& name);
    void stopDevice(Platform p, const std::string& id, const std::string& name);
    void wipeDevice(Platform p, const std::string& id, const std::string& name);
    void deleteDevice(Platform p, const std::string& id, const std::string& name);
    void createDevice(Platform p, const DeviceConfig& config);

    // Follows the selected device while it runs. A different selection,
    // panel or running state stops the current stream first; switching to
    // a new running device clears the log buffer
    void updateLogStream();
    void stopLogStream();
    // (platform, id) currently streamed, if any
    std::optional<std::pair<Platform, std::string>> logStreamTarget() const;

    // Blocks until every task spawned so far (and any they spawned) finished
    void waitForBackgroundTasks();
    size_t pendingTaskCount() const;

    // Blocking device-list refresh of both platforms
    void refreshDevices();

    DeviceMetadataCache& metadataCache() { return metadata_; }
    const DeviceMetadataCache& metadataCache() const { return metadata_; }
    DeviceCacheStore& cacheStore() { return cache_store_; }

private:
    void spawnTask(std::function<void()> task);

    struct LogTarget {
        Platform platform;
        std::string id;
        std::string name;
    };
    // Caller holds log_stream_mutex_
    void stopLogStreamLocked();

    bool platformAvailable(Platform p) const;
    // False when the listing failed and the previous list was kept
    bool refreshPlatform(Platform p);
    void loadMetadata(Platform p);

    void applyNavigation(NavigationTarget target);
    void applySteps(int steps);
    void flushNavigation();

    void handleNormalIntent(Intent intent);
    void handleCreateFormIntent(Intent intent);
    void handleConfirmIntent(Intent intent, bool wipe);
    void handleApiLevelIntent(Intent intent);

    void openCreateForm();
    void openApiLevels();
    void submitCreateForm();
    void requestConfirmation(bool wipe);
    void toggleSelectedDevice(bool start_only, bool stop_only);

    // Status text set, op run without the lock, then one notification and a
    // list refresh of the platform
    void runOperation(Platform p, DeviceOperation op, const std::string& name,
                      std::function<Result<void>()> fn);

    std::shared_ptr<AndroidDeviceManager> android_;
    std::shared_ptr<IosDeviceManager> ios_;
    config::AppConfig config_;
    EventBus& bus_;

    mutable std::shared_mutex state_mutex_;
    AppState state_;

    DeviceMetadataCache metadata_;
    DeviceCacheStore cache_store_;

    // Input-thread only
    EventDebouncer debouncer_;
    NavigationBatcher<NavigationTarget> navigation_;
    StepBatcher steps_;

    mutable std::mutex tasks_mutex_;
    std::vector<std::future<void>> tasks_;

    mutable std::mutex log_stream_mutex_;
    std::thread log_thread_;
    std::shared_ptr<std::atomic<bool>> log_stop_;
    std::optional<LogTarget> log_target_;

    std::atomic<bool> refresh_in_flight_{false};
    std::atomic<bool> quit_{false};
    std::atomic<bool> android_refresh_failed_{false};
    std::atomic<bool> ios_refresh_failed_{false};
};

} // namespace emu
