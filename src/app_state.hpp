#pragma once
// =============================================================================
// emu - Application State
// =============================================================================
// Single owned structure the renderer reads and the controller mutates:
//   - Android / iOS device lists with independent cursors
//   - active panel, focus, and the current mode with its dialog payload
//   - bounded notification queue and device-log ring buffer
//   - cached details snapshot, refresh timing, pending-operation indicator
//
// AppState does no locking and no I/O. AppController wraps it in a
// reader/writer lock and never calls a device manager while writing.
// =============================================================================
#include <chrono>
#include <deque>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "config_loader.hpp"
#include "create_device_form.hpp"
#include "device.hpp"
#include "notification.hpp"

namespace emu {

enum class FocusedPanel { DeviceList, LogArea };

enum class Mode { Normal, CreateDevice, ConfirmDelete, ConfirmWipe, ManageApiLevels, Help };

const char* modeStr(Mode m);

// Payload of ConfirmDelete / ConfirmWipe
struct ConfirmDialog {
    std::string device_name;
    std::string device_identifier;      // AVD name / UDID
    Platform platform = Platform::Android;
};

// Payload of ManageApiLevels: installed catalog with a cursor
struct ApiLevelView {
    Platform platform = Platform::Android;
    Catalog api_levels;
    size_t selected = 0;
};

struct LogEntry {
    std::string timestamp;              // HH:MM:SS
    std::string level;
    std::string message;
};

class AppState {
public:
    using Clock = std::chrono::steady_clock;

    explicit AppState(const config::UiConfig& ui = {});

    // =========================================================================
    // Device lists / selection
    // =========================================================================
    const std::vector<AndroidDevice>& androidDevices() const { return android_devices_; }
    const std::vector<IosDevice>& iosDevices() const { return ios_devices_; }

    // Replacing a list keeps the cursor on the same device id when it is still
    // present, otherwise clamps it into range
    void setAndroidDevices(std::vector<AndroidDevice> devices);
    void setIosDevices(std::vector<IosDevice> devices);

    size_t selectedIndex(Platform p) const {
        return p == Platform::Android ? selected_android_ : selected_ios_;
    }
    void setSelectedIndex(Platform p, size_t index);
    size_t deviceCount(Platform p) const;

    Platform activePanel() const { return active_panel_; }
    void setActivePanel(Platform p) { active_panel_ = p; }
    void nextPanel() { active_panel_ = otherPlatform(active_panel_); }

    FocusedPanel focusedPanel() const { return focused_panel_; }
    void setFocusedPanel(FocusedPanel f) { focused_panel_ = f; }

    // Active panel only, wrapping; no-op on an empty list
    void moveUp() { moveBySteps(-1); }
    void moveDown() { moveBySteps(1); }
    void moveBySteps(int steps);

    // (name, identifier) of the selected device in the active panel
    std::optional<std::pair<std::string, std::string>> selectedDevice() const;
    const AndroidDevice* selectedAndroidDevice() const;
    const IosDevice* selectedIosDevice() const;

    // First visible row of a list drawn in visible_rows rows
    size_t scrollOffset(Platform p, size_t visible_rows) const;
    // Stores scrollOffset() as the new starting row
    void syncScrollOffset(Platform p, size_t visible_rows);

    bool isLoading() const { return is_loading_; }
    void setLoading(bool loading) { is_loading_ = loading; }

    // =========================================================================
    // Mode / dialogs
    // =========================================================================
    Mode mode() const;

    void enterCreateDevice(CreateDeviceForm form) { mode_ = CreateDeviceMode{std::move(form)}; }
    void enterConfirmDelete(ConfirmDialog dialog) { mode_ = ConfirmDeleteMode{std::move(dialog)}; }
    void enterConfirmWipe(ConfirmDialog dialog) { mode_ = ConfirmWipeMode{std::move(dialog)}; }
    void enterManageApiLevels(ApiLevelView view) { mode_ = ManageApiLevelsMode{std::move(view)}; }
    void enterHelp() { mode_ = HelpMode{}; }
    void returnToNormal() { mode_ = NormalMode{}; }

    // nullptr unless the matching mode is active
    CreateDeviceForm* createForm();
    const CreateDeviceForm* createForm() const;
    const ConfirmDialog* confirmDeleteDialog() const;
    const ConfirmDialog* confirmWipeDialog() const;
    ApiLevelView* apiLevelView();
    const ApiLevelView* apiLevelView() const;

    // =========================================================================
    // Notifications
    // =========================================================================
    const std::deque<Notification>& notifications() const { return notifications_; }

    // Oldest entries are evicted past max_notifications
    void addNotification(Notification n);
    void addSuccessNotification(const std::string& message);
    void addErrorNotification(const std::string& message);
    void addWarningNotification(const std::string& message);
    void addInfoNotification(const std::string& message);

    void dismissExpiredNotifications() { dismissExpiredNotifications(Clock::now()); }
    void dismissExpiredNotifications(Clock::time_point now);
    void dismissAllNotifications() { notifications_.clear(); }
    void dismissNotification(size_t index);

    size_t maxNotifications() const { return max_notifications_; }

    // =========================================================================
    // Device log buffer
    // =========================================================================
    const std::deque<LogEntry>& logs() const { return device_logs_; }
    void addLog(const std::string& level, const std::string& message);
    void clearLogs();

    // Entries passing the level filter, oldest first
    std::vector<LogEntry> filteredLogs() const;
    const std::optional<std::string>& logFilter() const { return log_filter_level_; }
    void toggleLogFilter(std::optional<std::string> level);

    size_t logScrollOffset() const { return log_scroll_offset_; }
    void scrollLogsUp();
    void scrollLogsDown();
    void scrollLogsPageUp(size_t page_size);
    void scrollLogsPageDown(size_t page_size);
    void scrollLogsHalfPageUp(size_t page_size) { scrollLogsPageUp(page_size / 2); }
    void scrollLogsHalfPageDown(size_t page_size) { scrollLogsPageDown(page_size / 2); }
    void scrollLogsToTop();
    void scrollLogsToBottom();

    bool autoScroll() const { return auto_scroll_logs_; }
    bool manuallyScrolled() const { return manually_scrolled_; }
    // Following new entries: auto-scroll on and no manual scroll since
    bool isFollowingLogs() const { return auto_scroll_logs_ && !manually_scrolled_; }
    void toggleAutoScroll();

    bool fullscreenLogs() const { return fullscreen_logs_; }
    void toggleFullscreenLogs() { fullscreen_logs_ = !fullscreen_logs_; }

    // =========================================================================
    // Details snapshot
    // =========================================================================
    // Cached snapshot when it belongs to the selection, else a basic one
    // built from the list record
    std::optional<DeviceDetails> selectedDeviceDetails() const;
    const std::optional<DeviceDetails>& cachedDeviceDetails() const { return cached_details_; }
    void updateCachedDeviceDetails(DeviceDetails details) { cached_details_ = std::move(details); }
    void clearCachedDeviceDetails() { cached_details_.reset(); }
    // Clears only when the snapshot was computed for the other platform
    void smartClearCachedDeviceDetails(Platform new_panel);

    // =========================================================================
    // Refresh timing / pending operations
    // =========================================================================
    bool shouldAutoRefresh() const { return shouldAutoRefresh(Clock::now()); }
    bool shouldAutoRefresh(Clock::time_point now) const;
    void markRefreshed() { markRefreshed(Clock::now()); }
    void markRefreshed(Clock::time_point now) { last_refresh_ = now; }
    std::chrono::milliseconds autoRefreshInterval() const { return auto_refresh_interval_; }

    // Switches to the fast refresh interval until cleared
    void setPendingDeviceStart(const std::string& device_name);
    void clearPendingDeviceStart();
    const std::optional<std::string>& pendingDeviceStart() const { return pending_device_start_; }

    void setDeviceOperationStatus(const std::string& status) { device_operation_status_ = status; }
    void clearDeviceOperationStatus() { device_operation_status_.reset(); }
    const std::optional<std::string>& deviceOperationStatus() const { return device_operation_status_; }

private:
    struct NormalMode {};
    struct CreateDeviceMode { CreateDeviceForm form; };
    struct ConfirmDeleteMode { ConfirmDialog dialog; };
    struct ConfirmWipeMode { ConfirmDialog dialog; };
    struct ManageApiLevelsMode { ApiLevelView view; };
    struct HelpMode {};

    // Alternative order matches Mode
    using ModeState = std::variant<NormalMode, CreateDeviceMode, ConfirmDeleteMode,
                                   ConfirmWipeMode, ManageApiLevelsMode, HelpMode>;

    size_t& selectedRef(Platform p) { return p == Platform::Android ? selected_android_ : selected_ios_; }

    // --- Devices ---
    std::vector<AndroidDevice> android_devices_;
    std::vector<IosDevice> ios_devices_;
    size_t selected_android_ = 0;
    size_t selected_ios_ = 0;
    size_t android_scroll_offset_ = 0;
    size_t ios_scroll_offset_ = 0;
    Platform active_panel_ = Platform::Android;
    FocusedPanel focused_panel_ = FocusedPanel::DeviceList;
    bool is_loading_ = true;

    ModeState mode_;

    // --- Notifications ---
    std::deque<Notification> notifications_;
    size_t max_notifications_;
    std::chrono::milliseconds notification_dismiss_;

    // --- Logs ---
    std::deque<LogEntry> device_logs_;
    size_t max_log_entries_;
    size_t log_scroll_offset_ = 0;
    std::optional<std::string> log_filter_level_;
    bool auto_scroll_logs_ = true;
    bool manually_scrolled_ = false;
    bool fullscreen_logs_ = false;

    // --- Details / refresh ---
    std::optional<DeviceDetails> cached_details_;
    Clock::time_point last_refresh_;
    std::chrono::milliseconds normal_refresh_interval_;
    std::chrono::milliseconds fast_refresh_interval_;
    std::chrono::milliseconds auto_refresh_interval_;
    std::optional<std::string> pending_device_start_;
    std::optional<std::string> device_operation_status_;
};

} // namespace emu
