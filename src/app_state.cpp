#include "app_state.hpp"

#include <algorithm>
#include <ctime>

namespace emu {

namespace {

std::string clockTimestamp() {
    const std::time_t now = std::time(nullptr);
    struct tm tm_buf;
    localtime_r(&now, &tm_buf);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm_buf);
    return buf;
}

// Index of the device with the given id, else the old index clamped
template<typename DeviceT>
size_t reselect(const std::vector<DeviceT>& devices, const std::string& previous_id, size_t previous) {
    if (devices.empty()) return 0;
    if (!previous_id.empty()) {
        auto it = std::find_if(devices.begin(), devices.end(),
                               [&](const DeviceT& d) { return d.id() == previous_id; });
        if (it != devices.end()) return static_cast<size_t>(it - devices.begin());
    }
    return std::min(previous, devices.size() - 1);
}

} // anonymous namespace

const char* modeStr(Mode m) {
    switch (m) {
        case Mode::Normal:          return "Normal";
        case Mode::CreateDevice:    return "CreateDevice";
        case Mode::ConfirmDelete:   return "ConfirmDelete";
        case Mode::ConfirmWipe:     return "ConfirmWipe";
        case Mode::ManageApiLevels: return "ManageApiLevels";
        case Mode::Help:            return "Help";
    }
    return "Normal";
}

AppState::AppState(const config::UiConfig& ui)
    : max_notifications_(static_cast<size_t>(std::max(1, ui.max_notifications))),
      notification_dismiss_(ui.notification_dismiss_ms),
      max_log_entries_(static_cast<size_t>(std::max(1, ui.max_log_entries))),
      last_refresh_(Clock::now()),
      normal_refresh_interval_(ui.auto_refresh_ms),
      fast_refresh_interval_(ui.fast_refresh_ms),
      auto_refresh_interval_(ui.auto_refresh_ms) {}

// =============================================================================
// Device lists / selection
// =============================================================================

void AppState::setAndroidDevices(std::vector<AndroidDevice> devices) {
    std::string previous_id;
    if (selected_android_ < android_devices_.size()) previous_id = android_devices_[selected_android_].id();
    android_devices_ = std::move(devices);
    selected_android_ = reselect(android_devices_, previous_id, selected_android_);
}

void AppState::setIosDevices(std::vector<IosDevice> devices) {
    std::string previous_id;
    if (selected_ios_ < ios_devices_.size()) previous_id = ios_devices_[selected_ios_].id();
    ios_devices_ = std::move(devices);
    selected_ios_ = reselect(ios_devices_, previous_id, selected_ios_);
}

size_t AppState::deviceCount(Platform p) const {
    return p == Platform::Android ? android_devices_.size() : ios_devices_.size();
}

void AppState::setSelectedIndex(Platform p, size_t index) {
    const size_t len = deviceCount(p);
    selectedRef(p) = len == 0 ? 0 : std::min(index, len - 1);
}

void AppState::moveBySteps(int steps) {
    const size_t len = deviceCount(active_panel_);
    if (len == 0) return;

    const long long l = static_cast<long long>(len);
    size_t& selected = selectedRef(active_panel_);
    const long long next = (static_cast<long long>(selected) + steps) % l;
    selected = static_cast<size_t>((next + l) % l);
}

std::optional<std::pair<std::string, std::string>> AppState::selectedDevice() const {
    if (active_panel_ == Platform::Android) {
        if (const auto* d = selectedAndroidDevice()) return std::make_pair(d->name(), d->id());
    } else {
        if (const auto* d = selectedIosDevice()) return std::make_pair(d->name(), d->id());
    }
    return std::nullopt;
}

const AndroidDevice* AppState::selectedAndroidDevice() const {
    return selected_android_ < android_devices_.size() ? &android_devices_[selected_android_] : nullptr;
}

const IosDevice* AppState::selectedIosDevice() const {
    return selected_ios_ < ios_devices_.size() ? &ios_devices_[selected_ios_] : nullptr;
}

size_t AppState::scrollOffset(Platform p, size_t visible_rows) const {
    const size_t len = deviceCount(p);
    if (len <= visible_rows || visible_rows == 0) return 0;

    const size_t selected = selectedIndex(p);
    const size_t current = p == Platform::Android ? android_scroll_offset_ : ios_scroll_offset_;
    if (selected < current) return selected;
    if (selected >= current + visible_rows) return selected - (visible_rows - 1);
    return current;
}

void AppState::syncScrollOffset(Platform p, size_t visible_rows) {
    const size_t offset = scrollOffset(p, visible_rows);
    if (p == Platform::Android) android_scroll_offset_ = offset;
    else ios_scroll_offset_ = offset;
}

// =============================================================================
// Mode / dialogs
// =============================================================================

Mode AppState::mode() const {
    return static_cast<Mode>(mode_.index());
}

CreateDeviceForm* AppState::createForm() {
    auto* m = std::get_if<CreateDeviceMode>(&mode_);
    return m ? &m->form : nullptr;
}

const CreateDeviceForm* AppState::createForm() const {
    const auto* m = std::get_if<CreateDeviceMode>(&mode_);
    return m ? &m->form : nullptr;
}

const ConfirmDialog* AppState::confirmDeleteDialog() const {
    const auto* m = std::get_if<ConfirmDeleteMode>(&mode_);
    return m ? &m->dialog : nullptr;
}

const ConfirmDialog* AppState::confirmWipeDialog() const {
    const auto* m = std::get_if<ConfirmWipeMode>(&mode_);
    return m ? &m->dialog : nullptr;
}

ApiLevelView* AppState::apiLevelView() {
    auto* m = std::get_if<ManageApiLevelsMode>(&mode_);
    return m ? &m->view : nullptr;
}

const ApiLevelView* AppState::apiLevelView() const {
    const auto* m = std::get_if<ManageApiLevelsMode>(&mode_);
    return m ? &m->view : nullptr;
}

// =============================================================================
// Notifications
// =============================================================================

void AppState::addNotification(Notification n) {
    notifications_.push_back(std::move(n));
    while (notifications_.size() > max_notifications_) {
        notifications_.pop_front();
    }
}

void AppState::addSuccessNotification(const std::string& message) {
    addNotification(Notification::make(NotificationType::Success, message, notification_dismiss_));
}

void AppState::addErrorNotification(const std::string& message) {
    addNotification(Notification::make(NotificationType::Error, message, notification_dismiss_));
}

void AppState::addWarningNotification(const std::string& message) {
    addNotification(Notification::make(NotificationType::Warning, message, notification_dismiss_));
}

void AppState::addInfoNotification(const std::string& message) {
    addNotification(Notification::make(NotificationType::Info, message, notification_dismiss_));
}

void AppState::dismissExpiredNotifications(Clock::time_point now) {
    notifications_.erase(std::remove_if(notifications_.begin(), notifications_.end(),
                                        [now](const Notification& n) { return n.isExpired(now); }),
                         notifications_.end());
}

void AppState::dismissNotification(size_t index) {
    if (index < notifications_.size()) {
        notifications_.erase(notifications_.begin() + static_cast<std::ptrdiff_t>(index));
    }
}

// =============================================================================
// Device log buffer
// =============================================================================

void AppState::addLog(const std::string& level, const std::string& message) {
    device_logs_.push_back(LogEntry{clockTimestamp(), level, message});
    while (device_logs_.size() > max_log_entries_) {
        device_logs_.pop_front();
    }
    if (isFollowingLogs()) {
        log_scroll_offset_ = device_logs_.size() - 1;
    }
}

void AppState::clearLogs() {
    device_logs_.clear();
    log_scroll_offset_ = 0;
}

std::vector<LogEntry> AppState::filteredLogs() const {
    std::vector<LogEntry> out;
    for (const auto& e : device_logs_) {
        if (!log_filter_level_ || e.level == *log_filter_level_) out.push_back(e);
    }
    return out;
}

void AppState::toggleLogFilter(std::optional<std::string> level) {
    log_filter_level_ = std::move(level);
    log_scroll_offset_ = 0;
}

void AppState::scrollLogsUp() {
    if (log_scroll_offset_ > 0) {
        --log_scroll_offset_;
        manually_scrolled_ = true;
    }
}

void AppState::scrollLogsDown() {
    const size_t max_offset = device_logs_.empty() ? 0 : device_logs_.size() - 1;
    if (log_scroll_offset_ < max_offset) {
        ++log_scroll_offset_;
        manually_scrolled_ = true;
    }
}

void AppState::scrollLogsPageUp(size_t page_size) {
    log_scroll_offset_ = log_scroll_offset_ > page_size ? log_scroll_offset_ - page_size : 0;
    manually_scrolled_ = true;
}

void AppState::scrollLogsPageDown(size_t page_size) {
    const size_t max_offset = device_logs_.empty() ? 0 : device_logs_.size() - 1;
    log_scroll_offset_ = std::min(log_scroll_offset_ + page_size, max_offset);
    manually_scrolled_ = true;
}

void AppState::scrollLogsToTop() {
    log_scroll_offset_ = 0;
    manually_scrolled_ = true;
}

void AppState::scrollLogsToBottom() {
    const size_t total = filteredLogs().size();
    log_scroll_offset_ = total == 0 ? 0 : total - 1;
    manually_scrolled_ = false;
}

void AppState::toggleAutoScroll() {
    auto_scroll_logs_ = !auto_scroll_logs_;
    if (auto_scroll_logs_) manually_scrolled_ = false;
}

// =============================================================================
// Details snapshot
// =============================================================================

std::optional<DeviceDetails> AppState::selectedDeviceDetails() const {
    const auto selected = selectedDevice();
    if (!selected) return std::nullopt;

    if (cached_details_ && cached_details_->platform == active_panel_ &&
        cached_details_->identifier == selected->second) {
        return cached_details_;
    }

    DeviceDetails details;
    details.platform = active_panel_;
    if (active_panel_ == Platform::Android) {
        const AndroidDevice& d = *selectedAndroidDevice();
        details.name = d.name();
        details.status = d.isRunning() ? "Running" : "Stopped";
        details.device_type = d.device_type;
        details.api_level_or_version = "API " + std::to_string(d.api_level) +
                                       " (Android " + androidVersionName(d.api_level) + ")";
        details.identifier = d.id();
    } else {
        const IosDevice& d = *selectedIosDevice();
        details.name = d.name();
        details.status = d.isRunning() ? "Booted" : "Shutdown";
        details.device_type = d.device_type;
        details.api_level_or_version = d.runtime_version;
        details.identifier = d.udid();
    }
    return details;
}

void AppState::smartClearCachedDeviceDetails(Platform new_panel) {
    if (cached_details_ && cached_details_->platform != new_panel) {
        cached_details_.reset();
    }
}

// =============================================================================
// Refresh timing / pending operations
// =============================================================================

bool AppState::shouldAutoRefresh(Clock::time_point now) const {
    return now - last_refresh_ >= auto_refresh_interval_ || pending_device_start_.has_value();
}

void AppState::setPendingDeviceStart(const std::string& device_name) {
    pending_device_start_ = device_name;
    auto_refresh_interval_ = fast_refresh_interval_;
}

void AppState::clearPendingDeviceStart() {
    pending_device_start_.reset();
    auto_refresh_interval_ = normal_refresh_interval_;
}

} // namespace emu
