#include "app_controller.hpp"
#include "emu_log.hpp"

#include <algorithm>
#include <cctype>

namespace emu {

namespace {

std::string firstLine(const std::string& text) {
    return text.substr(0, text.find('\n'));
}

const char* platformLabel(Platform p) {
    return p == Platform::Android ? "Android" : "iOS";
}

std::string progressText(DeviceOperation op, const std::string& name) {
    switch (op) {
        case DeviceOperation::Create: return "Creating device '" + name + "'...";
        case DeviceOperation::Start:  return "Starting device '" + name + "'...";
        case DeviceOperation::Stop:   return "Stopping device '" + name + "'...";
        case DeviceOperation::Wipe:   return "Wiping device '" + name + "'...";
        case DeviceOperation::Delete: return "Deleting device '" + name + "'...";
    }
    return name;
}

std::string doneText(DeviceOperation op, const std::string& name) {
    switch (op) {
        case DeviceOperation::Create: return "Device '" + name + "' created";
        case DeviceOperation::Start:  return "Device '" + name + "' started";
        case DeviceOperation::Stop:   return "Device '" + name + "' stopped";
        case DeviceOperation::Wipe:   return "Device '" + name + "' wiped";
        case DeviceOperation::Delete: return "Device '" + name + "' deleted";
    }
    return name;
}

template<typename DeviceT>
bool isRunningByName(const std::vector<DeviceT>& devices, const std::string& name) {
    return std::any_of(devices.begin(), devices.end(), [&](const DeviceT& d) {
        return (d.name() == name || d.id() == name) && d.isRunning();
    });
}

template<typename Mgr, typename Fn>
std::function<Result<void>()> bindManager(std::shared_ptr<Mgr> mgr, Fn fn) {
    return [mgr, fn]() { return fn(*mgr); };
}

// Manager calls parse tool output; a throw from one is an ordinary error
template<typename Fn>
auto guarded(const char* what, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const std::exception& e) {
        ELOG_ERROR("controller", "%s threw: %s", what, e.what());
        return Error(std::string(what) + " failed: " + e.what(), ErrorCode::ParseError);
    }
}

size_t wrapStep(size_t index, int delta, size_t len) {
    const long long l = static_cast<long long>(len);
    const long long n = (static_cast<long long>(index) + delta) % l;
    return static_cast<size_t>((n + l) % l);
}

} // anonymous namespace

const char* intentStr(Intent i) {
    switch (i) {
        case Intent::MoveUp:               return "MoveUp";
        case Intent::MoveDown:             return "MoveDown";
        case Intent::NextPanel:            return "NextPanel";
        case Intent::FocusAndroid:         return "FocusAndroid";
        case Intent::FocusIos:             return "FocusIos";
        case Intent::FocusDetails:         return "FocusDetails";
        case Intent::ToggleDevice:         return "ToggleDevice";
        case Intent::StartDevice:          return "StartDevice";
        case Intent::StopDevice:           return "StopDevice";
        case Intent::RequestDelete:        return "RequestDelete";
        case Intent::RequestWipe:          return "RequestWipe";
        case Intent::OpenCreateForm:       return "OpenCreateForm";
        case Intent::OpenApiLevels:        return "OpenApiLevels";
        case Intent::Refresh:              return "Refresh";
        case Intent::Confirm:              return "Confirm";
        case Intent::Cancel:               return "Cancel";
        case Intent::NextField:            return "NextField";
        case Intent::PrevField:            return "PrevField";
        case Intent::SelectNext:           return "SelectNext";
        case Intent::SelectPrev:           return "SelectPrev";
        case Intent::ShowHelp:             return "ShowHelp";
        case Intent::DismissNotifications: return "DismissNotifications";
        case Intent::ToggleFullscreenLogs: return "ToggleFullscreenLogs";
        case Intent::ToggleAutoScroll:     return "ToggleAutoScroll";
        case Intent::ClearLogs:            return "ClearLogs";
        case Intent::Quit:                 return "Quit";
    }
    return "?";
}

AppController::AppController(std::shared_ptr<AndroidDeviceManager> android,
                             std::shared_ptr<IosDeviceManager> ios,
                             const config::AppConfig& config,
                             EventBus& bus)
    : android_(std::move(android)),
      ios_(std::move(ios)),
      config_(config),
      bus_(bus),
      state_(config.ui),
      metadata_(constants::METADATA_CACHE_TTL),
      cache_store_(config.cache),
      debouncer_(std::chrono::milliseconds(config.ui.debounce_ms)),
      navigation_(std::chrono::milliseconds(config.ui.navigation_batch_ms)),
      steps_(std::chrono::milliseconds(config.ui.navigation_batch_ms)) {}

AppController::~AppController() {
    stopLogStream();
    waitForBackgroundTasks();
}

void AppController::initialize() {
    if (auto cached = cache_store_.load()) {
        const size_t android_count = cached->android_devices.size();
        const size_t ios_count = cached->ios_devices.size();
        withWrite([&](AppState& s) {
            s.setAndroidDevices(std::move(cached->android_devices));
            s.setIosDevices(std::move(cached->ios_devices));
            s.setLoading(false);
        });

        DeviceListRefreshedEvent ev;
        ev.from_cache = true;
        ev.platform = Platform::Android;
        ev.device_count = android_count;
        bus_.publish(ev);
        ev.platform = Platform::Ios;
        ev.device_count = ios_count;
        bus_.publish(ev);
    }

    withWrite([](AppState& s) { s.markRefreshed(); });
    refreshDevicesAsync();
    if (platformAvailable(Platform::Android)) {
        refreshMetadataAsync(Platform::Android);
    }
    ELOG_INFO("controller", "Initialized (android=%s ios=%s)",
              platformAvailable(Platform::Android) ? "yes" : "no",
              platformAvailable(Platform::Ios) ? "yes" : "no");
}

bool AppController::platformAvailable(Platform p) const {
    if (p == Platform::Android) return android_ && android_->isAvailable();
    return ios_ && ios_->isAvailable();
}

// =============================================================================
// Background tasks
// =============================================================================

void AppController::spawnTask(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(), [](std::future<void>& f) {
        return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }), tasks_.end());

    tasks_.push_back(std::async(std::launch::async, [task = std::move(task)]() {
        try {
            task();
        } catch (const std::exception& e) {
            ELOG_ERROR("controller", "Background task failed: %s", e.what());
        }
    }));
}

void AppController::waitForBackgroundTasks() {
    for (;;) {
        std::vector<std::future<void>> batch;
        {
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            batch.swap(tasks_);
        }
        if (batch.empty()) return;
        for (auto& f : batch) f.wait();
    }
}

size_t AppController::pendingTaskCount() const {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    return static_cast<size_t>(std::count_if(tasks_.begin(), tasks_.end(), [](const std::future<void>& f) {
        return f.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
    }));
}

// =============================================================================
// Device list refresh
// =============================================================================

void AppController::refreshDevicesAsync() {
    if (refresh_in_flight_.exchange(true)) return;
    spawnTask([this]() {
        struct ClearOnExit {
            std::atomic<bool>& flag;
            ~ClearOnExit() { flag = false; }
        } clear{refresh_in_flight_};
        refreshDevices();
    });
}

void AppController::refreshDevices() {
    const bool android_ok = refreshPlatform(Platform::Android);
    const bool ios_ok = refreshPlatform(Platform::Ios);
    withWrite([](AppState& s) { s.setLoading(false); });

    if (!android_ok && !ios_ok) return;

    auto lists = withRead([](const AppState& s) {
        return std::make_pair(s.androidDevices(), s.iosDevices());
    });
    auto saved = cache_store_.save(lists.first, lists.second);
    if (saved.is_err()) {
        ELOG_WARN("controller", "Device cache not saved: %s", saved.error().message.c_str());
    }
}

bool AppController::refreshPlatform(Platform p) {
    if (!platformAvailable(p)) return false;

    std::optional<Error> error;
    size_t count = 0;
    if (p == Platform::Android) {
        auto r = guarded("Android device listing", [this]() { return android_->listDevices(); });
        if (r.is_ok()) {
            count = r.value().size();
            withWrite([&](AppState& s) {
                s.setAndroidDevices(std::move(r).value());
                if (s.pendingDeviceStart() && isRunningByName(s.androidDevices(), *s.pendingDeviceStart())) {
                    ELOG_INFO("controller", "Device '%s' is up", s.pendingDeviceStart()->c_str());
                    s.clearPendingDeviceStart();
                }
            });
        } else {
            error = r.error();
        }
    } else {
        auto r = guarded("iOS device listing", [this]() { return ios_->listDevices(); });
        if (r.is_ok()) {
            count = r.value().size();
            withWrite([&](AppState& s) {
                s.setIosDevices(std::move(r).value());
                if (s.pendingDeviceStart() && isRunningByName(s.iosDevices(), *s.pendingDeviceStart())) {
                    ELOG_INFO("controller", "Device '%s' is up", s.pendingDeviceStart()->c_str());
                    s.clearPendingDeviceStart();
                }
            });
        } else {
            error = r.error();
        }
    }

    std::atomic<bool>& failed = p == Platform::Android ? android_refresh_failed_ : ios_refresh_failed_;
    if (error) {
        ELOG_WARN("controller", "%s device refresh failed: %s", platformLabel(p), error->message.c_str());
        // One notification per failure streak; the stale list stays
        if (!failed.exchange(true)) {
            const std::string text = std::string("Failed to refresh ") + platformLabel(p) +
                                     " devices: " + firstLine(error->message);
            withWrite([&](AppState& s) { s.addWarningNotification(text); });
        }
        return false;
    }

    if (failed.exchange(false)) {
        ELOG_INFO("controller", "%s device refresh recovered", platformLabel(p));
    }
    ELOG_DEBUG("controller", "%s devices: %zu", platformLabel(p), count);

    DeviceListRefreshedEvent ev;
    ev.platform = p;
    ev.device_count = count;
    bus_.publish(ev);
    return true;
}

// =============================================================================
// Metadata catalogs
// =============================================================================

void AppController::ensureMetadataFresh(Platform p) {
    if (!platformAvailable(p)) return;
    if (metadata_.isStale(p) && !metadata_.isLoading(p)) {
        refreshMetadataAsync(p);
    }
}

void AppController::refreshMetadataAsync(Platform p) {
    if (!platformAvailable(p)) return;
    if (!metadata_.tryBeginRefresh(p)) {
        ELOG_DEBUG("controller", "%s catalog refresh already running", platformLabel(p));
        return;
    }
    spawnTask([this, p]() { loadMetadata(p); });
}

void AppController::loadMetadata(Platform p) {
    Result<Catalog> types = guarded("Device type catalog", [this, p]() {
        return p == Platform::Android ? android_->listAvailableDevices() : ios_->listAvailableDevices();
    });
    Result<Catalog> versions = Catalog{};
    if (types.is_ok()) {
        versions = guarded("Version catalog", [this, p]() {
            return p == Platform::Android ? android_->listAvailableApiLevels() : ios_->listAvailableApiLevels();
        });
    }

    MetadataRefreshedEvent ev;
    ev.platform = p;

    if (types.is_ok() && versions.is_ok()) {
        ev.success = true;
        ev.device_type_count = types.value().size();
        ev.version_count = versions.value().size();
        metadata_.update(p, types.value(), versions.value());

        withWrite([&](AppState& s) {
            if (auto* form = s.createForm(); form && form->platform() == p) {
                form->setCatalogs(types.value(), versions.value());
            }
            if (auto* view = s.apiLevelView(); view && view->platform == p) {
                view->api_levels = versions.value();
                if (view->selected >= view->api_levels.size()) view->selected = 0;
            }
        });
        ELOG_INFO("controller", "%s catalogs: %zu device types, %zu versions",
                  platformLabel(p), ev.device_type_count, ev.version_count);
    } else {
        const Error& err = types.is_err() ? types.error() : versions.error();
        metadata_.failRefresh(p);
        const std::string text = std::string("Failed to load ") + platformLabel(p) +
                                 " device catalog: " + firstLine(err.message);
        withWrite([&](AppState& s) {
            s.addWarningNotification(text);
            if (auto* form = s.createForm(); form && form->platform() == p) {
                form->is_loading_cache = false;
                if (form->available_versions.empty()) form->error_message = firstLine(err.message);
            }
        });
    }

    bus_.publish(ev);
}

// =============================================================================
// Device log stream
// =============================================================================

void AppController::updateLogStream() {
    auto wanted = withRead([](const AppState& s) -> std::optional<LogTarget> {
        if (s.activePanel() == Platform::Android) {
            const auto* d = s.selectedAndroidDevice();
            if (d && d->isRunning()) return LogTarget{Platform::Android, d->id(), d->name()};
        } else {
            const auto* d = s.selectedIosDevice();
            if (d && d->isRunning()) return LogTarget{Platform::Ios, d->id(), d->name()};
        }
        return std::nullopt;
    });
    if (wanted && !platformAvailable(wanted->platform)) wanted.reset();

    std::lock_guard<std::mutex> lock(log_stream_mutex_);
    if (!wanted && !log_target_) return;
    if (wanted && log_target_ && wanted->platform == log_target_->platform && wanted->id == log_target_->id) {
        return;
    }

    stopLogStreamLocked();
    if (!wanted) return;

    withWrite([](AppState& s) {
        s.clearLogs();
        s.scrollLogsToBottom();
    });

    const LogTarget target = *wanted;
    auto stop = std::make_shared<std::atomic<bool>>(false);
    log_target_ = target;
    log_stop_ = stop;
    log_thread_ = std::thread([this, target, stop]() {
        ELOG_DEBUG("controller", "Log stream for '%s' started", target.name.c_str());
        const LogSink sink = [this, &stop](const std::string& level, const std::string& line) {
            withWrite([&](AppState& s) {
                if (!stop->load()) s.addLog(level, line);
            });
        };
        auto r = guarded("Log stream", [&]() {
            return target.platform == Platform::Android ? android_->streamLogs(target.id, sink, *stop)
                                                        : ios_->streamLogs(target.id, sink, *stop);
        });
        if (r.is_err() && !stop->load()) {
            if (r.error().is(ErrorCode::Unsupported)) {
                ELOG_DEBUG("controller", "No log stream for '%s': %s", target.name.c_str(),
                           r.error().message.c_str());
            } else {
                ELOG_WARN("controller", "Log stream for '%s' failed: %s", target.name.c_str(),
                          r.error().message.c_str());
            }
            return;
        }
        ELOG_DEBUG("controller", "Log stream for '%s' ended", target.name.c_str());
    });
}

void AppController::stopLogStream() {
    std::lock_guard<std::mutex> lock(log_stream_mutex_);
    stopLogStreamLocked();
}

void AppController::stopLogStreamLocked() {
    if (log_stop_) *log_stop_ = true;
    if (log_thread_.joinable()) log_thread_.join();
    log_stop_.reset();
    log_target_.reset();
}

std::optional<std::pair<Platform, std::string>> AppController::logStreamTarget() const {
    std::lock_guard<std::mutex> lock(log_stream_mutex_);
    if (!log_target_) return std::nullopt;
    return std::make_pair(log_target_->platform, log_target_->id);
}

// =============================================================================
// Details
// =============================================================================

void AppController::loadSelectedDeviceDetailsAsync() {
    struct Target { Platform platform; std::string id; };
    auto target = withRead([](const AppState& s) -> std::optional<Target> {
        auto selected = s.selectedDevice();
        if (!selected) return std::nullopt;
        const auto& cached = s.cachedDeviceDetails();
        if (cached && cached->platform == s.activePanel() && cached->identifier == selected->second) {
            return std::nullopt;
        }
        return Target{s.activePanel(), selected->second};
    });
    if (!target || !platformAvailable(target->platform)) return;

    const Platform p = target->platform;
    const std::string id = target->id;
    spawnTask([this, p, id]() {
        auto r = guarded("Device details", [this, p, &id]() {
            return p == Platform::Android ? android_->getDeviceDetails(id) : ios_->getDeviceDetails(id);
        });
        if (r.is_err()) {
            ELOG_DEBUG("controller", "Details for %s unavailable: %s", id.c_str(), r.error().message.c_str());
            return;
        }
        withWrite([&](AppState& s) {
            auto selected = s.selectedDevice();
            // Selection may have moved on while the tool ran
            if (selected && s.activePanel() == p && selected->second == id) {
                s.updateCachedDeviceDetails(std::move(r).value());
            }
        });
    });
}

// =============================================================================
// Operations
// =============================================================================

void AppController::runOperation(Platform p, DeviceOperation op, const std::string& name,
                                 std::function<Result<void>()> fn) {
    withWrite([&](AppState& s) {
        s.setDeviceOperationStatus(progressText(op, name));
        if (op == DeviceOperation::Start) s.setPendingDeviceStart(name);
    });

    spawnTask([this, p, op, name, fn = std::move(fn)]() {
        ELOG_INFO("controller", "%s: %s '%s'", platformLabel(p), deviceOperationStr(op), name.c_str());
        const Result<void> r = guarded(deviceOperationStr(op), fn);
        const std::string message = r.is_ok() ? doneText(op, name) : userFriendlyMessage(r.error(), name);
        if (r.is_err()) {
            ELOG_WARN("controller", "%s '%s' failed: %s", deviceOperationStr(op), name.c_str(),
                      r.error().message.c_str());
        }

        withWrite([&](AppState& s) {
            s.clearDeviceOperationStatus();
            if (r.is_ok()) s.addSuccessNotification(message);
            else s.addErrorNotification(message);

            const bool clears_pending = (op == DeviceOperation::Start && r.is_err()) ||
                                        op == DeviceOperation::Stop || op == DeviceOperation::Delete;
            if (clears_pending && s.pendingDeviceStart() && *s.pendingDeviceStart() == name) {
                s.clearPendingDeviceStart();
            }
            // Status / contents changed; details are reloaded on demand
            if (r.is_ok() && s.cachedDeviceDetails() && s.cachedDeviceDetails()->platform == p) {
                s.clearCachedDeviceDetails();
            }

            if (op == DeviceOperation::Create) {
                if (auto* form = s.createForm()) {
                    if (r.is_ok()) {
                        s.returnToNormal();
                    } else {
                        form->is_creating = false;
                        form->creation_status.reset();
                        form->error_message = message;
                    }
                }
            }
            s.addLog(r.is_ok() ? "INFO" : "ERROR", message);
        });

        DeviceOperationEvent ev;
        ev.platform = p;
        ev.operation = op;
        ev.device_name = name;
        ev.success = r.is_ok();
        ev.message = message;
        bus_.publish(ev);

        refreshPlatform(p);
    });
}

void AppController::startDevice(Platform p, const std::string& id, const std::string& name) {
    auto call = [id](auto& mgr) { return mgr.startDevice(id); };
    if (!platformAvailable(p)) {
        withWrite([&](AppState& s) {
            s.addWarningNotification(std::string(platformLabel(p)) + " devices are not available on this host");
        });
        return;
    }
    runOperation(p, DeviceOperation::Start, name,
                 p == Platform::Android ? bindManager(android_, call) : bindManager(ios_, call));
}

void AppController::stopDevice(Platform p, const std::string& id, const std::string& name) {
    auto call = [id](auto& mgr) { return mgr.stopDevice(id); };
    if (!platformAvailable(p)) {
        withWrite([&](AppState& s) {
            s.addWarningNotification(std::string(platformLabel(p)) + " devices are not available on this host");
        });
        return;
    }
    runOperation(p, DeviceOperation::Stop, name,
                 p == Platform::Android ? bindManager(android_, call) : bindManager(ios_, call));
}

void AppController::wipeDevice(Platform p, const std::string& id, const std::string& name) {
    auto call = [id](auto& mgr) { return mgr.wipeDevice(id); };
    if (!platformAvailable(p)) {
        withWrite([&](AppState& s) {
            s.addWarningNotification(std::string(platformLabel(p)) + " devices are not available on this host");
        });
        return;
    }
    runOperation(p, DeviceOperation::Wipe, name,
                 p == Platform::Android ? bindManager(android_, call) : bindManager(ios_, call));
}

void AppController::deleteDevice(Platform p, const std::string& id, const std::string& name) {
    auto call = [id](auto& mgr) { return mgr.deleteDevice(id); };
    if (!platformAvailable(p)) {
        withWrite([&](AppState& s) {
            s.addWarningNotification(std::string(platformLabel(p)) + " devices are not available on this host");
        });
        return;
    }
    runOperation(p, DeviceOperation::Delete, name,
                 p == Platform::Android ? bindManager(android_, call) : bindManager(ios_, call));
}

void AppController::createDevice(Platform p, const DeviceConfig& config) {
    auto call = [config](auto& mgr) { return mgr.createDevice(config); };
    if (!platformAvailable(p)) {
        withWrite([&](AppState& s) {
            s.addWarningNotification(std::string(platformLabel(p)) + " devices are not available on this host");
            if (auto* form = s.createForm()) form->is_creating = false;
        });
        return;
    }
    runOperation(p, DeviceOperation::Create, config.name(),
                 p == Platform::Android ? bindManager(android_, call) : bindManager(ios_, call));
}

// =============================================================================
// Input
// =============================================================================

void AppController::handleIntent(Intent intent, Clock::time_point now) {
    const Mode mode = withRead([](const AppState& s) { return s.mode(); });
    ELOG_TRACE("input", "%s in %s", intentStr(intent), modeStr(mode));

    if (mode == Mode::Normal) {
        switch (intent) {
            case Intent::MoveUp:
            case Intent::MoveDown:
                // Keep arrival order across panels
                if (navigation_.hasPending()) applyNavigation(*navigation_.flush());
                steps_.addStep(intent == Intent::MoveUp ? -1 : 1, now);
                return;
            case Intent::NextPanel:
            case Intent::FocusAndroid:
            case Intent::FocusIos:
            case Intent::FocusDetails: {
                if (steps_.hasPendingSteps()) applySteps(steps_.flush());
                NavigationTarget target = NavigationTarget::Android;
                if (intent == Intent::NextPanel) {
                    Platform base = withRead([](const AppState& s) { return s.activePanel(); });
                    if (navigation_.pending() && *navigation_.pending() != NavigationTarget::Details) {
                        base = *navigation_.pending() == NavigationTarget::Android ? Platform::Android
                                                                                   : Platform::Ios;
                    }
                    target = otherPlatform(base) == Platform::Android ? NavigationTarget::Android
                                                                      : NavigationTarget::Ios;
                } else if (intent == Intent::FocusIos) {
                    target = NavigationTarget::Ios;
                } else if (intent == Intent::FocusDetails) {
                    target = NavigationTarget::Details;
                }
                navigation_.addNavigation(target, now);
                return;
            }
            case Intent::ToggleDevice:
            case Intent::StartDevice:
            case Intent::StopDevice:
            case Intent::RequestDelete:
            case Intent::RequestWipe:
            case Intent::OpenCreateForm:
            case Intent::OpenApiLevels:
            case Intent::Refresh:
                if (!debouncer_.shouldProcessEvent(now)) {
                    ELOG_TRACE("input", "Debounced %s", intentStr(intent));
                    return;
                }
                flushNavigation();
                break;
            default:
                break;
        }
        handleNormalIntent(intent);
        return;
    }

    switch (mode) {
        case Mode::CreateDevice:
            if (intent == Intent::Confirm && !debouncer_.shouldProcessEvent(now)) return;
            handleCreateFormIntent(intent);
            break;
        case Mode::ConfirmDelete:
        case Mode::ConfirmWipe:
            if (intent == Intent::Confirm && !debouncer_.shouldProcessEvent(now)) return;
            handleConfirmIntent(intent, mode == Mode::ConfirmWipe);
            break;
        case Mode::ManageApiLevels:
            handleApiLevelIntent(intent);
            break;
        case Mode::Help:
            if (intent == Intent::Cancel || intent == Intent::Confirm || intent == Intent::ShowHelp) {
                withWrite([](AppState& s) { s.returnToNormal(); });
            } else if (intent == Intent::Quit) {
                quit_ = true;
            }
            break;
        case Mode::Normal:
            break;
    }
}

void AppController::handleNormalIntent(Intent intent) {
    switch (intent) {
        case Intent::ToggleDevice:
            toggleSelectedDevice(false, false);
            break;
        case Intent::StartDevice:
            toggleSelectedDevice(true, false);
            break;
        case Intent::StopDevice:
            toggleSelectedDevice(false, true);
            break;
        case Intent::RequestDelete:
            requestConfirmation(false);
            break;
        case Intent::RequestWipe:
            requestConfirmation(true);
            break;
        case Intent::OpenCreateForm:
            openCreateForm();
            break;
        case Intent::OpenApiLevels:
            openApiLevels();
            break;
        case Intent::Refresh:
            withWrite([](AppState& s) { s.markRefreshed(); });
            refreshDevicesAsync();
            break;
        case Intent::ShowHelp:
            withWrite([](AppState& s) { s.enterHelp(); });
            break;
        case Intent::Cancel:
            // Explicitly abandons waiting for a booting device
            withWrite([](AppState& s) { s.clearPendingDeviceStart(); });
            break;
        case Intent::DismissNotifications:
            withWrite([](AppState& s) { s.dismissAllNotifications(); });
            break;
        case Intent::ToggleFullscreenLogs:
            withWrite([](AppState& s) { s.toggleFullscreenLogs(); });
            break;
        case Intent::ToggleAutoScroll:
            withWrite([](AppState& s) { s.toggleAutoScroll(); });
            break;
        case Intent::ClearLogs:
            withWrite([](AppState& s) { s.clearLogs(); });
            break;
        case Intent::Quit:
            quit_ = true;
            break;
        default:
            break;
    }
}

void AppController::handleCreateFormIntent(Intent intent) {
    switch (intent) {
        case Intent::Confirm:
            submitCreateForm();
            break;
        case Intent::Cancel:
            withWrite([](AppState& s) {
                const auto* form = s.createForm();
                if (form && !form->is_creating) s.returnToNormal();
            });
            break;
        case Intent::NextField:
        case Intent::PrevField:
        case Intent::MoveUp:
        case Intent::MoveDown:
        case Intent::SelectNext:
        case Intent::SelectPrev:
            withWrite([intent](AppState& s) {
                auto* form = s.createForm();
                if (!form || form->is_creating) return;
                switch (intent) {
                    case Intent::NextField:
                    case Intent::MoveDown:   form->nextField(); break;
                    case Intent::PrevField:
                    case Intent::MoveUp:     form->prevField(); break;
                    case Intent::SelectNext: form->cycleSelection(1); break;
                    case Intent::SelectPrev: form->cycleSelection(-1); break;
                    default: break;
                }
            });
            break;
        default:
            break;
    }
}

void AppController::handleConfirmIntent(Intent intent, bool wipe) {
    if (intent == Intent::Cancel) {
        withWrite([](AppState& s) { s.returnToNormal(); });
        return;
    }
    if (intent != Intent::Confirm) return;

    auto dialog = withWrite([wipe](AppState& s) -> std::optional<ConfirmDialog> {
        const ConfirmDialog* d = wipe ? s.confirmWipeDialog() : s.confirmDeleteDialog();
        if (!d) return std::nullopt;
        ConfirmDialog copy = *d;
        s.returnToNormal();
        return copy;
    });
    if (!dialog) return;

    if (wipe) wipeDevice(dialog->platform, dialog->device_identifier, dialog->device_name);
    else deleteDevice(dialog->platform, dialog->device_identifier, dialog->device_name);
}

void AppController::handleApiLevelIntent(Intent intent) {
    switch (intent) {
        case Intent::MoveUp:
        case Intent::MoveDown:
        case Intent::SelectPrev:
        case Intent::SelectNext:
            withWrite([intent](AppState& s) {
                auto* view = s.apiLevelView();
                if (!view || view->api_levels.empty()) return;
                const int delta = (intent == Intent::MoveUp || intent == Intent::SelectPrev) ? -1 : 1;
                view->selected = wrapStep(view->selected, delta, view->api_levels.size());
            });
            break;
        case Intent::Refresh: {
            const auto p = withRead([](const AppState& s) {
                const auto* view = s.apiLevelView();
                return view ? view->platform : Platform::Android;
            });
            refreshMetadataAsync(p);
            break;
        }
        case Intent::Cancel:
        case Intent::Confirm:
            withWrite([](AppState& s) { s.returnToNormal(); });
            break;
        case Intent::Quit:
            quit_ = true;
            break;
        default:
            break;
    }
}

void AppController::inputText(const std::string& text) {
    withWrite([&](AppState& s) {
        auto* form = s.createForm();
        if (!form || form->is_creating) return;
        switch (form->active_field) {
            case FormField::Name:
                form->name += text;
                break;
            case FormField::RamSize:
            case FormField::StorageSize: {
                std::string& target = form->active_field == FormField::RamSize ? form->ram_size : form->storage_size;
                for (char c : text) {
                    if (std::isdigit(static_cast<unsigned char>(c))) target += c;
                }
                break;
            }
            default:
                return;
        }
        form->error_message.reset();
    });
}

void AppController::deleteChar() {
    withWrite([](AppState& s) {
        auto* form = s.createForm();
        if (!form || form->is_creating) return;
        std::string* target = nullptr;
        switch (form->active_field) {
            case FormField::Name:        target = &form->name; break;
            case FormField::RamSize:     target = &form->ram_size; break;
            case FormField::StorageSize: target = &form->storage_size; break;
            default: return;
        }
        if (!target->empty()) target->pop_back();
        form->error_message.reset();
    });
}

void AppController::tick(Clock::time_point now) {
    if (auto target = navigation_.getBatchedNavigation(now)) {
        applyNavigation(*target);
    }
    if (auto steps = steps_.takeSteps(now)) {
        applySteps(*steps);
    }

    const bool refresh = withWrite([&](AppState& s) {
        s.dismissExpiredNotifications(now);
        if (s.shouldAutoRefresh(now) && !refresh_in_flight_.load()) {
            s.markRefreshed(now);
            return true;
        }
        return false;
    });
    if (refresh) refreshDevicesAsync();

    updateLogStream();
}

void AppController::flushNavigation() {
    if (auto target = navigation_.flush()) applyNavigation(*target);
    if (steps_.hasPendingSteps()) applySteps(steps_.flush());
}

void AppController::applyNavigation(NavigationTarget target) {
    withWrite([target](AppState& s) {
        if (target == NavigationTarget::Details) {
            s.setFocusedPanel(FocusedPanel::LogArea);
            return;
        }
        const Platform p = target == NavigationTarget::Android ? Platform::Android : Platform::Ios;
        s.smartClearCachedDeviceDetails(p);
        s.setActivePanel(p);
        s.setFocusedPanel(FocusedPanel::DeviceList);
    });
    loadSelectedDeviceDetailsAsync();
}

void AppController::applySteps(int steps) {
    if (steps == 0) return;
    withWrite([steps](AppState& s) { s.moveBySteps(steps); });
    loadSelectedDeviceDetailsAsync();
}

// =============================================================================
// Normal-mode actions
// =============================================================================

void AppController::toggleSelectedDevice(bool start_only, bool stop_only) {
    struct Selection { Platform platform; std::string name; std::string id; bool running; };
    auto sel = withRead([](const AppState& s) -> std::optional<Selection> {
        if (s.activePanel() == Platform::Android) {
            if (const auto* d = s.selectedAndroidDevice()) {
                return Selection{Platform::Android, d->name(), d->id(), d->isRunning()};
            }
        } else if (const auto* d = s.selectedIosDevice()) {
            return Selection{Platform::Ios, d->name(), d->id(), d->isRunning()};
        }
        return std::nullopt;
    });
    if (!sel) return;

    if (start_only && sel->running) {
        withWrite([&](AppState& s) { s.addInfoNotification("Device '" + sel->name + "' is already running"); });
        return;
    }
    if (stop_only && !sel->running) {
        withWrite([&](AppState& s) { s.addInfoNotification("Device '" + sel->name + "' is not running"); });
        return;
    }

    if (sel->running) stopDevice(sel->platform, sel->id, sel->name);
    else startDevice(sel->platform, sel->id, sel->name);
}

void AppController::requestConfirmation(bool wipe) {
    withWrite([wipe](AppState& s) {
        auto selected = s.selectedDevice();
        if (!selected) return;
        ConfirmDialog dialog{selected->first, selected->second, s.activePanel()};
        if (wipe) s.enterConfirmWipe(std::move(dialog));
        else s.enterConfirmDelete(std::move(dialog));
    });
}

void AppController::openCreateForm() {
    const Platform p = withRead([](const AppState& s) { return s.activePanel(); });
    if (!platformAvailable(p)) {
        withWrite([&](AppState& s) {
            s.addWarningNotification(std::string(platformLabel(p)) + " devices are not available on this host");
        });
        return;
    }

    CreateDeviceForm form = p == Platform::Android ? CreateDeviceForm::forAndroid(config_.android)
                                                   : CreateDeviceForm::forIos();
    if (p == Platform::Android) {
        if (config_.android.default_api_level > 0) {
            form.version = std::to_string(config_.android.default_api_level);
        }
    } else {
        form.version = config_.ios.default_ios_version;
        form.device_type_id = config_.ios.default_device_type;
    }

    const auto snapshot = metadata_.snapshot(p);
    if (snapshot.last_updated) {
        form.setCatalogs(snapshot.device_types, snapshot.versions);
    } else {
        form.is_loading_cache = true;
    }

    withWrite([&](AppState& s) { s.enterCreateDevice(std::move(form)); });
    ensureMetadataFresh(p);
}

void AppController::openApiLevels() {
    const Platform p = withRead([](const AppState& s) { return s.activePanel(); });
    if (!platformAvailable(p)) {
        withWrite([&](AppState& s) {
            s.addWarningNotification(std::string(platformLabel(p)) + " devices are not available on this host");
        });
        return;
    }
    ApiLevelView view;
    view.platform = p;
    view.api_levels = metadata_.versions(p);
    withWrite([&](AppState& s) { s.enterManageApiLevels(std::move(view)); });
    ensureMetadataFresh(p);
}

void AppController::submitCreateForm() {
    struct Request { Platform platform; DeviceConfig config; };
    auto request = withWrite([](AppState& s) -> std::optional<Request> {
        auto* form = s.createForm();
        if (!form || form->is_creating) return std::nullopt;
        auto r = form->toDeviceConfig();
        if (r.is_err()) {
            form->error_message = r.error().message;
            return std::nullopt;
        }
        form->error_message.reset();
        form->is_creating = true;
        form->creation_status = "Creating device...";
        return Request{form->platform(), std::move(r).value()};
    });
    if (!request) return;

    createDevice(request->platform, request->config);
}

} // namespace emu
