#include "ios_manager.hpp"
#include "device_priority.hpp"
#include "emu_log.hpp"
#include "parse_number.hpp"

#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>
#include <sstream>
#include <nlohmann/json.hpp>

namespace emu {
namespace ios {

namespace {

constexpr const char* RUNTIME_PREFIX = "com.apple.CoreSimulator.SimRuntime.";
constexpr const char* DEVICE_TYPE_PREFIX = "com.apple.CoreSimulator.SimDeviceType.";

std::string stripPrefix(const std::string& s, const char* prefix) {
    const std::string p(prefix);
    return s.rfind(p, 0) == 0 ? s.substr(p.size()) : s;
}

bool has(const std::string& s, const char* needle) {
    return s.find(needle) != std::string::npos;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// "iOS 17.2" -> 17.2 for newest-first ordering
double versionKey(const std::string& display) {
    static const std::regex re(R"((\d+)(?:\.(\d+))?)");
    std::smatch m;
    if (!std::regex_search(display, m, re)) return 0.0;
    double v = parseInt(m[1].str()).value_or(0);
    if (m[2].matched) v += parseInt(m[2].str()).value_or(0) / 100.0;
    return v;
}

std::optional<nlohmann::json> parseJson(const std::string& text, const char* what) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        ELOG_WARN("ios", "Malformed %s JSON: %s", what, e.what());
        return std::nullopt;
    }
}

std::string stringField(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::string();
    return it->get<std::string>();
}

} // anonymous namespace

std::string versionFromRuntime(const std::string& runtime_key) {
    const std::string tail = stripPrefix(runtime_key, RUNTIME_PREFIX);
    auto dash = tail.find('-');
    if (dash == std::string::npos) return tail;

    std::string platform = tail.substr(0, dash);
    std::string version = tail.substr(dash + 1);
    std::replace(version.begin(), version.end(), '-', '.');
    return platform == "iOS" ? version : platform + " " + version;
}

DeviceStatus statusFromState(const std::string& state) {
    if (state == "Booted")   return DeviceStatus::Running;
    if (state == "Shutdown") return DeviceStatus::Stopped;
    if (state == "Creating") return DeviceStatus::Creating;
    if (state == "Booting")  return DeviceStatus::Starting;
    if (state == "Shutting Down") return DeviceStatus::Stopping;
    return DeviceStatus::Unknown;
}

std::vector<IosDevice> parseDeviceList(const std::string& json_text) {
    std::vector<IosDevice> devices;
    auto root = parseJson(json_text, "device list");
    if (!root || !root->is_object()) return devices;

    auto runtimes = root->find("devices");
    if (runtimes == root->end() || !runtimes->is_object()) return devices;

    for (auto rt = runtimes->begin(); rt != runtimes->end(); ++rt) {
        if (!rt.value().is_array()) continue;
        const std::string version = versionFromRuntime(rt.key());
        const bool is_ios = version.find(' ') == std::string::npos;

        for (const auto& entry : rt.value()) {
            if (!entry.is_object()) continue;
            const std::string udid = stringField(entry, "udid");
            if (udid.empty()) continue;

            std::string name = stringField(entry, "name");
            if (name.empty()) name = udid;

            IosDevice dev(name, udid, stringField(entry, "deviceTypeIdentifier"), version,
                          statusFromState(stringField(entry, "state")));
            dev.runtime_version = is_ios ? "iOS " + version : version;
            auto avail = entry.find("isAvailable");
            dev.is_available = avail != entry.end() && avail->is_boolean() && avail->get<bool>();
            devices.push_back(std::move(dev));
        }
    }

    std::stable_sort(devices.begin(), devices.end(), [](const IosDevice& a, const IosDevice& b) {
        auto pa = iosDevicePriority(a.name());
        auto pb = iosDevicePriority(b.name());
        if (pa != pb) return pa < pb;
        if (a.name() != b.name()) return a.name() < b.name();
        return versionKey(a.ios_version) > versionKey(b.ios_version);
    });
    return devices;
}

Catalog parseDeviceTypes(const std::string& json_text) {
    Catalog catalog;
    auto root = parseJson(json_text, "device type");
    if (!root || !root->is_object()) return catalog;

    auto types = root->find("devicetypes");
    if (types == root->end() || !types->is_array()) return catalog;

    for (const auto& t : *types) {
        if (!t.is_object()) continue;
        const std::string id = stringField(t, "identifier");
        if (id.empty()) continue;
        std::string name = stringField(t, "name");
        catalog.emplace_back(id, name.empty() ? deviceTypeDisplayName(id) : name);
    }

    std::stable_sort(catalog.begin(), catalog.end(),
                     [](const CatalogEntry& a, const CatalogEntry& b) {
                         auto pa = iosDevicePriority(a.second);
                         auto pb = iosDevicePriority(b.second);
                         if (pa != pb) return pa < pb;
                         return a.second < b.second;
                     });
    return catalog;
}

Catalog parseRuntimes(const std::string& json_text) {
    Catalog catalog;
    auto root = parseJson(json_text, "runtime");
    if (!root || !root->is_object()) return catalog;

    auto runtimes = root->find("runtimes");
    if (runtimes == root->end() || !runtimes->is_array()) return catalog;

    for (const auto& r : *runtimes) {
        if (!r.is_object()) continue;
        const std::string id = stringField(r, "identifier");
        auto avail = r.find("isAvailable");
        if (id.empty() || avail == r.end() || !avail->is_boolean() || !avail->get<bool>()) continue;

        std::string display = stringField(r, "name");
        if (display.empty()) {
            const std::string version = stringField(r, "version");
            if (!version.empty()) {
                display = "iOS " + version;
            } else {
                std::string v = versionFromRuntime(id);
                display = v.find(' ') == std::string::npos ? "iOS " + v : v;
            }
        }
        catalog.emplace_back(id, display);
    }

    std::stable_sort(catalog.begin(), catalog.end(),
                     [](const CatalogEntry& a, const CatalogEntry& b) {
                         return versionKey(a.second) > versionKey(b.second);
                     });
    return catalog;
}

std::string deviceTypeDisplayName(const std::string& identifier) {
    std::string name = stripPrefix(identifier, DEVICE_TYPE_PREFIX);
    std::replace(name.begin(), name.end(), '-', ' ');
    return name;
}

std::optional<std::string> resolutionForDeviceType(const std::string& device_type) {
    const std::string s = lower(deviceTypeDisplayName(device_type));

    if (has(s, "iphone")) {
        if (has(s, " se")) return std::string("750x1334");
        if (has(s, "pro max") || has(s, "plus")) return std::string("1290x2796");
        return std::string("1179x2556");
    }
    if (has(s, "ipad")) {
        if (has(s, "pro")) {
            if (has(s, "12.9") || has(s, "12 9") || has(s, "13")) return std::string("2048x2732");
            return std::string("1668x2388");
        }
        if (has(s, "air")) return has(s, "13") ? std::string("2048x2732") : std::string("1640x2360");
        if (has(s, "mini")) return std::string("1488x2266");
        return std::string("1640x2360");
    }
    return std::nullopt;
}

const char* compactLogLevel(const std::string& line) {
    static const std::regex type_re(
        R"(^\d{4}-\d\d-\d\d\s+\d\d:\d\d:\d\d\.\d+\s+(Df|Db|Er|Fa|A|I|E|F)\s)");
    std::smatch m;
    if (std::regex_search(line, m, type_re)) {
        const std::string type = m[1].str();
        if (type == "E" || type == "Er" || type == "F" || type == "Fa") return "ERROR";
        if (type == "Db") return "DEBUG";
        return "INFO";
    }
    if (has(line, "error") || has(line, "Error")) return "ERROR";
    if (has(line, "warning") || has(line, "Warning")) return "WARN";
    return "INFO";
}

} // namespace ios

// =============================================================================
// IosManager
// =============================================================================

namespace {

bool findOnPath(const std::string& program) {
    const char* path = std::getenv("PATH");
    if (!path) return false;
    std::stringstream ss(path);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) continue;
        if (::access((dir + "/" + program).c_str(), X_OK) == 0) return true;
    }
    return false;
}

const char* statusText(DeviceStatus s) {
    switch (s) {
        case DeviceStatus::Running: return "Booted";
        case DeviceStatus::Stopped: return "Shutdown";
        default:                    return deviceStatusStr(s);
    }
}

} // anonymous namespace

IosManager::IosManager(std::shared_ptr<CommandExecutor> executor, bool available,
                       std::string xcrun, int retries)
    : executor_(std::move(executor)), available_(available),
      xcrun_(std::move(xcrun)), retries_(retries) {}

std::unique_ptr<IosManager> IosManager::create(std::shared_ptr<CommandExecutor> executor, int retries) {
    const bool available = findOnPath("xcrun");
    if (!available) {
        ELOG_INFO("ios", "xcrun not found, iOS simulators disabled");
    }
    return std::make_unique<IosManager>(std::move(executor), available, "xcrun", retries);
}

Result<void> IosManager::checkAvailable() const {
    if (available_) return Ok();
    return Err<void>("iOS simulators require macOS with Xcode command line tools", ErrorCode::Unsupported);
}

Result<std::string> IosManager::simctl(const CommandArgs& args) {
    CommandArgs full;
    full.reserve(args.size() + 1);
    full.push_back("simctl");
    full.insert(full.end(), args.begin(), args.end());
    return executor_->run(xcrun_, full);
}

Result<std::vector<IosDevice>> IosManager::listDevices() {
    EMU_TRY_VOID(checkAvailable());
    const CommandArgs args = {"simctl", "list", "devices", "--json"};
    auto output = EMU_TRY(executor_->runWithRetry(xcrun_, args, retries_));
    auto devices = ios::parseDeviceList(output);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_known_ = devices;
    }
    ELOG_DEBUG("ios", "Listed %zu simulators", devices.size());
    return devices;
}

Result<Catalog> IosManager::listAvailableDevices() {
    EMU_TRY_VOID(checkAvailable());
    const CommandArgs args = {"simctl", "list", "devicetypes", "--json"};
    auto output = EMU_TRY(executor_->runWithRetry(xcrun_, args, retries_));
    return ios::parseDeviceTypes(output);
}

Result<Catalog> IosManager::listAvailableApiLevels() {
    EMU_TRY_VOID(checkAvailable());
    const CommandArgs args = {"simctl", "list", "runtimes", "--json"};
    auto output = EMU_TRY(executor_->runWithRetry(xcrun_, args, retries_));
    return ios::parseRuntimes(output);
}

Result<IosDevice> IosManager::resolveDevice(const std::string& id, bool fresh) {
    auto match = [&id](const std::vector<IosDevice>& devices) -> std::optional<IosDevice> {
        for (const auto& d : devices) {
            if (d.udid() == id) return d;
        }
        for (const auto& d : devices) {
            if (d.name() == id) return d;
        }
        return std::nullopt;
    };

    if (!fresh) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto found = match(last_known_)) return *found;
    }
    auto devices = EMU_TRY(listDevices());
    if (auto found = match(devices)) return *found;
    return Err<IosDevice>("Device '" + id + "' not found", ErrorCode::DeviceNotFound);
}

Result<void> IosManager::createDevice(const DeviceConfig& config) {
    EMU_TRY_VOID(checkAvailable());
    if (config.name().empty()) {
        return Err<void>("Device name is required", ErrorCode::ValidationFailed);
    }
    if (config.deviceType().empty() || config.version().empty()) {
        return Err<void>("Device type and runtime are required", ErrorCode::ValidationFailed);
    }

    ELOG_INFO("ios", "Creating simulator %s (%s, %s)", config.name().c_str(),
              config.deviceType().c_str(), config.version().c_str());
    const CommandArgs args = {"create", config.name(), config.deviceType(), config.version()};
    auto out = simctl(args);
    if (out.is_err()) {
        ELOG_ERROR("ios", "simctl create failed: %s", out.error().message.c_str());
        return Err<void>(out.error().message, ErrorCode::CreateFailed);
    }

    std::string udid = out.value();
    udid.erase(std::remove_if(udid.begin(), udid.end(),
                              [](unsigned char c) { return std::isspace(c); }),
               udid.end());
    ELOG_INFO("ios", "Created simulator %s", udid.c_str());
    return Ok();
}

Result<void> IosManager::startDevice(const std::string& id) {
    EMU_TRY_VOID(checkAvailable());
    auto device = EMU_TRY(resolveDevice(id));

    if (device.isRunning()) {
        ELOG_INFO("ios", "%s is already booted", device.name().c_str());
    } else {
        const CommandArgs args = {"simctl", "boot", device.udid()};
        auto booted = executor_->runIgnoringErrors(xcrun_, args, {ios::ALREADY_BOOTED});
        if (booted.is_err()) {
            ELOG_ERROR("ios", "Failed to boot %s: %s", device.udid().c_str(),
                       booted.error().message.c_str());
            return booted.error();
        }
        ELOG_INFO("ios", "Booted %s", device.name().c_str());
    }

    // The device runs headless without it, so a failure is not fatal
    const CommandArgs open_args = {"-a", "Simulator"};
    auto opened = executor_->spawn("open", open_args);
    if (opened.is_err()) {
        ELOG_WARN("ios", "Could not open Simulator.app: %s", opened.error().message.c_str());
    }
    return Ok();
}

Result<void> IosManager::streamLogs(const std::string& id, const LogSink& sink,
                                    const std::atomic<bool>& stop) {
    EMU_TRY_VOID(checkAvailable());
    auto device = EMU_TRY(resolveDevice(id));

    ELOG_INFO("ios", "Following log of %s", device.name().c_str());
    const CommandArgs args = {"simctl", "spawn", device.udid(), "log", "stream", "--style", "compact"};
    return executor_->streamLines(xcrun_, args, [&sink](const std::string& line) {
        if (line.find_first_not_of(" \t") == std::string::npos) return;
        if (line.rfind("Filtering the log data", 0) == 0 || line.rfind("Timestamp", 0) == 0) return;
        sink(ios::compactLogLevel(line), line);
    }, stop);
}

Result<void> IosManager::stopDevice(const std::string& id) {
    EMU_TRY_VOID(checkAvailable());
    auto device = EMU_TRY(resolveDevice(id));

    const CommandArgs args = {"simctl", "shutdown", device.udid()};
    auto stopped = executor_->runIgnoringErrors(xcrun_, args, {ios::ALREADY_SHUTDOWN});
    if (stopped.is_err()) {
        ELOG_ERROR("ios", "Failed to shut down %s: %s", device.udid().c_str(),
                   stopped.error().message.c_str());
        return stopped.error();
    }
    ELOG_INFO("ios", "Shut down %s", device.name().c_str());
    return Ok();
}

Result<void> IosManager::wipeDevice(const std::string& id) {
    EMU_TRY_VOID(checkAvailable());
    auto device = EMU_TRY(resolveDevice(id));

    // erase refuses a booted simulator
    if (device.isRunning()) {
        const CommandArgs shutdown = {"simctl", "shutdown", device.udid()};
        auto stopped = executor_->runIgnoringErrors(xcrun_, shutdown, {ios::ALREADY_SHUTDOWN});
        if (stopped.is_err()) return stopped.error();
    }

    const CommandArgs args = {"erase", device.udid()};
    auto erased = simctl(args);
    if (erased.is_err()) {
        ELOG_ERROR("ios", "Failed to erase %s: %s", device.udid().c_str(),
                   erased.error().message.c_str());
        return erased.error();
    }
    ELOG_INFO("ios", "Erased %s", device.name().c_str());
    return Ok();
}

Result<void> IosManager::deleteDevice(const std::string& id) {
    EMU_TRY_VOID(checkAvailable());
    auto device = EMU_TRY(resolveDevice(id));

    const CommandArgs shutdown = {"shutdown", device.udid()};
    auto stopped = simctl(shutdown);
    if (stopped.is_err()) {
        ELOG_DEBUG("ios", "Shutdown before delete failed (continuing): %s",
                   stopped.error().message.c_str());
    }

    const CommandArgs args = {"delete", device.udid()};
    auto deleted = simctl(args);
    if (deleted.is_err()) {
        ELOG_ERROR("ios", "Failed to delete %s: %s", device.udid().c_str(),
                   deleted.error().message.c_str());
        return deleted.error();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_known_.erase(std::remove_if(last_known_.begin(), last_known_.end(),
                                         [&](const IosDevice& d) { return d.udid() == device.udid(); }),
                          last_known_.end());
    }
    ELOG_INFO("ios", "Deleted %s", device.name().c_str());
    return Ok();
}

Result<DeviceDetails> IosManager::getDeviceDetails(const std::string& id) {
    EMU_TRY_VOID(checkAvailable());
    auto device = EMU_TRY(resolveDevice(id, true));

    DeviceDetails details;
    details.name = device.name();
    details.status = statusText(device.status());
    details.platform = Platform::Ios;
    details.device_type = ios::deviceTypeDisplayName(device.device_type);
    details.api_level_or_version = device.runtime_version;
    details.resolution = ios::resolutionForDeviceType(device.device_type);
    details.identifier = device.udid();

    const char* home = std::getenv("HOME");
    if (home && *home) {
        details.device_path = std::string(home) + "/Library/Developer/CoreSimulator/Devices/" +
                              device.udid();
    }
    return details;
}

} // namespace emu
