#pragma once
// =============================================================================
// emu - Device Records
// =============================================================================
// Platform device records (Android AVD, iOS simulator) behind a small
// capability interface, the create-device request and the details snapshot
// shown in the details pane.
// =============================================================================
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace emu {

enum class Platform { Android, Ios };

const char* platformStr(Platform p);
inline Platform otherPlatform(Platform p) {
    return p == Platform::Android ? Platform::Ios : Platform::Android;
}

enum class DeviceStatus { Stopped, Starting, Running, Stopping, Creating, Error, Unknown };

const char* deviceStatusStr(DeviceStatus s);
// Inverse of deviceStatusStr; unrecognized text -> Unknown
DeviceStatus parseDeviceStatus(const std::string& s);

// (id, display name) pair used by the type / API catalogs
using CatalogEntry = std::pair<std::string, std::string>;
using Catalog = std::vector<CatalogEntry>;

// =============================================================================
// Device: capability interface shared by both platforms
// =============================================================================
class Device {
public:
    virtual ~Device() = default;

    // Manager-assigned identifier (AVD name / simulator UDID)
    virtual const std::string& id() const = 0;
    virtual const std::string& name() const = 0;
    virtual Platform platform() const = 0;

    DeviceStatus status() const { return status_; }
    // Always equal to status() == Running
    bool isRunning() const { return status_ == DeviceStatus::Running; }

    void setStatus(DeviceStatus s) { status_ = s; }
    // Coarse running/not-running update coming from a list refresh
    void setRunning(bool running) {
        status_ = running ? DeviceStatus::Running : DeviceStatus::Stopped;
    }

protected:
    Device() = default;
    explicit Device(DeviceStatus s) : status_(s) {}
    Device(const Device&) = default;
    Device& operator=(const Device&) = default;

private:
    DeviceStatus status_ = DeviceStatus::Stopped;
};

// =============================================================================
// AndroidDevice: one AVD
// =============================================================================
class AndroidDevice : public Device {
public:
    AndroidDevice() = default;
    AndroidDevice(std::string avd_name, std::string type, int api,
                  DeviceStatus s = DeviceStatus::Stopped)
        : Device(s), name_(std::move(avd_name)), device_type(std::move(type)), api_level(api) {}

    const std::string& id() const override { return name_; }
    const std::string& name() const override { return name_; }
    Platform platform() const override { return Platform::Android; }
    void setName(std::string n) { name_ = std::move(n); }

    bool operator==(const AndroidDevice& o) const;
    bool operator!=(const AndroidDevice& o) const { return !(*this == o); }

private:
    std::string name_;

public:
    std::string device_type;       // "pixel_7" / "Pixel 7 (Google)"
    int api_level = 0;
    std::string ram_size = "2048";
    std::string storage_size = "512M";
};

// =============================================================================
// IosDevice: one simulator
// =============================================================================
class IosDevice : public Device {
public:
    IosDevice() = default;
    IosDevice(std::string display_name, std::string sim_udid, std::string type,
              std::string version, DeviceStatus s = DeviceStatus::Stopped)
        : Device(s), name_(std::move(display_name)), udid_(std::move(sim_udid)),
          device_type(std::move(type)), ios_version(std::move(version)) {}

    const std::string& id() const override { return udid_; }
    const std::string& name() const override { return name_; }
    Platform platform() const override { return Platform::Ios; }
    const std::string& udid() const { return udid_; }

    bool operator==(const IosDevice& o) const;
    bool operator!=(const IosDevice& o) const { return !(*this == o); }

private:
    std::string name_;
    std::string udid_;

public:
    std::string device_type;       // deviceTypeIdentifier
    std::string ios_version;       // "17.0"
    std::string runtime_version;   // "iOS 17.0"
    bool is_available = true;
};

// =============================================================================
// DeviceConfig: create_device request. Each with*() returns a new value.
// =============================================================================
class DeviceConfig {
public:
    DeviceConfig(std::string name, std::string device_type, std::string version)
        : name_(std::move(name)), device_type_(std::move(device_type)), version_(std::move(version)) {}

    DeviceConfig withRam(std::string ram_mb) const;
    DeviceConfig withStorage(std::string storage_mb) const;
    DeviceConfig withOption(std::string key, std::string value) const;

    const std::string& name() const { return name_; }
    const std::string& deviceType() const { return device_type_; }
    const std::string& version() const { return version_; }
    const std::optional<std::string>& ramSize() const { return ram_size_; }
    const std::optional<std::string>& storageSize() const { return storage_size_; }
    const std::map<std::string, std::string>& options() const { return options_; }

private:
    std::string name_;
    std::string device_type_;      // avd device id / simctl device type identifier
    std::string version_;          // API level / runtime identifier
    std::optional<std::string> ram_size_;
    std::optional<std::string> storage_size_;
    std::map<std::string, std::string> options_;
};

// =============================================================================
// DeviceDetails: snapshot rendered in the details pane
// =============================================================================
struct DeviceDetails {
    std::string name;
    std::string status;
    Platform platform = Platform::Android;
    std::string device_type;
    std::string api_level_or_version;
    std::optional<std::string> ram_size;
    std::optional<std::string> storage_size;
    std::optional<std::string> resolution;
    std::optional<std::string> dpi;
    std::optional<std::string> device_path;
    std::optional<std::string> system_image;
    std::string identifier;        // AVD name / UDID

    bool operator==(const DeviceDetails& o) const;
};

// Android API level -> marketing version ("34" -> "14"), "Unknown" otherwise
std::string androidVersionName(int api_level);

// =============================================================================
// JSON interchange (nlohmann ADL hooks)
// =============================================================================
void to_json(nlohmann::json& j, const AndroidDevice& d);
void from_json(const nlohmann::json& j, AndroidDevice& d);
void to_json(nlohmann::json& j, const IosDevice& d);
void from_json(const nlohmann::json& j, IosDevice& d);

} // namespace emu
