#include "device.hpp"
#include <nlohmann/json.hpp>

namespace emu {

const char* platformStr(Platform p) {
    switch (p) {
        case Platform::Android: return "Android";
        case Platform::Ios:     return "iOS";
    }
    return "?";
}

const char* deviceStatusStr(DeviceStatus s) {
    switch (s) {
        case DeviceStatus::Stopped:  return "Stopped";
        case DeviceStatus::Starting: return "Starting";
        case DeviceStatus::Running:  return "Running";
        case DeviceStatus::Stopping: return "Stopping";
        case DeviceStatus::Creating: return "Creating";
        case DeviceStatus::Error:    return "Error";
        case DeviceStatus::Unknown:  return "Unknown";
    }
    return "Unknown";
}

DeviceStatus parseDeviceStatus(const std::string& s) {
    if (s == "Stopped")  return DeviceStatus::Stopped;
    if (s == "Starting") return DeviceStatus::Starting;
    if (s == "Running")  return DeviceStatus::Running;
    if (s == "Stopping") return DeviceStatus::Stopping;
    if (s == "Creating") return DeviceStatus::Creating;
    if (s == "Error")    return DeviceStatus::Error;
    return DeviceStatus::Unknown;
}

bool AndroidDevice::operator==(const AndroidDevice& o) const {
    return name_ == o.name_ && status() == o.status() && device_type == o.device_type &&
           api_level == o.api_level && ram_size == o.ram_size && storage_size == o.storage_size;
}

bool IosDevice::operator==(const IosDevice& o) const {
    return name_ == o.name_ && udid_ == o.udid_ && status() == o.status() &&
           device_type == o.device_type && ios_version == o.ios_version &&
           runtime_version == o.runtime_version && is_available == o.is_available;
}

bool DeviceDetails::operator==(const DeviceDetails& o) const {
    return name == o.name && status == o.status && platform == o.platform &&
           device_type == o.device_type && api_level_or_version == o.api_level_or_version &&
           ram_size == o.ram_size && storage_size == o.storage_size &&
           resolution == o.resolution && dpi == o.dpi && device_path == o.device_path &&
           system_image == o.system_image && identifier == o.identifier;
}

// -----------------------------------------------------------------------------
// DeviceConfig
// -----------------------------------------------------------------------------

DeviceConfig DeviceConfig::withRam(std::string ram_mb) const {
    DeviceConfig copy = *this;
    copy.ram_size_ = std::move(ram_mb);
    return copy;
}

DeviceConfig DeviceConfig::withStorage(std::string storage_mb) const {
    DeviceConfig copy = *this;
    copy.storage_size_ = std::move(storage_mb);
    return copy;
}

DeviceConfig DeviceConfig::withOption(std::string key, std::string value) const {
    DeviceConfig copy = *this;
    copy.options_[std::move(key)] = std::move(value);
    return copy;
}

std::string androidVersionName(int api_level) {
    switch (api_level) {
        case 36: return "16";
        case 35: return "15";
        case 34: return "14";
        case 33: return "13";
        case 32: return "12L";
        case 31: return "12";
        case 30: return "11";
        case 29: return "10";
        case 28: return "9";
        case 27: return "8.1";
        case 26: return "8.0";
        case 25: return "7.1";
        case 24: return "7.0";
        case 23: return "6.0";
        case 22: return "5.1";
        case 21: return "5.0";
        default: return "Unknown";
    }
}

// =============================================================================
// JSON
// =============================================================================
// is_running is written for readers of the cache file; on load the status
// field is authoritative so the running flag can never disagree with it.

void to_json(nlohmann::json& j, const AndroidDevice& d) {
    j = nlohmann::json{
        {"name", d.name()},
        {"device_type", d.device_type},
        {"api_level", d.api_level},
        {"status", deviceStatusStr(d.status())},
        {"is_running", d.isRunning()},
        {"ram_size", d.ram_size},
        {"storage_size", d.storage_size},
    };
}

void from_json(const nlohmann::json& j, AndroidDevice& d) {
    d.setName(j.at("name").get<std::string>());
    d.device_type = j.at("device_type").get<std::string>();
    d.api_level = j.at("api_level").get<int>();
    d.setStatus(parseDeviceStatus(j.at("status").get<std::string>()));
    d.ram_size = j.value("ram_size", std::string("2048"));
    d.storage_size = j.value("storage_size", std::string("512M"));
}

void to_json(nlohmann::json& j, const IosDevice& d) {
    j = nlohmann::json{
        {"name", d.name()},
        {"udid", d.udid()},
        {"device_type", d.device_type},
        {"ios_version", d.ios_version},
        {"runtime_version", d.runtime_version},
        {"status", deviceStatusStr(d.status())},
        {"is_running", d.isRunning()},
        {"is_available", d.is_available},
    };
}

void from_json(const nlohmann::json& j, IosDevice& d) {
    d = IosDevice(j.at("name").get<std::string>(), j.at("udid").get<std::string>(),
                  j.at("device_type").get<std::string>(), j.at("ios_version").get<std::string>(),
                  parseDeviceStatus(j.at("status").get<std::string>()));
    d.runtime_version = j.value("runtime_version", std::string());
    d.is_available = j.value("is_available", true);
}

} // namespace emu
