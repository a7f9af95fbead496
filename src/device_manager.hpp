#pragma once
// =============================================================================
// emu - Device Manager Contract
// =============================================================================
// Uniform lifecycle surface over one platform tool. Every operation that
// targets a device accepts either its name or its manager-assigned id.
// Implementations block on the CommandExecutor; callers run them off the
// UI thread.
// =============================================================================
#include <atomic>
#include <functional>
#include <string>
#include <vector>
#include "device.hpp"
#include "result.hpp"

namespace emu {

// One device log line with its level (ERROR / WARN / INFO / DEBUG)
using LogSink = std::function<void(const std::string& level, const std::string& line)>;

template<typename DeviceT>
class DeviceManager {
public:
    using DeviceType = DeviceT;

    virtual ~DeviceManager() = default;

    virtual Platform platform() const = 0;

    // Platform tooling present on this host
    virtual bool isAvailable() const = 0;

    // Sorted by display priority
    virtual Result<std::vector<DeviceT>> listDevices() = 0;

    // Device-type catalog (id, display)
    virtual Result<Catalog> listAvailableDevices() = 0;
    // Installed API levels / runtimes (id, display), newest first
    virtual Result<Catalog> listAvailableApiLevels() = 0;

    virtual Result<void> createDevice(const DeviceConfig& config) = 0;
    virtual Result<void> startDevice(const std::string& id) = 0;
    virtual Result<void> stopDevice(const std::string& id) = 0;
    virtual Result<void> wipeDevice(const std::string& id) = 0;
    virtual Result<void> deleteDevice(const std::string& id) = 0;

    virtual Result<DeviceDetails> getDeviceDetails(const std::string& id) = 0;

    // Follows the log of a running device until it ends or stop is set.
    // Blocks for the lifetime of the stream
    virtual Result<void> streamLogs(const std::string& id, const LogSink& /*sink*/,
                                    const std::atomic<bool>& /*stop*/) {
        return Error("Log streaming not supported for " + id, ErrorCode::Unsupported);
    }
};

using AndroidDeviceManager = DeviceManager<AndroidDevice>;
using IosDeviceManager = DeviceManager<IosDevice>;

// Classified text for a failed operation, suitable for a notification.
// Recognized tool failures (missing licenses / system image, duplicate
// name, unknown device) get an actionable message, anything else keeps
// the raw error text.
std::string userFriendlyMessage(const Error& error, const std::string& device_name);

} // namespace emu
