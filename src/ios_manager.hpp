#pragma once
// =============================================================================
// emu - iOS Simulator Manager
// =============================================================================
// `xcrun simctl` front end. Listings are JSON; lifecycle commands take the
// simulator UDID. On hosts without xcrun the manager reports itself
// unavailable and every operation fails with ErrorCode::Unsupported.
// =============================================================================
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "command_executor.hpp"
#include "device_manager.hpp"

namespace emu {
namespace ios {

// Substrings of simctl errors that mean "already in the requested state"
constexpr const char* ALREADY_BOOTED = "current state: Booted";
constexpr const char* ALREADY_SHUTDOWN = "current state: Shutdown";

// "com.apple.CoreSimulator.SimRuntime.iOS-17-0" -> "17.0",
// non-iOS runtimes keep their platform ("watchOS 10.0")
std::string versionFromRuntime(const std::string& runtime_key);

DeviceStatus statusFromState(const std::string& state);

// `simctl list devices --json`. Malformed text or entries are skipped
std::vector<IosDevice> parseDeviceList(const std::string& json_text);

// `simctl list devicetypes --json` -> (identifier, name), display order
Catalog parseDeviceTypes(const std::string& json_text);

// `simctl list runtimes --json` -> available (identifier, "iOS 17.0"), newest first
Catalog parseRuntimes(const std::string& json_text);

// "com.apple.CoreSimulator.SimDeviceType.iPhone-15-Pro" -> "iPhone 15 Pro"
std::string deviceTypeDisplayName(const std::string& identifier);

// Level of a `log stream --style compact` line ("... E  backboardd[68:1a2]");
// "error" / "warning" keywords otherwise, else INFO
const char* compactLogLevel(const std::string& line);

// Screen size in pixels for well-known models
std::optional<std::string> resolutionForDeviceType(const std::string& device_type);

} // namespace ios

class IosManager : public IosDeviceManager {
public:
    IosManager(std::shared_ptr<CommandExecutor> executor, bool available,
               std::string xcrun = "xcrun", int retries = 2);

    // Looks up xcrun on PATH
    static std::unique_ptr<IosManager> create(std::shared_ptr<CommandExecutor> executor, int retries);

    Platform platform() const override { return Platform::Ios; }
    bool isAvailable() const override { return available_; }

    Result<std::vector<IosDevice>> listDevices() override;
    Result<Catalog> listAvailableDevices() override;
    Result<Catalog> listAvailableApiLevels() override;

    Result<void> createDevice(const DeviceConfig& config) override;
    Result<void> startDevice(const std::string& id) override;
    Result<void> stopDevice(const std::string& id) override;
    Result<void> wipeDevice(const std::string& id) override;
    Result<void> deleteDevice(const std::string& id) override;

    Result<DeviceDetails> getDeviceDetails(const std::string& id) override;

    // `simctl spawn <udid> log stream --style compact`
    Result<void> streamLogs(const std::string& id, const LogSink& sink,
                            const std::atomic<bool>& stop) override;

private:
    Result<void> checkAvailable() const;
    Result<std::string> simctl(const CommandArgs& args);
    // Matches UDID or name; last known listing first, then a fresh one
    Result<IosDevice> resolveDevice(const std::string& id, bool fresh = false);

    std::shared_ptr<CommandExecutor> executor_;
    bool available_;
    std::string xcrun_;
    int retries_;

    mutable std::mutex mutex_;
    std::vector<IosDevice> last_known_;
};

} // namespace emu
