#pragma once
// =============================================================================
// emu - Android Virtual Device Manager
// =============================================================================
// Drives avdmanager / adb / sdkmanager / emulator through a CommandExecutor.
// The SDK location is resolved once (ANDROID_HOME, then ANDROID_SDK_ROOT)
// into AndroidSdkPaths; nothing re-reads the environment afterwards.
//
// Tool output parsers live in emu::android so they can be tested directly.
// =============================================================================
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "command_executor.hpp"
#include "config_loader.hpp"
#include "device_manager.hpp"

namespace emu {
namespace android {

// One record of `avdmanager list avd`
struct AvdRecord {
    std::string name;
    std::string path;
    std::string target;      // "Google Play (Google Inc.) Based on: Android 14.0 ..."
    std::string tag_abi;     // "google_apis_playstore/x86_64"
    std::string device;      // "pixel_7 (Google)"
};

/**
 * Line-driven accumulator for `avdmanager list avd`.
 * "Name:" opens a record, recognized keys fill it, a "---" separator, a
 * blank line or finish() emits it. Unknown lines are ignored. Records in
 * the "could not be loaded" section are dropped.
 */
class AvdListParser {
public:
    void feedLine(const std::string& line);
    void finish();

    const std::vector<AvdRecord>& records() const { return records_; }
    std::vector<AvdRecord> takeRecords() { return std::move(records_); }

private:
    void emit();

    std::optional<AvdRecord> current_;
    bool broken_section_ = false;
    std::vector<AvdRecord> records_;
};

std::vector<AvdRecord> parseAvdList(const std::string& output);

// "14.0" -> 34, "12L" -> 32, "8.1" -> 27; 0 when unknown
int apiLevelFromAndroidVersion(const std::string& version);

// "API level N", "Based on: Android X", "android-N"; 0 when none
int apiLevelFromTarget(const std::string& target);

// Digits following "API_" / "API " in an AVD name; 0 when none
int apiLevelFromName(const std::string& avd_name);

using IniValues = std::map<std::string, std::string>;

IniValues parseIni(const std::string& content);
Result<IniValues> readIniFile(const std::string& path);
// Replaces existing keys in place and appends the rest
Result<void> updateIniFile(const std::string& path, const IniValues& values);

// image.sysdir.1 / target keys of an AVD config.ini; 0 when none
int apiLevelFromConfig(const IniValues& ini);

// `avdmanager list device` -> (id, "Name (OEM)"), sorted by display priority
Catalog parseDeviceDefinitions(const std::string& output);

// Level of a `logcat -v time` (or threadtime) line; keyword fallback, else INFO
const char* logcatLevel(const std::string& line);

// `adb devices` -> online emulator serials ("emulator-5554")
std::vector<std::string> parseEmulatorSerials(const std::string& adb_output);

struct SystemImage {
    std::string package;     // "system-images;android-34;google_apis;x86_64"
    int api_level = 0;
    std::string tag;
    std::string abi;
};

// Rows of the "Installed packages:" section of `sdkmanager --list`
std::vector<SystemImage> parseInstalledSystemImages(const std::string& output);

// ("34", "API 34 - Android 14"), one per level, newest first
Catalog apiLevelCatalog(const std::vector<SystemImage>& images);

// Preferred tag first, then google_apis_playstore, google_apis, default;
// host ABI preferred within a tag
std::optional<SystemImage> selectSystemImage(const std::vector<SystemImage>& images,
                                             int api_level, const std::string& preferred_tag);

// Display name -> AVD name: spaces and '_' become '_', other characters
// outside [A-Za-z0-9.-] are dropped, surrounding '_' trimmed
std::string sanitizeAvdName(const std::string& name);

// "512M" / "2048" / "4G" -> "N MB"; nullopt when not numeric
std::optional<std::string> formatSizeMb(const std::string& value);

} // namespace android

struct AndroidSdkPaths {
    std::string sdk_root;
    std::string avd_home;    // $ANDROID_AVD_HOME, else $HOME/.android/avd
    std::string avdmanager;
    std::string sdkmanager;
    std::string adb;
    std::string emulator;

    // Standard layout under root without checking the filesystem
    static AndroidSdkPaths fromSdkRoot(const std::string& root, const std::string& avd_home);

    // Reads the environment and locates each tool on disk
    static Result<AndroidSdkPaths> fromEnvironment();
};

class AndroidManager : public AndroidDeviceManager {
public:
    AndroidManager(std::shared_ptr<CommandExecutor> executor, AndroidSdkPaths paths,
                   config::AndroidConfig options = {}, int retries = 2);

    // Environment lookup + construction in one step
    static Result<std::unique_ptr<AndroidManager>> create(std::shared_ptr<CommandExecutor> executor,
                                                          const config::AndroidConfig& options,
                                                          int retries);

    Platform platform() const override { return Platform::Android; }
    bool isAvailable() const override { return true; }

    Result<std::vector<AndroidDevice>> listDevices() override;
    Result<Catalog> listAvailableDevices() override;
    Result<Catalog> listAvailableApiLevels() override;

    Result<void> createDevice(const DeviceConfig& config) override;
    Result<void> startDevice(const std::string& id) override;
    Result<void> stopDevice(const std::string& id) override;
    Result<void> wipeDevice(const std::string& id) override;
    Result<void> deleteDevice(const std::string& id) override;

    Result<DeviceDetails> getDeviceDetails(const std::string& id) override;

    // `adb -s <serial> logcat -v time` of the emulator running this AVD
    Result<void> streamLogs(const std::string& id, const LogSink& sink,
                            const std::atomic<bool>& stop) override;

    // AVD name -> emulator serial for every running emulator
    Result<std::map<std::string, std::string>> runningAvds();

    Result<std::vector<android::SystemImage>> listSystemImages();

    const AndroidSdkPaths& paths() const { return paths_; }

private:
    Result<std::vector<android::AvdRecord>> listAvds();
    // Last known listing first, one fresh listing on a miss
    Result<android::AvdRecord> resolveAvd(const std::string& id);
    std::optional<std::string> queryAvdName(const std::string& serial);
    std::string avdDirectory(const android::AvdRecord& record) const;
    int resolveApiLevel(const android::AvdRecord& record) const;
    Result<void> stopIfRunning(const std::string& avd_name);

    std::shared_ptr<CommandExecutor> executor_;
    AndroidSdkPaths paths_;
    config::AndroidConfig options_;
    int retries_;

    mutable std::mutex mutex_;
    std::vector<android::AvdRecord> last_known_;
};

} // namespace emu
