#include "android_manager.hpp"
#include "device_priority.hpp"
#include "emu_log.hpp"
#include "parse_number.hpp"

#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <regex>
#include <set>
#include <sstream>

namespace emu {
namespace android {

namespace {

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

// "Key: value" -> value, when the line starts with key
std::optional<std::string> keyValue(const std::string& trimmed, const char* key) {
    if (!startsWith(trimmed, key)) return std::nullopt;
    return trim(trimmed.substr(std::strlen(key)));
}

const char* hostAbi() {
#if defined(__aarch64__) || defined(__arm64__)
    return "arm64-v8a";
#else
    return "x86_64";
#endif
}

} // anonymous namespace

// =============================================================================
// avdmanager list avd
// =============================================================================

void AvdListParser::emit() {
    if (current_ && !current_->name.empty() && !broken_section_) {
        records_.push_back(std::move(*current_));
    }
    current_.reset();
}

void AvdListParser::feedLine(const std::string& line) {
    const std::string t = trim(line);

    if (t.empty() || startsWith(t, "---")) {
        emit();
        return;
    }
    if (startsWith(t, "The following Android Virtual Devices could not be loaded")) {
        emit();
        broken_section_ = true;
        return;
    }

    if (auto v = keyValue(t, "Name:")) {
        emit();
        current_ = AvdRecord{};
        current_->name = *v;
        return;
    }
    if (!current_) return;

    if (auto v = keyValue(t, "Path:")) {
        current_->path = *v;
    } else if (auto v = keyValue(t, "Target:")) {
        current_->target = *v;
    } else if (startsWith(t, "Based on:")) {
        // Continuation of Target; newer tools put Tag/ABI on the same line
        current_->target += " " + t;
        auto pos = t.find("Tag/ABI:");
        if (pos != std::string::npos) {
            current_->tag_abi = trim(t.substr(pos + std::strlen("Tag/ABI:")));
        }
    } else if (auto v = keyValue(t, "Tag/ABI:")) {
        current_->tag_abi = *v;
    } else if (auto v = keyValue(t, "Device:")) {
        current_->device = *v;
    }
}

void AvdListParser::finish() {
    emit();
}

std::vector<AvdRecord> parseAvdList(const std::string& output) {
    AvdListParser parser;
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        parser.feedLine(line);
    }
    parser.finish();
    return parser.takeRecords();
}

// =============================================================================
// API level resolution
// =============================================================================

int apiLevelFromAndroidVersion(const std::string& version) {
    static const std::regex re(R"(^\s*(\d+)(?:\.(\d+))?\s*(L?))");
    std::smatch m;
    if (!std::regex_search(version, m, re)) return 0;
    const int major = parseInt(m[1].str()).value_or(0);
    const int minor = m[2].matched ? parseInt(m[2].str()).value_or(0) : 0;
    const bool large = m[3].length() > 0;

    switch (major) {
        case 16: return 36;
        case 15: return 35;
        case 14: return 34;
        case 13: return 33;
        case 12: return large ? 32 : 31;
        case 11: return 30;
        case 10: return 29;
        case 9:  return 28;
        case 8:  return minor >= 1 ? 27 : 26;
        case 7:  return minor >= 1 ? 25 : 24;
        case 6:  return 23;
        case 5:  return minor >= 1 ? 22 : 21;
        case 4:  return minor >= 4 ? 19 : 0;
        default: return 0;
    }
}

int apiLevelFromTarget(const std::string& target) {
    static const std::regex api_level_re(R"(API level (\d+))");
    static const std::regex based_on_re(R"(Based on:\s*Android\s+(\d+(?:\.\d+)?L?))");
    static const std::regex platform_re(R"(android-(\d+))");

    std::smatch m;
    if (std::regex_search(target, m, api_level_re)) return parseInt(m[1].str()).value_or(0);
    if (std::regex_search(target, m, based_on_re)) {
        int api = apiLevelFromAndroidVersion(m[1].str());
        if (api > 0) return api;
    }
    if (std::regex_search(target, m, platform_re)) return parseInt(m[1].str()).value_or(0);
    return 0;
}

int apiLevelFromName(const std::string& avd_name) {
    static const std::regex re(R"(API[_ ](\d+))", std::regex::icase);
    std::smatch m;
    if (std::regex_search(avd_name, m, re)) return parseInt(m[1].str()).value_or(0);
    return 0;
}

int apiLevelFromConfig(const IniValues& ini) {
    static const std::regex re(R"(android-(\d+))");
    for (const char* key : {"image.sysdir.1", "target"}) {
        auto it = ini.find(key);
        if (it == ini.end()) continue;
        std::smatch m;
        if (std::regex_search(it->second, m, re)) return parseInt(m[1].str()).value_or(0);
    }
    return 0;
}

// =============================================================================
// logcat
// =============================================================================

const char* logcatLevel(const std::string& line) {
    // time:       "01-15 10:23:45.678 E/ActivityManager( 512): ..."
    // threadtime: "01-15 10:23:45.678   512   530 E ActivityManager: ..."
    static const std::regex time_re(R"(^\d\d-\d\d\s+\d\d:\d\d:\d\d\.\d+\s+([VDIWEF])/)");
    static const std::regex threadtime_re(R"(^\d\d-\d\d\s+\d\d:\d\d:\d\d\.\d+\s+\d+\s+\d+\s+([VDIWEF])\s)");

    std::smatch m;
    if (std::regex_search(line, m, time_re) || std::regex_search(line, m, threadtime_re)) {
        switch (m[1].str()[0]) {
            case 'E':
            case 'F': return "ERROR";
            case 'W': return "WARN";
            case 'I': return "INFO";
            default:  return "DEBUG";
        }
    }
    if (line.find("ERROR") != std::string::npos) return "ERROR";
    if (line.find("WARN") != std::string::npos) return "WARN";
    if (line.find("DEBUG") != std::string::npos) return "DEBUG";
    return "INFO";
}

// =============================================================================
// config.ini
// =============================================================================

IniValues parseIni(const std::string& content) {
    IniValues values;
    std::istringstream iss(content);
    std::string line;
    while (std::getline(iss, line)) {
        const std::string t = trim(line);
        if (t.empty() || t[0] == '#' || t[0] == ';') continue;
        auto eq = t.find('=');
        if (eq == std::string::npos) continue;
        values[trim(t.substr(0, eq))] = trim(t.substr(eq + 1));
    }
    return values;
}

Result<IniValues> readIniFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return IoError("Cannot open " + path, IoError::Kind::NotFound);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parseIni(ss.str());
}

Result<void> updateIniFile(const std::string& path, const IniValues& values) {
    std::ifstream in(path);
    if (!in) {
        return IoError("Cannot open " + path, IoError::Kind::NotFound);
    }
    std::vector<std::string> lines;
    std::set<std::string> written;
    std::string line;
    while (std::getline(in, line)) {
        auto eq = line.find('=');
        if (eq != std::string::npos) {
            auto it = values.find(trim(line.substr(0, eq)));
            if (it != values.end()) {
                line = it->first + "=" + it->second;
                written.insert(it->first);
            }
        }
        lines.push_back(line);
    }
    in.close();

    for (const auto& [key, value] : values) {
        if (!written.count(key)) lines.push_back(key + "=" + value);
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return IoError("Cannot write " + path, IoError::Kind::PermissionDenied);
    }
    for (const auto& l : lines) out << l << '\n';
    if (!out) {
        return IoError("Write failed: " + path);
    }
    return Ok();
}

// =============================================================================
// avdmanager list device
// =============================================================================

Catalog parseDeviceDefinitions(const std::string& output) {
    static const std::regex id_re(R"re(^id:\s*\d+\s+or\s+"([^"]+)")re");

    struct Definition { std::string id, name, oem; };
    std::vector<Definition> defs;
    Definition current;

    auto flush = [&]() {
        if (!current.id.empty()) defs.push_back(current);
        current = Definition{};
    };

    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        const std::string t = trim(line);
        std::smatch m;
        if (std::regex_search(t, m, id_re)) {
            flush();
            current.id = m[1].str();
        } else if (startsWith(t, "---")) {
            flush();
        } else if (auto v = keyValue(t, "Name:")) {
            current.name = *v;
        } else if (startsWith(t, "OEM")) {
            auto colon = t.find(':');
            if (colon != std::string::npos) current.oem = trim(t.substr(colon + 1));
        }
    }
    flush();

    Catalog catalog;
    for (const auto& d : defs) {
        std::string display = d.name.empty() ? d.id : d.name;
        if (!d.oem.empty() && d.oem != "Generic") display += " (" + d.oem + ")";
        catalog.emplace_back(d.id, display);
    }
    std::stable_sort(catalog.begin(), catalog.end(),
                     [](const CatalogEntry& a, const CatalogEntry& b) {
                         auto pa = androidDevicePriority(a.first, a.second);
                         auto pb = androidDevicePriority(b.first, b.second);
                         if (pa != pb) return pa < pb;
                         return a.second < b.second;
                     });
    return catalog;
}

// =============================================================================
// adb devices
// =============================================================================

namespace {

// Serial as printed by adb for a local emulator; anything else is not ours
bool isValidEmulatorSerial(const std::string& serial) {
    if (serial.size() > 32 || !startsWith(serial, "emulator-")) return false;
    for (char c : serial) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') return false;
    }
    return true;
}

} // anonymous namespace

std::vector<std::string> parseEmulatorSerials(const std::string& adb_output) {
    std::vector<std::string> serials;
    std::istringstream iss(adb_output);
    std::string line;
    while (std::getline(iss, line)) {
        if (line.find("List of devices") != std::string::npos) continue;
        if (line.empty()) continue;

        size_t tab_pos = line.find('\t');
        if (tab_pos == std::string::npos) continue;

        std::string id = line.substr(0, tab_pos);
        std::string state = trim(line.substr(tab_pos + 1));
        if (state == "device" && isValidEmulatorSerial(id)) {
            serials.push_back(id);
        }
    }
    return serials;
}

// =============================================================================
// sdkmanager --list
// =============================================================================

std::vector<SystemImage> parseInstalledSystemImages(const std::string& output) {
    std::vector<SystemImage> images;
    std::set<std::string> seen;
    bool installed = false;

    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        const std::string t = trim(line);
        if (startsWith(t, "Installed packages:")) {
            installed = true;
            continue;
        }
        if (startsWith(t, "Available Packages:") || startsWith(t, "Available Updates:")) {
            installed = false;
            continue;
        }
        if (!installed || !startsWith(t, "system-images;")) continue;

        std::string package = t.substr(0, t.find_first_of(" \t|"));
        if (!seen.insert(package).second) continue;

        // system-images;android-34;google_apis;x86_64
        std::vector<std::string> parts;
        std::stringstream ps(package);
        std::string part;
        while (std::getline(ps, part, ';')) parts.push_back(part);
        if (parts.size() < 4 || !startsWith(parts[1], "android-")) continue;

        const std::string level = parts[1].substr(std::strlen("android-"));
        if (level.empty() || !std::all_of(level.begin(), level.end(),
                                          [](unsigned char c) { return std::isdigit(c); })) {
            continue;   // preview codenames
        }
        auto api = parseInt(level);
        if (!api) continue;
        images.push_back({package, *api, parts[2], parts[3]});
    }
    return images;
}

Catalog apiLevelCatalog(const std::vector<SystemImage>& images) {
    std::set<int, std::greater<int>> levels;
    for (const auto& img : images) levels.insert(img.api_level);

    Catalog catalog;
    for (int level : levels) {
        const std::string version = androidVersionName(level);
        std::string display = "API " + std::to_string(level);
        if (version != "Unknown") display += " - Android " + version;
        catalog.emplace_back(std::to_string(level), display);
    }
    return catalog;
}

std::optional<SystemImage> selectSystemImage(const std::vector<SystemImage>& images,
                                             int api_level, const std::string& preferred_tag) {
    std::vector<SystemImage> candidates;
    for (const auto& img : images) {
        if (img.api_level == api_level) candidates.push_back(img);
    }
    if (candidates.empty()) return std::nullopt;

    std::vector<std::string> tags;
    for (const std::string& tag : {preferred_tag, std::string("google_apis_playstore"),
                                   std::string("google_apis"), std::string("default")}) {
        if (!tag.empty() && std::find(tags.begin(), tags.end(), tag) == tags.end()) {
            tags.push_back(tag);
        }
    }

    for (const auto& tag : tags) {
        const SystemImage* any_abi = nullptr;
        for (const auto& img : candidates) {
            if (img.tag != tag) continue;
            if (img.abi == hostAbi()) return img;
            if (!any_abi) any_abi = &img;
        }
        if (any_abi) return *any_abi;
    }
    for (const auto& img : candidates) {
        if (img.abi == hostAbi()) return img;
    }
    return candidates.front();
}

// =============================================================================
// Names and sizes
// =============================================================================

std::string sanitizeAvdName(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '.' || c == '-') {
            out += c;
        } else if (c == ' ' || c == '_') {
            if (out.empty() || out.back() != '_') out += '_';
        }
    }
    size_t b = out.find_first_not_of('_');
    if (b == std::string::npos) return std::string();
    size_t e = out.find_last_not_of('_');
    return out.substr(b, e - b + 1);
}

std::optional<std::string> formatSizeMb(const std::string& value) {
    static const std::regex re(R"(^\s*(\d+)\s*([MmGg]?)[Bb]?\s*$)");
    std::smatch m;
    if (!std::regex_match(value, m, re)) return std::nullopt;
    auto parsed = parseUint64(m[1].str());
    if (!parsed) return std::nullopt;
    uint64_t n = *parsed;
    const std::string unit = m[2].str();
    if (unit == "G" || unit == "g") {
        if (n > UINT64_MAX / 1024) return std::nullopt;
        n *= 1024;
    }
    return std::to_string(n) + " MB";
}

} // namespace android

// =============================================================================
// AndroidSdkPaths
// =============================================================================

namespace {

std::string envOr(const char* name, const std::string& def = std::string()) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : def;
}

bool isExecutable(const std::string& path) {
    return ::access(path.c_str(), X_OK) == 0;
}

std::optional<std::string> findTool(const std::string& root, std::initializer_list<const char*> rel) {
    for (const char* r : rel) {
        std::string candidate = root + "/" + r;
        if (isExecutable(candidate)) return candidate;
    }
    return std::nullopt;
}

std::string defaultAvdHome() {
    std::string avd_home = envOr("ANDROID_AVD_HOME");
    if (!avd_home.empty()) return avd_home;
    std::string home = envOr("HOME");
    return home.empty() ? std::string(".android/avd") : home + "/.android/avd";
}

std::string spacesToUnderscores(std::string s) {
    std::replace(s.begin(), s.end(), ' ', '_');
    return s;
}

bool sameAvdName(const std::string& avd_name, const std::string& id) {
    return avd_name == id || spacesToUnderscores(avd_name) == spacesToUnderscores(id);
}

// "pixel_7 (Google)" -> "pixel_7"
std::string deviceIdOf(const std::string& device) {
    auto paren = device.find(" (");
    return paren == std::string::npos ? device : device.substr(0, paren);
}

std::optional<std::string> findRunningSerial(const std::map<std::string, std::string>& running,
                                             const std::string& avd_name) {
    auto it = running.find(avd_name);
    if (it == running.end()) it = running.find(spacesToUnderscores(avd_name));
    if (it == running.end()) return std::nullopt;
    return it->second;
}

std::string withMegabyteSuffix(const std::string& size) {
    if (!size.empty() && std::isdigit(static_cast<unsigned char>(size.back()))) return size + "M";
    return size;
}

} // anonymous namespace

AndroidSdkPaths AndroidSdkPaths::fromSdkRoot(const std::string& root, const std::string& avd_home) {
    AndroidSdkPaths p;
    p.sdk_root = root;
    p.avd_home = avd_home;
    p.avdmanager = root + "/cmdline-tools/latest/bin/avdmanager";
    p.sdkmanager = root + "/cmdline-tools/latest/bin/sdkmanager";
    p.adb = root + "/platform-tools/adb";
    p.emulator = root + "/emulator/emulator";
    return p;
}

Result<AndroidSdkPaths> AndroidSdkPaths::fromEnvironment() {
    std::string root = envOr("ANDROID_HOME");
    if (root.empty()) root = envOr("ANDROID_SDK_ROOT");
    if (root.empty()) {
        return Err<AndroidSdkPaths>("Android SDK not found. Please set ANDROID_HOME or ANDROID_SDK_ROOT",
                                    ErrorCode::ToolNotFound);
    }

    AndroidSdkPaths p;
    p.sdk_root = root;
    p.avd_home = defaultAvdHome();

    auto avdmanager = findTool(root, {"cmdline-tools/latest/bin/avdmanager", "tools/bin/avdmanager"});
    if (!avdmanager) {
        return Err<AndroidSdkPaths>("Tool 'avdmanager' not found in Android SDK at " + root,
                                    ErrorCode::ToolNotFound);
    }
    auto emulator = findTool(root, {"emulator/emulator", "tools/emulator"});
    if (!emulator) {
        return Err<AndroidSdkPaths>("Tool 'emulator' not found in Android SDK at " + root,
                                    ErrorCode::ToolNotFound);
    }
    p.avdmanager = *avdmanager;
    p.emulator = *emulator;

    // Optional tools fall back to PATH lookup
    p.sdkmanager = findTool(root, {"cmdline-tools/latest/bin/sdkmanager", "tools/bin/sdkmanager"})
                       .value_or("sdkmanager");
    p.adb = findTool(root, {"platform-tools/adb"}).value_or("adb");

    ELOG_INFO("android", "SDK root %s (avd home %s)", p.sdk_root.c_str(), p.avd_home.c_str());
    return p;
}

// =============================================================================
// AndroidManager
// =============================================================================

AndroidManager::AndroidManager(std::shared_ptr<CommandExecutor> executor, AndroidSdkPaths paths,
                               config::AndroidConfig options, int retries)
    : executor_(std::move(executor)), paths_(std::move(paths)),
      options_(std::move(options)), retries_(retries) {}

Result<std::unique_ptr<AndroidManager>> AndroidManager::create(
        std::shared_ptr<CommandExecutor> executor, const config::AndroidConfig& options, int retries) {
    auto paths = EMU_TRY(AndroidSdkPaths::fromEnvironment());
    return std::make_unique<AndroidManager>(std::move(executor), std::move(paths), options, retries);
}

Result<std::vector<android::AvdRecord>> AndroidManager::listAvds() {
    const CommandArgs args = {"list", "avd"};
    auto output = EMU_TRY(executor_->runWithRetry(paths_.avdmanager, args, retries_));
    auto records = android::parseAvdList(output);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_known_ = records;
    }
    return records;
}

Result<android::AvdRecord> AndroidManager::resolveAvd(const std::string& id) {
    auto match = [&id](const std::vector<android::AvdRecord>& records)
            -> std::optional<android::AvdRecord> {
        for (const auto& r : records) {
            if (sameAvdName(r.name, id)) return r;
        }
        return std::nullopt;
    };

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto found = match(last_known_)) return *found;
    }
    auto fresh = EMU_TRY(listAvds());
    if (auto found = match(fresh)) return *found;
    return Err<android::AvdRecord>("Device '" + id + "' not found", ErrorCode::DeviceNotFound);
}

std::string AndroidManager::avdDirectory(const android::AvdRecord& record) const {
    if (!record.path.empty()) return record.path;
    return paths_.avd_home + "/" + record.name + ".avd";
}

int AndroidManager::resolveApiLevel(const android::AvdRecord& record) const {
    if (int api = android::apiLevelFromTarget(record.target)) return api;
    auto ini = android::readIniFile(avdDirectory(record) + "/config.ini");
    if (ini.is_ok()) {
        if (int api = android::apiLevelFromConfig(ini.value())) return api;
    }
    return android::apiLevelFromName(record.name);
}

std::optional<std::string> AndroidManager::queryAvdName(const std::string& serial) {
    const CommandArgs console = {"-s", serial, "emu", "avd", "name"};
    auto out = executor_->run(paths_.adb, console);
    if (out.is_ok()) {
        // Console answers "<name>\r\nOK"
        std::string name = android::trim(out.value().substr(0, out.value().find('\n')));
        if (!name.empty() && name != "OK" && name.find("error") == std::string::npos &&
            name.find("KO") == std::string::npos && name.find("unknown command") == std::string::npos) {
            return name;
        }
    }

    for (const char* prop : {"ro.boot.qemu.avd_name", "ro.kernel.qemu.avd_name"}) {
        const CommandArgs args = {"-s", serial, "shell", "getprop", prop};
        auto r = executor_->run(paths_.adb, args);
        if (r.is_ok()) {
            std::string name = android::trim(r.value());
            if (!name.empty()) return name;
        }
    }
    return std::nullopt;
}

Result<std::map<std::string, std::string>> AndroidManager::runningAvds() {
    const CommandArgs args = {"devices"};
    auto out = EMU_TRY(executor_->run(paths_.adb, args));

    std::map<std::string, std::string> running;
    for (const auto& serial : android::parseEmulatorSerials(out)) {
        auto name = queryAvdName(serial);
        if (!name) {
            ELOG_WARN("android", "Could not determine AVD name for %s", serial.c_str());
            continue;
        }
        running[*name] = serial;
        running.emplace(spacesToUnderscores(*name), serial);
    }
    return running;
}

Result<std::vector<AndroidDevice>> AndroidManager::listDevices() {
    auto records = EMU_TRY(listAvds());

    std::map<std::string, std::string> running;
    auto r = runningAvds();
    if (r.is_ok()) {
        running = std::move(r).value();
    } else {
        ELOG_WARN("android", "adb devices failed, treating AVDs as stopped: %s",
                  r.error().message.c_str());
    }

    std::vector<AndroidDevice> devices;
    devices.reserve(records.size());
    for (const auto& rec : records) {
        const bool is_running = findRunningSerial(running, rec.name).has_value();
        AndroidDevice dev(rec.name, deviceIdOf(rec.device), resolveApiLevel(rec),
                          is_running ? DeviceStatus::Running : DeviceStatus::Stopped);

        auto ini = android::readIniFile(avdDirectory(rec) + "/config.ini");
        if (ini.is_ok()) {
            const auto& values = ini.value();
            auto ram = values.find("hw.ramSize");
            if (ram != values.end() && !ram->second.empty()) dev.ram_size = ram->second;
            auto storage = values.find("disk.dataPartition.size");
            if (storage != values.end() && !storage->second.empty()) dev.storage_size = storage->second;
        }
        devices.push_back(std::move(dev));
    }

    std::stable_sort(devices.begin(), devices.end(),
                     [](const AndroidDevice& a, const AndroidDevice& b) {
                         auto pa = androidDevicePriority(a.device_type, a.name());
                         auto pb = androidDevicePriority(b.device_type, b.name());
                         if (pa != pb) return pa < pb;
                         return a.name() < b.name();
                     });

    ELOG_DEBUG("android", "Listed %zu AVDs (%zu running)", devices.size(), running.size());
    return devices;
}

Result<Catalog> AndroidManager::listAvailableDevices() {
    const CommandArgs args = {"list", "device"};
    auto output = EMU_TRY(executor_->runWithRetry(paths_.avdmanager, args, retries_));
    return android::parseDeviceDefinitions(output);
}

Result<std::vector<android::SystemImage>> AndroidManager::listSystemImages() {
    const CommandArgs args = {"--list", "--verbose", "--include_obsolete"};
    auto output = EMU_TRY(executor_->runWithRetry(paths_.sdkmanager, args, retries_));
    return android::parseInstalledSystemImages(output);
}

Result<Catalog> AndroidManager::listAvailableApiLevels() {
    auto images = EMU_TRY(listSystemImages());
    return android::apiLevelCatalog(images);
}

Result<void> AndroidManager::createDevice(const DeviceConfig& config) {
    const std::string name = android::sanitizeAvdName(config.name());
    if (name.empty()) {
        return Err<void>("Invalid device name '" + config.name() + "'", ErrorCode::ValidationFailed);
    }

    auto existing = EMU_TRY(listAvds());
    for (const auto& rec : existing) {
        if (rec.name == name) {
            return Err<void>("Device '" + name + "' already exists", ErrorCode::CreateFailed);
        }
    }

    auto images = EMU_TRY(listSystemImages());

    static const std::regex digits_re(R"((\d+))");
    std::smatch m;
    int api = 0;
    if (std::regex_search(config.version(), m, digits_re)) {
        auto parsed = parseInt(m[1].str());
        if (!parsed) {
            return Err<void>("Invalid API level '" + config.version() + "'", ErrorCode::ValidationFailed);
        }
        api = *parsed;
    }
    if (api == 0) api = options_.default_api_level;
    if (api == 0) {
        for (const auto& img : images) api = std::max(api, img.api_level);
    }

    auto tag_opt = config.options().find("tag");
    const std::string& tag = tag_opt != config.options().end() ? tag_opt->second : options_.default_tag;
    auto image = android::selectSystemImage(images, api, tag);
    if (!image) {
        return Err<void>("No system image installed for API " + std::to_string(api) +
                         ". Install one with: sdkmanager \"system-images;android-" +
                         std::to_string(api) + ";" + tag + ";x86_64\"",
                         ErrorCode::CreateFailed);
    }

    CommandArgs args = {"create", "avd", "-n", name, "-k", image->package};
    if (!config.deviceType().empty()) {
        args.push_back("--device");
        args.push_back(config.deviceType());
    }

    ELOG_INFO("android", "Creating AVD %s from %s", name.c_str(), image->package.c_str());
    // avdmanager asks whether to create a custom hardware profile
    auto created = executor_->runWithInput(paths_.avdmanager, args, "no\n");
    if (created.is_err()) {
        ELOG_ERROR("android", "avdmanager create failed for %s: %s", name.c_str(),
                   created.error().message.c_str());
        return Err<void>(created.error().message, ErrorCode::CreateFailed);
    }

    const std::string ram = config.ramSize().value_or(options_.default_ram);
    const std::string storage = config.storageSize().value_or(options_.default_storage);
    android::IniValues tuning = {
        {"hw.ramSize", ram},
        {"disk.dataPartition.size", withMegabyteSuffix(storage)},
    };
    const std::string ini_path = paths_.avd_home + "/" + name + ".avd/config.ini";
    auto tuned = android::updateIniFile(ini_path, tuning);
    if (tuned.is_err()) {
        ELOG_WARN("android", "AVD %s created without RAM/storage settings: %s", name.c_str(),
                  tuned.error().message.c_str());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_known_.clear();
    }
    ELOG_INFO("android", "Created AVD %s (API %d)", name.c_str(), api);
    return Ok();
}

Result<void> AndroidManager::startDevice(const std::string& id) {
    auto avd = EMU_TRY(resolveAvd(id));
    const CommandArgs args = {"-avd", avd.name, "-no-audio", "-no-snapshot-save",
                              "-no-boot-anim", "-netfast"};
    auto pid = executor_->spawn(paths_.emulator, args);
    if (pid.is_err()) {
        ELOG_ERROR("android", "Failed to launch emulator for %s: %s", avd.name.c_str(),
                   pid.error().message.c_str());
        return pid.error();
    }
    ELOG_INFO("android", "Emulator for %s launched (pid %d)", avd.name.c_str(), pid.value());
    return Ok();
}

Result<void> AndroidManager::stopIfRunning(const std::string& avd_name) {
    auto running = EMU_TRY(runningAvds());
    auto serial = findRunningSerial(running, avd_name);
    if (!serial) {
        ELOG_DEBUG("android", "%s is not running", avd_name.c_str());
        return Ok();
    }
    const CommandArgs args = {"-s", *serial, "emu", "kill"};
    auto killed = executor_->run(paths_.adb, args);
    if (killed.is_err()) return killed.error();
    ELOG_INFO("android", "Stopped %s (%s)", avd_name.c_str(), serial->c_str());
    return Ok();
}

Result<void> AndroidManager::streamLogs(const std::string& id, const LogSink& sink,
                                        const std::atomic<bool>& stop) {
    auto avd = EMU_TRY(resolveAvd(id));
    auto running = EMU_TRY(runningAvds());
    auto serial = findRunningSerial(running, avd.name);
    if (!serial) {
        return Err<void>("Device '" + avd.name + "' is not running", ErrorCode::DeviceNotFound);
    }

    ELOG_INFO("android", "Following logcat of %s (%s)", avd.name.c_str(), serial->c_str());
    const CommandArgs args = {"-s", *serial, "logcat", "-v", "time"};
    return executor_->streamLines(paths_.adb, args, [&sink](const std::string& line) {
        if (line.find_first_not_of(" \t") == std::string::npos) return;
        sink(android::logcatLevel(line), line);
    }, stop);
}

Result<void> AndroidManager::stopDevice(const std::string& id) {
    auto avd = EMU_TRY(resolveAvd(id));
    return stopIfRunning(avd.name);
}

Result<void> AndroidManager::deleteDevice(const std::string& id) {
    auto avd = EMU_TRY(resolveAvd(id));
    EMU_TRY_VOID(stopIfRunning(avd.name));

    const CommandArgs args = {"delete", "avd", "-n", avd.name};
    auto deleted = executor_->run(paths_.avdmanager, args);
    if (deleted.is_err()) {
        ELOG_ERROR("android", "Failed to delete %s: %s", avd.name.c_str(),
                   deleted.error().message.c_str());
        return deleted.error();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_known_.erase(std::remove_if(last_known_.begin(), last_known_.end(),
                                         [&](const android::AvdRecord& r) { return r.name == avd.name; }),
                          last_known_.end());
    }
    ELOG_INFO("android", "Deleted AVD %s", avd.name.c_str());
    return Ok();
}

Result<void> AndroidManager::wipeDevice(const std::string& id) {
    namespace fs = std::filesystem;

    auto avd = EMU_TRY(resolveAvd(id));
    EMU_TRY_VOID(stopIfRunning(avd.name));

    const fs::path dir = avdDirectory(avd);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Err<void>("AVD directory not found: " + dir.string(), ErrorCode::Io);
    }

    // Recreated from the system image on next boot
    static const char* kUserDataFiles[] = {
        "userdata.img", "userdata-qemu.img", "userdata.img.qcow2", "userdata-qemu.img.qcow2",
        "cache.img", "cache.img.qcow2", "sdcard.img", "sdcard.img.qcow2", "multiinstance.lock",
    };
    for (const char* file : kUserDataFiles) {
        fs::remove(dir / file, ec);
        if (ec) {
            ELOG_WARN("android", "Failed to remove %s: %s", (dir / file).string().c_str(),
                      ec.message().c_str());
        }
    }
    fs::remove_all(dir / "snapshots", ec);
    if (ec) {
        ELOG_WARN("android", "Failed to remove snapshots of %s: %s", avd.name.c_str(),
                  ec.message().c_str());
    }

    ELOG_INFO("android", "Wiped user data of %s", avd.name.c_str());
    return Ok();
}

Result<DeviceDetails> AndroidManager::getDeviceDetails(const std::string& id) {
    auto avd = EMU_TRY(resolveAvd(id));

    bool is_running = false;
    auto running = runningAvds();
    if (running.is_ok()) is_running = findRunningSerial(running.value(), avd.name).has_value();

    const int api = resolveApiLevel(avd);
    DeviceDetails details;
    details.name = avd.name;
    details.status = is_running ? "Running" : "Stopped";
    details.platform = Platform::Android;
    details.device_type = deviceIdOf(avd.device);
    details.api_level_or_version =
        "API " + std::to_string(api) + " (Android " + androidVersionName(api) + ")";
    details.identifier = avd.name;

    const std::string dir = avdDirectory(avd);
    auto ini = android::readIniFile(dir + "/config.ini");
    if (ini.is_err()) {
        ELOG_DEBUG("android", "No config.ini for %s: %s", avd.name.c_str(), ini.error().message.c_str());
        return details;
    }

    const auto& v = ini.value();
    auto get = [&v](const char* key) -> std::string {
        auto it = v.find(key);
        return it == v.end() ? std::string() : it->second;
    };
    details.ram_size = android::formatSizeMb(get("hw.ramSize"));
    details.storage_size = android::formatSizeMb(get("disk.dataPartition.size"));
    const std::string width = get("hw.lcd.width");
    const std::string height = get("hw.lcd.height");
    if (!width.empty() && !height.empty()) details.resolution = width + "x" + height;
    const std::string density = get("hw.lcd.density");
    if (!density.empty()) details.dpi = density + " DPI";
    const std::string sysdir = get("image.sysdir.1");
    if (!sysdir.empty()) details.system_image = sysdir;
    details.device_path = dir;
    return details;
}

} // namespace emu
