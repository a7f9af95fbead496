// =============================================================================
// emu - Headless Entry Point
// =============================================================================
// Runs the controller without a terminal front end:
//   emu [--debug] [--config PATH] [--log FILE] <command> [args]
//
//   list                          both device lists (default)
//   start|stop|wipe|delete NAME   lifecycle operation by name or id
//   create android NAME TYPE API  create an AVD
//   create ios NAME TYPE RUNTIME  create a simulator
//   catalog android|ios           device types and installed versions
// =============================================================================
#include "app_controller.hpp"
#include "android_manager.hpp"
#include "command_executor.hpp"
#include "config_loader.hpp"
#include "emu_log.hpp"
#include "event_bus.hpp"
#include "ios_manager.hpp"

#include <signal.h>
#include <cstdio>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

namespace {

struct Options {
    bool debug = false;
    std::string config_path;
    std::string log_path;
    std::vector<std::string> args;
};

void printUsage() {
    std::fprintf(stderr,
                 "usage: emu [--debug] [--config PATH] [--log FILE] <command> [args]\n"
                 "  list\n"
                 "  start|stop|wipe|delete NAME\n"
                 "  create android|ios NAME TYPE VERSION\n"
                 "  catalog android|ios\n");
}

bool parseOptions(int argc, char* argv[], Options& out) {
    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        if (std::strcmp(a, "--debug") == 0) {
            out.debug = true;
        } else if (std::strcmp(a, "--config") == 0 || std::strcmp(a, "--log") == 0) {
            if (i + 1 >= argc) return false;
            (a[2] == 'c' ? out.config_path : out.log_path) = argv[++i];
        } else if (std::strcmp(a, "--help") == 0 || std::strcmp(a, "-h") == 0) {
            return false;
        } else {
            out.args.emplace_back(a);
        }
    }
    if (out.args.empty()) out.args.emplace_back("list");
    return true;
}

bool parsePlatform(const std::string& s, emu::Platform& out) {
    if (s == "android") { out = emu::Platform::Android; return true; }
    if (s == "ios")     { out = emu::Platform::Ios; return true; }
    return false;
}

void printLists(const emu::AppState& s) {
    std::printf("Android (%zu)\n", s.androidDevices().size());
    for (const auto& d : s.androidDevices()) {
        std::printf("  %-32s API %-3d %-8s %s\n", d.name().c_str(), d.api_level,
                    emu::deviceStatusStr(d.status()), d.device_type.c_str());
    }
    std::printf("iOS (%zu)\n", s.iosDevices().size());
    for (const auto& d : s.iosDevices()) {
        std::printf("  %-32s %-10s %-8s %s\n", d.name().c_str(), d.runtime_version.c_str(),
                    emu::deviceStatusStr(d.status()), d.udid().c_str());
    }
}

// (platform, id, name) of the first device matching name or id
struct Target {
    emu::Platform platform;
    std::string id;
    std::string name;
};

std::optional<Target> findDevice(const emu::AppState& s, const std::string& key) {
    for (const auto& d : s.androidDevices()) {
        if (d.name() == key || d.id() == key) return Target{emu::Platform::Android, d.id(), d.name()};
    }
    for (const auto& d : s.iosDevices()) {
        if (d.name() == key || d.id() == key) return Target{emu::Platform::Ios, d.id(), d.name()};
    }
    return std::nullopt;
}

// Last notification is the outcome of the operation just run
int reportOutcome(const emu::AppController& controller) {
    return controller.withRead([](const emu::AppState& s) {
        if (s.notifications().empty()) return 0;
        const auto& n = s.notifications().back();
        std::printf("%s: %s\n", emu::notificationTypeStr(n.type), n.message.c_str());
        return n.type == emu::NotificationType::Error ? 1 : 0;
    });
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // Tools that exit before reading their stdin must not kill the process
    signal(SIGPIPE, SIG_IGN);

    Options opts;
    if (!parseOptions(argc, argv, opts)) {
        printUsage();
        return 2;
    }

    emu::config::AppConfig config = opts.config_path.empty()
        ? emu::config::loadConfig()
        : emu::config::loadConfig(opts.config_path, true);

    emu::log::setLogLevel(opts.debug ? emu::log::Level::Debug : emu::log::parseLevel(config.log.level));
    const std::string log_path = opts.log_path.empty() ? config.log.log_path : opts.log_path;
    if (!log_path.empty() && !emu::log::openLogFile(log_path.c_str())) {
        ELOG_WARN("main", "Cannot open log file %s", log_path.c_str());
    }
    ELOG_INFO("main", "emu starting");

    auto executor = std::make_shared<emu::CommandRunner>(std::chrono::milliseconds(config.command.timeout_ms));

    std::shared_ptr<emu::AndroidDeviceManager> android;
    auto android_result = emu::AndroidManager::create(executor, config.android, config.command.retries);
    if (android_result.is_ok()) {
        android = std::move(android_result).value();
    } else {
        ELOG_WARN("main", "Android unavailable: %s", android_result.error().message.c_str());
    }
    std::shared_ptr<emu::IosDeviceManager> ios = emu::IosManager::create(executor, config.command.retries);

    auto op_sub = emu::bus().subscribe<emu::DeviceOperationEvent>([](const emu::DeviceOperationEvent& e) {
        ELOG_INFO("main", "%s %s '%s': %s", emu::platformStr(e.platform), emu::deviceOperationStr(e.operation),
                  e.device_name.c_str(), e.success ? "ok" : e.message.c_str());
    });

    emu::AppController controller(android, ios, config);
    controller.refreshDevices();

    const std::string& cmd = opts.args[0];
    int rc = 0;

    if (cmd == "list") {
        controller.withRead([](const emu::AppState& s) { printLists(s); });
        rc = reportOutcome(controller);
    } else if (cmd == "start" || cmd == "stop" || cmd == "wipe" || cmd == "delete") {
        if (opts.args.size() < 2) {
            printUsage();
            return 2;
        }
        auto target = controller.withRead([&](const emu::AppState& s) { return findDevice(s, opts.args[1]); });
        if (!target) {
            std::fprintf(stderr, "Device '%s' not found\n", opts.args[1].c_str());
            return 1;
        }
        if (cmd == "start") controller.startDevice(target->platform, target->id, target->name);
        else if (cmd == "stop") controller.stopDevice(target->platform, target->id, target->name);
        else if (cmd == "wipe") controller.wipeDevice(target->platform, target->id, target->name);
        else controller.deleteDevice(target->platform, target->id, target->name);
        controller.waitForBackgroundTasks();
        rc = reportOutcome(controller);
    } else if (cmd == "create") {
        emu::Platform p;
        if (opts.args.size() < 5 || !parsePlatform(opts.args[1], p)) {
            printUsage();
            return 2;
        }
        controller.createDevice(p, emu::DeviceConfig(opts.args[2], opts.args[3], opts.args[4]));
        controller.waitForBackgroundTasks();
        rc = reportOutcome(controller);
    } else if (cmd == "catalog") {
        emu::Platform p;
        if (opts.args.size() < 2 || !parsePlatform(opts.args[1], p)) {
            printUsage();
            return 2;
        }
        controller.refreshMetadataAsync(p);
        controller.waitForBackgroundTasks();
        const auto snap = controller.metadataCache().snapshot(p);
        std::printf("Device types (%zu)\n", snap.device_types.size());
        for (const auto& [id, display] : snap.device_types) std::printf("  %-40s %s\n", id.c_str(), display.c_str());
        std::printf("Versions (%zu)\n", snap.versions.size());
        for (const auto& [id, display] : snap.versions) std::printf("  %-40s %s\n", id.c_str(), display.c_str());
        rc = reportOutcome(controller);
    } else {
        printUsage();
        rc = 2;
    }

    emu::bus().publish(emu::ShutdownEvent{});
    ELOG_INFO("main", "emu exiting (%d)", rc);
    emu::log::closeLogFile();
    return rc;
}
