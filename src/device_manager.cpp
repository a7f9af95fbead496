#include "device_manager.hpp"

namespace emu {

namespace {

bool has(const std::string& text, const char* needle) {
    return text.find(needle) != std::string::npos;
}

std::string firstLine(const std::string& text) {
    auto nl = text.find('\n');
    return nl == std::string::npos ? text : text.substr(0, nl);
}

} // anonymous namespace

std::string userFriendlyMessage(const Error& error, const std::string& device_name) {
    const std::string& text = error.message;

    if (error.is(ErrorCode::DeviceNotFound)) {
        return "Device '" + device_name + "' not found";
    }
    if (has(text, "licenses")) {
        return "Android SDK licenses not accepted. Run 'sdkmanager --licenses'";
    }
    if (has(text, "system image") || has(text, "not installed")) {
        return "Required system image not installed";
    }
    if (has(text, "already exists")) {
        return "Device '" + device_name + "' already exists";
    }
    if (error.is(ErrorCode::CreateFailed)) {
        if (has(text, "device") && has(text, "not found")) {
            return "Specified device type not found";
        }
        return "Failed to create device '" + device_name + "': " + firstLine(text);
    }
    if (error.is(ErrorCode::Timeout)) {
        return "Operation on '" + device_name + "' timed out";
    }
    return firstLine(text);
}

} // namespace emu
