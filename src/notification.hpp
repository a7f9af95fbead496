#pragma once
// =============================================================================
// emu - Notifications
// =============================================================================
#include <chrono>
#include <optional>
#include <string>
#include "emu_constants.hpp"

namespace emu {

enum class NotificationType { Success, Error, Warning, Info };

inline const char* notificationTypeStr(NotificationType t) {
    switch (t) {
        case NotificationType::Success: return "Success";
        case NotificationType::Error:   return "Error";
        case NotificationType::Warning: return "Warning";
        case NotificationType::Info:    return "Info";
    }
    return "Info";
}

struct Notification {
    using Clock = std::chrono::steady_clock;

    NotificationType type = NotificationType::Info;
    std::string message;
    Clock::time_point created;
    // nullopt = persistent
    std::optional<std::chrono::milliseconds> auto_dismiss_after;

    static Notification make(NotificationType type, std::string message,
                             std::chrono::milliseconds dismiss = constants::NOTIFICATION_AUTO_DISMISS,
                             Clock::time_point now = Clock::now()) {
        return Notification{type, std::move(message), now, dismiss};
    }

    static Notification persistent(NotificationType type, std::string message,
                                   Clock::time_point now = Clock::now()) {
        return Notification{type, std::move(message), now, std::nullopt};
    }

    // True once strictly more than auto_dismiss_after has passed
    bool isExpired(Clock::time_point now) const {
        if (!auto_dismiss_after) return false;
        return now - created > *auto_dismiss_after;
    }
    bool isExpired() const { return isExpired(Clock::now()); }
};

} // namespace emu
