#pragma once
// =============================================================================
// emu - Shared Constants
// =============================================================================
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace emu {

namespace constants {
    // --- Refresh / timing ---
    static constexpr std::chrono::milliseconds AUTO_REFRESH_INTERVAL{3000};
    static constexpr std::chrono::milliseconds FAST_REFRESH_INTERVAL{1000};   // while a device boots
    static constexpr std::chrono::milliseconds NOTIFICATION_AUTO_DISMISS{5000};
    static constexpr std::chrono::milliseconds EVENT_DEBOUNCE_TIMEOUT{10};
    static constexpr std::chrono::milliseconds NAVIGATION_BATCH_TIMEOUT{50};
    static constexpr std::chrono::milliseconds COMMAND_TIMEOUT{30000};
    static constexpr std::chrono::seconds METADATA_CACHE_TTL{300};
    static constexpr std::chrono::seconds DEVICE_CACHE_MAX_AGE{300};

    // --- Buffers ---
    static constexpr size_t MAX_LOG_ENTRIES = 1000;
    static constexpr size_t MAX_NOTIFICATIONS = 10;
    static constexpr size_t MAX_COMMAND_OUTPUT = 4 * 1024 * 1024;

    // --- Create-device limits (MB) ---
    static constexpr uint32_t MIN_RAM_MB = 512;
    static constexpr uint32_t MAX_RAM_MB = 8192;
    static constexpr uint32_t MIN_STORAGE_MB = 1024;
    static constexpr uint32_t MAX_STORAGE_MB = 65536;
    static constexpr uint32_t DEFAULT_RAM_MB = 2048;
    static constexpr uint32_t DEFAULT_STORAGE_MB = 8192;
    static constexpr size_t MAX_DEVICE_NAME_LENGTH = 50;

    // --- Priority sentinel (lower sorts earlier) ---
    static constexpr uint32_t PRIORITY_UNKNOWN = 999;

    static constexpr uint32_t DEVICE_CACHE_VERSION = 1;
} // namespace constants

} // namespace emu
