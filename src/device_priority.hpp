#pragma once
// =============================================================================
// emu - Device Categorization & Display Ordering
// =============================================================================
// Pure functions of the device id / display name. Lower priority values sort
// earlier. Only the relative ordering is meaningful:
//   Android: Pixel < other phones < foldables < tablets < TV < wear < auto < desktop
//   iOS:     iPhone < iPad < Apple TV < Apple Watch
// Within a family a higher extracted version sorts earlier.
// =============================================================================
#include <cstdint>
#include <optional>
#include <string>

namespace emu {

enum class DeviceCategory { Phone, Tablet, Wear, Tv, Automotive, Desktop };

const char* deviceCategoryStr(DeviceCategory c);   // "phone", "tablet", ...

// Substring heuristics over lower-cased "id name"; tablets are checked before
// phones, default Phone
DeviceCategory categorizeDevice(const std::string& device_id, const std::string& display_name);

// "all" matches everything, otherwise compares against deviceCategoryStr()
bool matchesCategoryFilter(const std::string& filter, const std::string& device_id,
                           const std::string& display_name);

// Version number embedded in a device name ("Pixel 9" -> 9, "iPhone 16e" -> 16).
// API level tokens ("API 34") are not versions
std::optional<uint32_t> extractDeviceVersion(const std::string& text);

uint32_t androidDevicePriority(const std::string& device_id, const std::string& display_name);
uint32_t iosDevicePriority(const std::string& display_name);

} // namespace emu
