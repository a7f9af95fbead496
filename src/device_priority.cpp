#include "device_priority.hpp"
#include "emu_constants.hpp"
#include "parse_number.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace emu {

namespace {

// Family bases (Android)
constexpr uint32_t PIXEL_UNVERSIONED = 25;
constexpr uint32_t PIXEL_MAX = 19;
constexpr uint32_t PIXEL_VERSION_CEILING = 20;
constexpr uint32_t PHONE_BASE = 100;
constexpr uint32_t FOLDABLE_BASE = 200;
constexpr uint32_t TABLET_BASE = 300;
constexpr uint32_t TV_BASE = 400;
constexpr uint32_t WEAR_BASE = 500;
constexpr uint32_t AUTOMOTIVE_BASE = 600;
constexpr uint32_t DESKTOP_BASE = 700;
constexpr uint32_t ANDROID_VERSION_CEILING = 50;

// Family bases (iOS)
constexpr uint32_t IPHONE_BASE = 0;
constexpr uint32_t IPAD_BASE = 300;
constexpr uint32_t APPLE_TV_BASE = 600;
constexpr uint32_t WATCH_BASE = 700;
constexpr uint32_t IOS_VARIANT_STEP = 40;
constexpr uint32_t IOS_VERSION_CEILING = 30;

std::string lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// lower-case, '_' and '-' become spaces so "pixel_9" and "iPhone-15" tokenize
std::string normalize(const std::string& s) {
    std::string out = lower(s);
    std::replace(out.begin(), out.end(), '_', ' ');
    std::replace(out.begin(), out.end(), '-', ' ');
    return out;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

bool containsWord(const std::string& haystack, const char* word) {
    std::regex re(std::string("\\b") + word + "\\b");
    return std::regex_search(haystack, re);
}

uint32_t versionTerm(std::optional<uint32_t> v, uint32_t ceiling) {
    if (!v) return ceiling;
    return ceiling - std::min(*v, ceiling);
}

// "iPad (10th generation)" -> 10
std::optional<uint32_t> extractGeneration(const std::string& normalized) {
    static const std::regex gen_re(R"((\d+)(?:st|nd|rd|th)\s+generation)");
    std::smatch m;
    if (std::regex_search(normalized, m, gen_re)) return parseUint32(m[1].str());
    return std::nullopt;
}

uint32_t oemOffset(const std::string& combined, const std::string& display_name) {
    if (contains(combined, "google") || contains(combined, "pixel")) return 0;
    if (contains(combined, "samsung") || contains(combined, "galaxy")) return 10;
    if (contains(combined, "oneplus")) return 20;

    // "Name (OEM)" suffix from avdmanager list device
    auto open = display_name.find('(');
    auto close = display_name.find(')', open == std::string::npos ? 0 : open);
    if (open != std::string::npos && close != std::string::npos) {
        std::string oem = lower(display_name.substr(open + 1, close - open - 1));
        static const char* known[] = {"xiaomi", "asus", "oppo", "vivo", "huawei",
                                      "motorola", "lenovo", "sony"};
        for (const char* k : known) {
            if (oem == k) return 30;
        }
    }
    return 40;
}

} // anonymous namespace

const char* deviceCategoryStr(DeviceCategory c) {
    switch (c) {
        case DeviceCategory::Phone:      return "phone";
        case DeviceCategory::Tablet:     return "tablet";
        case DeviceCategory::Wear:       return "wear";
        case DeviceCategory::Tv:         return "tv";
        case DeviceCategory::Automotive: return "automotive";
        case DeviceCategory::Desktop:    return "desktop";
    }
    return "phone";
}

DeviceCategory categorizeDevice(const std::string& device_id, const std::string& display_name) {
    const std::string s = normalize(device_id + " " + display_name);

    auto inch = [&](const char* size) {
        return containsWord(s, size) && contains(s, "inch");
    };

    if (contains(s, "tablet") || contains(s, "pad") ||
        inch("10") || inch("11") || inch("12") || inch("13")) {
        return DeviceCategory::Tablet;
    }
    if (contains(s, "wear") || contains(s, "watch") || contains(s, "round") ||
        contains(s, "square")) {
        return DeviceCategory::Wear;
    }
    if (containsWord(s, "tv") || contains(s, "1080p") || contains(s, "720p") ||
        containsWord(s, "4k")) {
        return DeviceCategory::Tv;
    }
    if (contains(s, "automotive") || containsWord(s, "auto") || containsWord(s, "car")) {
        return DeviceCategory::Automotive;
    }
    if (contains(s, "desktop") || (contains(s, "foldable") && contains(s, "large")) ||
        inch("15") || inch("17")) {
        return DeviceCategory::Desktop;
    }
    return DeviceCategory::Phone;
}

bool matchesCategoryFilter(const std::string& filter, const std::string& device_id,
                           const std::string& display_name) {
    if (filter.empty() || filter == "all") return true;
    return filter == deviceCategoryStr(categorizeDevice(device_id, display_name));
}

std::optional<uint32_t> extractDeviceVersion(const std::string& text) {
    static const std::regex api_re(R"(\bapi\s*\d+)");
    static const std::regex family_res[] = {
        std::regex(R"(pixel\s?(\d+))"),
        std::regex(R"(galaxy\s?s(\d+))"),
        std::regex(R"(galaxy\s?z\s?(?:fold|flip)\s?(\d+))"),
        std::regex(R"(oneplus\s?(\d+))"),
        std::regex(R"(nexus\s?(\d+))"),
        std::regex(R"(iphone\s?(\d+))"),
        std::regex(R"(series\s?(\d+))"),
        std::regex(R"((\d+)\s?(?:pro|plus|ultra))"),
    };
    // A single trailing letter is part of the version token ("16e", "9a")
    static const std::regex any_number_re(R"(\b(\d{1,2})[a-z]?\b)");

    const std::string s = std::regex_replace(normalize(text), api_re, " ");

    std::smatch m;
    for (const auto& re : family_res) {
        if (std::regex_search(s, m, re)) return parseUint32(m[1].str());
    }

    std::optional<uint32_t> best;
    for (auto it = std::sregex_iterator(s.begin(), s.end(), any_number_re);
         it != std::sregex_iterator(); ++it) {
        const uint32_t v = parseUint32((*it)[1].str()).value_or(0);
        if (v > 0 && v <= 50 && (!best || v > *best)) best = v;
    }
    return best;
}

uint32_t androidDevicePriority(const std::string& device_id, const std::string& display_name) {
    if (device_id.empty() && display_name.empty()) return constants::PRIORITY_UNKNOWN;

    const std::string combined = normalize(device_id + " " + display_name);
    const auto version = extractDeviceVersion(device_id + " " + display_name);
    const bool foldable = contains(combined, "fold") || contains(combined, "flip");
    const DeviceCategory category = categorizeDevice(device_id, display_name);

    if (category == DeviceCategory::Phone && !foldable &&
        contains(combined, "pixel") && !contains(combined, "nexus")) {
        if (!version) return PIXEL_UNVERSIONED;
        return std::min(PIXEL_VERSION_CEILING - std::min(*version, PIXEL_VERSION_CEILING), PIXEL_MAX);
    }

    uint32_t base = PHONE_BASE;
    switch (category) {
        case DeviceCategory::Phone:      base = foldable ? FOLDABLE_BASE : PHONE_BASE; break;
        case DeviceCategory::Tablet:     base = TABLET_BASE; break;
        case DeviceCategory::Tv:         base = TV_BASE; break;
        case DeviceCategory::Wear:       base = WEAR_BASE; break;
        case DeviceCategory::Automotive: base = AUTOMOTIVE_BASE; break;
        case DeviceCategory::Desktop:    base = DESKTOP_BASE; break;
    }
    return base + oemOffset(combined, display_name) + versionTerm(version, ANDROID_VERSION_CEILING);
}

uint32_t iosDevicePriority(const std::string& display_name) {
    const std::string s = normalize(display_name);
    if (s.empty()) return constants::PRIORITY_UNKNOWN;

    if (contains(s, "iphone")) {
        uint32_t rank = 3;
        if (contains(s, "pro max"))                        rank = 0;
        else if (containsWord(s, "pro"))                   rank = 1;
        else if (containsWord(s, "plus") || containsWord(s, "max")) rank = 2;
        else if (containsWord(s, "mini"))                  rank = 4;
        else if (containsWord(s, "se"))                    rank = 5;
        return IPHONE_BASE + rank * IOS_VARIANT_STEP +
               versionTerm(extractDeviceVersion(display_name), IOS_VERSION_CEILING);
    }

    if (contains(s, "ipad")) {
        uint32_t rank = 4;
        if (containsWord(s, "pro")) {
            if (contains(s, "12.9") || containsWord(s, "13")) rank = 0;
            else if (containsWord(s, "11"))                  rank = 1;
            else                                             rank = 2;
        } else if (containsWord(s, "air")) {
            rank = 3;
        } else if (containsWord(s, "mini")) {
            rank = 5;
        }
        return IPAD_BASE + rank * IOS_VARIANT_STEP +
               versionTerm(extractGeneration(s), IOS_VERSION_CEILING);
    }

    if (containsWord(s, "tv")) {
        uint32_t rank = contains(s, "4k") ? 0 : 1;
        return APPLE_TV_BASE + rank * IOS_VARIANT_STEP / 2 +
               versionTerm(extractGeneration(s), 10);
    }

    if (contains(s, "watch")) {
        if (containsWord(s, "ultra")) {
            return WATCH_BASE + versionTerm(extractDeviceVersion(display_name), IOS_VERSION_CEILING);
        }
        if (contains(s, "series")) {
            return WATCH_BASE + IOS_VARIANT_STEP +
                   versionTerm(extractDeviceVersion(display_name), IOS_VERSION_CEILING);
        }
        if (containsWord(s, "se")) return WATCH_BASE + 2 * IOS_VARIANT_STEP;
        return WATCH_BASE + 2 * IOS_VARIANT_STEP + 10;
    }

    return constants::PRIORITY_UNKNOWN;
}

} // namespace emu
