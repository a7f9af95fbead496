// =============================================================================
// Unit tests for device categorization and ordering (src/device_priority.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "device_priority.hpp"
#include "emu_constants.hpp"

using namespace emu;

// ---------------------------------------------------------------------------
// Categories
// ---------------------------------------------------------------------------
TEST(DeviceCategoryTest, AvdNames) {
    EXPECT_EQ(categorizeDevice("Pixel_7_API_34", ""), DeviceCategory::Phone);
    EXPECT_EQ(categorizeDevice("Pixel_Tablet_API_33", ""), DeviceCategory::Tablet);
    EXPECT_EQ(categorizeDevice("Wear_OS_Round_API_30", ""), DeviceCategory::Wear);
}

TEST(DeviceCategoryTest, CatalogEntries) {
    EXPECT_EQ(categorizeDevice("tv_1080p", "Android TV (1080p)"), DeviceCategory::Tv);
    EXPECT_EQ(categorizeDevice("automotive_1024p_landscape", "Automotive (1024p landscape)"),
              DeviceCategory::Automotive);
    EXPECT_EQ(categorizeDevice("desktop_medium", "Medium Desktop"), DeviceCategory::Desktop);
    EXPECT_EQ(categorizeDevice("10.1in WXGA (Tablet)", "10.1\" WXGA (Tablet)"), DeviceCategory::Tablet);
}

TEST(DeviceCategoryTest, TabletBeatsPhoneBrand) {
    EXPECT_EQ(categorizeDevice("pixel_tablet", "Pixel Tablet (Google)"), DeviceCategory::Tablet);
    EXPECT_EQ(categorizeDevice("galaxy_tab", "Galaxy Tab S9 Tablet"), DeviceCategory::Tablet);
}

TEST(DeviceCategoryTest, DefaultIsPhone) {
    EXPECT_EQ(categorizeDevice("", ""), DeviceCategory::Phone);
    EXPECT_EQ(categorizeDevice("something_odd", "Something Odd"), DeviceCategory::Phone);
}

TEST(DeviceCategoryTest, Filter) {
    EXPECT_TRUE(matchesCategoryFilter("all", "tv_1080p", "Android TV"));
    EXPECT_TRUE(matchesCategoryFilter("tv", "tv_1080p", "Android TV"));
    EXPECT_FALSE(matchesCategoryFilter("phone", "tv_1080p", "Android TV"));
    EXPECT_TRUE(matchesCategoryFilter("phone", "pixel_7", "Pixel 7 (Google)"));
}

// ---------------------------------------------------------------------------
// Version extraction
// ---------------------------------------------------------------------------
TEST(DeviceVersionTest, FamilyNumbers) {
    EXPECT_EQ(extractDeviceVersion("Pixel 9 (Google)"), 9u);
    EXPECT_EQ(extractDeviceVersion("pixel_7_pro"), 7u);
    EXPECT_EQ(extractDeviceVersion("iPhone 15 Pro Max"), 15u);
    EXPECT_EQ(extractDeviceVersion("Apple Watch Series 9 (45mm)"), 9u);
}

TEST(DeviceVersionTest, LetterSuffixIsSameVersion) {
    EXPECT_EQ(extractDeviceVersion("iPhone 16e"), 16u);
    EXPECT_EQ(extractDeviceVersion("iPhone 16e"), extractDeviceVersion("iPhone 16"));
}

TEST(DeviceVersionTest, ApiLevelIsNotAVersion) {
    EXPECT_EQ(extractDeviceVersion("Pixel_7_API_34"), 7u);
    EXPECT_FALSE(extractDeviceVersion("Medium Phone API 35").has_value());
}

TEST(DeviceVersionTest, OversizedNumberIsNoVersion) {
    EXPECT_FALSE(extractDeviceVersion("Pixel 99999999999").has_value());
    EXPECT_FALSE(extractDeviceVersion("iPhone 4294967296").has_value());
    EXPECT_EQ(androidDevicePriority("pixel_99999999999", "Pixel 99999999999"),
              androidDevicePriority("pixel_99999999999", "Pixel 99999999999"));
}

// ---------------------------------------------------------------------------
// Android ordering
// ---------------------------------------------------------------------------
TEST(AndroidPriorityTest, NewerPixelFirst) {
    EXPECT_LT(androidDevicePriority("pixel_9", "Pixel 9 (Google)"),
              androidDevicePriority("pixel_7", "Pixel 7 (Google)"));
}

TEST(AndroidPriorityTest, FamilyOrder) {
    const uint32_t pixel = androidDevicePriority("pixel_7", "Pixel 7 (Google)");
    const uint32_t phone = androidDevicePriority("medium_phone", "Medium Phone (Generic)");
    const uint32_t tablet = androidDevicePriority("pixel_tablet", "Pixel Tablet (Google)");
    const uint32_t tv = androidDevicePriority("tv_1080p", "Android TV (1080p) (Google)");
    const uint32_t wear = androidDevicePriority("wearos_small_round", "Wear OS Small Round (Google)");

    EXPECT_LT(pixel, phone);
    EXPECT_LT(phone, tablet);
    EXPECT_LT(tablet, tv);
    EXPECT_LT(tv, wear);
}

TEST(AndroidPriorityTest, UnknownGetsSentinel) {
    EXPECT_EQ(androidDevicePriority("", ""), constants::PRIORITY_UNKNOWN);
}

TEST(AndroidPriorityTest, PureFunctionOfName) {
    EXPECT_EQ(androidDevicePriority("pixel_8", "Pixel 8 (Google)"),
              androidDevicePriority("pixel_8", "Pixel 8 (Google)"));
}

// ---------------------------------------------------------------------------
// iOS ordering
// ---------------------------------------------------------------------------
TEST(IosPriorityTest, FamilyOrder) {
    const uint32_t iphone = iosDevicePriority("iPhone 15");
    const uint32_t ipad = iosDevicePriority("iPad Pro 11-inch (M4)");
    const uint32_t tv = iosDevicePriority("Apple TV 4K (3rd generation)");
    const uint32_t watch = iosDevicePriority("Apple Watch Series 9 (45mm)");

    EXPECT_LT(iphone, ipad);
    EXPECT_LT(ipad, tv);
    EXPECT_LT(tv, watch);
}

TEST(IosPriorityTest, NewerAndProFirst) {
    EXPECT_LT(iosDevicePriority("iPhone 16"), iosDevicePriority("iPhone 15"));
    EXPECT_LT(iosDevicePriority("iPhone 15 Pro"), iosDevicePriority("iPhone 15"));
    EXPECT_EQ(iosDevicePriority("iPhone 16e"), iosDevicePriority("iPhone 16"));
}

TEST(IosPriorityTest, UnknownGetsSentinel) {
    EXPECT_EQ(iosDevicePriority(""), constants::PRIORITY_UNKNOWN);
    EXPECT_EQ(iosDevicePriority("Apple Vision Pro"), constants::PRIORITY_UNKNOWN);
}
