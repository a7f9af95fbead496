// =============================================================================
// Unit tests for AppState (src/app_state.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include <cstdlib>
#include <string>
#include <vector>
#include "app_state.hpp"

using namespace emu;
using namespace std::chrono_literals;

namespace {

std::vector<AndroidDevice> androidList(size_t n) {
    std::vector<AndroidDevice> out;
    for (size_t i = 0; i < n; ++i) {
        out.emplace_back("AVD_" + std::to_string(i), "pixel_7", 34);
    }
    return out;
}

std::vector<IosDevice> iosList(size_t n) {
    std::vector<IosDevice> out;
    for (size_t i = 0; i < n; ++i) {
        out.emplace_back("iPhone " + std::to_string(i), "UDID-" + std::to_string(i),
                         "com.apple.CoreSimulator.SimDeviceType.iPhone-15", "17.0");
        out.back().runtime_version = "iOS 17.0";
    }
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// Initial state
// ---------------------------------------------------------------------------
TEST(AppStateTest, InitialState) {
    AppState s;
    EXPECT_EQ(s.mode(), Mode::Normal);
    EXPECT_EQ(s.activePanel(), Platform::Android);
    EXPECT_EQ(s.focusedPanel(), FocusedPanel::DeviceList);
    EXPECT_TRUE(s.isLoading());
    EXPECT_TRUE(s.notifications().empty());
    EXPECT_FALSE(s.selectedDevice().has_value());
    EXPECT_FALSE(s.selectedDeviceDetails().has_value());
    EXPECT_EQ(s.autoRefreshInterval(), 3000ms);
}

// ---------------------------------------------------------------------------
// Selection / navigation
// ---------------------------------------------------------------------------
TEST(AppStateTest, MoveWrapsBothWays) {
    AppState s;
    s.setAndroidDevices(androidList(3));

    s.moveUp();
    EXPECT_EQ(s.selectedIndex(Platform::Android), 2u);
    s.moveDown();
    EXPECT_EQ(s.selectedIndex(Platform::Android), 0u);
    s.moveDown();
    s.moveDown();
    EXPECT_EQ(s.selectedIndex(Platform::Android), 2u);
}

TEST(AppStateTest, MoveOnEmptyListIsNoOp) {
    AppState s;
    s.moveDown();
    s.moveBySteps(-7);
    EXPECT_EQ(s.selectedIndex(Platform::Android), 0u);
}

TEST(AppStateTest, MoveDownLenTimesIsIdentity) {
    for (size_t len = 1; len <= 6; ++len) {
        for (size_t start = 0; start < len; ++start) {
            AppState s;
            s.setAndroidDevices(androidList(len));
            s.setSelectedIndex(Platform::Android, start);
            for (size_t i = 0; i < len; ++i) s.moveDown();
            EXPECT_EQ(s.selectedIndex(Platform::Android), start) << "len " << len;
            for (size_t i = 0; i < len; ++i) s.moveUp();
            EXPECT_EQ(s.selectedIndex(Platform::Android), start) << "len " << len;
        }
    }
}

TEST(AppStateTest, MoveByStepsMatchesRepeatedSingleMoves) {
    const int steps[] = {-13, -5, -1, 0, 1, 2, 4, 9, 17};
    for (int n : steps) {
        AppState batched;
        AppState single;
        batched.setAndroidDevices(androidList(4));
        single.setAndroidDevices(androidList(4));
        batched.setSelectedIndex(Platform::Android, 1);
        single.setSelectedIndex(Platform::Android, 1);

        batched.moveBySteps(n);
        for (int i = 0; i < std::abs(n); ++i) {
            if (n > 0) single.moveDown();
            else single.moveUp();
        }
        EXPECT_EQ(batched.selectedIndex(Platform::Android), single.selectedIndex(Platform::Android))
            << "steps " << n;
    }
}

TEST(AppStateTest, MovesOnlyAffectActivePanel) {
    AppState s;
    s.setAndroidDevices(androidList(3));
    s.setIosDevices(iosList(3));
    s.nextPanel();
    ASSERT_EQ(s.activePanel(), Platform::Ios);

    s.moveDown();
    EXPECT_EQ(s.selectedIndex(Platform::Ios), 1u);
    EXPECT_EQ(s.selectedIndex(Platform::Android), 0u);

    s.nextPanel();
    EXPECT_EQ(s.activePanel(), Platform::Android);
}

TEST(AppStateTest, ReplacingListFollowsSelectedId) {
    AppState s;
    s.setAndroidDevices(androidList(4));
    s.setSelectedIndex(Platform::Android, 2);   // AVD_2

    auto reordered = androidList(4);
    std::swap(reordered[0], reordered[2]);
    s.setAndroidDevices(reordered);
    EXPECT_EQ(s.selectedIndex(Platform::Android), 0u);
    EXPECT_EQ(s.selectedDevice()->second, "AVD_2");
}

TEST(AppStateTest, ReplacingListClampsWhenSelectionGone) {
    AppState s;
    s.setAndroidDevices(androidList(5));
    s.setSelectedIndex(Platform::Android, 4);
    s.setAndroidDevices(androidList(2));
    EXPECT_EQ(s.selectedIndex(Platform::Android), 1u);

    s.setAndroidDevices({});
    EXPECT_EQ(s.selectedIndex(Platform::Android), 0u);
    EXPECT_EQ(s.selectedAndroidDevice(), nullptr);
}

TEST(AppStateTest, SelectedDeviceUsesActivePanel) {
    AppState s;
    s.setAndroidDevices(androidList(2));
    s.setIosDevices(iosList(2));
    s.setSelectedIndex(Platform::Ios, 1);

    EXPECT_EQ(s.selectedDevice()->first, "AVD_0");
    s.setActivePanel(Platform::Ios);
    auto sel = s.selectedDevice();
    ASSERT_TRUE(sel.has_value());
    EXPECT_EQ(sel->first, "iPhone 1");
    EXPECT_EQ(sel->second, "UDID-1");
}

// ---------------------------------------------------------------------------
// Scroll offset
// ---------------------------------------------------------------------------
TEST(AppStateTest, ScrollOffsetKeepsSelectionVisible) {
    AppState s;
    s.setAndroidDevices(androidList(10));

    EXPECT_EQ(s.scrollOffset(Platform::Android, 20), 0u);   // everything fits
    EXPECT_EQ(s.scrollOffset(Platform::Android, 0), 0u);

    s.setSelectedIndex(Platform::Android, 6);
    EXPECT_EQ(s.scrollOffset(Platform::Android, 4), 3u);     // selected at the bottom row
    s.syncScrollOffset(Platform::Android, 4);

    s.setSelectedIndex(Platform::Android, 4);
    EXPECT_EQ(s.scrollOffset(Platform::Android, 4), 3u);     // still visible, unchanged

    s.setSelectedIndex(Platform::Android, 1);
    EXPECT_EQ(s.scrollOffset(Platform::Android, 4), 1u);     // scrolled above the window
}

// ---------------------------------------------------------------------------
// Modes
// ---------------------------------------------------------------------------
TEST(AppStateTest, ModePayloadsMatchMode) {
    AppState s;
    EXPECT_EQ(s.createForm(), nullptr);

    s.enterCreateDevice(CreateDeviceForm::forAndroid());
    EXPECT_EQ(s.mode(), Mode::CreateDevice);
    ASSERT_NE(s.createForm(), nullptr);
    EXPECT_EQ(s.confirmDeleteDialog(), nullptr);

    s.enterConfirmDelete(ConfirmDialog{"Pixel 7", "Pixel_7", Platform::Android});
    EXPECT_EQ(s.mode(), Mode::ConfirmDelete);
    EXPECT_EQ(s.createForm(), nullptr);
    ASSERT_NE(s.confirmDeleteDialog(), nullptr);
    EXPECT_EQ(s.confirmDeleteDialog()->device_identifier, "Pixel_7");
    EXPECT_EQ(s.confirmWipeDialog(), nullptr);

    s.enterConfirmWipe(ConfirmDialog{"iPhone 15", "U1", Platform::Ios});
    EXPECT_EQ(s.mode(), Mode::ConfirmWipe);
    EXPECT_EQ(s.confirmWipeDialog()->platform, Platform::Ios);

    s.enterManageApiLevels(ApiLevelView{Platform::Android, {{"34", "API 34"}}, 0});
    EXPECT_EQ(s.mode(), Mode::ManageApiLevels);
    EXPECT_EQ(s.apiLevelView()->api_levels.size(), 1u);

    s.enterHelp();
    EXPECT_EQ(s.mode(), Mode::Help);
    EXPECT_EQ(s.apiLevelView(), nullptr);

    s.returnToNormal();
    EXPECT_EQ(s.mode(), Mode::Normal);
    EXPECT_STREQ(modeStr(s.mode()), "Normal");
}

// ---------------------------------------------------------------------------
// Notifications
// ---------------------------------------------------------------------------
TEST(AppStateTest, NotificationQueueEvictsOldest) {
    config::UiConfig ui;
    ui.max_notifications = 3;
    AppState s(ui);

    for (int i = 0; i < 5; ++i) s.addInfoNotification("n" + std::to_string(i));
    ASSERT_EQ(s.notifications().size(), 3u);
    EXPECT_EQ(s.notifications().front().message, "n2");
    EXPECT_EQ(s.notifications().back().message, "n4");
}

TEST(AppStateTest, ExpiredNotificationsAreDismissed) {
    AppState s;
    const auto t0 = AppState::Clock::now();
    s.addNotification(Notification::make(NotificationType::Success, "short", 100ms, t0));
    s.addNotification(Notification::make(NotificationType::Error, "long", 5000ms, t0));
    s.addNotification(Notification::persistent(NotificationType::Warning, "sticky", t0));

    s.dismissExpiredNotifications(t0 + 100ms);
    EXPECT_EQ(s.notifications().size(), 3u);     // not strictly past yet

    s.dismissExpiredNotifications(t0 + 101ms);
    ASSERT_EQ(s.notifications().size(), 2u);
    EXPECT_EQ(s.notifications().front().message, "long");

    s.dismissExpiredNotifications(t0 + 1h);
    ASSERT_EQ(s.notifications().size(), 1u);
    EXPECT_EQ(s.notifications().front().message, "sticky");
}

TEST(AppStateTest, TypedNotificationsUseConfiguredDismiss) {
    config::UiConfig ui;
    ui.notification_dismiss_ms = 1234;
    AppState s(ui);
    s.addErrorNotification("boom");
    ASSERT_EQ(s.notifications().size(), 1u);
    EXPECT_EQ(s.notifications()[0].type, NotificationType::Error);
    EXPECT_EQ(*s.notifications()[0].auto_dismiss_after, 1234ms);
}

TEST(AppStateTest, DismissByIndexAndAll) {
    AppState s;
    s.addInfoNotification("a");
    s.addWarningNotification("b");
    s.addSuccessNotification("c");

    s.dismissNotification(1);
    ASSERT_EQ(s.notifications().size(), 2u);
    EXPECT_EQ(s.notifications()[1].message, "c");
    s.dismissNotification(7);
    EXPECT_EQ(s.notifications().size(), 2u);

    s.dismissAllNotifications();
    EXPECT_TRUE(s.notifications().empty());
}

// ---------------------------------------------------------------------------
// Device logs
// ---------------------------------------------------------------------------
TEST(AppStateTest, LogBufferIsBoundedAndFollowsTail) {
    config::UiConfig ui;
    ui.max_log_entries = 3;
    AppState s(ui);

    for (int i = 0; i < 5; ++i) s.addLog("INFO", "line " + std::to_string(i));
    ASSERT_EQ(s.logs().size(), 3u);
    EXPECT_EQ(s.logs().front().message, "line 2");
    EXPECT_EQ(s.logs().front().timestamp.size(), 8u);     // HH:MM:SS
    EXPECT_EQ(s.logScrollOffset(), 2u);
    EXPECT_TRUE(s.isFollowingLogs());
}

TEST(AppStateTest, ManualScrollStopsFollowing) {
    AppState s;
    for (int i = 0; i < 10; ++i) s.addLog("INFO", "x");
    ASSERT_EQ(s.logScrollOffset(), 9u);

    s.scrollLogsUp();
    EXPECT_TRUE(s.manuallyScrolled());
    EXPECT_FALSE(s.isFollowingLogs());
    s.addLog("INFO", "new");
    EXPECT_EQ(s.logScrollOffset(), 8u);

    s.scrollLogsPageUp(5);
    EXPECT_EQ(s.logScrollOffset(), 3u);
    s.scrollLogsHalfPageUp(10);
    EXPECT_EQ(s.logScrollOffset(), 0u);
    s.scrollLogsPageDown(100);
    EXPECT_EQ(s.logScrollOffset(), 10u);

    s.scrollLogsToBottom();
    EXPECT_FALSE(s.manuallyScrolled());
    EXPECT_TRUE(s.isFollowingLogs());
    EXPECT_EQ(s.logScrollOffset(), 10u);
}

TEST(AppStateTest, AutoScrollToggle) {
    AppState s;
    s.toggleAutoScroll();
    EXPECT_FALSE(s.autoScroll());
    s.addLog("INFO", "a");
    s.addLog("INFO", "b");
    EXPECT_EQ(s.logScrollOffset(), 0u);

    s.scrollLogsDown();
    ASSERT_TRUE(s.manuallyScrolled());
    s.toggleAutoScroll();
    EXPECT_TRUE(s.autoScroll());
    EXPECT_FALSE(s.manuallyScrolled());
}

TEST(AppStateTest, LogFilterAndClear) {
    AppState s;
    s.addLog("INFO", "a");
    s.addLog("ERROR", "b");
    s.addLog("INFO", "c");

    s.toggleLogFilter(std::string("ERROR"));
    EXPECT_EQ(s.logScrollOffset(), 0u);
    auto filtered = s.filteredLogs();
    ASSERT_EQ(filtered.size(), 1u);
    EXPECT_EQ(filtered[0].message, "b");

    s.toggleLogFilter(std::nullopt);
    EXPECT_EQ(s.filteredLogs().size(), 3u);

    s.clearLogs();
    EXPECT_TRUE(s.logs().empty());
    EXPECT_EQ(s.logScrollOffset(), 0u);
}

TEST(AppStateTest, FullscreenToggle) {
    AppState s;
    EXPECT_FALSE(s.fullscreenLogs());
    s.toggleFullscreenLogs();
    EXPECT_TRUE(s.fullscreenLogs());
}

// ---------------------------------------------------------------------------
// Details snapshot
// ---------------------------------------------------------------------------
TEST(AppStateTest, BasicDetailsFromListRecord) {
    AppState s;
    auto devices = androidList(1);
    devices[0].setRunning(true);
    s.setAndroidDevices(devices);

    auto d = s.selectedDeviceDetails();
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->status, "Running");
    EXPECT_EQ(d->api_level_or_version, "API 34 (Android 14)");
    EXPECT_EQ(d->identifier, "AVD_0");

    s.setIosDevices(iosList(1));
    s.setActivePanel(Platform::Ios);
    d = s.selectedDeviceDetails();
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->status, "Shutdown");
    EXPECT_EQ(d->api_level_or_version, "iOS 17.0");
    EXPECT_EQ(d->identifier, "UDID-0");
}

TEST(AppStateTest, CachedDetailsOnlyForMatchingSelection) {
    AppState s;
    s.setAndroidDevices(androidList(2));

    DeviceDetails cached;
    cached.platform = Platform::Android;
    cached.identifier = "AVD_0";
    cached.status = "Running";
    cached.resolution = "1080x2400";
    s.updateCachedDeviceDetails(cached);

    EXPECT_EQ(s.selectedDeviceDetails()->resolution, std::optional<std::string>("1080x2400"));

    s.moveDown();
    auto other = s.selectedDeviceDetails();
    ASSERT_TRUE(other.has_value());
    EXPECT_EQ(other->identifier, "AVD_1");
    EXPECT_FALSE(other->resolution.has_value());
}

TEST(AppStateTest, SmartClearOnlyAcrossPlatforms) {
    AppState s;
    DeviceDetails cached;
    cached.platform = Platform::Android;
    s.updateCachedDeviceDetails(cached);

    s.smartClearCachedDeviceDetails(Platform::Android);
    EXPECT_TRUE(s.cachedDeviceDetails().has_value());

    s.smartClearCachedDeviceDetails(Platform::Ios);
    EXPECT_FALSE(s.cachedDeviceDetails().has_value());
}

// ---------------------------------------------------------------------------
// Refresh timing / pending start
// ---------------------------------------------------------------------------
TEST(AppStateTest, AutoRefreshAfterInterval) {
    AppState s;
    const auto t0 = AppState::Clock::now();
    s.markRefreshed(t0);
    EXPECT_FALSE(s.shouldAutoRefresh(t0 + 2999ms));
    EXPECT_TRUE(s.shouldAutoRefresh(t0 + 3000ms));
}

TEST(AppStateTest, PendingStartUsesFastInterval) {
    config::UiConfig ui;
    ui.auto_refresh_ms = 3000;
    ui.fast_refresh_ms = 1000;
    AppState s(ui);
    const auto t0 = AppState::Clock::now();
    s.markRefreshed(t0);

    s.setPendingDeviceStart("Pixel_7");
    EXPECT_EQ(s.autoRefreshInterval(), 1000ms);
    EXPECT_EQ(*s.pendingDeviceStart(), "Pixel_7");
    EXPECT_TRUE(s.shouldAutoRefresh(t0));

    s.clearPendingDeviceStart();
    EXPECT_EQ(s.autoRefreshInterval(), 3000ms);
    EXPECT_FALSE(s.pendingDeviceStart().has_value());
    EXPECT_FALSE(s.shouldAutoRefresh(t0 + 1000ms));
}

TEST(AppStateTest, OperationStatus) {
    AppState s;
    s.setDeviceOperationStatus("Starting device 'Pixel_7'...");
    ASSERT_TRUE(s.deviceOperationStatus().has_value());
    s.clearDeviceOperationStatus();
    EXPECT_FALSE(s.deviceOperationStatus().has_value());
}
