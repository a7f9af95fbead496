// =============================================================================
// Unit tests for EventBus (src/event_bus.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include <stdexcept>
#include "event_bus.hpp"

using namespace emu;

// ---------------------------------------------------------------------------
// Basic subscribe + publish
// ---------------------------------------------------------------------------
TEST(EventBusTest, SubscribeAndPublish) {
    EventBus bus;
    int received_count = 0;
    std::string received_name;

    auto sub = bus.subscribe<DeviceOperationEvent>(
        [&](const DeviceOperationEvent& e) {
            received_count++;
            received_name = e.device_name;
        });

    DeviceOperationEvent ev;
    ev.platform = Platform::Android;
    ev.operation = DeviceOperation::Start;
    ev.device_name = "Pixel_7_API_34";
    ev.success = true;
    bus.publish(ev);

    EXPECT_EQ(received_count, 1);
    EXPECT_EQ(received_name, "Pixel_7_API_34");
}

// ---------------------------------------------------------------------------
// Multiple subscribers for the same event
// ---------------------------------------------------------------------------
TEST(EventBusTest, MultipleSubscribers) {
    EventBus bus;
    int count_a = 0;
    int count_b = 0;

    auto sub_a = bus.subscribe<ShutdownEvent>(
        [&](const ShutdownEvent&) { count_a++; });
    auto sub_b = bus.subscribe<ShutdownEvent>(
        [&](const ShutdownEvent&) { count_b++; });

    bus.publish(ShutdownEvent{});

    EXPECT_EQ(count_a, 1);
    EXPECT_EQ(count_b, 1);
}

// ---------------------------------------------------------------------------
// Unsubscribe via RAII handle destruction
// ---------------------------------------------------------------------------
TEST(EventBusTest, UnsubscribeOnHandleDestruction) {
    EventBus bus;
    int count = 0;

    {
        auto sub = bus.subscribe<ShutdownEvent>(
            [&](const ShutdownEvent&) { count++; });
        bus.publish(ShutdownEvent{});
        EXPECT_EQ(count, 1);
    }

    bus.publish(ShutdownEvent{});
    EXPECT_EQ(count, 1);
}

// ---------------------------------------------------------------------------
// has_subscribers reflects current state
// ---------------------------------------------------------------------------
TEST(EventBusTest, HasSubscribers) {
    EventBus bus;
    EXPECT_FALSE(bus.has_subscribers<MetadataRefreshedEvent>());

    {
        auto sub = bus.subscribe<MetadataRefreshedEvent>(
            [](const MetadataRefreshedEvent&) {});
        EXPECT_TRUE(bus.has_subscribers<MetadataRefreshedEvent>());
    }

    EXPECT_FALSE(bus.has_subscribers<MetadataRefreshedEvent>());
}

// ---------------------------------------------------------------------------
// Different event types are independent
// ---------------------------------------------------------------------------
TEST(EventBusTest, EventTypeIsolation) {
    EventBus bus;
    int refresh_count = 0;
    int op_count = 0;
    size_t last_count = 0;

    auto sub1 = bus.subscribe<DeviceListRefreshedEvent>(
        [&](const DeviceListRefreshedEvent& e) { refresh_count++; last_count = e.device_count; });
    auto sub2 = bus.subscribe<DeviceOperationEvent>(
        [&](const DeviceOperationEvent&) { op_count++; });

    DeviceListRefreshedEvent ev;
    ev.platform = Platform::Ios;
    ev.device_count = 4;
    bus.publish(ev);

    EXPECT_EQ(refresh_count, 1);
    EXPECT_EQ(last_count, 4u);
    EXPECT_EQ(op_count, 0);
}

// ---------------------------------------------------------------------------
// release() keeps subscription alive after handle destruction
// ---------------------------------------------------------------------------
TEST(EventBusTest, ReleaseKeepsSubscription) {
    EventBus bus;
    int count = 0;

    {
        auto sub = bus.subscribe<ShutdownEvent>(
            [&](const ShutdownEvent&) { count++; });
        sub.release();
    }

    bus.publish(ShutdownEvent{});
    EXPECT_EQ(count, 1);
}

// ---------------------------------------------------------------------------
// Handler exception does not crash bus or prevent other handlers
// ---------------------------------------------------------------------------
TEST(EventBusTest, HandlerExceptionIsCaught) {
    EventBus bus;
    int good_count = 0;

    auto sub1 = bus.subscribe<ShutdownEvent>(
        [](const ShutdownEvent&) { throw std::runtime_error("boom"); });
    auto sub2 = bus.subscribe<ShutdownEvent>(
        [&](const ShutdownEvent&) { good_count++; });

    EXPECT_NO_THROW(bus.publish(ShutdownEvent{}));
    EXPECT_EQ(good_count, 1);
}

// ---------------------------------------------------------------------------
// Move semantics for SubscriptionHandle
// ---------------------------------------------------------------------------
TEST(EventBusTest, HandleMoveSemantic) {
    EventBus bus;
    int count = 0;

    SubscriptionHandle outer;
    {
        auto inner = bus.subscribe<ShutdownEvent>(
            [&](const ShutdownEvent&) { count++; });
        outer = std::move(inner);
    }

    bus.publish(ShutdownEvent{});
    EXPECT_EQ(count, 1);
}

TEST(EventBusTest, OperationNames) {
    EXPECT_STREQ(deviceOperationStr(DeviceOperation::Wipe), "wipe");
    EXPECT_STREQ(deviceOperationStr(DeviceOperation::Delete), "delete");
}
