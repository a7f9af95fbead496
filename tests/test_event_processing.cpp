// =============================================================================
// Unit tests for input debouncing / batching (src/event_processing.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "event_processing.hpp"

using namespace emu;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// EventDebouncer
// ---------------------------------------------------------------------------
TEST(EventDebouncerTest, FirstEventAlwaysAccepted) {
    EventDebouncer d(10ms);
    EXPECT_TRUE(d.shouldProcessEvent(InputClock::now()));
}

TEST(EventDebouncerTest, RejectsInsideInterval) {
    EventDebouncer d(10ms);
    const auto t0 = InputClock::now();
    ASSERT_TRUE(d.shouldProcessEvent(t0));
    EXPECT_FALSE(d.shouldProcessEvent(t0 + 5ms));
    EXPECT_FALSE(d.shouldProcessEvent(t0 + 9ms));
    EXPECT_TRUE(d.shouldProcessEvent(t0 + 10ms));
    // Interval counts from the last accepted event
    EXPECT_FALSE(d.shouldProcessEvent(t0 + 15ms));
    EXPECT_TRUE(d.shouldProcessEvent(t0 + 20ms));
}

TEST(EventDebouncerTest, ResetAcceptsImmediately) {
    EventDebouncer d(100ms);
    const auto t0 = InputClock::now();
    ASSERT_TRUE(d.shouldProcessEvent(t0));
    d.reset();
    EXPECT_TRUE(d.shouldProcessEvent(t0 + 1ms));
}

TEST(EventDebouncerTest, DefaultInterval) {
    EventDebouncer d;
    EXPECT_EQ(d.interval(), 10ms);
}

// ---------------------------------------------------------------------------
// NavigationBatcher
// ---------------------------------------------------------------------------
TEST(NavigationBatcherTest, LastTargetOfBurstWins) {
    NavigationBatcher<NavigationTarget> b(50ms);
    const auto t0 = InputClock::now();
    b.addNavigation(NavigationTarget::Android, t0);
    b.addNavigation(NavigationTarget::Ios, t0 + 1ms);
    b.addNavigation(NavigationTarget::Details, t0 + 2ms);
    b.addNavigation(NavigationTarget::Android, t0 + 3ms);

    auto out = b.getBatchedNavigation(t0 + 60ms);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, NavigationTarget::Android);
    EXPECT_FALSE(b.getBatchedNavigation(t0 + 200ms).has_value());
}

TEST(NavigationBatcherTest, NothingInsideWindow) {
    NavigationBatcher<NavigationTarget> b(20ms);
    const auto t0 = InputClock::now();
    b.addNavigation(NavigationTarget::Ios, t0);

    EXPECT_FALSE(b.getBatchedNavigation(t0 + 5ms).has_value());
    EXPECT_TRUE(b.hasPending());

    auto out = b.getBatchedNavigation(t0 + 25ms);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, NavigationTarget::Ios);
    EXPECT_FALSE(b.hasPending());
}

TEST(NavigationBatcherTest, WindowRestartsOnEachAdd) {
    NavigationBatcher<NavigationTarget> b(20ms);
    const auto t0 = InputClock::now();
    b.addNavigation(NavigationTarget::Android, t0);
    b.addNavigation(NavigationTarget::Ios, t0 + 15ms);
    EXPECT_FALSE(b.getBatchedNavigation(t0 + 25ms).has_value());
    EXPECT_EQ(*b.getBatchedNavigation(t0 + 35ms), NavigationTarget::Ios);
}

TEST(NavigationBatcherTest, FlushIgnoresWindow) {
    NavigationBatcher<NavigationTarget> b(1000ms);
    b.addNavigation(NavigationTarget::Details);
    auto out = b.flush();
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, NavigationTarget::Details);
    EXPECT_FALSE(b.flush().has_value());
}

TEST(NavigationBatcherTest, EmptyBatcherYieldsNothing) {
    NavigationBatcher<NavigationTarget> b;
    EXPECT_FALSE(b.getBatchedNavigation().has_value());
    EXPECT_STREQ(navigationTargetStr(NavigationTarget::Ios), "iOS");
}

// ---------------------------------------------------------------------------
// StepBatcher
// ---------------------------------------------------------------------------
TEST(StepBatcherTest, SumsBurst) {
    StepBatcher s(50ms);
    const auto t0 = InputClock::now();
    for (int i = 0; i < 5; ++i) s.addStep(1, t0 + std::chrono::milliseconds(i));
    s.addStep(-1, t0 + 5ms);

    EXPECT_FALSE(s.takeSteps(t0 + 20ms).has_value());
    auto steps = s.takeSteps(t0 + 60ms);
    ASSERT_TRUE(steps.has_value());
    EXPECT_EQ(*steps, 4);
    EXPECT_FALSE(s.hasPendingSteps());
}

TEST(StepBatcherTest, CancelledStepsYieldNothing) {
    StepBatcher s(50ms);
    const auto t0 = InputClock::now();
    s.addStep(1, t0);
    s.addStep(-1, t0 + 1ms);
    EXPECT_FALSE(s.takeSteps(t0 + 100ms).has_value());
}

TEST(StepBatcherTest, FlushReturnsNetSteps) {
    StepBatcher s(1000ms);
    s.addStep(-3);
    EXPECT_TRUE(s.hasPendingSteps());
    EXPECT_EQ(s.flush(), -3);
    EXPECT_EQ(s.flush(), 0);
}
