#pragma once
// =============================================================================
// emu - Input Debouncing & Navigation Batching
// =============================================================================
// Sits between raw key intents and AppState so a burst of input turns into
// one state write:
//   EventDebouncer      drops re-triggers of an action inside its interval
//   NavigationBatcher   keeps only the latest target of a burst
//   StepBatcher         sums cursor steps of a burst into one moveBySteps()
// All time-dependent calls take an optional explicit `now` for tests.
// =============================================================================
#include <chrono>
#include <optional>
#include "emu_constants.hpp"

namespace emu {

using InputClock = std::chrono::steady_clock;

// Panel / pane a navigation intent points at
enum class NavigationTarget { Android, Ios, Details };

const char* navigationTargetStr(NavigationTarget t);

class EventDebouncer {
public:
    explicit EventDebouncer(std::chrono::milliseconds interval = constants::EVENT_DEBOUNCE_TIMEOUT)
        : interval_(interval) {}

    // True (and records the time) when no event was accepted within the interval
    bool shouldProcessEvent() { return shouldProcessEvent(InputClock::now()); }
    bool shouldProcessEvent(InputClock::time_point now);

    // Next call is accepted regardless of elapsed time
    void reset() { last_accepted_.reset(); }

    std::chrono::milliseconds interval() const { return interval_; }

private:
    std::chrono::milliseconds interval_;
    std::optional<InputClock::time_point> last_accepted_;
};

template<typename Target>
class NavigationBatcher {
public:
    explicit NavigationBatcher(std::chrono::milliseconds window = constants::NAVIGATION_BATCH_TIMEOUT)
        : window_(window) {}

    // Overwrites any target not yet taken
    void addNavigation(Target target) { addNavigation(target, InputClock::now()); }
    void addNavigation(Target target, InputClock::time_point now) {
        pending_ = target;
        last_added_ = now;
    }

    // The latest target once the window has passed since the last add, then
    // nothing until the next add. Inside the window nothing is consumed.
    std::optional<Target> getBatchedNavigation() { return getBatchedNavigation(InputClock::now()); }
    std::optional<Target> getBatchedNavigation(InputClock::time_point now) {
        if (!pending_ || now - last_added_ < window_) return std::nullopt;
        std::optional<Target> out = pending_;
        pending_.reset();
        return out;
    }

    bool hasPending() const { return pending_.has_value(); }
    const std::optional<Target>& pending() const { return pending_; }

    // Takes the pending target without waiting for the window
    std::optional<Target> flush() {
        std::optional<Target> out = pending_;
        pending_.reset();
        return out;
    }

private:
    std::chrono::milliseconds window_;
    std::optional<Target> pending_;
    InputClock::time_point last_added_;
};

// Vertical cursor steps (+down / -up) summed over a burst
class StepBatcher {
public:
    explicit StepBatcher(std::chrono::milliseconds window = constants::NAVIGATION_BATCH_TIMEOUT)
        : window_(window) {}

    void addStep(int delta) { addStep(delta, InputClock::now()); }
    void addStep(int delta, InputClock::time_point now);

    // Net steps once the window has passed; nullopt while the burst continues
    // or when the steps cancelled out
    std::optional<int> takeSteps() { return takeSteps(InputClock::now()); }
    std::optional<int> takeSteps(InputClock::time_point now);

    // Net steps regardless of the window (flush before a non-navigation intent)
    int flush();

    bool hasPendingSteps() const { return steps_ != 0; }

private:
    std::chrono::milliseconds window_;
    int steps_ = 0;
    InputClock::time_point last_added_;
};

} // namespace emu
