#include "event_processing.hpp"

namespace emu {

const char* navigationTargetStr(NavigationTarget t) {
    switch (t) {
        case NavigationTarget::Android: return "Android";
        case NavigationTarget::Ios:     return "iOS";
        case NavigationTarget::Details: return "Details";
    }
    return "?";
}

bool EventDebouncer::shouldProcessEvent(InputClock::time_point now) {
    if (last_accepted_ && now - *last_accepted_ < interval_) {
        return false;
    }
    last_accepted_ = now;
    return true;
}

void StepBatcher::addStep(int delta, InputClock::time_point now) {
    steps_ += delta;
    last_added_ = now;
}

std::optional<int> StepBatcher::takeSteps(InputClock::time_point now) {
    if (now - last_added_ < window_) return std::nullopt;
    const int steps = flush();
    if (steps == 0) return std::nullopt;
    return steps;
}

int StepBatcher::flush() {
    const int steps = steps_;
    steps_ = 0;
    return steps;
}

} // namespace emu
