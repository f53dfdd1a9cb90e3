#include "shared_state_bridge.hpp"

#include <iostream>

#include "codec.hpp"

SharedStateBridge::SharedStateBridge(SharedDefaults& defaults, const Clock& clock)
    : defaults_(defaults), clock_(clock) {}

bool SharedStateBridge::save(const TimerSnapshot& timer) {
    std::string bytes;
    if (!encode_timer(timer, bytes)) {
        std::cerr << "[bridge] cannot encode timer state\n";
        return false;
    }
    return defaults_.set(kStateKey, bytes);
}

TimerSnapshot SharedStateBridge::load() const {
    std::string bytes;
    if (!defaults_.get(kStateKey, bytes)) return default_state();

    TimerSnapshot timer;
    if (!decode_timer(bytes, timer)) {
        std::cerr << "[bridge] unreadable timer record, using idle\n";
        return default_state();
    }

    if (timer.state == TimerState::Running && timer.end && *timer.end < clock_.now()) {
        TimerSnapshot alarm;
        alarm.total_duration = timer.total_duration;
        alarm.state = TimerState::Alarm;
        return alarm;
    }
    return timer;
}
