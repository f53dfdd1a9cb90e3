#pragma once
#include <string>

#include "clock.hpp"
#include "shared_defaults.hpp"
#include "snapshot.hpp"

// SharedStateBridge exposes a coarse, possibly stale view of the rest timer
// to other local processes. Only the companion process writes it; any
// process may read it.
class SharedStateBridge {
public:
    static constexpr const char* kStateKey = "sharedTimerState";

    SharedStateBridge(SharedDefaults& defaults, const Clock& clock);

    static TimerSnapshot default_state() { return TimerSnapshot{}; }

    bool save(const TimerSnapshot& timer);

    /*
     * load
     * Missing or unreadable record -> idle default. A record still marked
     * running whose end has passed is returned as alarm (end cleared, total
     * kept): the writer may not have recorded its own transition yet.
     */
    TimerSnapshot load() const;

private:
    SharedDefaults& defaults_;
    const Clock& clock_;
};
