#pragma once
#include <string>

#include "snapshot.hpp"

// Host services the rest timer depends on. Implementations may call a
// GrantListener from any thread.

class GrantListener {
public:
    virtual ~GrantListener() = default;
    virtual void grant_started() = 0;
    virtual void grant_will_expire() = 0;
    // The countdown end covered by the grant has been reached.
    virtual void grant_time_reached() = 0;
    // Denied before start, expired, or revoked by the host.
    virtual void grant_invalidated(const std::string& reason) = 0;
};

// BackgroundGrant keeps the process running past the foreground so the
// countdown can complete.
class BackgroundGrant {
public:
    virtual ~BackgroundGrant() = default;
    virtual void request(TimePoint end, GrantListener& listener) = 0;
    // Releasing an absent grant does nothing. No signal follows a release.
    virtual void invalidate() = 0;
};

// AlertScheduler posts named local alerts that fire even if the process is
// suspended. Scheduling a name that is already pending replaces it.
class AlertScheduler {
public:
    virtual ~AlertScheduler() = default;
    virtual void schedule(const std::string& name, TimePoint at, const std::string& body) = 0;
    virtual void cancel(const std::string& name) = 0;
};

class HapticPlayer {
public:
    virtual ~HapticPlayer() = default;
    virtual void play() = 0;
};
