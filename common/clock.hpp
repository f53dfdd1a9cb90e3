#pragma once
#include <chrono>

#include "snapshot.hpp"

// Clock supplies wall time to everything that stamps or compares absolute
// times. Tests substitute a manual clock.
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock final : public Clock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

// Completion stamps are kept at wire precision so a local value and its
// decoded copy compare equal.
inline TimePoint stamp_now(const Clock& clock) {
    return from_millis(to_millis(clock.now()));
}
