#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "clock.hpp"
#include "main_context.hpp"
#include "platform.hpp"
#include "shared_state_bridge.hpp"
#include "snapshot.hpp"

struct TimerOptions {
    std::chrono::milliseconds tick_interval{500};
    std::chrono::milliseconds haptic_interval{1500};
};

/*
 * RestTimerEngine
 * The single authoritative rest-timer state machine:
 *
 *   idle --start--> running --countdown zero--> alarm --dismiss--> idle
 *                      |  \----stop/skip----> idle
 *
 * The countdown is kept as an absolute end time, so remaining time is always
 * recomputed from the clock and survives suspension. While running the engine
 * holds a background grant and a fallback local alert at the end time; the
 * first trigger to reach alarm cancels the alert. Every transition is
 * projected to the SharedStateBridge when one is attached (companion only).
 *
 * All public methods run on the owning MainContext. GrantListener callbacks
 * may arrive on any thread and are marshalled onto it.
 */
class RestTimerEngine final : public GrantListener {
public:
    static constexpr const char* kAlertName = "rest-timer";
    using Observer = std::function<void(const TimerSnapshot&)>;

    RestTimerEngine(MainContext& context, const Clock& clock, BackgroundGrant& grant,
                    AlertScheduler& alerts, HapticPlayer& haptics,
                    SharedStateBridge* bridge = nullptr, TimerOptions options = TimerOptions());
    ~RestTimerEngine() override;

    RestTimerEngine(const RestTimerEngine&) = delete;
    RestTimerEngine& operator=(const RestTimerEngine&) = delete;

    // Rejected unless idle.
    bool start(int duration_seconds);
    // Cancels whatever is active, then starts.
    void force_start(int duration_seconds);
    // running or alarm -> idle, releasing everything the timer holds.
    bool stop();
    bool skip() { return stop(); }
    // alarm -> idle.
    bool dismiss();
    // Extends a running countdown and re-arms the fallback alert.
    bool add_time(int seconds);

    void enter_background();
    void enter_foreground();

    // Periodic countdown check.
    void tick();
    // running -> alarm. Fires once per start; no-op in any other state.
    bool fire_alarm();

    TimerState state() const { return state_; }
    std::optional<TimePoint> end() const { return end_; }
    int total_duration() const { return total_; }
    int remaining_seconds() const;
    double progress() const;
    std::string formatted_remaining() const;
    TimerSnapshot snapshot() const;

    bool grant_active() const { return grant_active_; }
    bool ticking() const { return tick_id_ != 0; }
    bool haptics_playing() const { return playing_haptics_; }
    bool in_background() const { return in_background_; }

    void on_change(Observer observer) { observers_.push_back(std::move(observer)); }

    // GrantListener
    void grant_started() override;
    void grant_will_expire() override;
    void grant_time_reached() override;
    void grant_invalidated(const std::string& reason) override;

private:
    void start_ticking();
    void stop_ticking();
    void start_haptics();
    void stop_haptics();
    void arm_fallback();
    void request_grant();
    void release_grant();
    void clear();
    void publish();

    MainContext& context_;
    const Clock& clock_;
    BackgroundGrant& grant_;
    AlertScheduler& alerts_;
    HapticPlayer& haptics_;
    SharedStateBridge* bridge_;
    TimerOptions options_;

    TimerState state_ = TimerState::Idle;
    std::optional<TimePoint> end_;
    int total_ = 0;

    // Bumped on every grant request so signals from an earlier grant are
    // ignored. Read from grant threads.
    std::atomic<uint64_t> generation_{0};
    bool grant_active_ = false;
    bool in_background_ = false;
    bool playing_haptics_ = false;
    MainContext::TimerId tick_id_ = 0;
    MainContext::TimerId pulse_id_ = 0;

    std::vector<Observer> observers_;
};
