#include "rest_timer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>

RestTimerEngine::RestTimerEngine(MainContext& context, const Clock& clock, BackgroundGrant& grant,
                                 AlertScheduler& alerts, HapticPlayer& haptics,
                                 SharedStateBridge* bridge, TimerOptions options)
    : context_(context),
      clock_(clock),
      grant_(grant),
      alerts_(alerts),
      haptics_(haptics),
      bridge_(bridge),
      options_(options) {}

RestTimerEngine::~RestTimerEngine() {
    stop_ticking();
    stop_haptics();
    grant_.invalidate();
}

// -------------------- transitions --------------------

bool RestTimerEngine::start(int duration_seconds) {
    if (state_ != TimerState::Idle) return false;
    if (duration_seconds <= 0) return false;

    end_ = clock_.now() + std::chrono::seconds(duration_seconds);
    total_ = duration_seconds;
    state_ = TimerState::Running;

    request_grant();
    arm_fallback();
    start_ticking();
    publish();
    return true;
}

void RestTimerEngine::force_start(int duration_seconds) {
    stop();
    start(duration_seconds);
}

bool RestTimerEngine::stop() {
    if (state_ == TimerState::Idle) return false;
    stop_ticking();
    stop_haptics();
    release_grant();
    alerts_.cancel(kAlertName);
    clear();
    publish();
    return true;
}

// The fallback alert was cancelled on entering alarm, nothing to cancel here.
bool RestTimerEngine::dismiss() {
    if (state_ != TimerState::Alarm) return false;
    stop_haptics();
    release_grant();
    clear();
    publish();
    return true;
}

bool RestTimerEngine::add_time(int seconds) {
    if (state_ != TimerState::Running || seconds <= 0) return false;
    *end_ += std::chrono::seconds(seconds);
    total_ += seconds;
    request_grant();
    arm_fallback();
    publish();
    return true;
}

bool RestTimerEngine::fire_alarm() {
    if (state_ != TimerState::Running) return false;
    stop_ticking();
    alerts_.cancel(kAlertName);
    state_ = TimerState::Alarm;
    start_haptics();
    publish();
    return true;
}

void RestTimerEngine::tick() {
    if (state_ == TimerState::Running && remaining_seconds() <= 0) fire_alarm();
}

// -------------------- background / foreground --------------------

/*
 * enter_background
 * With an active grant the countdown keeps ticking. Without one the host will
 * not run a foreground timer, so the tick is dropped and the fallback alert
 * is what reaches the user; enter_foreground reconciles.
 */
void RestTimerEngine::enter_background() {
    in_background_ = true;
    if (state_ == TimerState::Running && !grant_active_) {
        stop_ticking();
        std::cout << "[timer] backgrounded without grant, fallback alert armed\n";
    }
}

void RestTimerEngine::enter_foreground() {
    in_background_ = false;
    if (state_ == TimerState::Running) {
        if (remaining_seconds() <= 0) {
            fire_alarm();
        } else if (!ticking()) {
            start_ticking();
        }
    } else if (state_ == TimerState::Alarm) {
        start_haptics();
    }
}

// -------------------- grant signals --------------------

void RestTimerEngine::grant_started() {
    const uint64_t gen = generation_.load();
    context_.post([this, gen] {
        if (gen != generation_.load() || state_ != TimerState::Running) return;
        grant_active_ = true;
        if (in_background_ && !ticking()) start_ticking();
    });
}

void RestTimerEngine::grant_will_expire() {
    const uint64_t gen = generation_.load();
    context_.post([this, gen] {
        if (gen != generation_.load()) return;
        std::cout << "[timer] background grant about to expire\n";
    });
}

void RestTimerEngine::grant_time_reached() {
    const uint64_t gen = generation_.load();
    context_.post([this, gen] {
        if (gen != generation_.load()) return;
        fire_alarm();
    });
}

void RestTimerEngine::grant_invalidated(const std::string& reason) {
    const uint64_t gen = generation_.load();
    context_.post([this, gen, reason] {
        if (gen != generation_.load()) return;
        grant_active_ = false;
        std::cout << "[timer] background grant ended: " << reason << "\n";
        if (state_ != TimerState::Alarm) stop_haptics();
        if (state_ == TimerState::Running && in_background_) stop_ticking();
    });
}

// -------------------- queries --------------------

int RestTimerEngine::remaining_seconds() const {
    if (!end_) return 0;
    const double left = std::chrono::duration<double>(*end_ - clock_.now()).count();
    return std::max(0, (int)std::ceil(left));
}

double RestTimerEngine::progress() const {
    if (total_ <= 0) return 0.0;
    const double elapsed = (double)(total_ - remaining_seconds());
    return std::min(1.0, std::max(0.0, elapsed / (double)total_));
}

std::string RestTimerEngine::formatted_remaining() const {
    const int remaining = remaining_seconds();
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%d:%02d", remaining / 60, remaining % 60);
    return buf;
}

TimerSnapshot RestTimerEngine::snapshot() const {
    TimerSnapshot snap;
    snap.end = end_;
    snap.total_duration = total_;
    snap.state = state_;
    return snap;
}

// -------------------- helpers --------------------

void RestTimerEngine::start_ticking() {
    stop_ticking();
    tick_id_ = context_.schedule_every(options_.tick_interval, [this] { tick(); });
}

void RestTimerEngine::stop_ticking() {
    if (tick_id_ != 0) context_.cancel(tick_id_);
    tick_id_ = 0;
}

void RestTimerEngine::start_haptics() {
    if (playing_haptics_) return;
    playing_haptics_ = true;
    haptics_.play();
    pulse_id_ = context_.schedule_every(options_.haptic_interval, [this] { haptics_.play(); });
}

void RestTimerEngine::stop_haptics() {
    if (pulse_id_ != 0) context_.cancel(pulse_id_);
    pulse_id_ = 0;
    playing_haptics_ = false;
}

void RestTimerEngine::arm_fallback() {
    alerts_.cancel(kAlertName);
    if (end_) alerts_.schedule(kAlertName, *end_, "Rest finished");
}

// Any previous grant is released first so at most one is ever held.
void RestTimerEngine::request_grant() {
    release_grant();
    generation_.fetch_add(1);
    grant_.request(*end_, *this);
}

void RestTimerEngine::release_grant() {
    grant_.invalidate();
    grant_active_ = false;
}

void RestTimerEngine::clear() {
    state_ = TimerState::Idle;
    end_.reset();
    total_ = 0;
}

void RestTimerEngine::publish() {
    const TimerSnapshot snap = snapshot();
    if (bridge_ && !bridge_->save(snap)) {
        std::cerr << "[timer] bridge write failed\n";
    }
    for (auto& observer : observers_) observer(snap);
}
