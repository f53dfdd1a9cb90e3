#include "linux_platform.hpp"

#include <iostream>
#include <vector>

// How long before a grant's limit the listener is warned.
static constexpr std::chrono::seconds kExpiryWarning{5};

// -------------------- ThreadedGrant --------------------

ThreadedGrant::ThreadedGrant(std::chrono::seconds limit) : limit_(limit) {}

ThreadedGrant::~ThreadedGrant() { invalidate(); }

void ThreadedGrant::request(TimePoint end, GrantListener& listener) {
    invalidate();
    if (limit_.count() <= 0) {
        listener.grant_invalidated("denied");
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = false;
    }
    worker_ = std::thread(&ThreadedGrant::run, this, end, &listener);
}

void ThreadedGrant::invalidate() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

bool ThreadedGrant::sleep_until(TimePoint at) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_until(lock, at, [this] { return released_; });
}

void ThreadedGrant::run(TimePoint end, GrantListener* listener) {
    const TimePoint expires = std::chrono::system_clock::now() + limit_;
    listener->grant_started();

    if (end <= expires) {
        if (sleep_until(end)) listener->grant_time_reached();
        return;
    }

    const TimePoint warn_at = expires - kExpiryWarning;
    if (!sleep_until(warn_at)) return;
    listener->grant_will_expire();
    if (!sleep_until(expires)) return;
    listener->grant_invalidated("expired");
}

// -------------------- ThreadedAlertScheduler --------------------

ThreadedAlertScheduler::ThreadedAlertScheduler(FireFn fire)
    : fire_(std::move(fire)), worker_(&ThreadedAlertScheduler::run, this) {}

ThreadedAlertScheduler::~ThreadedAlertScheduler() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void ThreadedAlertScheduler::schedule(const std::string& name, TimePoint at,
                                      const std::string& body) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        alerts_[name] = Alert{at, body};
    }
    cv_.notify_all();
}

void ThreadedAlertScheduler::cancel(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        alerts_.erase(name);
    }
    cv_.notify_all();
}

bool ThreadedAlertScheduler::pending(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return alerts_.count(name) != 0;
}

/*
 * run
 * Sleeps until the earliest alert is due or the set of alerts changes, then
 * fires everything whose time has passed. |fire_| is called without the lock
 * held so it may schedule or cancel.
 */
void ThreadedAlertScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_) {
        if (alerts_.empty()) {
            cv_.wait(lock);
            continue;
        }

        TimePoint earliest = alerts_.begin()->second.at;
        for (const auto& entry : alerts_) {
            if (entry.second.at < earliest) earliest = entry.second.at;
        }
        if (std::chrono::system_clock::now() < earliest) {
            cv_.wait_until(lock, earliest);
            continue;
        }

        std::vector<std::pair<std::string, std::string>> due;
        const TimePoint now = std::chrono::system_clock::now();
        for (auto it = alerts_.begin(); it != alerts_.end();) {
            if (it->second.at <= now) {
                due.emplace_back(it->first, it->second.body);
                it = alerts_.erase(it);
            } else {
                ++it;
            }
        }

        lock.unlock();
        for (const auto& alert : due) {
            if (fire_) fire_(alert.first, alert.second);
        }
        lock.lock();
    }
}

// -------------------- TerminalHaptics --------------------

void TerminalHaptics::play() { std::cout << "\a[haptic] pulse" << std::endl; }
