#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include "platform.hpp"

/*
 * ThreadedGrant
 * Background grant for a plain Linux process. A worker thread reports
 * "started", then "time reached" at the requested end. A grant is limited to
 * |limit|: a countdown ending later gets "will expire" shortly before the
 * limit and "invalidated" at it. A zero limit denies every request.
 */
class ThreadedGrant final : public BackgroundGrant {
public:
    explicit ThreadedGrant(std::chrono::seconds limit);
    ~ThreadedGrant() override;

    void request(TimePoint end, GrantListener& listener) override;
    void invalidate() override;

private:
    void run(TimePoint end, GrantListener* listener);
    // Waits until |at| or a release. Returns false on release.
    bool sleep_until(TimePoint at);

    std::chrono::seconds limit_;
    std::thread worker_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool released_ = false;
};

/*
 * ThreadedAlertScheduler
 * Keeps named alerts and calls |fire| on its own thread when one comes due.
 */
class ThreadedAlertScheduler final : public AlertScheduler {
public:
    using FireFn = std::function<void(const std::string& name, const std::string& body)>;

    explicit ThreadedAlertScheduler(FireFn fire);
    ~ThreadedAlertScheduler() override;

    void schedule(const std::string& name, TimePoint at, const std::string& body) override;
    void cancel(const std::string& name) override;
    bool pending(const std::string& name);

private:
    struct Alert {
        TimePoint at;
        std::string body;
    };

    void run();

    FireFn fire_;
    std::map<std::string, Alert> alerts_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::thread worker_;
};

// TerminalHaptics rings the terminal bell; the closest thing a console has.
class TerminalHaptics final : public HapticPlayer {
public:
    void play() override;
};
