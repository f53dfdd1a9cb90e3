#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "linux_platform.hpp"

using namespace std::chrono_literals;

// Collects signals arriving on worker threads.
class EventLog {
public:
    void add(const std::string& event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        }
        cv_.notify_all();
    }

    // Waits until |count| events have arrived or |timeout| passes.
    std::vector<std::string> wait_for(size_t count, std::chrono::milliseconds timeout = 3000ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [&] { return events_.size() >= count; });
        return events_;
    }

    std::vector<std::string> events() {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> events_;
};

class LoggingListener final : public GrantListener {
public:
    explicit LoggingListener(EventLog& log) : log_(log) {}
    void grant_started() override { log_.add("started"); }
    void grant_will_expire() override { log_.add("will_expire"); }
    void grant_time_reached() override { log_.add("time_reached"); }
    void grant_invalidated(const std::string& reason) override { log_.add("invalidated:" + reason); }

private:
    EventLog& log_;
};

static TimePoint in(std::chrono::milliseconds d) { return std::chrono::system_clock::now() + d; }

TEST(ThreadedGrant, ZeroLimitDeniesEveryRequest) {
    EventLog log;
    LoggingListener listener(log);
    ThreadedGrant grant(0s);

    grant.request(in(50ms), listener);
    EXPECT_EQ(log.events(), std::vector<std::string>{"invalidated:denied"});
    grant.request(in(50ms), listener);
    EXPECT_EQ(log.events(), (std::vector<std::string>{"invalidated:denied", "invalidated:denied"}));
}

TEST(ThreadedGrant, ReportsTimeReachedAtTheEnd) {
    EventLog log;
    LoggingListener listener(log);
    ThreadedGrant grant(60s);

    grant.request(in(50ms), listener);
    EXPECT_EQ(log.wait_for(2), (std::vector<std::string>{"started", "time_reached"}));
}

TEST(ThreadedGrant, ReleaseBeforeTheEndSilencesIt) {
    EventLog log;
    LoggingListener listener(log);
    ThreadedGrant grant(60s);

    grant.request(in(10000ms), listener);
    ASSERT_EQ(log.wait_for(1), std::vector<std::string>{"started"});
    grant.invalidate();
    grant.invalidate();

    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(log.events(), std::vector<std::string>{"started"});
}

TEST(ThreadedGrant, CountdownPastTheLimitExpires) {
    EventLog log;
    LoggingListener listener(log);
    // The expiry warning is due before the grant even starts.
    ThreadedGrant grant(1s);

    grant.request(in(3600000ms), listener);
    EXPECT_EQ(log.wait_for(3),
              (std::vector<std::string>{"started", "will_expire", "invalidated:expired"}));
}

TEST(ThreadedGrant, InvalidateWithoutRequestDoesNothing) {
    ThreadedGrant grant(60s);
    grant.invalidate();
    grant.invalidate();
}

TEST(ThreadedAlertScheduler, RearmingReplacesThePendingAlert) {
    EventLog log;
    ThreadedAlertScheduler alerts(
        [&](const std::string& name, const std::string& body) { log.add(name + ":" + body); });

    alerts.schedule("rest-timer", in(10000ms), "first");
    alerts.schedule("rest-timer", in(50ms), "second");
    EXPECT_TRUE(alerts.pending("rest-timer"));

    EXPECT_EQ(log.wait_for(1), std::vector<std::string>{"rest-timer:second"});
    EXPECT_FALSE(alerts.pending("rest-timer"));

    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(log.events().size(), 1u);
}

TEST(ThreadedAlertScheduler, CancelledAlertNeverFires) {
    EventLog log;
    ThreadedAlertScheduler alerts(
        [&](const std::string& name, const std::string&) { log.add(name); });

    alerts.schedule("rest-timer", in(100ms), "done");
    alerts.cancel("rest-timer");
    alerts.cancel("rest-timer");
    alerts.cancel("never-scheduled");
    EXPECT_FALSE(alerts.pending("rest-timer"));

    std::this_thread::sleep_for(300ms);
    EXPECT_TRUE(log.events().empty());
}

TEST(ThreadedAlertScheduler, AlertsFireInTimeOrder) {
    EventLog log;
    ThreadedAlertScheduler alerts(
        [&](const std::string& name, const std::string&) { log.add(name); });

    alerts.schedule("later", in(150ms), "");
    alerts.schedule("sooner", in(30ms), "");
    EXPECT_EQ(log.wait_for(2), (std::vector<std::string>{"sooner", "later"}));
}
