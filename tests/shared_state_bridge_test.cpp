#include <gtest/gtest.h>

#include "shared_defaults.hpp"
#include "shared_state_bridge.hpp"
#include "test_support.hpp"

TEST(SharedStateBridge, MissingRecordReadsAsIdle) {
    TempDir dir;
    ManualClock clock;
    SharedDefaults defaults(dir.path());
    SharedStateBridge bridge(defaults, clock);

    const TimerSnapshot seen = bridge.load();
    EXPECT_EQ(seen.state, TimerState::Idle);
    EXPECT_FALSE(seen.end.has_value());
    EXPECT_EQ(seen.total_duration, 0);
}

TEST(SharedStateBridge, RunningRecordPastItsEndReadsAsAlarm) {
    TempDir dir;
    ManualClock clock;
    SharedDefaults defaults(dir.path());
    SharedStateBridge bridge(defaults, clock);

    TimerSnapshot running;
    running.end = clock.now() - std::chrono::seconds(10);
    running.total_duration = 90;
    running.state = TimerState::Running;
    ASSERT_TRUE(bridge.save(running));

    const TimerSnapshot seen = bridge.load();
    EXPECT_EQ(seen.state, TimerState::Alarm);
    EXPECT_FALSE(seen.end.has_value());
    EXPECT_EQ(seen.total_duration, 90);
}

TEST(SharedStateBridge, LiveRunningRecordIsReturnedAsWritten) {
    TempDir dir;
    ManualClock clock;
    SharedDefaults defaults(dir.path());
    SharedStateBridge bridge(defaults, clock);

    TimerSnapshot running;
    running.end = clock.now() + std::chrono::seconds(30);
    running.total_duration = 60;
    running.state = TimerState::Running;
    ASSERT_TRUE(bridge.save(running));
    EXPECT_EQ(bridge.load(), running);
}

TEST(SharedStateBridge, ReaderInAnotherInstanceSeesWrites) {
    TempDir dir;
    ManualClock clock;
    SharedDefaults writer_defaults(dir.path());
    SharedStateBridge writer(writer_defaults, clock);
    SharedDefaults reader_defaults(dir.path());
    SharedStateBridge reader(reader_defaults, clock);

    TimerSnapshot alarm;
    alarm.total_duration = 45;
    alarm.state = TimerState::Alarm;
    ASSERT_TRUE(writer.save(alarm));
    EXPECT_EQ(reader.load(), alarm);
}

TEST(SharedStateBridge, CorruptRecordReadsAsIdle) {
    TempDir dir;
    ManualClock clock;
    SharedDefaults defaults(dir.path());
    SharedStateBridge bridge(defaults, clock);
    ASSERT_TRUE(defaults.set(SharedStateBridge::kStateKey, std::string("\xff\xff\xff\xff", 4)));

    EXPECT_EQ(bridge.load(), SharedStateBridge::default_state());
}

TEST(SharedDefaults, KeysAreRestricted) {
    EXPECT_TRUE(SharedDefaults::valid_key("sharedTimerState"));
    EXPECT_TRUE(SharedDefaults::valid_key("a.b-c_d"));
    EXPECT_FALSE(SharedDefaults::valid_key(""));
    EXPECT_FALSE(SharedDefaults::valid_key("../escape"));
    EXPECT_FALSE(SharedDefaults::valid_key("with space"));
}

TEST(SharedDefaults, SetGetRemove) {
    TempDir dir;
    SharedDefaults defaults(dir.path());
    std::string value;
    EXPECT_FALSE(defaults.get("selectedTheme", value));

    ASSERT_TRUE(defaults.set("selectedTheme", "ocean"));
    ASSERT_TRUE(defaults.get("selectedTheme", value));
    EXPECT_EQ(value, "ocean");

    ASSERT_TRUE(defaults.set("selectedTheme", "dark"));
    ASSERT_TRUE(defaults.get("selectedTheme", value));
    EXPECT_EQ(value, "dark");

    EXPECT_TRUE(defaults.remove("selectedTheme"));
    EXPECT_FALSE(defaults.get("selectedTheme", value));
}
