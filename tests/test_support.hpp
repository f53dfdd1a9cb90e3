#pragma once
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "clock.hpp"
#include "peer_link.hpp"
#include "platform.hpp"
#include "snapshot.hpp"

// ManualClock only moves when a test advances it.
class ManualClock final : public Clock {
public:
    explicit ManualClock(int64_t start_ms = 1700000000000) : now_(from_millis(start_ms)) {}

    TimePoint now() const override { return now_; }
    void advance(std::chrono::milliseconds d) { now_ += d; }
    void advance_seconds(int s) { now_ += std::chrono::seconds(s); }
    void set(TimePoint at) { now_ = at; }

private:
    TimePoint now_;
};

// FakePeerLink records deliveries; reachability and failure are set by the test.
class FakePeerLink final : public PeerLink {
public:
    bool reachable() const override { return reachable_; }

    bool deliver(const wsync::Envelope& message) override {
        attempts++;
        if (fail_after >= 0 && (int)delivered.size() >= fail_after) return false;
        if (fail) return false;
        delivered.push_back(message);
        return true;
    }

    PeerStatus probe(wsync::PeerRole) override {
        PeerStatus status;
        status.reachable = reachable_;
        status.app_installed = installed;
        return status;
    }

    void set_reachable(bool r) { reachable_ = r; }

    bool reachable_ = false;
    bool installed = true;
    bool fail = false;
    int fail_after = -1;  // fail every delivery once this many have succeeded
    int attempts = 0;
    std::vector<wsync::Envelope> delivered;
};

// RecordingGrant keeps the listener so a test can play the host's part.
class RecordingGrant final : public BackgroundGrant {
public:
    void request(TimePoint end, GrantListener& listener) override {
        requests++;
        last_end = end;
        listener_ = &listener;
    }
    void invalidate() override {
        invalidations++;
        listener_ = nullptr;
    }

    bool held() const { return listener_ != nullptr; }
    GrantListener* listener() { return listener_; }

    int requests = 0;
    int invalidations = 0;
    TimePoint last_end;

private:
    GrantListener* listener_ = nullptr;
};

class RecordingAlerts final : public AlertScheduler {
public:
    void schedule(const std::string& name, TimePoint at, const std::string&) override {
        scheduled++;
        pending[name] = at;
    }
    void cancel(const std::string& name) override {
        cancelled++;
        pending.erase(name);
    }

    std::map<std::string, TimePoint> pending;
    int scheduled = 0;
    int cancelled = 0;
};

class CountingHaptics final : public HapticPlayer {
public:
    void play() override { plays++; }
    int plays = 0;
};

// TempDir creates a fresh directory under /tmp and removes it on exit.
class TempDir {
public:
    TempDir() {
        char tmpl[] = "/tmp/wsync_test_XXXXXX";
        const char* made = mkdtemp(tmpl);
        path_ = made ? made : "/tmp";
    }
    ~TempDir() {
        std::error_code ec;
        if (path_ != "/tmp") std::filesystem::remove_all(path_, ec);
    }

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return path_ + "/" + name; }

private:
    std::string path_;
};

// -------------------- snapshot builders --------------------

// uuid_of(n) is a well formed, distinct identifier per n.
inline Uuid uuid_of(int n) {
    char buf[37];
    std::snprintf(buf, sizeof(buf), "00000000-0000-4000-8000-%012d", n);
    return Uuid{buf};
}

inline TimePoint at_ms(int64_t ms) { return from_millis(ms); }

inline SetRecord make_set(int n, int set_index, bool completed = false,
                          std::optional<int64_t> completed_ms = std::nullopt) {
    SetRecord set;
    set.id = uuid_of(n);
    set.set_index = set_index;
    set.weight = 60.0;
    set.reps = 8;
    set.completed = completed;
    if (completed_ms) set.completed_at = at_ms(*completed_ms);
    return set;
}

inline ExerciseEntry make_exercise(int n, const std::string& name, int order_index,
                                   std::vector<SetRecord> sets) {
    ExerciseEntry entry;
    entry.id = uuid_of(n);
    entry.exercise_id = uuid_of(n + 500);
    entry.name = name;
    entry.order_index = order_index;
    entry.sets = std::move(sets);
    return entry;
}

// Bench (sets 1..3) ungrouped at order 0, then a two-member group at order 1.
inline WorkoutSnapshot sample_workout() {
    WorkoutSnapshot w;
    w.default_rest_seconds = 90;
    w.exercises.push_back(
        make_exercise(100, "Bench Press", 0, {make_set(1, 1), make_set(2, 2), make_set(3, 3)}));

    ExerciseGroup group;
    group.id = uuid_of(200);
    group.order_index = 1;
    group.set_count = 2;
    group.round_rest_seconds = 60;
    ExerciseEntry curl = make_exercise(101, "Curl", 1, {make_set(11, 1), make_set(12, 2)});
    curl.group_order_index = 0;
    ExerciseEntry dip = make_exercise(102, "Dip", 1, {make_set(21, 1), make_set(22, 2)});
    dip.group_order_index = 1;
    dip.metric = MetricKind::BodyweightReps;
    group.exercises.push_back(curl);
    group.exercises.push_back(dip);
    w.groups.push_back(group);
    return w;
}
