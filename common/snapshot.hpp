#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

using TimePoint = std::chrono::system_clock::time_point;

// Uuid holds the canonical lowercase 8-4-4-4-12 text form of an identifier.
// Instances built through parse() or generate() are always well formed.
struct Uuid {
    std::string value;

    static bool parse(const std::string& text, Uuid& out);
    static Uuid generate();

    bool empty() const { return value.empty(); }
    bool operator==(const Uuid& other) const { return value == other.value; }
    bool operator!=(const Uuid& other) const { return value != other.value; }
    bool operator<(const Uuid& other) const { return value < other.value; }
};

struct UuidHash {
    size_t operator()(const Uuid& id) const { return std::hash<std::string>()(id.value); }
};

enum class MetricKind { WeightReps, BodyweightReps, TimeDistance, Completion };

const char* metric_kind_name(MetricKind kind);

// SetRecord is one planned/recorded set. completed_at moves with every local
// change of `completed`; the conflict resolver keys on it.
struct SetRecord {
    Uuid id;
    int set_index = 1;
    std::optional<double> weight;
    std::optional<int> reps;
    std::optional<int> duration_seconds;
    std::optional<double> distance_meters;
    std::optional<int> rest_seconds;
    bool completed = false;
    std::optional<TimePoint> completed_at;

    bool operator==(const SetRecord& other) const;
};

struct ExerciseEntry {
    Uuid id;
    Uuid exercise_id;
    std::string name;
    int order_index = 0;
    std::optional<int> group_order_index;  // unset for ungrouped entries
    MetricKind metric = MetricKind::WeightReps;
    std::optional<std::string> body_part_code;
    std::vector<SetRecord> sets;

    bool operator==(const ExerciseEntry& other) const;
};

// ExerciseGroup is a superset/giant set performed in rounds.
struct ExerciseGroup {
    Uuid id;
    int order_index = 0;
    int set_count = 0;
    std::optional<int> round_rest_seconds;
    std::vector<ExerciseEntry> exercises;

    bool operator==(const ExerciseGroup& other) const;
};

struct WorkoutSnapshot {
    bool routine_mode = false;
    std::vector<ExerciseEntry> exercises;  // ungrouped only
    std::vector<ExerciseGroup> groups;
    int default_rest_seconds = 0;
    bool auto_start_rest = false;
    bool skip_rest_on_final_set = true;

    bool operator==(const WorkoutSnapshot& other) const;
    bool operator!=(const WorkoutSnapshot& other) const { return !(*this == other); }
};

enum class TimerState { Idle, Running, Alarm };

const char* timer_state_name(TimerState state);

struct TimerSnapshot {
    std::optional<TimePoint> end;
    int total_duration = 0;
    TimerState state = TimerState::Idle;

    bool operator==(const TimerSnapshot& other) const;
};

// Walks every set of the snapshot, ungrouped entries first, then each group.
void for_each_set(const WorkoutSnapshot& snapshot, const std::function<void(const SetRecord&)>& fn);

// find_set returns the set with |id| or nullptr. Set ids are unique across
// the whole snapshot so the first hit is the only one.
SetRecord* find_set(WorkoutSnapshot& snapshot, const Uuid& id);

int64_t to_millis(TimePoint at);
TimePoint from_millis(int64_t ms);
