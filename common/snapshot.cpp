#include "snapshot.hpp"

#include <cctype>
#include <random>
#include <sstream>
#include <iomanip>

namespace {

bool is_hex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

/*
 * Uuid::parse
 * Accepts the 36-character hyphenated form in either case and stores it
 * lowercased. Anything else is rejected and |out| is left untouched.
 */
bool Uuid::parse(const std::string& text, Uuid& out) {
    if (text.size() != 36) return false;
    std::string canonical = text;
    for (size_t i = 0; i < canonical.size(); ++i) {
        const bool dash_slot = (i == 8 || i == 13 || i == 18 || i == 23);
        if (dash_slot) {
            if (canonical[i] != '-') return false;
        } else {
            if (!is_hex(canonical[i])) return false;
            canonical[i] = (char)std::tolower(static_cast<unsigned char>(canonical[i]));
        }
    }
    out.value = canonical;
    return true;
}

// generate builds a random version-4 identifier.
Uuid Uuid::generate() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    uint64_t hi = rng();
    uint64_t lo = rng();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::stringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(8) << (uint32_t)(hi >> 32) << "-"
       << std::setw(4) << (uint32_t)((hi >> 16) & 0xFFFF) << "-"
       << std::setw(4) << (uint32_t)(hi & 0xFFFF) << "-"
       << std::setw(4) << (uint32_t)(lo >> 48) << "-"
       << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return Uuid{ss.str()};
}

const char* metric_kind_name(MetricKind kind) {
    switch (kind) {
        case MetricKind::WeightReps: return "weightReps";
        case MetricKind::BodyweightReps: return "bodyweightReps";
        case MetricKind::TimeDistance: return "timeDistance";
        case MetricKind::Completion: return "completion";
    }
    return "weightReps";
}

const char* timer_state_name(TimerState state) {
    switch (state) {
        case TimerState::Idle: return "idle";
        case TimerState::Running: return "running";
        case TimerState::Alarm: return "alarm";
    }
    return "idle";
}

bool SetRecord::operator==(const SetRecord& other) const {
    return id == other.id && set_index == other.set_index && weight == other.weight &&
           reps == other.reps && duration_seconds == other.duration_seconds &&
           distance_meters == other.distance_meters && rest_seconds == other.rest_seconds &&
           completed == other.completed && completed_at == other.completed_at;
}

bool ExerciseEntry::operator==(const ExerciseEntry& other) const {
    return id == other.id && exercise_id == other.exercise_id && name == other.name &&
           order_index == other.order_index && group_order_index == other.group_order_index &&
           metric == other.metric && body_part_code == other.body_part_code && sets == other.sets;
}

bool ExerciseGroup::operator==(const ExerciseGroup& other) const {
    return id == other.id && order_index == other.order_index && set_count == other.set_count &&
           round_rest_seconds == other.round_rest_seconds && exercises == other.exercises;
}

bool WorkoutSnapshot::operator==(const WorkoutSnapshot& other) const {
    return routine_mode == other.routine_mode && exercises == other.exercises &&
           groups == other.groups && default_rest_seconds == other.default_rest_seconds &&
           auto_start_rest == other.auto_start_rest &&
           skip_rest_on_final_set == other.skip_rest_on_final_set;
}

bool TimerSnapshot::operator==(const TimerSnapshot& other) const {
    return end == other.end && total_duration == other.total_duration && state == other.state;
}

void for_each_set(const WorkoutSnapshot& snapshot, const std::function<void(const SetRecord&)>& fn) {
    for (const auto& entry : snapshot.exercises) {
        for (const auto& set : entry.sets) fn(set);
    }
    for (const auto& group : snapshot.groups) {
        for (const auto& entry : group.exercises) {
            for (const auto& set : entry.sets) fn(set);
        }
    }
}

SetRecord* find_set(WorkoutSnapshot& snapshot, const Uuid& id) {
    for (auto& entry : snapshot.exercises) {
        for (auto& set : entry.sets) {
            if (set.id == id) return &set;
        }
    }
    for (auto& group : snapshot.groups) {
        for (auto& entry : group.exercises) {
            for (auto& set : entry.sets) {
                if (set.id == id) return &set;
            }
        }
    }
    return nullptr;
}

int64_t to_millis(TimePoint at) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count();
}

TimePoint from_millis(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms)));
}
