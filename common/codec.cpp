#include "codec.hpp"

#include <fstream>
#include <sstream>
#include <unordered_set>

#include <google/protobuf/text_format.h>

namespace {

void set_error(std::string* error, const std::string& what) {
    if (error) *error = what;
}

wsync::MetricType metric_to_message(MetricKind kind) {
    switch (kind) {
        case MetricKind::WeightReps: return wsync::METRIC_WEIGHT_REPS;
        case MetricKind::BodyweightReps: return wsync::METRIC_BODYWEIGHT_REPS;
        case MetricKind::TimeDistance: return wsync::METRIC_TIME_DISTANCE;
        case MetricKind::Completion: return wsync::METRIC_COMPLETION;
    }
    return wsync::METRIC_WEIGHT_REPS;
}

bool metric_from_message(int value, MetricKind& out) {
    switch (value) {
        case wsync::METRIC_WEIGHT_REPS: out = MetricKind::WeightReps; return true;
        case wsync::METRIC_BODYWEIGHT_REPS: out = MetricKind::BodyweightReps; return true;
        case wsync::METRIC_TIME_DISTANCE: out = MetricKind::TimeDistance; return true;
        case wsync::METRIC_COMPLETION: out = MetricKind::Completion; return true;
        default: return false;
    }
}

void set_to_message(const SetRecord& set, wsync::SetData& msg) {
    msg.set_id(set.id.value);
    msg.set_set_index(set.set_index);
    if (set.weight) msg.set_weight(*set.weight);
    if (set.reps) msg.set_reps(*set.reps);
    if (set.duration_seconds) msg.set_duration_seconds(*set.duration_seconds);
    if (set.distance_meters) msg.set_distance_meters(*set.distance_meters);
    if (set.rest_seconds) msg.set_rest_seconds(*set.rest_seconds);
    msg.set_is_completed(set.completed);
    if (set.completed_at) msg.set_completed_at_ms(to_millis(*set.completed_at));
}

void entry_to_message(const ExerciseEntry& entry, wsync::ExerciseData& msg) {
    msg.set_id(entry.id.value);
    msg.set_exercise_id(entry.exercise_id.value);
    msg.set_name(entry.name);
    msg.set_order_index(entry.order_index);
    if (entry.group_order_index) msg.set_group_order_index(*entry.group_order_index);
    msg.set_metric(metric_to_message(entry.metric));
    if (entry.body_part_code) msg.set_body_part_code(*entry.body_part_code);
    for (const auto& set : entry.sets) set_to_message(set, *msg.add_sets());
}

// Decoding state shared across one snapshot: set ids must be unique since
// they are the merge join key.
struct DecodeScope {
    std::unordered_set<std::string> set_ids;
    std::string* error = nullptr;
};

bool set_from_message(const wsync::SetData& msg, SetRecord& out, DecodeScope& scope) {
    if (!Uuid::parse(msg.id(), out.id)) {
        set_error(scope.error, "bad set id '" + msg.id() + "'");
        return false;
    }
    if (!scope.set_ids.insert(out.id.value).second) {
        set_error(scope.error, "duplicate set id " + out.id.value);
        return false;
    }
    out.set_index = msg.set_index();
    if (msg.has_weight()) out.weight = msg.weight();
    if (msg.has_reps()) out.reps = msg.reps();
    if (msg.has_duration_seconds()) out.duration_seconds = msg.duration_seconds();
    if (msg.has_distance_meters()) out.distance_meters = msg.distance_meters();
    if (msg.has_rest_seconds()) out.rest_seconds = msg.rest_seconds();
    out.completed = msg.is_completed();
    if (msg.has_completed_at_ms()) out.completed_at = from_millis(msg.completed_at_ms());
    return true;
}

bool entry_from_message(const wsync::ExerciseData& msg, ExerciseEntry& out, DecodeScope& scope) {
    if (!Uuid::parse(msg.id(), out.id) || !Uuid::parse(msg.exercise_id(), out.exercise_id)) {
        set_error(scope.error, "bad exercise id in '" + msg.name() + "'");
        return false;
    }
    if (!metric_from_message(msg.metric(), out.metric)) {
        set_error(scope.error, "unknown metric " + std::to_string(msg.metric()));
        return false;
    }
    out.name = msg.name();
    out.order_index = msg.order_index();
    if (msg.has_group_order_index()) out.group_order_index = msg.group_order_index();
    if (msg.has_body_part_code()) out.body_part_code = msg.body_part_code();
    out.sets.reserve(msg.sets_size());
    for (const auto& s : msg.sets()) {
        SetRecord set;
        if (!set_from_message(s, set, scope)) return false;
        out.sets.push_back(std::move(set));
    }
    return true;
}

}  // namespace

void to_message(const WorkoutSnapshot& snapshot, wsync::WorkoutData& msg) {
    msg.set_routine_mode(snapshot.routine_mode);
    for (const auto& entry : snapshot.exercises) entry_to_message(entry, *msg.add_exercises());
    for (const auto& group : snapshot.groups) {
        wsync::GroupData* g = msg.add_groups();
        g->set_id(group.id.value);
        g->set_order_index(group.order_index);
        g->set_set_count(group.set_count);
        if (group.round_rest_seconds) g->set_round_rest_seconds(*group.round_rest_seconds);
        for (const auto& entry : group.exercises) entry_to_message(entry, *g->add_exercises());
    }
    msg.set_default_rest_seconds(snapshot.default_rest_seconds);
    msg.set_auto_start_rest(snapshot.auto_start_rest);
    msg.set_skip_rest_on_final_set(snapshot.skip_rest_on_final_set);
}

bool from_message(const wsync::WorkoutData& msg, WorkoutSnapshot& out, std::string* error) {
    DecodeScope scope;
    scope.error = error;

    WorkoutSnapshot snapshot;
    snapshot.routine_mode = msg.routine_mode();
    snapshot.default_rest_seconds = msg.default_rest_seconds();
    snapshot.auto_start_rest = msg.auto_start_rest();
    snapshot.skip_rest_on_final_set =
        msg.has_skip_rest_on_final_set() ? msg.skip_rest_on_final_set() : true;

    for (const auto& e : msg.exercises()) {
        ExerciseEntry entry;
        if (!entry_from_message(e, entry, scope)) return false;
        snapshot.exercises.push_back(std::move(entry));
    }
    for (const auto& g : msg.groups()) {
        ExerciseGroup group;
        if (!Uuid::parse(g.id(), group.id)) {
            set_error(error, "bad group id '" + g.id() + "'");
            return false;
        }
        group.order_index = g.order_index();
        group.set_count = g.set_count();
        if (g.has_round_rest_seconds()) group.round_rest_seconds = g.round_rest_seconds();
        for (const auto& e : g.exercises()) {
            ExerciseEntry entry;
            if (!entry_from_message(e, entry, scope)) return false;
            group.exercises.push_back(std::move(entry));
        }
        snapshot.groups.push_back(std::move(group));
    }
    out = std::move(snapshot);
    return true;
}

bool encode_snapshot(const WorkoutSnapshot& snapshot, std::string& bytes) {
    wsync::WorkoutData msg;
    to_message(snapshot, msg);
    return msg.SerializeToString(&bytes);
}

bool decode_snapshot(const std::string& bytes, WorkoutSnapshot& out, std::string* error) {
    wsync::WorkoutData msg;
    if (!msg.ParseFromString(bytes)) {
        set_error(error, "not a WorkoutData message");
        return false;
    }
    return from_message(msg, out, error);
}

bool encode_set_completion(const Uuid& set_id, TimePoint completed_at, std::string& bytes) {
    wsync::SetCompletionMessage msg;
    msg.set_set_id(set_id.value);
    msg.set_completed_at_ms(to_millis(completed_at));
    return msg.SerializeToString(&bytes);
}

bool decode_set_completion(const std::string& bytes, Uuid& set_id, TimePoint& completed_at) {
    wsync::SetCompletionMessage msg;
    if (!msg.ParseFromString(bytes)) return false;
    if (!Uuid::parse(msg.set_id(), set_id)) return false;
    completed_at = from_millis(msg.completed_at_ms());
    return true;
}

bool encode_timer(const TimerSnapshot& timer, std::string& bytes) {
    wsync::TimerRecord msg;
    if (timer.end) msg.set_end_ms(to_millis(*timer.end));
    msg.set_total_duration(timer.total_duration);
    switch (timer.state) {
        case TimerState::Idle: msg.set_state(wsync::TIMER_IDLE); break;
        case TimerState::Running: msg.set_state(wsync::TIMER_RUNNING); break;
        case TimerState::Alarm: msg.set_state(wsync::TIMER_ALARM); break;
    }
    return msg.SerializeToString(&bytes);
}

bool decode_timer(const std::string& bytes, TimerSnapshot& out) {
    wsync::TimerRecord msg;
    if (!msg.ParseFromString(bytes)) return false;

    TimerSnapshot timer;
    switch (msg.state()) {
        case wsync::TIMER_IDLE: timer.state = TimerState::Idle; break;
        case wsync::TIMER_RUNNING: timer.state = TimerState::Running; break;
        case wsync::TIMER_ALARM: timer.state = TimerState::Alarm; break;
        default: return false;
    }
    if (msg.has_end_ms()) timer.end = from_millis(msg.end_ms());
    timer.total_duration = msg.total_duration();
    out = timer;
    return true;
}

bool load_workout_textproto(const std::string& path, WorkoutSnapshot& out, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "cannot open " + path;
        return false;
    }
    std::stringstream text;
    text << in.rdbuf();

    wsync::WorkoutData msg;
    if (!google::protobuf::TextFormat::ParseFromString(text.str(), &msg)) {
        error = "cannot parse " + path + " as wsync.WorkoutData";
        return false;
    }
    return from_message(msg, out, &error);
}
