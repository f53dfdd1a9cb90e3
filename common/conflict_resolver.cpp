#include "conflict_resolver.hpp"

#include <unordered_map>

namespace {

using LocalStates = std::unordered_map<Uuid, CompletionState, UuidHash>;

void merge_entry(const LocalStates& local, ExerciseEntry& entry) {
    for (auto& set : entry.sets) {
        auto it = local.find(set.id);
        if (it == local.end()) continue;
        CompletionState incoming{set.completed, set.completed_at};
        if (resolve_completion(it->second, incoming) == Winner::Local) {
            set.completed = it->second.completed;
            set.completed_at = it->second.completed_at;
        }
    }
}

}  // namespace

Winner resolve_completion(const CompletionState& local, const CompletionState& incoming) {
    if (!local.completed_at) return Winner::Incoming;
    if (!incoming.completed_at) return Winner::Local;
    return *incoming.completed_at > *local.completed_at ? Winner::Incoming : Winner::Local;
}

WorkoutSnapshot merge_snapshots(const WorkoutSnapshot& local, const WorkoutSnapshot& incoming) {
    LocalStates states;
    for_each_set(local, [&](const SetRecord& set) {
        states[set.id] = CompletionState{set.completed, set.completed_at};
    });

    WorkoutSnapshot merged = incoming;
    for (auto& entry : merged.exercises) merge_entry(states, entry);
    for (auto& group : merged.groups) {
        for (auto& entry : group.exercises) merge_entry(states, entry);
    }
    return merged;
}

bool apply_completion(WorkoutSnapshot& snapshot, const Uuid& set_id, const CompletionState& incoming) {
    SetRecord* set = find_set(snapshot, set_id);
    if (!set) return false;
    CompletionState local{set->completed, set->completed_at};
    if (resolve_completion(local, incoming) != Winner::Incoming) return false;
    set->completed = incoming.completed;
    set->completed_at = incoming.completed_at;
    return true;
}
