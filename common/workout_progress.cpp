#include "workout_progress.hpp"

#include <algorithm>

static std::vector<const SetRecord*> sorted_sets(const ExerciseEntry& exercise) {
    std::vector<const SetRecord*> sets;
    for (const auto& set : exercise.sets) sets.push_back(&set);
    std::stable_sort(sets.begin(), sets.end(), [](const SetRecord* a, const SetRecord* b) {
        return a->set_index < b->set_index;
    });
    return sets;
}

int completed_sets(const ExerciseEntry& exercise) {
    int count = 0;
    for (const auto& set : exercise.sets) {
        if (set.completed) count++;
    }
    return count;
}

int rounds_completed(const ExerciseGroup& group) {
    if (group.set_count <= 0 || group.exercises.empty()) return 0;
    int fewest = completed_sets(group.exercises.front());
    for (const auto& member : group.exercises) fewest = std::min(fewest, completed_sets(member));
    return std::min(fewest, group.set_count);
}

int active_round(const ExerciseGroup& group) {
    return std::min(rounds_completed(group) + 1, std::max(group.set_count, 1));
}

bool group_complete(const ExerciseGroup& group) {
    return rounds_completed(group) >= group.set_count;
}

NextItem next_incomplete(const WorkoutSnapshot& snapshot) {
    const ExerciseGroup* group = nullptr;
    for (const auto& candidate : snapshot.groups) {
        if (group_complete(candidate)) continue;
        if (!group || candidate.order_index < group->order_index) group = &candidate;
    }

    std::vector<const ExerciseEntry*> ungrouped;
    for (const auto& exercise : snapshot.exercises) ungrouped.push_back(&exercise);
    std::stable_sort(ungrouped.begin(), ungrouped.end(),
                     [](const ExerciseEntry* a, const ExerciseEntry* b) {
                         return a->order_index < b->order_index;
                     });

    NextItem set_item;
    for (const ExerciseEntry* exercise : ungrouped) {
        const auto sets = sorted_sets(*exercise);
        for (size_t i = 0; i < sets.size(); i++) {
            if (sets[i]->completed) continue;
            set_item.kind = NextItem::Kind::Set;
            set_item.exercise = exercise;
            set_item.set = sets[i];
            set_item.set_number = (int)i + 1;
            set_item.total_sets = (int)sets.size();
            break;
        }
        if (set_item.kind != NextItem::Kind::None) break;
    }

    if (group && (set_item.kind == NextItem::Kind::None ||
                  group->order_index < set_item.exercise->order_index)) {
        NextItem item;
        item.kind = NextItem::Kind::GroupRound;
        item.group = group;
        item.round = active_round(*group);
        return item;
    }
    return set_item;
}

std::vector<Uuid> round_set_ids(const ExerciseGroup& group, int round) {
    std::vector<Uuid> ids;
    if (round <= 0) return ids;

    std::vector<const ExerciseEntry*> members;
    for (const auto& member : group.exercises) members.push_back(&member);
    std::stable_sort(members.begin(), members.end(),
                     [](const ExerciseEntry* a, const ExerciseEntry* b) {
                         return a->group_order_index.value_or(a->order_index) <
                                b->group_order_index.value_or(b->order_index);
                     });

    const size_t index = (size_t)round - 1;
    for (const ExerciseEntry* member : members) {
        const auto sets = sorted_sets(*member);
        if (index >= sets.size()) continue;
        if (!sets[index]->completed) ids.push_back(sets[index]->id);
    }
    return ids;
}

RestDecision rest_after_completion(const WorkoutSnapshot& snapshot,
                                   std::optional<int> rest_seconds, bool final_set) {
    RestDecision decision;
    const int effective = rest_seconds.value_or(snapshot.default_rest_seconds);
    if (effective <= 0) return decision;
    if (final_set && snapshot.skip_rest_on_final_set) return decision;
    decision.seconds = effective;
    decision.auto_start = snapshot.auto_start_rest;
    return decision;
}

static void print_exercise(std::ostream& out, const ExerciseEntry& exercise, const char* indent) {
    out << indent << exercise.name << " (" << metric_kind_name(exercise.metric) << ")\n";
    for (const SetRecord* set : sorted_sets(exercise)) {
        out << indent << "  [" << (set->completed ? 'x' : ' ') << "] #" << set->set_index;
        if (set->weight) out << " " << *set->weight << "kg";
        if (set->reps) out << " x" << *set->reps;
        if (set->duration_seconds) out << " " << *set->duration_seconds << "s";
        if (set->distance_meters) out << " " << *set->distance_meters << "m";
        out << "  " << set->id.value << "\n";
    }
}

void print_snapshot(std::ostream& out, const WorkoutSnapshot& snapshot) {
    for (const auto& exercise : snapshot.exercises) print_exercise(out, exercise, "");
    for (const auto& group : snapshot.groups) {
        out << "group " << group.order_index << " round " << active_round(group) << "/"
            << group.set_count << (group_complete(group) ? " done" : "") << "\n";
        for (const auto& member : group.exercises) print_exercise(out, member, "  ");
    }
}
