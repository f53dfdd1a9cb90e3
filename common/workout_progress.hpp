#pragma once
#include <optional>
#include <ostream>
#include <vector>

#include "snapshot.hpp"

// What the companion should record next.
struct NextItem {
    enum class Kind { None, Set, GroupRound };

    Kind kind = Kind::None;
    // Set: the exercise and set; set_number/total_sets are 1-based positions
    // within the exercise ordered by set index.
    const ExerciseEntry* exercise = nullptr;
    const SetRecord* set = nullptr;
    int set_number = 0;
    int total_sets = 0;
    // GroupRound: the group and its 1-based active round.
    const ExerciseGroup* group = nullptr;
    int round = 0;
};

int completed_sets(const ExerciseEntry& exercise);

// Fewest completed sets across the members, capped at the group's set count.
int rounds_completed(const ExerciseGroup& group);

int active_round(const ExerciseGroup& group);

bool group_complete(const ExerciseGroup& group);

/*
 * next_incomplete
 * The earliest unfinished group competes with the first incomplete ungrouped
 * set; the group is chosen only when its order index is strictly lower than
 * that set's exercise. Pointers refer into |snapshot|.
 */
NextItem next_incomplete(const WorkoutSnapshot& snapshot);

// Incomplete set ids of |round| across members ordered by order index.
std::vector<Uuid> round_set_ids(const ExerciseGroup& group, int round);

struct RestDecision {
    int seconds = 0;          // 0 means no rest
    bool auto_start = false;  // otherwise ask before starting
};

// Effective rest after a recorded set or round. |rest_seconds| falls back to
// the snapshot default.
RestDecision rest_after_completion(const WorkoutSnapshot& snapshot,
                                   std::optional<int> rest_seconds, bool final_set);

// One line per set, grouped the way the companion shows them.
void print_snapshot(std::ostream& out, const WorkoutSnapshot& snapshot);
