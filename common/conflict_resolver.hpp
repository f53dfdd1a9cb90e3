#pragma once
#include <optional>

#include "snapshot.hpp"

// CompletionState is the (completed, completed_at) pair that is resolved as
// one unit. Every other field of a set is structural.
struct CompletionState {
    bool completed = false;
    std::optional<TimePoint> completed_at;
};

enum class Winner { Local, Incoming };

/*
 * resolve_completion
 * Last-writer-wins on completed_at:
 *   local unstamped          -> incoming
 *   incoming unstamped       -> local
 *   both stamped             -> strictly later stamp, ties keep local
 */
Winner resolve_completion(const CompletionState& local, const CompletionState& incoming);

/*
 * merge_snapshots
 * Returns |incoming| with the completion pair of every set that also exists
 * in |local| (matched by set id, never by position) resolved through
 * resolve_completion. Ordering, grouping, metrics, names and targets are taken
 * from |incoming| unchanged.
 */
WorkoutSnapshot merge_snapshots(const WorkoutSnapshot& local, const WorkoutSnapshot& incoming);

// apply_completion resolves a single incoming pair against the set with
// |set_id| in |snapshot|. Returns true when the set exists and incoming won.
bool apply_completion(WorkoutSnapshot& snapshot, const Uuid& set_id, const CompletionState& incoming);
