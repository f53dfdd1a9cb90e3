#include <sstream>

#include <gtest/gtest.h>

#include "test_support.hpp"
#include "workout_progress.hpp"

static void complete(WorkoutSnapshot& w, int n) {
    SetRecord* set = find_set(w, uuid_of(n));
    ASSERT_NE(set, nullptr);
    set->completed = true;
}

TEST(WorkoutProgress, UngroupedSetComesFirstWhenOrderedFirst) {
    const WorkoutSnapshot w = sample_workout();
    const NextItem next = next_incomplete(w);
    ASSERT_EQ(next.kind, NextItem::Kind::Set);
    EXPECT_EQ(next.set->id, uuid_of(1));
    EXPECT_EQ(next.set_number, 1);
    EXPECT_EQ(next.total_sets, 3);
}

TEST(WorkoutProgress, SetsFollowSetIndexNotStorageOrder) {
    WorkoutSnapshot w = sample_workout();
    std::swap(w.exercises[0].sets[0], w.exercises[0].sets[2]);
    complete(w, 1);
    const NextItem next = next_incomplete(w);
    ASSERT_EQ(next.kind, NextItem::Kind::Set);
    EXPECT_EQ(next.set->id, uuid_of(2));
    EXPECT_EQ(next.set_number, 2);
}

TEST(WorkoutProgress, GroupWinsOnlyWithStrictlyLowerOrder) {
    WorkoutSnapshot w = sample_workout();
    w.groups[0].order_index = 0;  // tie with the ungrouped exercise
    EXPECT_EQ(next_incomplete(w).kind, NextItem::Kind::Set);

    w.exercises[0].order_index = 2;
    const NextItem next = next_incomplete(w);
    ASSERT_EQ(next.kind, NextItem::Kind::GroupRound);
    EXPECT_EQ(next.group->id, uuid_of(200));
    EXPECT_EQ(next.round, 1);
}

TEST(WorkoutProgress, GroupFollowsWhenUngroupedIsDone) {
    WorkoutSnapshot w = sample_workout();
    complete(w, 1);
    complete(w, 2);
    complete(w, 3);
    NextItem next = next_incomplete(w);
    ASSERT_EQ(next.kind, NextItem::Kind::GroupRound);
    EXPECT_EQ(next.round, 1);

    complete(w, 11);
    complete(w, 21);
    next = next_incomplete(w);
    ASSERT_EQ(next.kind, NextItem::Kind::GroupRound);
    EXPECT_EQ(next.round, 2);

    complete(w, 12);
    complete(w, 22);
    EXPECT_EQ(next_incomplete(w).kind, NextItem::Kind::None);
}

TEST(WorkoutProgress, RoundsCompletedUsesTheSlowestMember) {
    WorkoutSnapshot w = sample_workout();
    complete(w, 11);
    complete(w, 12);
    EXPECT_EQ(rounds_completed(w.groups[0]), 0);
    complete(w, 21);
    EXPECT_EQ(rounds_completed(w.groups[0]), 1);
    EXPECT_EQ(active_round(w.groups[0]), 2);
    EXPECT_FALSE(group_complete(w.groups[0]));
}

TEST(WorkoutProgress, RoundSetIdsSkipRecordedSets) {
    WorkoutSnapshot w = sample_workout();
    // Members listed out of group order.
    std::swap(w.groups[0].exercises[0], w.groups[0].exercises[1]);
    EXPECT_EQ(round_set_ids(w.groups[0], 1), (std::vector<Uuid>{uuid_of(11), uuid_of(21)}));

    complete(w, 11);
    EXPECT_EQ(round_set_ids(w.groups[0], 1), (std::vector<Uuid>{uuid_of(21)}));
    EXPECT_TRUE(round_set_ids(w.groups[0], 3).empty());
    EXPECT_TRUE(round_set_ids(w.groups[0], 0).empty());
}

TEST(WorkoutProgress, RestFallsBackToDefault) {
    WorkoutSnapshot w = sample_workout();
    RestDecision rest = rest_after_completion(w, std::nullopt, false);
    EXPECT_EQ(rest.seconds, 90);
    EXPECT_FALSE(rest.auto_start);

    w.auto_start_rest = true;
    rest = rest_after_completion(w, 45, false);
    EXPECT_EQ(rest.seconds, 45);
    EXPECT_TRUE(rest.auto_start);
}

TEST(WorkoutProgress, NoRestWhenZeroOrFinal) {
    WorkoutSnapshot w = sample_workout();
    EXPECT_EQ(rest_after_completion(w, 0, false).seconds, 0);

    EXPECT_EQ(rest_after_completion(w, 60, true).seconds, 0);
    w.skip_rest_on_final_set = false;
    EXPECT_EQ(rest_after_completion(w, 60, true).seconds, 60);

    w.default_rest_seconds = 0;
    EXPECT_EQ(rest_after_completion(w, std::nullopt, false).seconds, 0);
}

TEST(WorkoutProgress, PrintMarksCompletedSets) {
    WorkoutSnapshot w = sample_workout();
    complete(w, 2);
    std::ostringstream out;
    print_snapshot(out, w);
    const std::string text = out.str();
    EXPECT_NE(text.find("Bench Press"), std::string::npos);
    EXPECT_NE(text.find("[x] #2"), std::string::npos);
    EXPECT_NE(text.find("group 1 round 1/2"), std::string::npos);
}
