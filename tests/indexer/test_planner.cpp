// REFINDEX - Cycle Planner Tests
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include <gtest/gtest.h>

#include "refindex/indexer/planner.h"

#include <set>

using namespace refindex;
using namespace refindex::indexer;

namespace {

std::function<bool(RefId)> StoredIds(std::set<RefId> ids) {
    return [ids = std::move(ids)](RefId id) { return ids.count(id) > 0; };
}

std::vector<RefId> Ids(const WorkSet& work) {
    std::vector<RefId> out;
    for (const auto& item : work.items) {
        out.push_back(item.id);
    }
    return out;
}

WorkReason ReasonOf(const WorkSet& work, RefId id) {
    for (const auto& item : work.items) {
        if (item.id == id) {
            return item.reason;
        }
    }
    ADD_FAILURE() << "id " << id << " not planned";
    return WorkReason::New;
}

} // namespace

TEST(PlannerTest, EmptyStoreSchedulesEverythingAsNew) {
    WorkSet work = PlanCycle(std::nullopt, {}, {2, 0, 1}, StoredIds({}));

    EXPECT_EQ(Ids(work), (std::vector<RefId>{0, 1, 2}));
    EXPECT_EQ(work.newCount, 3u);
    EXPECT_EQ(work.gapCount, 0u);
    for (const auto& item : work.items) {
        EXPECT_EQ(item.reason, WorkReason::New);
    }
}

TEST(PlannerTest, NothingOnChainNothingStored) {
    WorkSet work = PlanCycle(std::nullopt, {}, {}, StoredIds({}));
    EXPECT_TRUE(work.empty());
    EXPECT_EQ(work.ToString(), "0 ids (new=0, gap=0, recheck=0, vanished=0)");
}

TEST(PlannerTest, MixedCycle) {
    // Stored: 0, 1 finalized; 3, 5 open. Chain lost 4 before we saw it.
    WorkSet work = PlanCycle(5, {3, 5}, {0, 1, 2, 3, 5, 6, 7}, StoredIds({0, 1, 3, 5}));

    EXPECT_EQ(Ids(work), (std::vector<RefId>{2, 3, 4, 5, 6, 7}));
    EXPECT_EQ(ReasonOf(work, 2), WorkReason::Gap);
    EXPECT_EQ(ReasonOf(work, 3), WorkReason::Recheck);
    EXPECT_EQ(ReasonOf(work, 4), WorkReason::Gap);
    EXPECT_EQ(ReasonOf(work, 5), WorkReason::Recheck);
    EXPECT_EQ(ReasonOf(work, 6), WorkReason::New);
    EXPECT_EQ(ReasonOf(work, 7), WorkReason::New);

    EXPECT_EQ(work.newCount, 2u);
    EXPECT_EQ(work.gapCount, 2u);
    EXPECT_EQ(work.recheckCount, 2u);
    EXPECT_EQ(work.vanishedCount, 0u);
}

TEST(PlannerTest, FinalizedRowsAreNeverScheduled) {
    // 0 and 1 are final locally whether or not the chain still has them
    WorkSet work = PlanCycle(1, {}, {1}, StoredIds({0, 1}));
    EXPECT_TRUE(work.empty());
}

TEST(PlannerTest, OpenRowMissingFromChainIsVanished) {
    WorkSet work = PlanCycle(4, {2, 4}, {4}, StoredIds({0, 1, 2, 3, 4}));

    EXPECT_EQ(Ids(work), (std::vector<RefId>{2, 4}));
    EXPECT_EQ(ReasonOf(work, 2), WorkReason::Vanished);
    EXPECT_EQ(ReasonOf(work, 4), WorkReason::Recheck);
    EXPECT_EQ(work.vanishedCount, 1u);
}

TEST(PlannerTest, GapsOnlyBelowLocalMax) {
    // Nothing stored below 3; chain has only 3 and 10
    WorkSet work = PlanCycle(3, {}, {3, 10}, StoredIds({3}));

    EXPECT_EQ(Ids(work), (std::vector<RefId>{0, 1, 2, 10}));
    EXPECT_EQ(work.gapCount, 3u);
    EXPECT_EQ(ReasonOf(work, 10), WorkReason::New);
    EXPECT_EQ(work.ToString(), "4 ids (new=1, gap=3, recheck=0, vanished=0)");
}

TEST(PlannerTest, DuplicateChainIdsPlannedOnce) {
    WorkSet work = PlanCycle(std::nullopt, {}, {5, 5, 5}, StoredIds({}));
    ASSERT_EQ(work.size(), 1u);
    EXPECT_EQ(work.items[0].id, 5u);
}

TEST(PlannerTest, ReasonNames) {
    EXPECT_STREQ(WorkReasonName(WorkReason::New), "new");
    EXPECT_STREQ(WorkReasonName(WorkReason::Gap), "gap");
    EXPECT_STREQ(WorkReasonName(WorkReason::Recheck), "recheck");
    EXPECT_STREQ(WorkReasonName(WorkReason::Vanished), "vanished");
}
