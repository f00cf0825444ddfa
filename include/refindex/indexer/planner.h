// REFINDEX - Cycle Planner
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#ifndef REFINDEX_INDEXER_PLANNER_H
#define REFINDEX_INDEXER_PLANNER_H

#include "refindex/core/types.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace refindex {
namespace indexer {

enum class WorkReason {
    New,        // Above the local high-water mark
    Gap,        // At or below the mark but never stored
    Recheck,    // Stored, unfinalized, still on chain
    Vanished,   // Stored, unfinalized, gone from chain
};

const char* WorkReasonName(WorkReason reason);

struct WorkItem {
    RefId id{0};
    WorkReason reason{WorkReason::New};
};

struct WorkSet {
    std::vector<WorkItem> items;    // One entry per id, ascending

    size_t newCount{0};
    size_t gapCount{0};
    size_t recheckCount{0};
    size_t vanishedCount{0};

    bool empty() const { return items.empty(); }
    size_t size() const { return items.size(); }

    std::string ToString() const;
};

/**
 * Compute the ids one cycle must look at.
 *
 * @param localMax      Highest stored id, unset when nothing is stored
 * @param unfinalized   Stored ids that are not finalized
 * @param onChain       Ids currently present in chain storage
 * @param existsLocally Whether a row is stored for an id
 *
 * Finalized rows are never scheduled. Ids below localMax that are missing
 * both locally and on chain are scheduled as gaps so they get a Cleared row.
 */
WorkSet PlanCycle(std::optional<RefId> localMax,
                  const std::vector<RefId>& unfinalized,
                  const std::vector<RefId>& onChain,
                  const std::function<bool(RefId)>& existsLocally);

} // namespace indexer
} // namespace refindex

#endif // REFINDEX_INDEXER_PLANNER_H
