// REFINDEX - Cycle Planner Implementation
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include "refindex/indexer/planner.h"

#include <map>
#include <set>
#include <sstream>

namespace refindex {
namespace indexer {

const char* WorkReasonName(WorkReason reason) {
    switch (reason) {
        case WorkReason::New: return "new";
        case WorkReason::Gap: return "gap";
        case WorkReason::Recheck: return "recheck";
        case WorkReason::Vanished: return "vanished";
    }
    return "unknown";
}

std::string WorkSet::ToString() const {
    std::ostringstream ss;
    ss << items.size() << " ids (new=" << newCount << ", gap=" << gapCount
       << ", recheck=" << recheckCount << ", vanished=" << vanishedCount << ")";
    return ss.str();
}

WorkSet PlanCycle(std::optional<RefId> localMax,
                  const std::vector<RefId>& unfinalized,
                  const std::vector<RefId>& onChain,
                  const std::function<bool(RefId)>& existsLocally) {
    const std::set<RefId> chainIds(onChain.begin(), onChain.end());
    const std::set<RefId> openIds(unfinalized.begin(), unfinalized.end());
    std::map<RefId, WorkReason> plan;

    for (RefId id : chainIds) {
        if (!localMax || id > *localMax) {
            plan.emplace(id, WorkReason::New);
        } else if (openIds.count(id)) {
            plan.emplace(id, WorkReason::Recheck);
        } else if (!existsLocally(id)) {
            plan.emplace(id, WorkReason::Gap);
        }
    }

    for (RefId id : openIds) {
        if (!chainIds.count(id)) {
            plan.emplace(id, WorkReason::Vanished);
        }
    }

    if (localMax) {
        for (RefId id = 0; id < *localMax; ++id) {
            if (!chainIds.count(id) && !openIds.count(id) && !existsLocally(id)) {
                plan.emplace(id, WorkReason::Gap);
            }
        }
    }

    WorkSet work;
    work.items.reserve(plan.size());
    for (const auto& [id, reason] : plan) {
        work.items.push_back(WorkItem{id, reason});
        switch (reason) {
            case WorkReason::New: ++work.newCount; break;
            case WorkReason::Gap: ++work.gapCount; break;
            case WorkReason::Recheck: ++work.recheckCount; break;
            case WorkReason::Vanished: ++work.vanishedCount; break;
        }
    }
    return work;
}

} // namespace indexer
} // namespace refindex
