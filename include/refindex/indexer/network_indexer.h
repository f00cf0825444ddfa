// REFINDEX - Network Indexer
// Copyright (c) 2024 REFINDEX Developers
// MIT License
//
// One reconciliation loop for one network. Each cycle:
//
//   1. connects to the first reachable endpoint;
//   2. plans from the store's high-water mark, its unfinalized ids and the
//      chain's ReferendumInfoFor keys;
//   3. fetches, decodes and reconciles every planned id on a worker pool;
//   4. reports the outcome to observers.
//
// A transport failure aborts what is left of the cycle. Any other per-id
// failure is counted and the id is retried next cycle.

#ifndef REFINDEX_INDEXER_NETWORK_INDEXER_H
#define REFINDEX_INDEXER_NETWORK_INDEXER_H

#include "refindex/chain/client.h"
#include "refindex/db/refdb.h"
#include "refindex/indexer/planner.h"
#include "refindex/indexer/reconciler.h"
#include "refindex/indexer/settings.h"
#include "refindex/util/cancel.h"
#include "refindex/util/threadpool.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace refindex {
namespace indexer {

// ============================================================================
// Cycle Report
// ============================================================================

struct CycleReport {
    NetworkId network{0};
    std::string networkName;
    std::string endpoint;           // Endpoint used, empty if none connected

    /// False when the cycle stopped early (no endpoint, transport, store)
    bool completed{false};
    bool cancelled{false};
    chain::ErrorKind abortKind{chain::ErrorKind::None};
    std::string abortMessage;

    std::optional<uint32_t> referendumCount;
    size_t onChain{0};

    // Work set classification
    size_t planned{0};
    size_t newIds{0};
    size_t gapIds{0};
    size_t recheckIds{0};
    size_t vanishedIds{0};

    // Outcomes
    size_t created{0};
    size_t updated{0};
    size_t cleared{0};
    size_t unchanged{0};
    size_t skipped{0};      // Not processed because the cycle was aborted
    size_t errors{0};

    std::chrono::milliseconds duration{0};

    std::string ToString() const;
};

using CycleObserver = std::function<void(const CycleReport&)>;

// ============================================================================
// Network Indexer
// ============================================================================

class NetworkIndexer {
public:
    /**
     * @param network  Network identity and endpoints
     * @param workers  Worker pool width
     * @param store    Shared store; must outlive the indexer
     * @param factory  Builds a client per endpoint per cycle
     */
    NetworkIndexer(NetworkSettings network, size_t workers,
                   db::RefStore& store, chain::ClientFactory factory);

    ~NetworkIndexer();

    NetworkIndexer(const NetworkIndexer&) = delete;
    NetworkIndexer& operator=(const NetworkIndexer&) = delete;

    /// Run one reconciliation cycle; never throws for chain or store failures
    CycleReport RunCycle(const util::CancellationToken& cancel);

    /**
     * Run cycles every interval until cancel fires. Returns without error
     * once cancelled; in-flight work is abandoned.
     */
    void Run(std::chrono::milliseconds interval, const util::CancellationToken& cancel);

    /// Called after every cycle from the loop thread
    void AddObserver(CycleObserver observer);

    const NetworkSettings& GetNetwork() const { return network_; }

    uint64_t CyclesRun() const { return cycles_.load(); }

private:
    enum class ItemResult {
        Created,
        Updated,
        Cleared,
        Unchanged,
        Finalized,
        Error,
        Aborted,
    };

    struct CycleState;

    ItemResult ProcessItem(const chain::ChainClient& client, const WorkItem& item,
                           CycleState& state);

    void Notify(const CycleReport& report);

    NetworkSettings network_;
    db::RefStore& store_;
    chain::ClientFactory factory_;
    util::ThreadPool pool_;

    std::vector<CycleObserver> observers_;
    std::mutex observersMutex_;

    std::atomic<uint64_t> cycles_{0};
};

} // namespace indexer
} // namespace refindex

#endif // REFINDEX_INDEXER_NETWORK_INDEXER_H
