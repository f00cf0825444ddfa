// REFINDEX - Indexer Service
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#ifndef REFINDEX_INDEXER_SERVICE_H
#define REFINDEX_INDEXER_SERVICE_H

#include "refindex/indexer/network_indexer.h"
#include "refindex/indexer/settings.h"
#include "refindex/util/cancel.h"

#include <memory>
#include <thread>
#include <vector>

namespace refindex {
namespace indexer {

/**
 * Owns one NetworkIndexer and one loop thread per enabled network. Loops
 * share only the store; cancelling the service token stops all of them.
 */
class MultiNetworkIndexer {
public:
    MultiNetworkIndexer(const IndexerSettings& settings, db::RefStore& store,
                        chain::ClientFactory factory);

    /// Stops and joins every loop
    ~MultiNetworkIndexer();

    MultiNetworkIndexer(const MultiNetworkIndexer&) = delete;
    MultiNetworkIndexer& operator=(const MultiNetworkIndexer&) = delete;

    /// Start one loop thread per network; false if already running
    bool Start(const util::CancellationToken& cancel);

    /// Cancel the loops and wait for them to exit
    void Stop();

    /// Block until every loop has exited
    void Join();

    bool IsRunning() const { return !threads_.empty(); }

    /// Run a single cycle on every network concurrently and wait for them
    std::vector<CycleReport> RunOnce(const util::CancellationToken& cancel);

    /// Registered on every network
    void AddObserver(const CycleObserver& observer);

    size_t NetworkCount() const { return indexers_.size(); }

    NetworkIndexer* GetIndexer(NetworkId id);

private:
    std::chrono::milliseconds interval_;
    std::vector<std::unique_ptr<NetworkIndexer>> indexers_;
    std::unique_ptr<util::CancellationSource> cancel_;
    std::vector<std::thread> threads_;
};

} // namespace indexer
} // namespace refindex

#endif // REFINDEX_INDEXER_SERVICE_H
