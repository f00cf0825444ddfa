// REFINDEX - Indexer Service Implementation
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include "refindex/indexer/service.h"

#include "refindex/util/logging.h"

namespace refindex {
namespace indexer {

MultiNetworkIndexer::MultiNetworkIndexer(const IndexerSettings& settings, db::RefStore& store,
                                         chain::ClientFactory factory)
    : interval_(std::chrono::duration_cast<std::chrono::milliseconds>(settings.interval)) {
    for (const auto& network : settings.networks) {
        if (!network.enabled) {
            LOG_INFO(util::LogCategory::INDEXER) << "Network " << network.name << " disabled";
            continue;
        }
        indexers_.push_back(std::make_unique<NetworkIndexer>(network, settings.workers,
                                                             store, factory));
    }
}

MultiNetworkIndexer::~MultiNetworkIndexer() {
    Stop();
}

bool MultiNetworkIndexer::Start(const util::CancellationToken& cancel) {
    if (!threads_.empty()) {
        return false;
    }

    cancel_ = std::make_unique<util::CancellationSource>(cancel);
    util::CancellationToken token = cancel_->Token();
    for (auto& indexer : indexers_) {
        NetworkIndexer* ni = indexer.get();
        threads_.emplace_back([this, ni, token]() { ni->Run(interval_, token); });
    }

    LOG_INFO(util::LogCategory::INDEXER) << "Started " << threads_.size()
                                         << " network indexer(s)";
    return true;
}

void MultiNetworkIndexer::Stop() {
    if (cancel_) {
        cancel_->Cancel();
    }
    Join();
}

void MultiNetworkIndexer::Join() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

std::vector<CycleReport> MultiNetworkIndexer::RunOnce(const util::CancellationToken& cancel) {
    std::vector<CycleReport> reports(indexers_.size());
    std::vector<std::thread> threads;
    threads.reserve(indexers_.size());

    for (size_t i = 0; i < indexers_.size(); ++i) {
        threads.emplace_back([this, i, &reports, cancel]() {
            reports[i] = indexers_[i]->RunCycle(cancel);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    return reports;
}

void MultiNetworkIndexer::AddObserver(const CycleObserver& observer) {
    for (auto& indexer : indexers_) {
        indexer->AddObserver(observer);
    }
}

NetworkIndexer* MultiNetworkIndexer::GetIndexer(NetworkId id) {
    for (auto& indexer : indexers_) {
        if (indexer->GetNetwork().id == id) {
            return indexer.get();
        }
    }
    return nullptr;
}

} // namespace indexer
} // namespace refindex
