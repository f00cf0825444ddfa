// REFINDEX - Network Indexer Implementation
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include "refindex/indexer/network_indexer.h"

#include "refindex/chain/referendum.h"
#include "refindex/chain/storage.h"
#include "refindex/util/logging.h"
#include "refindex/util/time.h"

#include <future>
#include <sstream>

namespace refindex {
namespace indexer {

namespace {

util::ThreadPool::Config PoolConfig(const NetworkSettings& network, size_t workers) {
    util::ThreadPool::Config config;
    config.numThreads = workers == 0 ? 1 : workers;
    config.name = "idx-" + network.name;
    return config;
}

/// Closes the cycle's connection once every worker is done with it
class ConnectionGuard {
public:
    explicit ConnectionGuard(chain::ChainClient* client) : client_(client) {}
    ~ConnectionGuard() {
        if (client_) {
            client_->Close();
        }
    }

    ConnectionGuard(const ConnectionGuard&) = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;

private:
    chain::ChainClient* client_;
};

} // namespace

// Shared by the workers of one cycle
struct NetworkIndexer::CycleState {
    explicit CycleState(const util::CancellationToken& parent) : source(parent) {}

    util::CancellationSource source;
    std::atomic<bool> transportFailed{false};
    std::mutex mutex;
    std::string transportMessage;
};

std::string CycleReport::ToString() const {
    std::ostringstream ss;
    ss << networkName << ": ";
    if (cancelled) {
        ss << "cancelled";
    } else if (!completed) {
        ss << "aborted (" << chain::ErrorKindToString(abortKind) << ": " << abortMessage << ")";
    } else {
        ss << "completed";
    }
    ss << ", planned=" << planned
       << " [new=" << newIds << " gap=" << gapIds << " recheck=" << recheckIds
       << " vanished=" << vanishedIds << "]"
       << ", created=" << created << " updated=" << updated << " cleared=" << cleared
       << " unchanged=" << unchanged << " skipped=" << skipped << " errors=" << errors
       << ", " << duration.count() << "ms";
    return ss.str();
}

// ============================================================================
// NetworkIndexer
// ============================================================================

NetworkIndexer::NetworkIndexer(NetworkSettings network, size_t workers,
                               db::RefStore& store, chain::ClientFactory factory)
    : network_(std::move(network)),
      store_(store),
      factory_(std::move(factory)),
      pool_(PoolConfig(network_, workers)) {}

NetworkIndexer::~NetworkIndexer() {
    pool_.Shutdown();
}

void NetworkIndexer::AddObserver(CycleObserver observer) {
    std::lock_guard<std::mutex> lock(observersMutex_);
    observers_.push_back(std::move(observer));
}

void NetworkIndexer::Notify(const CycleReport& report) {
    std::vector<CycleObserver> observers;
    {
        std::lock_guard<std::mutex> lock(observersMutex_);
        observers = observers_;
    }
    for (const auto& observer : observers) {
        try {
            observer(report);
        } catch (const std::exception& e) {
            LOG_ERROR(util::LogCategory::INDEXER) << "Cycle observer threw: " << e.what();
        }
    }
}

CycleReport NetworkIndexer::RunCycle(const util::CancellationToken& cancel) {
    util::ScopedLogContext logContext(network_.name);
    util::ScopedLogTimer timer(util::LogCategory::INDEXER, "Cycle");
    ++cycles_;

    CycleReport report;
    report.network = network_.id;
    report.networkName = network_.name;

    auto finish = [&]() {
        report.duration = std::chrono::milliseconds(timer.ElapsedMillis());
        if (report.completed) {
            LOG_INFO(util::LogCategory::INDEXER) << "Cycle finished: " << report.ToString();
        } else {
            LOG_WARN(util::LogCategory::INDEXER) << "Cycle finished: " << report.ToString();
        }
        return report;
    };
    auto stop = [&](chain::ErrorKind kind, const std::string& message) {
        report.abortKind = kind;
        report.abortMessage = message;
        report.cancelled = kind == chain::ErrorKind::Cancelled;
        return finish();
    };

    LOG_INFO(util::LogCategory::INDEXER) << "Cycle started for network " << network_.id
                                         << " (" << network_.endpoints.size() << " endpoints)";

    // Connect
    auto connected = chain::ConnectChain(network_.endpoints, factory_, cancel);
    if (!connected.ok()) {
        return stop(connected.kind(), connected.message());
    }
    std::unique_ptr<chain::ChainClient> client = std::move(connected.value());
    ConnectionGuard guard(client.get());
    report.endpoint = client->Endpoint();

    auto count = chain::FetchReferendumCount(*client, cancel);
    if (count.ok()) {
        report.referendumCount = count.value();
        LOG_DEBUG(util::LogCategory::INDEXER) << "ReferendumCount on chain: " << count.value();
    } else if (count.kind() == chain::ErrorKind::Transport ||
               count.kind() == chain::ErrorKind::Cancelled) {
        return stop(count.kind(), count.message());
    } else {
        LOG_DEBUG(util::LogCategory::INDEXER) << "ReferendumCount unavailable: "
                                              << count.message();
    }

    // Plan
    std::optional<RefId> localMax;
    std::vector<RefId> unfinalized;
    db::Status s = store_.GetMaxRefID(network_.id, localMax);
    if (s.ok()) {
        s = store_.GetUnfinalizedRefIDs(network_.id, unfinalized);
    }
    if (!s.ok()) {
        return stop(chain::ErrorKind::None, "store: " + s.ToString());
    }

    auto ids = chain::EnumerateReferendumIds(*client, cancel);
    if (!ids.ok()) {
        return stop(ids.kind(), ids.message());
    }
    report.onChain = ids.value().size();

    WorkSet work = PlanCycle(localMax, unfinalized, ids.value(),
                             [this](RefId id) { return store_.ExistsRecord(network_.id, id); });
    report.planned = work.size();
    report.newIds = work.newCount;
    report.gapIds = work.gapCount;
    report.recheckIds = work.recheckCount;
    report.vanishedIds = work.vanishedCount;

    LOG_INFO(util::LogCategory::INDEXER) << "Local max "
                                         << (localMax ? std::to_string(*localMax) : "none")
                                         << ", " << unfinalized.size() << " unfinalized, "
                                         << report.onChain << " on chain; planned "
                                         << work.ToString();

    // Dispatch
    CycleState state(cancel);
    std::vector<std::future<ItemResult>> futures;
    futures.reserve(work.size());
    const chain::ChainClient& shared = *client;
    for (const WorkItem& item : work.items) {
        try {
            futures.push_back(pool_.Submit([this, &shared, item, &state]() {
                return ProcessItem(shared, item, state);
            }));
        } catch (const std::runtime_error& e) {
            LOG_ERROR(util::LogCategory::INDEXER) << "Dispatch stopped: " << e.what();
            report.skipped += work.size() - futures.size();
            break;
        }
    }

    // Aggregate
    for (auto& future : futures) {
        try {
            switch (future.get()) {
                case ItemResult::Created: ++report.created; break;
                case ItemResult::Updated: ++report.updated; break;
                case ItemResult::Cleared: ++report.cleared; break;
                case ItemResult::Unchanged:
                case ItemResult::Finalized: ++report.unchanged; break;
                case ItemResult::Error: ++report.errors; break;
                case ItemResult::Aborted: ++report.skipped; break;
            }
        } catch (const std::exception& e) {
            ++report.errors;
            LOG_ERROR(util::LogCategory::INDEXER) << "Worker failed: " << e.what();
        }
    }

    if (state.transportFailed) {
        std::lock_guard<std::mutex> lock(state.mutex);
        return stop(chain::ErrorKind::Transport, state.transportMessage);
    }
    if (cancel.IsCancelled()) {
        return stop(chain::ErrorKind::Cancelled, "cancelled");
    }
    report.completed = true;
    return finish();
}

NetworkIndexer::ItemResult NetworkIndexer::ProcessItem(const chain::ChainClient& client,
                                                       const WorkItem& item,
                                                       CycleState& state) {
    util::ScopedLogContext logContext(network_.name);
    const util::CancellationToken token = state.source.Token();
    if (token.IsCancelled()) {
        return ItemResult::Aborted;
    }

    auto raw = client.GetStorage(chain::ReferendumInfoKey(item.id), token);

    std::optional<chain::ReferendumInfo> info;
    if (raw.ok()) {
        chain::DecodeOptions options;
        options.originsPalletIndex = network_.originsPallet;
        try {
            info = chain::DecodeReferendumInfo(item.id, raw.value(), options);
        } catch (const chain::DecodeError& e) {
            LOG_WARN(util::LogCategory::DECODE) << "ref #" << item.id << ": " << e.what();
            return ItemResult::Error;
        }
        if (!info->complete) {
            LOG_DEBUG(util::LogCategory::DECODE) << "ref #" << item.id << " decoded up to "
                                                 << info->stoppedAt;
        }
    } else if (!raw.IsNotFound()) {
        switch (raw.kind()) {
            case chain::ErrorKind::Transport:
                if (!state.transportFailed.exchange(true)) {
                    {
                        std::lock_guard<std::mutex> lock(state.mutex);
                        state.transportMessage = raw.message();
                    }
                    LOG_WARN(util::LogCategory::INDEXER) << "Transport failure at ref #"
                                                         << item.id << ", aborting cycle: "
                                                         << raw.message();
                }
                state.source.Cancel();
                return ItemResult::Aborted;
            case chain::ErrorKind::Cancelled:
                return ItemResult::Aborted;
            default:
                LOG_WARN(util::LogCategory::INDEXER) << "ref #" << item.id << " ("
                                                     << WorkReasonName(item.reason) << "): "
                                                     << chain::ErrorKindToString(raw.kind())
                                                     << ": " << raw.message();
                return ItemResult::Error;
        }
    }

    RecordContext ctx;
    ctx.network = network_.id;
    ctx.ss58Prefix = network_.ss58Prefix;
    ctx.now = util::GetTime();

    std::string error;
    switch (Reconcile(store_, item.id, info, ctx, &error)) {
        case Outcome::Created: return ItemResult::Created;
        case Outcome::Updated: return ItemResult::Updated;
        case Outcome::Cleared: return ItemResult::Cleared;
        case Outcome::Unchanged: return ItemResult::Unchanged;
        case Outcome::Finalized: return ItemResult::Finalized;
        case Outcome::StoreError:
            LOG_WARN(util::LogCategory::DB) << "ref #" << item.id << ": " << error;
            return ItemResult::Error;
    }
    return ItemResult::Error;
}

void NetworkIndexer::Run(std::chrono::milliseconds interval,
                         const util::CancellationToken& cancel) {
    LOG_INFO(util::LogCategory::INDEXER) << "Indexer for " << network_.name << " started, every "
                                         << interval.count() / 1000 << "s with "
                                         << pool_.ThreadCount() << " workers";

    while (!cancel.IsCancelled()) {
        CycleReport report = RunCycle(cancel);
        Notify(report);
        if (cancel.WaitFor(interval)) {
            break;
        }
    }

    LOG_INFO(util::LogCategory::INDEXER) << "Indexer for " << network_.name << " stopped";
}

} // namespace indexer
} // namespace refindex
