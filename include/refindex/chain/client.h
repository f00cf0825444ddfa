// REFINDEX - Chain Client
// Copyright (c) 2024 REFINDEX Developers
// MIT License
//
// Typed access to a chain node: storage reads, key enumeration, the
// current head, endpoint failover and a polling head subscription.
//
// The client performs no retries. Failures are reported through
// ChainResult with an ErrorKind so callers can tell a dropped connection
// apart from a missing item or a slow node.

#ifndef REFINDEX_CHAIN_CLIENT_H
#define REFINDEX_CHAIN_CLIENT_H

#include "refindex/core/types.h"
#include "refindex/rpc/client.h"
#include "refindex/util/cancel.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace refindex {
namespace chain {

// ============================================================================
// Results
// ============================================================================

enum class ErrorKind {
    None,
    NotFound,             // Item absent (not an error for storage reads)
    Transport,            // Connect refused, connection dropped
    Timeout,              // Request deadline passed
    Rpc,                  // Node answered with a JSON-RPC error
    Protocol,             // Malformed response
    Cancelled,            // Caller's token fired
    NoReachableEndpoint   // Every configured endpoint failed
};

const char* ErrorKindToString(ErrorKind kind);

/**
 * Value or classified error.
 */
template<typename T>
class ChainResult {
public:
    static ChainResult Ok(T value) {
        ChainResult r;
        r.value_ = std::move(value);
        return r;
    }

    static ChainResult Error(ErrorKind kind, std::string message) {
        ChainResult r;
        r.kind_ = kind;
        r.message_ = std::move(message);
        return r;
    }

    /// Carry another result's error over to this value type
    template<typename U>
    static ChainResult From(const ChainResult<U>& other) {
        return Error(other.kind(), other.message());
    }

    bool ok() const { return kind_ == ErrorKind::None; }
    bool IsNotFound() const { return kind_ == ErrorKind::NotFound; }

    ErrorKind kind() const { return kind_; }
    const std::string& message() const { return message_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

private:
    ChainResult() = default;

    ErrorKind kind_{ErrorKind::None};
    std::string message_;
    std::optional<T> value_;
};

struct Header {
    BlockNumber number{0};
    std::string parentHash;
    std::string stateRoot;
};

// ============================================================================
// Chain Client Interface
// ============================================================================

/**
 * Read-only view of one chain endpoint. Query methods are const and safe to
 * call from many threads at once.
 */
class ChainClient {
public:
    virtual ~ChainClient() = default;

    /// Endpoint URL this client talks to
    virtual const std::string& Endpoint() const = 0;

    /// chain_getHeader; also the liveness check
    virtual ChainResult<Header> GetHead(const util::CancellationToken& cancel) const = 0;

    /**
     * state_getStorage. A null or empty ("0x") result is NotFound.
     */
    virtual ChainResult<Bytes> GetStorage(const Bytes& key,
                                          const util::CancellationToken& cancel) const = 0;

    /**
     * state_getKeysPaged: up to count keys under prefix, strictly after
     * startKey when given.
     */
    virtual ChainResult<std::vector<Bytes>> GetKeysPaged(
        const Bytes& prefix, uint32_t count, const Bytes* startKey,
        const util::CancellationToken& cancel) const = 0;

    /// chain_getBlockHash for a height, or the best block when unset
    virtual ChainResult<std::string> GetBlockHash(std::optional<BlockNumber> number,
                                                  const util::CancellationToken& cancel) const;

    /// Release the transport; later calls fail with Transport
    virtual void Close() = 0;
};

// ============================================================================
// JSON-RPC Implementation
// ============================================================================

class RPCChainClient : public ChainClient {
public:
    RPCChainClient(std::string endpoint, const rpc::RPCClientConfig& config);

    const std::string& Endpoint() const override { return endpoint_; }

    ChainResult<Header> GetHead(const util::CancellationToken& cancel) const override;

    ChainResult<Bytes> GetStorage(const Bytes& key,
                                  const util::CancellationToken& cancel) const override;

    ChainResult<std::vector<Bytes>> GetKeysPaged(
        const Bytes& prefix, uint32_t count, const Bytes* startKey,
        const util::CancellationToken& cancel) const override;

    ChainResult<std::string> GetBlockHash(std::optional<BlockNumber> number,
                                          const util::CancellationToken& cancel) const override;

    void Close() override { closed_ = true; }

    const rpc::RPCClient& GetRPCClient() const { return rpc_; }

private:
    ChainResult<rpc::JSONValue> CallMethod(const std::string& method,
                                           const rpc::JSONValue& params,
                                           const util::CancellationToken& cancel) const;

    std::string endpoint_;
    rpc::RPCClient rpc_;
    std::atomic<bool> closed_{false};
};

/// Builds a client for an endpoint URL; returns null if the URL is unusable
using ClientFactory = std::function<std::unique_ptr<ChainClient>(const std::string& endpoint)>;

/// Factory producing RPCChainClient with the given timeouts (seconds)
ClientFactory MakeRPCClientFactory(int connectTimeout, int requestTimeout);

// ============================================================================
// Connection and Enumeration
// ============================================================================

/**
 * Try each endpoint in order and return the first whose liveness check
 * succeeds. Fails with NoReachableEndpoint once the list is exhausted.
 */
ChainResult<std::unique_ptr<ChainClient>> ConnectChain(
    const std::vector<std::string>& endpoints,
    const ClientFactory& factory,
    const util::CancellationToken& cancel);

/// Page size used by EnumerateKeys
constexpr uint32_t KEYS_PAGE_SIZE = 1000;

/**
 * Every key under prefix. Pages through state_getKeysPaged until a short
 * page comes back; cancellation is checked between pages.
 */
ChainResult<std::vector<Bytes>> EnumerateKeys(const ChainClient& client,
                                              const Bytes& prefix,
                                              const util::CancellationToken& cancel,
                                              uint32_t pageSize = KEYS_PAGE_SIZE);

/**
 * Ids of every ReferendumInfoFor entry. Keys that fail RefIdFromKey are
 * logged and skipped.
 */
ChainResult<std::vector<RefId>> EnumerateReferendumIds(const ChainClient& client,
                                                       const util::CancellationToken& cancel);

/// Referenda::ReferendumCount
ChainResult<uint32_t> FetchReferendumCount(const ChainClient& client,
                                           const util::CancellationToken& cancel);

// ============================================================================
// Head Subscription
// ============================================================================

/**
 * Polls the chain head on its own thread and invokes the callback whenever
 * the head number changes. Staleness is bounded by the poll period.
 */
class HeadSubscription {
public:
    using Callback = std::function<void(const Header&)>;

    HeadSubscription(std::shared_ptr<const ChainClient> client, Callback callback,
                     std::chrono::milliseconds period,
                     const util::CancellationToken& parent);

    /// Stops and joins the polling thread
    ~HeadSubscription();

    HeadSubscription(const HeadSubscription&) = delete;
    HeadSubscription& operator=(const HeadSubscription&) = delete;

    void Stop();

    bool IsRunning() const { return running_.load(); }

    /// Number of heads delivered so far
    uint64_t Delivered() const { return delivered_.load(); }

private:
    void Run();

    std::shared_ptr<const ChainClient> client_;
    Callback callback_;
    std::chrono::milliseconds period_;
    util::CancellationSource cancel_;
    std::atomic<bool> running_{true};
    std::atomic<uint64_t> delivered_{0};
    std::thread thread_;
};

std::unique_ptr<HeadSubscription> SubscribeNewHeads(
    std::shared_ptr<const ChainClient> client,
    HeadSubscription::Callback callback,
    std::chrono::milliseconds period,
    const util::CancellationToken& cancel);

} // namespace chain
} // namespace refindex

#endif // REFINDEX_CHAIN_CLIENT_H
