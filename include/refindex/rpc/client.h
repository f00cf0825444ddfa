// REFINDEX - RPC Client
// Copyright (c) 2024 REFINDEX Developers
// MIT License
//
// JSON-RPC 2.0 over HTTP/1.1 for talking to chain nodes.
//
// Each call opens its own socket, so one client may be shared by many
// worker threads. Every socket wait polls in short slices and checks the
// caller's cancellation token, and every call carries its own deadline.

#ifndef REFINDEX_RPC_CLIENT_H
#define REFINDEX_RPC_CLIENT_H

#include "refindex/rpc/json.h"
#include "refindex/util/cancel.h"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace refindex {
namespace rpc {

// ============================================================================
// RPC Client Configuration
// ============================================================================

struct RPCClientConfig {
    /// Server hostname or IP
    std::string host{"127.0.0.1"};

    /// Server port
    uint16_t port{9933};

    /// Request path
    std::string path{"/"};

    /// Connection timeout (seconds)
    int connectTimeout{10};

    /// Request timeout, send to last byte (seconds)
    int requestTimeout{30};

    /// "host:port/path" for log lines
    std::string ToString() const;
};

/**
 * Parse an endpoint URL into a client configuration.
 *
 * Accepts http://host[:port][/path] and ws://host[:port][/path]; a ws
 * endpoint is reached over plain HTTP on the same port. https:// and wss://
 * are refused since the client does not speak TLS. IPv6 literals go in
 * brackets. Timeouts are left at their defaults.
 *
 * @param error Receives the reason on failure (may be null)
 */
std::optional<RPCClientConfig> ParseEndpointURL(const std::string& url,
                                                std::string* error = nullptr);

// ============================================================================
// Call Result
// ============================================================================

enum class TransportStatus {
    OK,             // A JSON-RPC response arrived (may still be an RPC error)
    ConnectFailed,  // Resolve or connect failed
    SendFailed,     // Connection dropped while sending
    ReceiveFailed,  // Connection dropped before a full response arrived
    Timeout,        // Request deadline passed
    Cancelled,      // Caller's token fired
    BadResponse     // Malformed HTTP or not a JSON-RPC response
};

const char* TransportStatusToString(TransportStatus status);

struct RPCCallResult {
    TransportStatus status{TransportStatus::OK};

    /// Valid when status is OK
    RPCResponse response;

    /// Human-readable cause when status is not OK
    std::string error;

    /// True if a response arrived and carries a result
    bool IsSuccess() const { return status == TransportStatus::OK && !response.IsError(); }
};

// ============================================================================
// RPC Client
// ============================================================================

/**
 * JSON-RPC 2.0 client.
 * Thread-safe: every call is independent.
 */
class RPCClient {
public:
    RPCClient() = default;
    explicit RPCClient(const RPCClientConfig& config) : config_(config) {}

    RPCClient(const RPCClient&) = delete;
    RPCClient& operator=(const RPCClient&) = delete;

    const RPCClientConfig& GetConfig() const { return config_; }

    /**
     * Perform one round trip. Never throws for network conditions.
     *
     * @param params Positional parameters (null sends [])
     * @param cancel Aborts connect, send and receive waits when fired
     */
    RPCCallResult Call(const std::string& method,
                       const JSONValue& params = JSONValue(),
                       const util::CancellationToken& cancel = util::CancellationToken()) const;

    // === Statistics ===

    uint64_t GetTotalCalls() const { return totalCalls_.load(); }

    uint64_t GetTotalErrors() const { return totalErrors_.load(); }

    /// Mean round-trip time of successful calls (milliseconds)
    double GetAverageResponseTime() const;

    // === HTTP framing (exposed for tests) ===

    std::string BuildHTTPRequest(const std::string& body) const;

    /**
     * Split a complete HTTP response into status code and body.
     * Decodes chunked transfer encoding.
     */
    static bool ParseHTTPResponse(const std::string& raw, std::string& body, int& statusCode);

    /// True once raw holds a whole response (Content-Length or final chunk)
    static bool IsCompleteHTTPResponse(const std::string& raw);

private:
    int64_t GenerateId() const { return ++nextId_; }

    RPCCallResult Fail(TransportStatus status, std::string error) const;

    RPCClientConfig config_;

    mutable std::atomic<int64_t> nextId_{0};
    mutable std::atomic<uint64_t> totalCalls_{0};
    mutable std::atomic<uint64_t> totalErrors_{0};
    mutable std::atomic<uint64_t> okCalls_{0};
    mutable std::atomic<uint64_t> totalResponseTime_{0};
};

} // namespace rpc
} // namespace refindex

#endif // REFINDEX_RPC_CLIENT_H
