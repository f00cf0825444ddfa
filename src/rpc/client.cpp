// REFINDEX - RPC Client Implementation
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include "refindex/rpc/client.h"
#include "refindex/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace refindex {
namespace rpc {

namespace {

using SteadyClock = std::chrono::steady_clock;

/// Longest single poll() before the cancellation token is rechecked
constexpr int POLL_SLICE_MS = 100;

constexpr size_t MAX_RESPONSE_SIZE = 64 * 1024 * 1024;

enum class WaitResult { Ready, Timeout, Cancelled, Error };

/// Closes the descriptor on scope exit
class ScopedSocket {
public:
    ScopedSocket() = default;
    ~ScopedSocket() { Reset(); }

    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    void Reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_{-1};
};

WaitResult WaitSocket(int fd, short events, SteadyClock::time_point deadline,
                      const util::CancellationToken& cancel) {
    while (true) {
        if (cancel.IsCancelled()) {
            return WaitResult::Cancelled;
        }
        auto now = SteadyClock::now();
        if (now >= deadline) {
            return WaitResult::Timeout;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int slice = static_cast<int>(std::min<int64_t>(POLL_SLICE_MS, remaining.count() + 1));

        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = events;
        pfd.revents = 0;
        int rc = ::poll(&pfd, 1, slice);
        if (rc > 0) {
            // POLLERR/POLLHUP surface through the following send/recv
            return WaitResult::Ready;
        }
        if (rc < 0 && errno != EINTR) {
            return WaitResult::Error;
        }
    }
}

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

/// Value of a header in a lower-cased header block, or empty
std::string FindHeader(const std::string& lowerHeaders, const std::string& name) {
    std::string needle = "\r\n" + name + ":";
    size_t pos = lowerHeaders.find(needle);
    if (pos == std::string::npos) {
        return "";
    }
    pos += needle.size();
    size_t end = lowerHeaders.find("\r\n", pos);
    std::string value = lowerHeaders.substr(pos, end == std::string::npos ? std::string::npos
                                                                           : end - pos);
    size_t first = value.find_first_not_of(" \t");
    size_t last = value.find_last_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    return value.substr(first, last - first + 1);
}

/**
 * Parse a Content-Length or chunk-size field. Fails on anything that is not
 * a plain number in the given base or that exceeds MAX_RESPONSE_SIZE.
 */
bool ParseLength(const std::string& digits, int base, size_t& out) {
    if (digits.empty() || digits.size() > 16) {
        return false;
    }
    for (unsigned char c : digits) {
        if (base == 16 ? !std::isxdigit(c) : !std::isdigit(c)) {
            return false;
        }
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(digits.c_str(), &end, base);
    if (errno == ERANGE || end != digits.c_str() + digits.size() ||
        value > MAX_RESPONSE_SIZE) {
        return false;
    }
    out = static_cast<size_t>(value);
    return true;
}

enum class ChunkedState { Complete, Incomplete, Malformed };

/// Longest chunk-size line accepted, extensions included
constexpr size_t MAX_CHUNK_LINE = 1024;

ChunkedState DecodeChunked(const std::string& raw, size_t pos, std::string& body) {
    body.clear();
    while (pos < raw.size()) {
        size_t lineEnd = raw.find("\r\n", pos);
        if (lineEnd == std::string::npos) {
            return raw.size() - pos > MAX_CHUNK_LINE ? ChunkedState::Malformed
                                                     : ChunkedState::Incomplete;
        }
        std::string sizeStr = raw.substr(pos, lineEnd - pos);
        size_t extPos = sizeStr.find(';');
        if (extPos != std::string::npos) {
            sizeStr.resize(extPos);
        }
        size_t chunkSize = 0;
        if (!ParseLength(sizeStr, 16, chunkSize) || body.size() + chunkSize > MAX_RESPONSE_SIZE) {
            return ChunkedState::Malformed;
        }
        pos = lineEnd + 2;
        if (chunkSize == 0) {
            return ChunkedState::Complete;  // trailers, if any, are ignored
        }
        if (raw.size() - pos < chunkSize + 2) {
            return ChunkedState::Incomplete;
        }
        body.append(raw, pos, chunkSize);
        pos += chunkSize + 2;
    }
    return ChunkedState::Incomplete;
}

TransportStatus Connect(ScopedSocket& sock, const RPCClientConfig& config,
                        const util::CancellationToken& cancel, std::string& error) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string portStr = std::to_string(config.port);
    struct addrinfo* result = nullptr;
    int status = ::getaddrinfo(config.host.c_str(), portStr.c_str(), &hints, &result);
    if (status != 0) {
        error = "Failed to resolve host " + config.host + ": " + gai_strerror(status);
        return TransportStatus::ConnectFailed;
    }

    auto deadline = SteadyClock::now() + std::chrono::seconds(config.connectTimeout);
    error = "Failed to connect to " + config.host + ":" + portStr;

    for (struct addrinfo* p = result; p != nullptr; p = p->ai_next) {
        sock.Reset(::socket(p->ai_family, p->ai_socktype, p->ai_protocol));
        if (!sock.Valid()) {
            continue;
        }
        int flags = ::fcntl(sock.Get(), F_GETFL, 0);
        if (flags < 0 || ::fcntl(sock.Get(), F_SETFL, flags | O_NONBLOCK) < 0) {
            continue;
        }

        if (::connect(sock.Get(), p->ai_addr, p->ai_addrlen) == 0) {
            ::freeaddrinfo(result);
            return TransportStatus::OK;
        }
        if (errno != EINPROGRESS) {
            error += std::string(": ") + std::strerror(errno);
            continue;
        }

        WaitResult wait = WaitSocket(sock.Get(), POLLOUT, deadline, cancel);
        if (wait == WaitResult::Cancelled) {
            ::freeaddrinfo(result);
            error = "Cancelled while connecting";
            return TransportStatus::Cancelled;
        }
        if (wait == WaitResult::Timeout) {
            error += ": connect timed out";
            break;
        }
        if (wait == WaitResult::Error) {
            error += std::string(": ") + std::strerror(errno);
            continue;
        }

        int soError = 0;
        socklen_t len = sizeof(soError);
        if (::getsockopt(sock.Get(), SOL_SOCKET, SO_ERROR, &soError, &len) == 0 && soError == 0) {
            ::freeaddrinfo(result);
            return TransportStatus::OK;
        }
        error += std::string(": ") + std::strerror(soError);
    }

    ::freeaddrinfo(result);
    sock.Reset();
    return TransportStatus::ConnectFailed;
}

} // namespace

// ============================================================================
// Configuration
// ============================================================================

std::string RPCClientConfig::ToString() const {
    bool v6 = host.find(':') != std::string::npos;
    return (v6 ? "[" + host + "]" : host) + ":" + std::to_string(port) + path;
}

std::optional<RPCClientConfig> ParseEndpointURL(const std::string& url, std::string* error) {
    auto fail = [&](const std::string& msg) -> std::optional<RPCClientConfig> {
        if (error) *error = msg + ": " + url;
        return std::nullopt;
    };

    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return fail("Missing URL scheme");
    }
    std::string scheme = ToLower(url.substr(0, schemeEnd));
    if (scheme == "https" || scheme == "wss") {
        return fail("TLS endpoints are not supported");
    }
    if (scheme != "http" && scheme != "ws") {
        return fail("Unsupported URL scheme '" + scheme + "'");
    }

    std::string rest = url.substr(schemeEnd + 3);
    size_t pathStart = rest.find('/');
    std::string authority = rest.substr(0, pathStart);

    RPCClientConfig config;
    config.path = pathStart == std::string::npos ? "/" : rest.substr(pathStart);
    config.port = 80;

    std::string portStr;
    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            return fail("Unterminated IPv6 literal");
        }
        config.host = authority.substr(1, close - 1);
        std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail[0] != ':') {
                return fail("Malformed host");
            }
            portStr = tail.substr(1);
        }
    } else {
        size_t colon = authority.find(':');
        config.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            portStr = authority.substr(colon + 1);
        }
    }

    if (config.host.empty()) {
        return fail("Missing host");
    }
    if (!portStr.empty()) {
        if (portStr.size() > 5 || !std::all_of(portStr.begin(), portStr.end(),
                                               [](unsigned char c) { return std::isdigit(c); })) {
            return fail("Invalid port");
        }
        unsigned long port = std::stoul(portStr);
        if (port == 0 || port > 65535) {
            return fail("Invalid port");
        }
        config.port = static_cast<uint16_t>(port);
    }

    return config;
}

const char* TransportStatusToString(TransportStatus status) {
    switch (status) {
        case TransportStatus::OK: return "ok";
        case TransportStatus::ConnectFailed: return "connect failed";
        case TransportStatus::SendFailed: return "send failed";
        case TransportStatus::ReceiveFailed: return "receive failed";
        case TransportStatus::Timeout: return "timeout";
        case TransportStatus::Cancelled: return "cancelled";
        case TransportStatus::BadResponse: return "bad response";
    }
    return "unknown";
}

// ============================================================================
// RPCClient Implementation
// ============================================================================

RPCCallResult RPCClient::Fail(TransportStatus status, std::string error) const {
    ++totalErrors_;
    RPCCallResult result;
    result.status = status;
    result.error = std::move(error);
    return result;
}

RPCCallResult RPCClient::Call(const std::string& method, const JSONValue& params,
                              const util::CancellationToken& cancel) const {
    auto start = SteadyClock::now();
    ++totalCalls_;

    RPCRequest req(method, params, JSONValue(GenerateId()));
    std::string httpRequest = BuildHTTPRequest(req.ToJSON());

    if (cancel.IsCancelled()) {
        return Fail(TransportStatus::Cancelled, "Cancelled before connect");
    }

    ScopedSocket sock;
    std::string error;
    TransportStatus connected = Connect(sock, config_, cancel, error);
    if (connected != TransportStatus::OK) {
        return Fail(connected, error);
    }

    auto deadline = SteadyClock::now() + std::chrono::seconds(config_.requestTimeout);

    // Send
    size_t totalSent = 0;
    while (totalSent < httpRequest.size()) {
        WaitResult wait = WaitSocket(sock.Get(), POLLOUT, deadline, cancel);
        if (wait == WaitResult::Cancelled) {
            return Fail(TransportStatus::Cancelled, method + ": cancelled");
        }
        if (wait == WaitResult::Timeout) {
            return Fail(TransportStatus::Timeout, method + ": timed out sending request");
        }
        if (wait == WaitResult::Error) {
            return Fail(TransportStatus::SendFailed, method + ": " + std::strerror(errno));
        }

        ssize_t sent = ::send(sock.Get(), httpRequest.data() + totalSent,
                              httpRequest.size() - totalSent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            return Fail(TransportStatus::SendFailed,
                        method + ": send failed: " + std::strerror(errno));
        }
        totalSent += static_cast<size_t>(sent);
    }

    // Receive
    std::string raw;
    char buffer[8192];
    while (!IsCompleteHTTPResponse(raw)) {
        WaitResult wait = WaitSocket(sock.Get(), POLLIN, deadline, cancel);
        if (wait == WaitResult::Cancelled) {
            return Fail(TransportStatus::Cancelled, method + ": cancelled");
        }
        if (wait == WaitResult::Timeout) {
            return Fail(TransportStatus::Timeout,
                        method + ": no response within " +
                        std::to_string(config_.requestTimeout) + "s");
        }
        if (wait == WaitResult::Error) {
            return Fail(TransportStatus::ReceiveFailed, method + ": " + std::strerror(errno));
        }

        ssize_t received = ::recv(sock.Get(), buffer, sizeof(buffer), 0);
        if (received < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            return Fail(TransportStatus::ReceiveFailed,
                        method + ": receive failed: " + std::strerror(errno));
        }
        if (received == 0) {
            // Close-delimited bodies end here; anything else was cut short
            size_t headerEnd = raw.find("\r\n\r\n");
            if (headerEnd != std::string::npos) {
                std::string lowerHeaders = ToLower(raw.substr(0, headerEnd));
                if (FindHeader(lowerHeaders, "content-length").empty() &&
                    FindHeader(lowerHeaders, "transfer-encoding").empty()) {
                    break;
                }
            }
            return Fail(TransportStatus::ReceiveFailed, method + ": connection closed by peer");
        }
        raw.append(buffer, static_cast<size_t>(received));
        if (raw.size() > MAX_RESPONSE_SIZE) {
            return Fail(TransportStatus::BadResponse, method + ": response too large");
        }
    }

    std::string body;
    int statusCode = 0;
    if (!ParseHTTPResponse(raw, body, statusCode)) {
        return Fail(TransportStatus::BadResponse, method + ": invalid HTTP response");
    }

    auto response = RPCResponse::Parse(body);
    if (!response) {
        return Fail(TransportStatus::BadResponse,
                    method + ": HTTP " + std::to_string(statusCode) +
                    " without a JSON-RPC body");
    }

    RPCCallResult result;
    result.response = std::move(*response);
    if (result.response.IsError()) {
        ++totalErrors_;
        result.error = result.response.GetErrorMessage();
        LOG_DEBUG(util::LogCategory::RPC) << method << " returned error "
                                          << result.response.GetErrorCode() << ": "
                                          << result.error;
    } else {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            SteadyClock::now() - start).count();
        totalResponseTime_ += static_cast<uint64_t>(elapsed);
        ++okCalls_;
        LOG_TRACE(util::LogCategory::RPC) << method << " completed in " << elapsed << "ms";
    }
    return result;
}

double RPCClient::GetAverageResponseTime() const {
    uint64_t calls = okCalls_.load();
    if (calls == 0) return 0.0;
    return static_cast<double>(totalResponseTime_.load()) / static_cast<double>(calls);
}

// ============================================================================
// HTTP Framing
// ============================================================================

std::string RPCClient::BuildHTTPRequest(const std::string& body) const {
    std::ostringstream ss;
    ss << "POST " << config_.path << " HTTP/1.1\r\n";
    ss << "Host: " << config_.host << ":" << config_.port << "\r\n";
    ss << "Content-Type: application/json\r\n";
    ss << "Accept: application/json\r\n";
    ss << "Content-Length: " << body.size() << "\r\n";
    ss << "Connection: close\r\n";
    ss << "\r\n";
    ss << body;
    return ss.str();
}

bool RPCClient::IsCompleteHTTPResponse(const std::string& raw) {
    size_t headerEnd = raw.find("\r\n\r\n");
    if (headerEnd == std::string::npos) {
        return false;
    }
    size_t bodyStart = headerEnd + 4;
    std::string lowerHeaders = ToLower(raw.substr(0, headerEnd));

    // A malformed length counts as complete so ParseHTTPResponse rejects it
    if (FindHeader(lowerHeaders, "transfer-encoding").find("chunked") != std::string::npos) {
        std::string body;
        return DecodeChunked(raw, bodyStart, body) != ChunkedState::Incomplete;
    }

    std::string length = FindHeader(lowerHeaders, "content-length");
    if (length.empty()) {
        return false;  // read until the peer closes
    }
    size_t contentLength = 0;
    if (!ParseLength(length, 10, contentLength)) {
        return true;
    }
    return raw.size() - bodyStart >= contentLength;
}

bool RPCClient::ParseHTTPResponse(const std::string& raw, std::string& body, int& statusCode) {
    size_t statusEnd = raw.find("\r\n");
    if (statusEnd == std::string::npos) return false;

    // "HTTP/1.1 200 OK"
    std::string statusLine = raw.substr(0, statusEnd);
    if (statusLine.compare(0, 5, "HTTP/") != 0) return false;
    size_t codeStart = statusLine.find(' ');
    if (codeStart == std::string::npos || codeStart + 4 > statusLine.size()) return false;
    std::string code = statusLine.substr(codeStart + 1, 3);
    if (!std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    statusCode = std::stoi(code);

    size_t headersEnd = raw.find("\r\n\r\n");
    if (headersEnd == std::string::npos) return false;
    size_t bodyStart = headersEnd + 4;

    std::string lowerHeaders = ToLower(raw.substr(0, headersEnd));
    if (FindHeader(lowerHeaders, "transfer-encoding").find("chunked") != std::string::npos) {
        return DecodeChunked(raw, bodyStart, body) == ChunkedState::Complete;
    }

    body = raw.substr(bodyStart);
    std::string length = FindHeader(lowerHeaders, "content-length");
    if (!length.empty()) {
        size_t contentLength = 0;
        if (!ParseLength(length, 10, contentLength)) return false;
        if (body.size() < contentLength) return false;
        body.resize(contentLength);
    }
    return true;
}

} // namespace rpc
} // namespace refindex
