// REFINDEX - RPC Transport Tests
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include <gtest/gtest.h>

#include "refindex/chain/client.h"
#include "refindex/chain/storage.h"
#include "refindex/core/hex.h"
#include "refindex/rpc/client.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace refindex;
using namespace refindex::rpc;

namespace {

// ============================================================================
// Loopback HTTP Server
// ============================================================================

/**
 * Answers each connection with whatever the handler returns for the request
 * body. An empty answer leaves the connection open and silent until Stop().
 */
class LoopbackServer {
public:
    using Handler = std::function<std::string(const std::string& body)>;

    explicit LoopbackServer(Handler handler) : handler_(std::move(handler)) {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listenFd_, 16) != 0) {
            throw std::runtime_error("loopback server: bind/listen failed");
        }
        socklen_t len = sizeof(addr);
        ::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { Loop(); });
    }

    ~LoopbackServer() { Stop(); }

    void Stop() {
        if (stop_.exchange(true)) {
            return;
        }
        thread_.join();
        for (int fd : held_) {
            ::close(fd);
        }
        held_.clear();
        ::close(listenFd_);
    }

    uint16_t Port() const { return port_; }

    std::string URL() const { return "http://127.0.0.1:" + std::to_string(port_); }

    std::vector<std::string> Requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    static std::string JSONResponse(const std::string& body) {
        return "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: " +
               std::to_string(body.size()) + "\r\n\r\n" + body;
    }

    static std::string Result(const std::string& resultJSON) {
        return JSONResponse("{\"jsonrpc\":\"2.0\",\"result\":" + resultJSON + ",\"id\":1}");
    }

private:
    void Loop() {
        while (!stop_) {
            pollfd pfd{listenFd_, POLLIN, 0};
            if (::poll(&pfd, 1, 20) <= 0) {
                continue;
            }
            int fd = ::accept(listenFd_, nullptr, nullptr);
            if (fd < 0) {
                continue;
            }
            std::string body = ReadRequest(fd);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(body);
            }
            std::string answer = handler_(body);
            if (answer.empty()) {
                held_.push_back(fd);
                continue;
            }
            size_t sent = 0;
            while (sent < answer.size()) {
                ssize_t n = ::send(fd, answer.data() + sent, answer.size() - sent, MSG_NOSIGNAL);
                if (n <= 0) break;
                sent += static_cast<size_t>(n);
            }
            ::close(fd);
        }
    }

    static std::string ReadRequest(int fd) {
        std::string raw;
        char buf[4096];
        while (true) {
            size_t headerEnd = raw.find("\r\n\r\n");
            if (headerEnd != std::string::npos) {
                size_t lenPos = raw.find("Content-Length: ");
                size_t length = 0;
                if (lenPos != std::string::npos && lenPos < headerEnd) {
                    length = std::stoul(raw.substr(lenPos + 16));
                }
                if (raw.size() >= headerEnd + 4 + length) {
                    return raw.substr(headerEnd + 4, length);
                }
            }
            ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) {
                return raw;
            }
            raw.append(buf, static_cast<size_t>(n));
        }
    }

    Handler handler_;
    int listenFd_{-1};
    uint16_t port_{0};
    std::atomic<bool> stop_{false};
    std::thread thread_;
    std::vector<int> held_;
    mutable std::mutex mutex_;
    std::vector<std::string> requests_;
};

/// A port nothing listens on
uint16_t ClosedPort() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    ::close(fd);
    return ntohs(addr.sin_port);
}

RPCClientConfig LocalConfig(uint16_t port, int requestTimeout = 5) {
    RPCClientConfig config;
    config.host = "127.0.0.1";
    config.port = port;
    config.connectTimeout = 2;
    config.requestTimeout = requestTimeout;
    return config;
}

} // namespace

// ============================================================================
// Endpoint URLs
// ============================================================================

TEST(EndpointURLTest, ParsesHostPortPath) {
    auto config = ParseEndpointURL("http://node.example:9944/rpc");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->host, "node.example");
    EXPECT_EQ(config->port, 9944);
    EXPECT_EQ(config->path, "/rpc");
}

TEST(EndpointURLTest, DefaultsAndWebSocketScheme) {
    auto plain = ParseEndpointURL("http://localhost");
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(plain->port, 80);
    EXPECT_EQ(plain->path, "/");

    auto ws = ParseEndpointURL("ws://127.0.0.1:9944");
    ASSERT_TRUE(ws.has_value());
    EXPECT_EQ(ws->port, 9944);
}

TEST(EndpointURLTest, IPv6Literal) {
    auto config = ParseEndpointURL("http://[::1]:9933");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->host, "::1");
    EXPECT_EQ(config->ToString(), "[::1]:9933/");
}

TEST(EndpointURLTest, Rejections) {
    std::string error;
    EXPECT_FALSE(ParseEndpointURL("wss://rpc.polkadot.io", &error).has_value());
    EXPECT_NE(error.find("TLS"), std::string::npos);
    EXPECT_NE(error.find("wss://rpc.polkadot.io"), std::string::npos);

    EXPECT_FALSE(ParseEndpointURL("127.0.0.1:9933").has_value());
    EXPECT_FALSE(ParseEndpointURL("ftp://host").has_value());
    EXPECT_FALSE(ParseEndpointURL("http://:9933").has_value());
    EXPECT_FALSE(ParseEndpointURL("http://host:0").has_value());
    EXPECT_FALSE(ParseEndpointURL("http://host:70000").has_value());
    EXPECT_FALSE(ParseEndpointURL("http://host:12ab").has_value());
}

// ============================================================================
// HTTP Framing
// ============================================================================

TEST(HTTPFramingTest, ContentLength) {
    std::string raw = "HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\nbody";
    EXPECT_TRUE(RPCClient::IsCompleteHTTPResponse(raw));
    EXPECT_FALSE(RPCClient::IsCompleteHTTPResponse(raw.substr(0, raw.size() - 1)));

    std::string body;
    int status = 0;
    ASSERT_TRUE(RPCClient::ParseHTTPResponse(raw, body, status));
    EXPECT_EQ(status, 200);
    EXPECT_EQ(body, "body");
}

TEST(HTTPFramingTest, Chunked) {
    std::string raw =
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
        "3\r\nabc\r\n2\r\nde\r\n0\r\n\r\n";
    EXPECT_TRUE(RPCClient::IsCompleteHTTPResponse(raw));

    std::string body;
    int status = 0;
    ASSERT_TRUE(RPCClient::ParseHTTPResponse(raw, body, status));
    EXPECT_EQ(body, "abcde");

    EXPECT_FALSE(RPCClient::IsCompleteHTTPResponse(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabc\r\n"));
}

TEST(HTTPFramingTest, OversizedLengthsRejected) {
    std::string body;
    int status = 0;

    // Too many digits for 64 bits: complete as far as reading goes, then rejected
    std::string overflow = "HTTP/1.1 200 OK\r\nContent-Length: 99999999999999999999999\r\n\r\n{}";
    EXPECT_TRUE(RPCClient::IsCompleteHTTPResponse(overflow));
    EXPECT_FALSE(RPCClient::ParseHTTPResponse(overflow, body, status));

    std::string tooLarge = "HTTP/1.1 200 OK\r\nContent-Length: 67108865\r\n\r\n{}";
    EXPECT_TRUE(RPCClient::IsCompleteHTTPResponse(tooLarge));
    EXPECT_FALSE(RPCClient::ParseHTTPResponse(tooLarge, body, status));

    std::string chunk = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                        "ffffffffffffffffffff\r\nabc\r\n0\r\n\r\n";
    EXPECT_TRUE(RPCClient::IsCompleteHTTPResponse(chunk));
    EXPECT_FALSE(RPCClient::ParseHTTPResponse(chunk, body, status));

    std::string wrapping = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                           "fffffffffffffffe\r\nabc\r\n";
    EXPECT_TRUE(RPCClient::IsCompleteHTTPResponse(wrapping));
    EXPECT_FALSE(RPCClient::ParseHTTPResponse(wrapping, body, status));

    std::string garbled = "HTTP/1.1 200 OK\r\nContent-Length: 12abc\r\n\r\n{}";
    EXPECT_FALSE(RPCClient::ParseHTTPResponse(garbled, body, status));
}

TEST(HTTPFramingTest, MalformedStatusLine) {
    std::string body;
    int status = 0;
    EXPECT_FALSE(RPCClient::ParseHTTPResponse("garbage\r\n\r\n", body, status));
    EXPECT_FALSE(RPCClient::ParseHTTPResponse("HTTP/1.1 2x0 OK\r\n\r\n", body, status));
}

TEST(HTTPFramingTest, RequestCarriesLengthAndClose) {
    RPCClient client(LocalConfig(9933));
    std::string request = client.BuildHTTPRequest("{}");
    EXPECT_EQ(request.compare(0, 16, "POST / HTTP/1.1\r"), 0);
    EXPECT_NE(request.find("Content-Length: 2\r\n"), std::string::npos);
    EXPECT_NE(request.find("Connection: close\r\n"), std::string::npos);
}

// ============================================================================
// RPCClient over Loopback
// ============================================================================

TEST(RPCClientTest, SuccessfulCall) {
    LoopbackServer server([](const std::string&) { return LoopbackServer::Result("\"0x01\""); });
    RPCClient client(LocalConfig(server.Port()));

    JSONValue params;
    params.Push("0xabcd");
    auto result = client.Call("state_getStorage", params);

    ASSERT_TRUE(result.IsSuccess()) << result.error;
    EXPECT_EQ(result.response.GetResult().GetString(), "0x01");
    EXPECT_EQ(client.GetTotalCalls(), 1u);
    EXPECT_EQ(client.GetTotalErrors(), 0u);

    auto requests = server.Requests();
    ASSERT_EQ(requests.size(), 1u);
    auto sent = RPCRequest::Parse(requests[0]);
    ASSERT_TRUE(sent.has_value());
    EXPECT_EQ(sent->GetMethod(), "state_getStorage");
    EXPECT_EQ(sent->GetParam(0).GetString(), "0xabcd");
}

TEST(RPCClientTest, RpcErrorIsNotTransportFailure) {
    LoopbackServer server([](const std::string&) {
        return LoopbackServer::JSONResponse(
            "{\"jsonrpc\":\"2.0\",\"error\":{\"code\":-32601,\"message\":\"nope\"},\"id\":1}");
    });
    RPCClient client(LocalConfig(server.Port()));

    auto result = client.Call("bogus_method");
    EXPECT_EQ(result.status, TransportStatus::OK);
    EXPECT_FALSE(result.IsSuccess());
    EXPECT_EQ(result.response.GetErrorCode(), ErrorCode::METHOD_NOT_FOUND);
    EXPECT_EQ(client.GetTotalErrors(), 1u);
}

TEST(RPCClientTest, CloseDelimitedBody) {
    LoopbackServer server([](const std::string&) {
        return std::string("HTTP/1.0 200 OK\r\n\r\n{\"jsonrpc\":\"2.0\",\"result\":7,\"id\":1}");
    });
    RPCClient client(LocalConfig(server.Port()));
    auto result = client.Call("x");
    ASSERT_TRUE(result.IsSuccess()) << result.error;
    EXPECT_EQ(result.response.GetResult().GetInt(), 7);
}

TEST(RPCClientTest, NonJSONBodyIsBadResponse) {
    LoopbackServer server([](const std::string&) {
        return LoopbackServer::JSONResponse("<html>busy</html>");
    });
    RPCClient client(LocalConfig(server.Port()));
    EXPECT_EQ(client.Call("x").status, TransportStatus::BadResponse);
}

TEST(RPCClientTest, OverflowingContentLengthIsBadResponse) {
    LoopbackServer server([](const std::string&) {
        return std::string("HTTP/1.1 200 OK\r\nContent-Length: 99999999999999999999999\r\n\r\n{}");
    });
    RPCClient client(LocalConfig(server.Port()));
    auto result = client.Call("chain_getHeader");
    EXPECT_EQ(result.status, TransportStatus::BadResponse);
    EXPECT_FALSE(result.error.empty());
}

TEST(RPCClientTest, ConnectionRefused) {
    RPCClient client(LocalConfig(ClosedPort()));
    auto result = client.Call("x");
    EXPECT_EQ(result.status, TransportStatus::ConnectFailed);
    EXPECT_FALSE(result.error.empty());
}

TEST(RPCClientTest, SilentServerTimesOut) {
    LoopbackServer server([](const std::string&) { return std::string(); });
    RPCClient client(LocalConfig(server.Port(), 1));

    auto start = std::chrono::steady_clock::now();
    auto result = client.Call("x");
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.status, TransportStatus::Timeout);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(RPCClientTest, CancellationInterruptsWait) {
    LoopbackServer server([](const std::string&) { return std::string(); });
    RPCClient client(LocalConfig(server.Port(), 30));
    util::CancellationSource source;

    std::thread canceller([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        source.Cancel();
    });
    auto start = std::chrono::steady_clock::now();
    auto result = client.Call("x", JSONValue(), source.Token());
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_EQ(result.status, TransportStatus::Cancelled);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

// ============================================================================
// RPCChainClient
// ============================================================================

TEST(RPCChainClientTest, StorageValueAndAbsence) {
    Bytes present = chain::ReferendumInfoKey(1);
    std::string presentHex = ToPrefixedHex(present);

    LoopbackServer server([presentHex](const std::string& body) {
        if (body.find(presentHex) != std::string::npos) {
            return LoopbackServer::Result("\"0x0500000000\"");
        }
        return LoopbackServer::Result("null");
    });
    chain::RPCChainClient client(server.URL(), LocalConfig(server.Port()));

    auto value = client.GetStorage(present, util::CancellationToken::None());
    ASSERT_TRUE(value.ok()) << value.message();
    EXPECT_EQ(value.value(), (Bytes{0x05, 0x00, 0x00, 0x00, 0x00}));

    auto absent = client.GetStorage(chain::ReferendumInfoKey(2), util::CancellationToken::None());
    EXPECT_TRUE(absent.IsNotFound());
}

TEST(RPCChainClientTest, MalformedStorageIsProtocolError) {
    LoopbackServer server([](const std::string&) { return LoopbackServer::Result("\"0xzz\""); });
    chain::RPCChainClient client(server.URL(), LocalConfig(server.Port()));
    auto value = client.GetStorage(Bytes{0x01}, util::CancellationToken::None());
    EXPECT_EQ(value.kind(), chain::ErrorKind::Protocol);
}

TEST(RPCChainClientTest, HeadNumberIsHex) {
    LoopbackServer server([](const std::string&) {
        return LoopbackServer::Result(
            "{\"number\":\"0x1a\",\"parentHash\":\"0x00\",\"stateRoot\":\"0x01\"}");
    });
    chain::RPCChainClient client(server.URL(), LocalConfig(server.Port()));
    auto head = client.GetHead(util::CancellationToken::None());
    ASSERT_TRUE(head.ok()) << head.message();
    EXPECT_EQ(head.value().number, 26u);
}

TEST(RPCChainClientTest, KeysPagedSendsStartKey) {
    Bytes key = chain::ReferendumInfoKey(9);
    std::string keyHex = ToPrefixedHex(key);
    LoopbackServer server([keyHex](const std::string&) {
        return LoopbackServer::Result("[\"" + keyHex + "\"]");
    });
    chain::RPCChainClient client(server.URL(), LocalConfig(server.Port()));

    Bytes prefix = chain::ReferendumInfoPrefix();
    auto page = client.GetKeysPaged(prefix, 10, &key, util::CancellationToken::None());
    ASSERT_TRUE(page.ok()) << page.message();
    ASSERT_EQ(page.value().size(), 1u);
    EXPECT_EQ(page.value()[0], key);

    auto sent = RPCRequest::Parse(server.Requests().at(0));
    ASSERT_TRUE(sent.has_value());
    EXPECT_EQ(sent->GetMethod(), "state_getKeysPaged");
    EXPECT_EQ(sent->GetParam(0).GetString(), ToPrefixedHex(prefix));
    EXPECT_EQ(sent->GetParam(1).GetInt(), 10);
    EXPECT_EQ(sent->GetParam(2).GetString(), keyHex);
}

TEST(RPCChainClientTest, ErrorKinds) {
    LoopbackServer server([](const std::string&) {
        return LoopbackServer::JSONResponse(
            "{\"jsonrpc\":\"2.0\",\"error\":{\"code\":-32000,\"message\":\"busy\"},\"id\":1}");
    });
    chain::RPCChainClient rpcError(server.URL(), LocalConfig(server.Port()));
    EXPECT_EQ(rpcError.GetHead(util::CancellationToken::None()).kind(), chain::ErrorKind::Rpc);

    chain::RPCChainClient refused("http://127.0.0.1", LocalConfig(ClosedPort()));
    EXPECT_EQ(refused.GetHead(util::CancellationToken::None()).kind(),
              chain::ErrorKind::Transport);

    chain::RPCChainClient closed(server.URL(), LocalConfig(server.Port()));
    closed.Close();
    EXPECT_EQ(closed.GetHead(util::CancellationToken::None()).kind(),
              chain::ErrorKind::Transport);
}

TEST(RPCChainClientTest, BrokenFramingFailsOverWithoutThrowing) {
    LoopbackServer broken([](const std::string&) {
        return std::string("HTTP/1.1 200 OK\r\nContent-Length: 99999999999999999999999\r\n\r\n{}");
    });
    chain::RPCChainClient client(broken.URL(), LocalConfig(broken.Port()));
    EXPECT_EQ(client.GetHead(util::CancellationToken::None()).kind(), chain::ErrorKind::Protocol);

    chain::ErrorKind kind = chain::ErrorKind::None;
    EXPECT_NO_THROW({
        auto connected = chain::ConnectChain({broken.URL()}, chain::MakeRPCClientFactory(2, 2),
                                             util::CancellationToken::None());
        kind = connected.kind();
    });
    EXPECT_EQ(kind, chain::ErrorKind::NoReachableEndpoint);
}

TEST(RPCChainClientTest, FactoryRejectsBadURL) {
    auto factory = chain::MakeRPCClientFactory(1, 1);
    EXPECT_TRUE(factory("wss://secure.example") == nullptr);
    auto client = factory("http://127.0.0.1:9933");
    ASSERT_TRUE(client != nullptr);
    EXPECT_EQ(client->Endpoint(), "http://127.0.0.1:9933");
}
