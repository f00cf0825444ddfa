// REFINDEX - Chain Client Implementation
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include "refindex/chain/client.h"

#include "refindex/chain/referendum.h"
#include "refindex/chain/storage.h"
#include "refindex/core/hex.h"
#include "refindex/util/logging.h"

#include <stdexcept>

namespace refindex {
namespace chain {

namespace {

ErrorKind ClassifyTransport(rpc::TransportStatus status) {
    switch (status) {
        case rpc::TransportStatus::OK: return ErrorKind::None;
        case rpc::TransportStatus::ConnectFailed:
        case rpc::TransportStatus::SendFailed:
        case rpc::TransportStatus::ReceiveFailed: return ErrorKind::Transport;
        case rpc::TransportStatus::Timeout: return ErrorKind::Timeout;
        case rpc::TransportStatus::Cancelled: return ErrorKind::Cancelled;
        case rpc::TransportStatus::BadResponse: return ErrorKind::Protocol;
    }
    return ErrorKind::Protocol;
}

/// "0x1a2b" -> 0x1a2b; nullopt on anything else
std::optional<BlockNumber> ParseHexNumber(const std::string& str) {
    if (str.size() < 3 || str.size() > 10 || str.compare(0, 2, "0x") != 0) {
        return std::nullopt;
    }
    BlockNumber value = 0;
    for (size_t i = 2; i < str.size(); ++i) {
        char c = str[i];
        value <<= 4;
        if (c >= '0' && c <= '9') value |= static_cast<BlockNumber>(c - '0');
        else if (c >= 'a' && c <= 'f') value |= static_cast<BlockNumber>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') value |= static_cast<BlockNumber>(c - 'A' + 10);
        else return std::nullopt;
    }
    return value;
}

} // namespace

const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::NotFound: return "not found";
        case ErrorKind::Transport: return "transport error";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Rpc: return "rpc error";
        case ErrorKind::Protocol: return "protocol error";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::NoReachableEndpoint: return "no reachable endpoint";
    }
    return "unknown";
}

ChainResult<std::string> ChainClient::GetBlockHash(std::optional<BlockNumber>,
                                                   const util::CancellationToken&) const {
    return ChainResult<std::string>::Error(ErrorKind::Rpc, "chain_getBlockHash not supported");
}

// ============================================================================
// RPCChainClient
// ============================================================================

RPCChainClient::RPCChainClient(std::string endpoint, const rpc::RPCClientConfig& config)
    : endpoint_(std::move(endpoint)), rpc_(config) {}

ChainResult<rpc::JSONValue> RPCChainClient::CallMethod(const std::string& method,
                                                       const rpc::JSONValue& params,
                                                       const util::CancellationToken& cancel) const {
    if (closed_) {
        return ChainResult<rpc::JSONValue>::Error(ErrorKind::Transport,
                                                  endpoint_ + ": client closed");
    }

    rpc::RPCCallResult result = rpc_.Call(method, params, cancel);
    if (result.status != rpc::TransportStatus::OK) {
        return ChainResult<rpc::JSONValue>::Error(ClassifyTransport(result.status),
                                                  endpoint_ + ": " + result.error);
    }
    if (result.response.IsError()) {
        return ChainResult<rpc::JSONValue>::Error(
            ErrorKind::Rpc,
            endpoint_ + ": " + method + " failed (" +
            std::to_string(result.response.GetErrorCode()) + "): " +
            result.response.GetErrorMessage());
    }
    return ChainResult<rpc::JSONValue>::Ok(result.response.GetResult());
}

ChainResult<Header> RPCChainClient::GetHead(const util::CancellationToken& cancel) const {
    auto result = CallMethod("chain_getHeader", rpc::JSONValue(rpc::JSONValue::Array{}), cancel);
    if (!result.ok()) {
        return ChainResult<Header>::From(result);
    }

    const rpc::JSONValue& json = result.value();
    auto number = ParseHexNumber(json["number"].GetString());
    if (!json.IsObject() || !number) {
        return ChainResult<Header>::Error(ErrorKind::Protocol,
                                          endpoint_ + ": malformed chain_getHeader result");
    }

    Header header;
    header.number = *number;
    header.parentHash = json["parentHash"].GetString();
    header.stateRoot = json["stateRoot"].GetString();
    return ChainResult<Header>::Ok(std::move(header));
}

ChainResult<Bytes> RPCChainClient::GetStorage(const Bytes& key,
                                              const util::CancellationToken& cancel) const {
    rpc::JSONValue params;
    params.Push(ToPrefixedHex(key));

    auto result = CallMethod("state_getStorage", params, cancel);
    if (!result.ok()) {
        return ChainResult<Bytes>::From(result);
    }

    const rpc::JSONValue& json = result.value();
    if (json.IsNull()) {
        return ChainResult<Bytes>::Error(ErrorKind::NotFound, "no value at " + ToPrefixedHex(key));
    }
    if (!json.IsString()) {
        return ChainResult<Bytes>::Error(ErrorKind::Protocol,
                                         endpoint_ + ": state_getStorage returned a non-string");
    }

    Bytes value;
    try {
        value = FromPrefixedHex(json.GetString());
    } catch (const std::invalid_argument& e) {
        return ChainResult<Bytes>::Error(ErrorKind::Protocol,
                                         endpoint_ + ": bad storage hex: " + e.what());
    }
    if (value.empty()) {
        return ChainResult<Bytes>::Error(ErrorKind::NotFound, "empty value at " + ToPrefixedHex(key));
    }
    return ChainResult<Bytes>::Ok(std::move(value));
}

ChainResult<std::vector<Bytes>> RPCChainClient::GetKeysPaged(
    const Bytes& prefix, uint32_t count, const Bytes* startKey,
    const util::CancellationToken& cancel) const {
    rpc::JSONValue params;
    params.Push(ToPrefixedHex(prefix));
    params.Push(count);
    if (startKey) {
        params.Push(ToPrefixedHex(*startKey));
    }

    auto result = CallMethod("state_getKeysPaged", params, cancel);
    if (!result.ok()) {
        return ChainResult<std::vector<Bytes>>::From(result);
    }
    if (!result.value().IsArray()) {
        return ChainResult<std::vector<Bytes>>::Error(
            ErrorKind::Protocol, endpoint_ + ": state_getKeysPaged returned a non-array");
    }

    std::vector<Bytes> keys;
    keys.reserve(result.value().Size());
    for (const auto& item : result.value().GetArray()) {
        try {
            keys.push_back(FromPrefixedHex(item.GetString()));
        } catch (const std::invalid_argument& e) {
            return ChainResult<std::vector<Bytes>>::Error(
                ErrorKind::Protocol, endpoint_ + ": bad key hex: " + e.what());
        }
    }
    return ChainResult<std::vector<Bytes>>::Ok(std::move(keys));
}

ChainResult<std::string> RPCChainClient::GetBlockHash(std::optional<BlockNumber> number,
                                                      const util::CancellationToken& cancel) const {
    rpc::JSONValue params(rpc::JSONValue::Array{});
    if (number) {
        params.Push(*number);
    }

    auto result = CallMethod("chain_getBlockHash", params, cancel);
    if (!result.ok()) {
        return ChainResult<std::string>::From(result);
    }
    if (result.value().IsNull()) {
        return ChainResult<std::string>::Error(ErrorKind::NotFound, "no block at that height");
    }
    if (!result.value().IsString()) {
        return ChainResult<std::string>::Error(ErrorKind::Protocol,
                                               endpoint_ + ": malformed block hash");
    }
    return ChainResult<std::string>::Ok(result.value().GetString());
}

ClientFactory MakeRPCClientFactory(int connectTimeout, int requestTimeout) {
    return [connectTimeout, requestTimeout](const std::string& endpoint)
               -> std::unique_ptr<ChainClient> {
        std::string error;
        auto config = rpc::ParseEndpointURL(endpoint, &error);
        if (!config) {
            LOG_WARN(util::LogCategory::CHAIN) << error;
            return nullptr;
        }
        config->connectTimeout = connectTimeout;
        config->requestTimeout = requestTimeout;
        return std::make_unique<RPCChainClient>(endpoint, *config);
    };
}

// ============================================================================
// Connection and Enumeration
// ============================================================================

ChainResult<std::unique_ptr<ChainClient>> ConnectChain(
    const std::vector<std::string>& endpoints,
    const ClientFactory& factory,
    const util::CancellationToken& cancel) {
    using Result = ChainResult<std::unique_ptr<ChainClient>>;

    for (const auto& endpoint : endpoints) {
        if (cancel.IsCancelled()) {
            return Result::Error(ErrorKind::Cancelled, "cancelled while connecting");
        }

        std::unique_ptr<ChainClient> client = factory(endpoint);
        if (!client) {
            continue;
        }

        auto head = client->GetHead(cancel);
        if (head.ok()) {
            LOG_DEBUG(util::LogCategory::CHAIN) << "Connected to " << endpoint
                                                << " at block #" << head.value().number;
            return Result::Ok(std::move(client));
        }
        if (head.kind() == ErrorKind::Cancelled) {
            return Result::Error(ErrorKind::Cancelled, head.message());
        }

        LOG_WARN(util::LogCategory::CHAIN) << "Endpoint " << endpoint << " unusable ("
                                           << ErrorKindToString(head.kind()) << "): "
                                           << head.message() << "; trying next";
        client->Close();
    }

    return Result::Error(ErrorKind::NoReachableEndpoint,
                         "all " + std::to_string(endpoints.size()) + " endpoints failed");
}

ChainResult<std::vector<Bytes>> EnumerateKeys(const ChainClient& client,
                                              const Bytes& prefix,
                                              const util::CancellationToken& cancel,
                                              uint32_t pageSize) {
    using Result = ChainResult<std::vector<Bytes>>;

    std::vector<Bytes> keys;
    std::optional<Bytes> startKey;
    while (true) {
        if (cancel.IsCancelled()) {
            return Result::Error(ErrorKind::Cancelled, "key enumeration cancelled");
        }

        auto page = client.GetKeysPaged(prefix, pageSize, startKey ? &*startKey : nullptr, cancel);
        if (!page.ok()) {
            return Result::From(page);
        }

        const std::vector<Bytes>& items = page.value();
        if (!items.empty() && startKey && items.back() == *startKey) {
            break;  // node ignored startKey; stop rather than loop forever
        }
        keys.insert(keys.end(), items.begin(), items.end());

        if (items.size() < pageSize) {
            break;
        }
        startKey = items.back();
    }

    return Result::Ok(std::move(keys));
}

ChainResult<std::vector<RefId>> EnumerateReferendumIds(const ChainClient& client,
                                                       const util::CancellationToken& cancel) {
    auto keys = EnumerateKeys(client, ReferendumInfoPrefix(), cancel);
    if (!keys.ok()) {
        return ChainResult<std::vector<RefId>>::From(keys);
    }

    std::vector<RefId> ids;
    ids.reserve(keys.value().size());
    for (const Bytes& key : keys.value()) {
        try {
            ids.push_back(RefIdFromKey(key));
        } catch (const DecodeError& e) {
            LOG_WARN(util::LogCategory::DECODE) << "Skipping storage key: " << e.what();
        }
    }
    return ChainResult<std::vector<RefId>>::Ok(std::move(ids));
}

ChainResult<uint32_t> FetchReferendumCount(const ChainClient& client,
                                           const util::CancellationToken& cancel) {
    auto raw = client.GetStorage(ReferendumCountKey(), cancel);
    if (!raw.ok()) {
        return ChainResult<uint32_t>::From(raw);
    }
    try {
        return ChainResult<uint32_t>::Ok(DecodeReferendumCount(raw.value()));
    } catch (const DecodeError& e) {
        return ChainResult<uint32_t>::Error(ErrorKind::Protocol, e.what());
    }
}

// ============================================================================
// HeadSubscription
// ============================================================================

HeadSubscription::HeadSubscription(std::shared_ptr<const ChainClient> client, Callback callback,
                                   std::chrono::milliseconds period,
                                   const util::CancellationToken& parent)
    : client_(std::move(client)),
      callback_(std::move(callback)),
      period_(period),
      cancel_(parent) {
    thread_ = std::thread(&HeadSubscription::Run, this);
}

HeadSubscription::~HeadSubscription() {
    Stop();
}

void HeadSubscription::Stop() {
    cancel_.Cancel();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void HeadSubscription::Run() {
    util::CancellationToken token = cancel_.Token();
    std::optional<BlockNumber> last;

    while (!token.IsCancelled()) {
        auto head = client_->GetHead(token);
        if (head.ok()) {
            if (!last || head.value().number != *last) {
                last = head.value().number;
                try {
                    callback_(head.value());
                    ++delivered_;
                } catch (const std::exception& e) {
                    LOG_ERROR(util::LogCategory::CHAIN) << "Head callback threw: " << e.what();
                }
            }
        } else if (head.kind() != ErrorKind::Cancelled) {
            LOG_DEBUG(util::LogCategory::CHAIN) << "Head poll on " << client_->Endpoint()
                                                << " failed: " << head.message();
        }

        if (token.WaitFor(period_)) {
            break;
        }
    }
    running_ = false;
}

std::unique_ptr<HeadSubscription> SubscribeNewHeads(
    std::shared_ptr<const ChainClient> client,
    HeadSubscription::Callback callback,
    std::chrono::milliseconds period,
    const util::CancellationToken& cancel) {
    return std::make_unique<HeadSubscription>(std::move(client), std::move(callback),
                                              period, cancel);
}

} // namespace chain
} // namespace refindex
