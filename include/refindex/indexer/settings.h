// REFINDEX - Indexer Settings
// Copyright (c) 2024 REFINDEX Developers
// MIT License
//
// Typed view of refindex.conf. Global keys set the service-wide knobs; each
// [section] describes one network:
//
//   workers=4
//   interval=3600
//
//   [polkadot]
//   id=1
//   rpc=http://127.0.0.1:9933
//   rpc=http://backup.example:9933
//   ss58prefix=0

#ifndef REFINDEX_INDEXER_SETTINGS_H
#define REFINDEX_INDEXER_SETTINGS_H

#include "refindex/core/types.h"
#include "refindex/util/config.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace refindex {
namespace indexer {

// Defaults
constexpr size_t DEFAULT_WORKERS = 4;
constexpr int64_t DEFAULT_INTERVAL_SECONDS = 3600;
constexpr int DEFAULT_RPC_TIMEOUT = 30;
constexpr int DEFAULT_CONNECT_TIMEOUT = 10;
constexpr uint16_t DEFAULT_SS58_PREFIX = 42;
constexpr uint8_t DEFAULT_ORIGINS_PALLET = 22;

struct NetworkSettings {
    NetworkId id{0};
    std::string name;
    std::vector<std::string> endpoints;   // Failover order
    uint16_t ss58Prefix{DEFAULT_SS58_PREFIX};
    uint8_t originsPallet{DEFAULT_ORIGINS_PALLET};
    bool enabled{true};
};

struct IndexerSettings {
    size_t workers{DEFAULT_WORKERS};
    std::chrono::seconds interval{DEFAULT_INTERVAL_SECONDS};
    int rpcTimeout{DEFAULT_RPC_TIMEOUT};
    int connectTimeout{DEFAULT_CONNECT_TIMEOUT};

    std::string dataDir;
    bool inMemory{false};

    std::string logLevel{"info"};
    bool printToConsole{true};
    std::string logFile{"debug.log"};

    std::vector<NetworkSettings> networks;

    /**
     * Build settings from parsed configuration. Every problem found is
     * reported, one per line, through error.
     * @return nullopt if the configuration is unusable
     */
    static std::optional<IndexerSettings> Load(const util::ConfigManager& config,
                                               std::string* error);

    /// Network by id, or nullptr
    const NetworkSettings* FindNetwork(NetworkId id) const;
};

} // namespace indexer
} // namespace refindex

#endif // REFINDEX_INDEXER_SETTINGS_H
