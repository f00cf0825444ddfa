// REFINDEX - Indexer Settings Implementation
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include "refindex/indexer/settings.h"

#include "refindex/rpc/client.h"
#include "refindex/util/logging.h"

#include <set>
#include <sstream>

namespace refindex {
namespace indexer {

namespace {

/// Collects problems; Load fails if any were recorded
class Problems {
public:
    void Add(const std::string& what) { lines_.push_back(what); }
    bool Empty() const { return lines_.empty(); }

    std::string Join() const {
        std::ostringstream ss;
        for (size_t i = 0; i < lines_.size(); ++i) {
            if (i > 0) ss << "\n";
            ss << lines_[i];
        }
        return ss.str();
    }

private:
    std::vector<std::string> lines_;
};

template<typename T>
bool ReadBounded(const util::ConfigManager& config, const std::string& key,
                 const std::string& section, int64_t minValue, int64_t maxValue,
                 T& out, Problems& problems) {
    if (!config.HasKey(key, section)) {
        return true;
    }
    auto value = config.TryGetInt(key, section);
    std::string where = section.empty() ? key : "[" + section + "] " + key;
    if (!value || *value < minValue || *value > maxValue) {
        problems.Add(where + ": expected an integer in [" + std::to_string(minValue) + ", " +
                     std::to_string(maxValue) + "], got '" +
                     config.GetString(key, "", section) + "'");
        return false;
    }
    out = static_cast<T>(*value);
    return true;
}

bool ReadFlag(const util::ConfigManager& config, const std::string& key,
              const std::string& section, bool& out, Problems& problems) {
    if (!config.HasKey(key, section)) {
        return true;
    }
    auto value = config.TryGetBool(key, section);
    if (!value) {
        problems.Add((section.empty() ? key : "[" + section + "] " + key) +
                     ": expected a boolean");
        return false;
    }
    out = *value;
    return true;
}

} // namespace

std::optional<IndexerSettings> IndexerSettings::Load(const util::ConfigManager& config,
                                                     std::string* error) {
    IndexerSettings settings;
    Problems problems;

    ReadBounded(config, "workers", "", 1, 256, settings.workers, problems);

    int64_t interval = DEFAULT_INTERVAL_SECONDS;
    if (ReadBounded(config, "interval", "", 1, 7 * 24 * 3600, interval, problems)) {
        settings.interval = std::chrono::seconds(interval);
    }

    ReadBounded(config, "rpctimeout", "", 1, 3600, settings.rpcTimeout, problems);
    ReadBounded(config, "connecttimeout", "", 1, 3600, settings.connectTimeout, problems);

    settings.dataDir = config.GetPath("datadir", util::ConfigManager::GetDefaultDataDir());
    ReadFlag(config, "inmemory", "", settings.inMemory, problems);

    settings.logLevel = config.GetString("loglevel", settings.logLevel);
    ReadFlag(config, "printtoconsole", "", settings.printToConsole, problems);
    settings.logFile = config.GetString("logfile", settings.logFile);

    std::set<NetworkId> seenIds;
    for (const std::string& section : config.GetSections()) {
        NetworkSettings net;
        net.name = config.GetString("name", section, section);

        auto id = config.TryGetUInt("id", section);
        if (!id || *id > UINT32_MAX) {
            problems.Add("[" + section + "] id: required, a non-negative 32-bit integer");
        } else {
            net.id = static_cast<NetworkId>(*id);
            if (!seenIds.insert(net.id).second) {
                problems.Add("[" + section + "] id: " + std::to_string(net.id) +
                             " is used by another network");
            }
        }

        net.endpoints = config.GetList("rpc", section);
        if (net.endpoints.empty()) {
            problems.Add("[" + section + "] rpc: at least one endpoint is required");
        }
        for (const auto& endpoint : net.endpoints) {
            std::string why;
            if (!rpc::ParseEndpointURL(endpoint, &why)) {
                problems.Add("[" + section + "] rpc: " + why);
            }
        }

        ReadBounded(config, "ss58prefix", section, 0, 16383, net.ss58Prefix, problems);
        ReadBounded(config, "originspallet", section, 0, 255, net.originsPallet, problems);
        ReadFlag(config, "enabled", section, net.enabled, problems);

        settings.networks.push_back(std::move(net));
    }

    if (!problems.Empty()) {
        if (error) {
            *error = problems.Join();
        }
        return std::nullopt;
    }

    LOG_DEBUG(util::LogCategory::CONFIG) << "Loaded " << settings.networks.size()
                                         << " network(s), workers=" << settings.workers
                                         << ", interval=" << settings.interval.count() << "s";
    return settings;
}

const NetworkSettings* IndexerSettings::FindNetwork(NetworkId id) const {
    for (const auto& net : networks) {
        if (net.id == id) {
            return &net;
        }
    }
    return nullptr;
}

} // namespace indexer
} // namespace refindex
