// REFINDEX Daemon - Main Entry Point
// Copyright (c) 2024 REFINDEX Developers
// MIT License
//
// refindexd keeps a local mirror of on-chain referenda for every configured
// network:
// - one reconciliation loop per network, polling on a fixed interval
// - records persisted in LevelDB (or in memory with -inmemory)
// - -dump prints the stored records of a network as JSON

#include <refindex/chain/client.h>
#include <refindex/db/leveldb.h>
#include <refindex/db/refdb.h>
#include <refindex/indexer/service.h>
#include <refindex/indexer/settings.h>
#include <refindex/util/cancel.h>
#include <refindex/util/config.h>
#include <refindex/util/logging.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <thread>

namespace refindex {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "REFINDEX Daemon";

/// Database directory inside the data directory
constexpr const char* DB_DIRNAME = "refs";

// ============================================================================
// Signal Handling
// ============================================================================

static std::atomic<bool> g_shutdownRequested{false};

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdownRequested.store(true);
    }
}

void SetupSignalHandlers() {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);
    std::signal(SIGPIPE, SIG_IGN);
}

/// Fires the root token once a signal arrives; stops when done is set
class SignalWatcher {
public:
    explicit SignalWatcher(util::CancellationSource& root)
        : root_(root), thread_([this] { Loop(); }) {}

    ~SignalWatcher() {
        done_.store(true);
        thread_.join();
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    void Loop() {
        while (!done_.load()) {
            if (g_shutdownRequested.load()) {
                LOG_INFO(util::LogCategory::DEFAULT) << "Received shutdown signal";
                root_.Cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    util::CancellationSource& root_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

// ============================================================================
// Command Line
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: refindexd [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                Show this help message\n";
    std::cout << "  -conf=<file>         Configuration file (default: <datadir>/refindex.conf)\n";
    std::cout << "  -datadir=<dir>       Data directory (default: ~/.refindex)\n";
    std::cout << "  -once                Run one cycle per network, then exit\n";
    std::cout << "  -dump=<network id>   Print stored records as JSON, then exit\n";
    std::cout << "  -inmemory            Keep records in memory only\n";
    std::cout << "\nIndexer Options:\n";
    std::cout << "  -workers=<n>         Workers per network (default: 4)\n";
    std::cout << "  -interval=<seconds>  Cycle interval (default: 3600)\n";
    std::cout << "  -rpctimeout=<s>      Per-request timeout (default: 30)\n";
    std::cout << "  -connecttimeout=<s>  Connect timeout (default: 10)\n";
    std::cout << "\nLogging Options:\n";
    std::cout << "  -loglevel=<level>    trace, debug, info, warn, error (default: info)\n";
    std::cout << "  -printtoconsole=0    Do not log to the console\n";
    std::cout << "  -logfile=<name>      Log file inside the data directory (default: debug.log)\n";
    std::cout << "\nNetworks are configured in [sections] of the configuration file:\n\n";
    std::cout << "  [polkadot]\n";
    std::cout << "  id=1\n";
    std::cout << "  rpc=http://127.0.0.1:9933\n";
    std::cout << "  ss58prefix=0\n";
}

/// Parse the command line, then the configuration file it points at
bool LoadConfiguration(int argc, char* argv[], util::ConfigManager& config) {
    auto result = config.ParseCommandLine(argc, argv);
    if (!result.success) {
        std::cerr << "Error: " << result.ToString() << "\n";
        return false;
    }
    if (config.GetBool("help", false) || config.GetBool("h", false)) {
        return true;
    }

    std::filesystem::path dataDir =
        config.GetPath("datadir", util::ConfigManager::GetDefaultDataDir());
    bool explicitConf = config.HasKey("conf");
    std::string confPath = config.GetPath(
        "conf", (dataDir / util::DEFAULT_CONFIG_FILENAME).string());

    std::error_code ec;
    if (!std::filesystem::exists(confPath, ec)) {
        if (explicitConf) {
            std::cerr << "Error: configuration file not found: " << confPath << "\n";
            return false;
        }
        return true;
    }

    result = config.ParseFile(confPath);
    if (!result.success) {
        std::cerr << "Error: " << result.ToString() << "\n";
        return false;
    }
    return true;
}

// ============================================================================
// Initialization
// ============================================================================

void SetupLogging(const indexer::IndexerSettings& settings) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();

    util::LogLevel level = util::LogLevelFromString(settings.logLevel);
    logger.SetLevel(level);

    if (settings.printToConsole) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    if (!settings.logFile.empty() && !settings.inMemory) {
        util::FileSink::Config fileConfig;
        fileConfig.path = (std::filesystem::path(settings.dataDir) / settings.logFile).string();
        fileConfig.level = level < util::LogLevel::Debug ? level : util::LogLevel::Debug;
        logger.AddSink(std::make_shared<util::FileSink>(fileConfig));
    }
}

std::unique_ptr<db::Database> OpenStore(const indexer::IndexerSettings& settings) {
    if (settings.inMemory) {
        LOG_INFO(util::LogCategory::DB) << "Using in-memory database";
        return std::make_unique<db::MemoryDatabase>();
    }

    std::filesystem::path path = std::filesystem::path(settings.dataDir) / DB_DIRNAME;
    auto [status, database] = db::OpenDatabase(path);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Cannot open database at " << path.string() << ": "
                                         << status.ToString();
        return nullptr;
    }
    LOG_INFO(util::LogCategory::DB) << "Opened database at " << path.string();
    return std::move(database);
}

int DumpRecords(db::RefStore& store, NetworkId network) {
    std::vector<db::ReferendumRecord> records;
    db::Status status = store.ListRecords(network, records);
    if (!status.ok()) {
        std::cerr << "Error: " << status.ToString() << "\n";
        return 1;
    }

    rpc::JSONValue out(rpc::JSONValue::Array{});
    for (const auto& record : records) {
        out.Push(db::RecordToJSON(record));
    }
    std::cout << out.ToJSON(true) << std::endl;
    return 0;
}

// ============================================================================
// Main Application
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;
    if (!LoadConfiguration(argc, argv, config)) {
        return 1;
    }
    if (config.GetBool("help", false) || config.GetBool("h", false)) {
        PrintHelp();
        return 0;
    }

    std::string error;
    auto settings = indexer::IndexerSettings::Load(config, &error);
    if (!settings) {
        std::cerr << "Configuration error:\n" << error << "\n";
        return 1;
    }

    std::error_code ec;
    if (!settings->inMemory) {
        std::filesystem::create_directories(settings->dataDir, ec);
        if (ec) {
            std::cerr << "Error: cannot create data directory " << settings->dataDir << ": "
                      << ec.message() << "\n";
            return 1;
        }
    }

    SetupLogging(*settings);
    LOG_INFO(util::LogCategory::DEFAULT) << CLIENT_NAME << " v" << VERSION << " starting";
    LOG_INFO(util::LogCategory::DEFAULT) << "Data directory: " << settings->dataDir;

    std::unique_ptr<db::Database> database = OpenStore(*settings);
    if (!database) {
        return 1;
    }
    db::DatabaseRefStore store(std::move(database));

    if (config.HasKey("dump")) {
        auto network = config.TryGetUInt("dump");
        if (!network || *network > UINT32_MAX) {
            std::cerr << "Error: -dump expects a network id\n";
            return 1;
        }
        return DumpRecords(store, static_cast<NetworkId>(*network));
    }

    if (settings->networks.empty()) {
        std::cerr << "Error: no networks configured\n";
        return 1;
    }

    SetupSignalHandlers();
    util::CancellationSource root;
    SignalWatcher watcher(root);

    indexer::MultiNetworkIndexer service(
        *settings, store,
        chain::MakeRPCClientFactory(settings->connectTimeout, settings->rpcTimeout));

    if (config.GetBool("once", false)) {
        auto reports = service.RunOnce(root.Token());
        for (const auto& report : reports) {
            std::cout << report.ToString() << "\n";
        }
        util::Logger::Instance().Flush();
        return 0;
    }

    service.Start(root.Token());
    LOG_INFO(util::LogCategory::DEFAULT) << "Indexing " << service.NetworkCount()
                                         << " network(s); interval "
                                         << settings->interval.count() << "s";

    while (!root.Token().WaitFor(std::chrono::seconds(1))) {
    }
    service.Stop();

    LOG_INFO(util::LogCategory::DEFAULT) << "Shutdown complete";
    util::Logger::Instance().Flush();
    return 0;
}

} // namespace refindex

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return refindex::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
