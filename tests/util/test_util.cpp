// REFINDEX - Util Module Tests
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include <gtest/gtest.h>

#include "refindex/util/cancel.h"
#include "refindex/util/logging.h"
#include "refindex/util/threadpool.h"
#include "refindex/util/time.h"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <thread>
#include <vector>

namespace refindex {
namespace util {
namespace {

// ============================================================================
// Logging Tests
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Trace);
        Logger::Instance().EnableAllCategories();
        sink_ = std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { entries_.push_back(entry); }, LogLevel::Trace);
        Logger::Instance().AddSink(sink_);
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
        Logger::Instance().EnableAllCategories();
    }

    std::shared_ptr<CallbackSink> sink_;
    std::vector<LogEntry> entries_;
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Fatal), "FATAL");
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("debug"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("WARNING"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("Error"), LogLevel::Error);
    EXPECT_EQ(LogLevelFromString("bogus"), LogLevel::Info);
}

TEST_F(LoggingTest, StreamMacroReachesSink) {
    LOG_INFO(LogCategory::INDEXER) << "planned " << 3 << " ids";

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
    EXPECT_EQ(entries_[0].category, "indexer");
    EXPECT_EQ(entries_[0].message, "planned 3 ids");
    EXPECT_GT(entries_[0].line, 0);
    EXPECT_EQ(GetBasename(entries_[0].file), "test_util.cpp");
}

TEST_F(LoggingTest, PrintfMacro) {
    LogWarnF(LogCategory::RPC, "endpoint %s failed after %d ms", "http://a", 250);
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "endpoint http://a failed after 250 ms");
}

TEST_F(LoggingTest, LevelFiltering) {
    Logger::Instance().SetLevel(LogLevel::Warn);
    LOG_INFO(LogCategory::DB) << "hidden";
    LOG_ERROR(LogCategory::DB) << "shown";

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "shown");
    EXPECT_FALSE(Logger::Instance().WillLog(LogLevel::Debug, LogCategory::DB));
}

TEST_F(LoggingTest, CategoryFiltering) {
    Logger::Instance().EnableCategory(LogCategory::CHAIN);
    EXPECT_TRUE(Logger::Instance().IsCategoryEnabled(LogCategory::CHAIN));
    EXPECT_FALSE(Logger::Instance().IsCategoryEnabled(LogCategory::DECODE));

    LOG_INFO(LogCategory::DECODE) << "hidden";
    LOG_INFO(LogCategory::CHAIN) << "shown";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].category, "chain");
}

TEST_F(LoggingTest, ArgumentsNotEvaluatedWhenFiltered) {
    Logger::Instance().SetLevel(LogLevel::Error);
    int evaluated = 0;
    auto expensive = [&]() { ++evaluated; return 1; };
    LOG_DEBUG(LogCategory::DB) << expensive();
    EXPECT_EQ(evaluated, 0);
}

TEST_F(LoggingTest, ScopedContextTagsEntries) {
    EXPECT_TRUE(CurrentLogContext().empty());
    {
        ScopedLogContext outer("polkadot");
        LOG_INFO(LogCategory::INDEXER) << "one";
        {
            ScopedLogContext inner("kusama");
            LOG_INFO(LogCategory::INDEXER) << "two";
        }
        EXPECT_EQ(CurrentLogContext(), "polkadot");
    }
    LOG_INFO(LogCategory::INDEXER) << "three";

    ASSERT_EQ(entries_.size(), 3u);
    EXPECT_EQ(entries_[0].context, "polkadot");
    EXPECT_EQ(entries_[1].context, "kusama");
    EXPECT_TRUE(entries_[2].context.empty());
}

TEST_F(LoggingTest, ContextIsPerThread) {
    ScopedLogContext tag("main");
    std::string seen = "unset";
    std::thread other([&seen]() { seen = CurrentLogContext(); });
    other.join();
    EXPECT_TRUE(seen.empty());
}

TEST_F(LoggingTest, AddRemoveSink) {
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);
    Logger::Instance().RemoveSink(sink_);
    EXPECT_EQ(Logger::Instance().SinkCount(), 0u);
    LOG_ERROR(LogCategory::DB) << "nobody listens";
    EXPECT_TRUE(entries_.empty());
}

TEST_F(LoggingTest, ScopedTimerLogsAtDebug) {
    {
        REFINDEX_LOG_TIMER(LogCategory::INDEXER, "cycle");
    }
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Debug);
    EXPECT_EQ(entries_[0].message.rfind("cycle took ", 0), 0u);
}

class FileSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir_ = std::filesystem::temp_directory_path() /
               ("refindex_log_test_" + std::to_string(rd()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    static LogEntry Entry(const std::string& message) {
        LogEntry entry;
        entry.level = LogLevel::Info;
        entry.category = LogCategory::INDEXER;
        entry.context = "dot";
        entry.message = message;
        entry.timestamp = std::chrono::system_clock::now();
        return entry;
    }

    static std::string ReadAll(const std::filesystem::path& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::filesystem::path dir_;
};

TEST_F(FileSinkTest, WritesFormattedLines) {
    FileSink::Config config;
    config.path = (dir_ / "debug.log").string();
    config.showThread = false;
    {
        FileSink sink(config);
        ASSERT_TRUE(sink.IsOpen());
        sink.Write(Entry("cycle started"));
        sink.Flush();
    }

    std::string text = ReadAll(dir_ / "debug.log");
    EXPECT_NE(text.find("[INFO ] [indexer] [dot] cycle started\n"), std::string::npos);
}

TEST_F(FileSinkTest, BelowLevelIgnored) {
    FileSink::Config config;
    config.path = (dir_ / "debug.log").string();
    config.level = LogLevel::Error;
    FileSink sink(config);
    sink.Write(Entry("quiet"));
    sink.Flush();
    EXPECT_EQ(sink.GetCurrentSize(), 0u);
}

TEST_F(FileSinkTest, RotatesPastMaxSize) {
    FileSink::Config config;
    config.path = (dir_ / "debug.log").string();
    config.maxSize = 64;
    config.maxFiles = 3;
    config.autoFlush = true;
    {
        FileSink sink(config);
        for (int i = 0; i < 10; ++i) {
            sink.Write(Entry("line " + std::to_string(i) + " padded to pass the limit"));
        }
    }

    EXPECT_TRUE(std::filesystem::exists(dir_ / "debug.log"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "debug.log.1"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "debug.log.3"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "debug.log.4"));
    EXPECT_NE(ReadAll(dir_ / "debug.log").find("line 9"), std::string::npos);
}

// ============================================================================
// Time Tests
// ============================================================================

class TimeTest : public ::testing::Test {
protected:
    void TearDown() override {
        DisableMockTime();
    }
};

TEST_F(TimeTest, GetTime) {
    int64_t now = GetTime();
    EXPECT_GT(now, 1600000000);
    EXPECT_LE(GetTime() - now, 1);
}

TEST_F(TimeTest, MockTime) {
    EnableMockTime();
    EXPECT_TRUE(IsMockTimeEnabled());
    SetMockTime(1700000000);
    EXPECT_EQ(GetTime(), 1700000000);

    AdvanceMockTime(Seconds(90));
    EXPECT_EQ(GetTime(), 1700000090);

    DisableMockTime();
    EXPECT_FALSE(IsMockTimeEnabled());
    EXPECT_NE(GetTime(), 1700000090);
}

// ============================================================================
// Cancellation Tests
// ============================================================================

TEST(CancellationTest, NoneNeverFires) {
    CancellationToken token = CancellationToken::None();
    EXPECT_FALSE(token.IsCancelled());
    EXPECT_FALSE(token.WaitFor(std::chrono::milliseconds(1)));
}

TEST(CancellationTest, CancelIsObservedByTokens) {
    CancellationSource source;
    CancellationToken token = source.Token();
    EXPECT_FALSE(token.IsCancelled());

    source.Cancel();
    source.Cancel();
    EXPECT_TRUE(source.IsCancelled());
    EXPECT_TRUE(token.IsCancelled());
    EXPECT_TRUE(token.WaitFor(std::chrono::milliseconds(0)));
}

TEST(CancellationTest, WaitForWakesEarly) {
    CancellationSource source;
    CancellationToken token = source.Token();

    auto start = std::chrono::steady_clock::now();
    std::thread canceller([&source]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        source.Cancel();
    });
    EXPECT_TRUE(token.WaitFor(std::chrono::seconds(30)));
    canceller.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}

TEST(CancellationTest, ParentCancelsChildren) {
    CancellationSource parent;
    CancellationSource child(parent.Token());
    CancellationSource grandchild(child.Token());

    parent.Cancel();
    EXPECT_TRUE(child.IsCancelled());
    EXPECT_TRUE(grandchild.Token().IsCancelled());
}

TEST(CancellationTest, ChildDoesNotCancelParent) {
    CancellationSource parent;
    CancellationSource child(parent.Token());

    child.Cancel();
    EXPECT_TRUE(child.IsCancelled());
    EXPECT_FALSE(parent.IsCancelled());
}

TEST(CancellationTest, ChildOfCancelledParentStartsCancelled) {
    CancellationSource parent;
    parent.Cancel();
    CancellationSource child(parent.Token());
    EXPECT_TRUE(child.IsCancelled());
}

// ============================================================================
// Thread Pool Tests
// ============================================================================

class ThreadPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool_ = std::make_unique<ThreadPool>(4);
    }

    void TearDown() override {
        pool_.reset();
    }

    std::unique_ptr<ThreadPool> pool_;
};

TEST_F(ThreadPoolTest, Construction) {
    EXPECT_TRUE(pool_->IsRunning());
    EXPECT_EQ(pool_->ThreadCount(), 4u);
}

TEST_F(ThreadPoolTest, SubmitReturnsValue) {
    auto future = pool_->Submit([](int a, int b) { return a * b; }, 6, 7);
    EXPECT_EQ(future.get(), 42);
}

TEST_F(ThreadPoolTest, ManyTasks) {
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 200; ++i) {
        futures.push_back(pool_->Submit([&counter]() { ++counter; }));
    }
    for (auto& f : futures) {
        f.get();
    }
    EXPECT_EQ(counter.load(), 200);
}

TEST_F(ThreadPoolTest, ExecuteAndWait) {
    std::atomic<int> counter{0};
    for (int i = 0; i < 10; ++i) {
        pool_->Execute([&counter]() { ++counter; });
    }
    pool_->Wait();
    EXPECT_EQ(counter.load(), 10);
    EXPECT_EQ(pool_->PendingTasks(), 0u);
}

TEST_F(ThreadPoolTest, ExceptionTravelsThroughFuture) {
    auto future = pool_->Submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    // The worker survives
    EXPECT_EQ(pool_->Submit([]() { return 1; }).get(), 1);
}

TEST_F(ThreadPoolTest, SubmitAfterShutdownThrows) {
    pool_->Shutdown();
    EXPECT_FALSE(pool_->IsRunning());
    EXPECT_THROW(pool_->Submit([]() { return 0; }), std::runtime_error);
}

TEST_F(ThreadPoolTest, BoundedQueue) {
    ThreadPool::Config config;
    config.numThreads = 1;
    config.maxQueueSize = 1;
    config.name = "tiny";
    ThreadPool pool(config);

    CancellationSource release;
    CancellationToken gate = release.Token();
    std::atomic<bool> started{false};
    auto blocker = pool.Submit([&started, gate]() {
        started = true;
        gate.WaitFor(std::chrono::seconds(30));
    });
    while (!started) {
        std::this_thread::yield();
    }

    auto queued = pool.Submit([]() {});
    EXPECT_THROW(pool.Submit([]() {}), std::runtime_error);

    release.Cancel();
    blocker.get();
    queued.get();
    EXPECT_EQ(pool.Name(), "tiny");
}

// ============================================================================
// Utility Tests
// ============================================================================

TEST(UtilityTest, FixedWidth) {
    EXPECT_EQ(FixedWidth("INFO", 5), "INFO ");
    EXPECT_EQ(FixedWidth("INDEXER", 3), "IND");
    EXPECT_EQ(FixedWidth("ab", 4, '.'), "ab..");
}

TEST(UtilityTest, GetBasename) {
    EXPECT_EQ(GetBasename("/src/indexer/planner.cpp"), "planner.cpp");
    EXPECT_EQ(GetBasename("planner.cpp"), "planner.cpp");
    EXPECT_EQ(GetBasename("C:\\src\\client.cpp"), "client.cpp");
}

} // namespace
} // namespace util
} // namespace refindex
