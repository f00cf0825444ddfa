// REFINDEX - Logging System
// Copyright (c) 2024 REFINDEX Developers
// MIT License
//
// Provides a flexible logging system with:
// - Multiple log levels (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
// - Log categories for filtering
// - Console, rotating file and callback outputs
// - A per-thread context tag (the network a loop is indexing)
// - Printf-style and stream-style interfaces

#ifndef REFINDEX_UTIL_LOGGING_H
#define REFINDEX_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace refindex {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,   // Very detailed debugging
    Debug = 1,   // Debug information
    Info = 2,    // General information
    Warn = 3,    // Warnings
    Error = 4,   // Errors
    Fatal = 5,   // Fatal errors
    Off = 6      // Disable logging
};

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string (unknown strings map to Info)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* CHAIN = "chain";
    constexpr const char* RPC = "rpc";
    constexpr const char* DECODE = "decode";
    constexpr const char* DB = "db";
    constexpr const char* INDEXER = "indexer";
    constexpr const char* CONFIG = "config";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    std::string context;    // Thread context tag, empty when unset
    std::string file;
    int line;
    std::string function;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;

    LogEntry() : level(LogLevel::Info), line(0) {}
};

// ============================================================================
// Log Sink Interface
// ============================================================================

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;

    virtual void Flush() = 0;

    virtual void SetLevel(LogLevel level) = 0;

    virtual LogLevel GetLevel() const = 0;
};

// ============================================================================
// Console Sink
// ============================================================================

class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};           // ANSI colours when stdout is a tty
        bool useStderr{false};          // Errors to stderr
        bool showTimestamp{true};
        bool showLevel{true};
        bool showCategory{true};
        bool showThread{false};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::mutex mutex_;

    std::string Format(const LogEntry& entry) const;

    const char* GetColorCode(LogLevel level) const;
};

// ============================================================================
// File Sink
// ============================================================================

/// Appends to a log file, rotating it to path.1 .. path.N past maxSize
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool autoFlush{false};
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{5};
        bool rotate{true};
        bool showThread{true};
        bool showLocation{true};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    size_t GetCurrentSize() const { return currentSize_; }

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t currentSize_{0};

    void Open();

    std::string Format(const LogEntry& entry) const;

    void Rotate();
};

// ============================================================================
// Callback Sink
// ============================================================================

class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_{LogLevel::Info};
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    /// Install a default console sink if none is present
    void Initialize();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the enabled categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* function,
              const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 7, 8)))
#endif
        ;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    std::atomic<bool> allCategoriesEnabled_{true};
};

// ============================================================================
// Thread Log Context
// ============================================================================

/// Context tag of the calling thread
const std::string& CurrentLogContext();

/// RAII: tag every entry logged by this thread, restoring the old tag on exit
class ScopedLogContext {
public:
    explicit ScopedLogContext(std::string context);
    ~ScopedLogContext();

    ScopedLogContext(const ScopedLogContext&) = delete;
    ScopedLogContext& operator=(const ScopedLogContext&) = delete;

private:
    std::string previous_;
};

// ============================================================================
// Log Stream
// ============================================================================

class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line, const char* function);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    std::string category_;
    const char* file_;
    int line_;
    const char* function_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define REFINDEX_LOGGER ::refindex::util::Logger::Instance()

#define REFINDEX_LOG_ENABLED(level, category) \
    REFINDEX_LOGGER.WillLog(::refindex::util::LogLevel::level, category)

#define REFINDEX_LOG(level, category) \
    if (REFINDEX_LOG_ENABLED(level, category)) \
        ::refindex::util::LogStream(::refindex::util::LogLevel::level, category, \
                                    __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   REFINDEX_LOG(Trace, category)
#define LOG_DEBUG(category)   REFINDEX_LOG(Debug, category)
#define LOG_INFO(category)    REFINDEX_LOG(Info, category)
#define LOG_WARN(category)    REFINDEX_LOG(Warn, category)
#define LOG_ERROR(category)   REFINDEX_LOG(Error, category)
#define LOG_FATAL(category)   REFINDEX_LOG(Fatal, category)

#define REFINDEX_LOGF(level, category, ...) \
    do { \
        if (REFINDEX_LOG_ENABLED(level, category)) { \
            REFINDEX_LOGGER.LogF(::refindex::util::LogLevel::level, category, \
                                 __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    } while(0)

#define LogDebugF(category, ...)  REFINDEX_LOGF(Debug, category, __VA_ARGS__)
#define LogWarnF(category, ...)   REFINDEX_LOGF(Warn, category, __VA_ARGS__)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// Logs "<operation> took N ms" at Debug when it goes out of scope
class ScopedLogTimer {
public:
    ScopedLogTimer(const char* category, std::string operation);
    ~ScopedLogTimer();

    int64_t ElapsedMillis() const;

private:
    const char* category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

#define REFINDEX_LOG_TIMER_CAT2(a, b) a##b
#define REFINDEX_LOG_TIMER_CAT(a, b) REFINDEX_LOG_TIMER_CAT2(a, b)
#define REFINDEX_LOG_TIMER(category, operation) \
    ::refindex::util::ScopedLogTimer REFINDEX_LOG_TIMER_CAT(_refindex_timer_, __LINE__)(category, operation)

// ============================================================================
// Utility Functions
// ============================================================================

/// Format timestamp for logging (local time, millisecond precision)
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Truncate or pad string to fixed width
std::string FixedWidth(const std::string& str, size_t width, char pad = ' ');

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace refindex

#endif // REFINDEX_UTIL_LOGGING_H
