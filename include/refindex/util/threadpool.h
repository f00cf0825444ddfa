// REFINDEX - Thread Pool
// Copyright (c) 2024 REFINDEX Developers
// MIT License
//
// Fixed-size worker pool used for the per-network reconciliation workers:
// - FIFO task queue with a bounded length
// - Futures for result retrieval and exception propagation
// - Graceful shutdown

#ifndef REFINDEX_UTIL_THREADPOOL_H
#define REFINDEX_UTIL_THREADPOOL_H

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace refindex {
namespace util {

// ============================================================================
// Thread Pool
// ============================================================================

/**
 * A thread pool for executing tasks asynchronously.
 *
 * Tasks run in submission order across numThreads workers. Exceptions thrown
 * by a Submit()ed task are delivered through its future; exceptions from an
 * Execute()d task are logged.
 */
class ThreadPool {
public:
    struct Config {
        size_t numThreads{4};        // 0 = hardware concurrency
        size_t maxQueueSize{100000}; // Maximum pending tasks
        std::string name{"pool"};    // Pool name for logging
        bool startImmediately{true}; // Start workers on construction
    };

    ThreadPool();

    explicit ThreadPool(size_t numThreads);

    explicit ThreadPool(const Config& config);

    /// Destructor (drops queued tasks, joins workers)
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Start worker threads
    void Start();

    /// Block until the queue is empty and no task is executing
    void Wait();

    /// Stop workers; queued tasks that have not started are dropped
    void Shutdown();

    bool IsRunning() const { return running_.load(); }

    size_t ThreadCount() const { return workers_.size(); }

    size_t PendingTasks() const;

    size_t ActiveTasks() const { return activeTasks_.load(); }

    const std::string& Name() const { return config_.name; }

    // ========================================================================
    // Task Submission
    // ========================================================================

    /**
     * Submit a task for execution.
     * @return Future for the result (rethrows the task's exception on get())
     * @throws std::runtime_error if the pool is not running or the queue is full
     */
    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type> {

        using ReturnType = typename std::invoke_result<F, Args...>::type;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<ReturnType> result = task->get_future();
        Enqueue([task]() { (*task)(); });
        return result;
    }

    /**
     * Submit a task without caring about the result.
     */
    template<typename F, typename... Args>
    void Execute(F&& f, Args&&... args) {
        Enqueue(std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    }

private:
    Config config_;
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;

    mutable std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable waitCondition_;

    std::atomic<bool> running_{false};
    std::atomic<size_t> activeTasks_{0};

    void Enqueue(std::function<void()> task);

    void WorkerLoop();
};

} // namespace util
} // namespace refindex

#endif // REFINDEX_UTIL_THREADPOOL_H
