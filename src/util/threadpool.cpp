// REFINDEX - Thread Pool Implementation
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include "refindex/util/threadpool.h"
#include "refindex/util/logging.h"

namespace refindex {
namespace util {

// ============================================================================
// ThreadPool Implementation
// ============================================================================

ThreadPool::ThreadPool() : ThreadPool(Config{}) {}

ThreadPool::ThreadPool(size_t numThreads) {
    config_.numThreads = numThreads;
    if (config_.startImmediately) {
        Start();
    }
}

ThreadPool::ThreadPool(const Config& config) : config_(config) {
    if (config_.startImmediately) {
        Start();
    }
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

void ThreadPool::Start() {
    if (running_.exchange(true)) {
        return; // Already running
    }

    size_t numThreads = config_.numThreads;
    if (numThreads == 0) {
        numThreads = std::thread::hardware_concurrency();
        if (numThreads == 0) {
            numThreads = 2;
        }
    }

    workers_.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ThreadPool::WorkerLoop, this);
    }
}

void ThreadPool::Wait() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    waitCondition_.wait(lock, [this] {
        return tasks_.empty() && activeTasks_.load() == 0;
    });
}

void ThreadPool::Shutdown() {
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (!running_.load()) {
            return;
        }
        running_.store(false);
    }

    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    std::unique_lock<std::mutex> lock(queueMutex_);
    if (!tasks_.empty()) {
        LogDebugF(LogCategory::DEFAULT, "%s: dropping %zu queued tasks",
                  config_.name.c_str(), tasks_.size());
        tasks_.clear();
    }
    waitCondition_.notify_all();
}

size_t ThreadPool::PendingTasks() const {
    std::unique_lock<std::mutex> lock(queueMutex_);
    return tasks_.size();
}

void ThreadPool::Enqueue(std::function<void()> task) {
    {
        std::unique_lock<std::mutex> lock(queueMutex_);

        if (!running_.load()) {
            throw std::runtime_error(config_.name + ": ThreadPool not running");
        }

        if (tasks_.size() >= config_.maxQueueSize) {
            throw std::runtime_error(config_.name + ": ThreadPool queue full");
        }

        tasks_.push_back(std::move(task));
    }

    condition_.notify_one();
}

void ThreadPool::WorkerLoop() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queueMutex_);

            condition_.wait(lock, [this] {
                return !running_.load() || !tasks_.empty();
            });

            if (!running_.load()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop_front();
            activeTasks_.fetch_add(1);
        }

        try {
            task();
        } catch (const std::exception& e) {
            // Submit() tasks never get here: packaged_task stores the exception.
            LOG_ERROR(LogCategory::DEFAULT) << config_.name << ": task failed: " << e.what();
        }

        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            activeTasks_.fetch_sub(1);
        }
        waitCondition_.notify_all();
    }
}

} // namespace util
} // namespace refindex
