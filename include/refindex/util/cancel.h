// REFINDEX - Cancellation Signals
// Copyright (c) 2024 REFINDEX Developers
// MIT License
//
// Hierarchical cancellation. A CancellationSource owns a signal; tokens are
// cheap read-only views of it handed to loops, workers and RPC calls.
// A source created from a parent token is cancelled whenever the parent is,
// so cancelling the service reaches every network loop, every cycle and
// every in-flight request below it.

#ifndef REFINDEX_UTIL_CANCEL_H
#define REFINDEX_UTIL_CANCEL_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace refindex {
namespace util {

namespace detail {

struct CancelState {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::weak_ptr<CancelState>> children;

    void Cancel();
};

} // namespace detail

/**
 * Read-only view of a cancellation signal.
 * A default-constructed token is never cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    /// True once the owning source (or any ancestor) was cancelled
    bool IsCancelled() const {
        return state_ && state_->cancelled.load();
    }

    /**
     * Block for up to duration or until cancelled.
     * @return true if the signal fired
     */
    bool WaitFor(std::chrono::milliseconds duration) const;

    /// Token that never fires
    static CancellationToken None() { return CancellationToken(); }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancelState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancelState> state_;
};

/**
 * Owner of a cancellation signal.
 */
class CancellationSource {
public:
    CancellationSource();

    /// Child source: cancelled with the parent, or on its own
    explicit CancellationSource(const CancellationToken& parent);

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    /// Fire the signal (idempotent); propagates to child sources
    void Cancel();

    bool IsCancelled() const { return state_->cancelled.load(); }

    CancellationToken Token() const { return CancellationToken(state_); }

private:
    std::shared_ptr<detail::CancelState> state_;
};

} // namespace util
} // namespace refindex

#endif // REFINDEX_UTIL_CANCEL_H
