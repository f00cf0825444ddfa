// REFINDEX - Cancellation Signals Implementation
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include "refindex/util/cancel.h"

#include <algorithm>

namespace refindex {
namespace util {

namespace detail {

void CancelState::Cancel() {
    std::vector<std::shared_ptr<CancelState>> live;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (cancelled.exchange(true)) {
            return;
        }
        for (const auto& weak : children) {
            if (auto child = weak.lock()) {
                live.push_back(std::move(child));
            }
        }
        children.clear();
    }
    cv.notify_all();

    // Children are cancelled outside our lock; each takes only its own.
    for (const auto& child : live) {
        child->Cancel();
    }
}

} // namespace detail

// ============================================================================
// CancellationToken
// ============================================================================

bool CancellationToken::WaitFor(std::chrono::milliseconds duration) const {
    if (!state_) {
        // Nothing can ever fire this token; plain sleep.
        std::mutex mutex;
        std::condition_variable cv;
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait_for(lock, duration, [] { return false; });
        return false;
    }

    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, duration, [this] {
        return state_->cancelled.load();
    });
}

// ============================================================================
// CancellationSource
// ============================================================================

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancelState>()) {}

CancellationSource::CancellationSource(const CancellationToken& parent)
    : state_(std::make_shared<detail::CancelState>()) {
    const auto& parentState = parent.state_;
    if (!parentState) {
        return;
    }

    bool parentCancelled = false;
    {
        std::lock_guard<std::mutex> lock(parentState->mutex);
        if (parentState->cancelled.load()) {
            parentCancelled = true;
        } else {
            auto& kids = parentState->children;
            kids.erase(std::remove_if(kids.begin(), kids.end(),
                           [](const std::weak_ptr<detail::CancelState>& w) {
                               return w.expired();
                           }),
                       kids.end());
            kids.push_back(state_);
        }
    }

    if (parentCancelled) {
        state_->Cancel();
    }
}

void CancellationSource::Cancel() {
    state_->Cancel();
}

} // namespace util
} // namespace refindex
