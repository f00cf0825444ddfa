// REFINDEX - Time Utilities Implementation
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include "refindex/util/time.h"

#include <atomic>

namespace refindex {
namespace util {

// ============================================================================
// Mock Time State
// ============================================================================

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
}

// ============================================================================
// Unix Timestamps
// ============================================================================

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return std::chrono::duration_cast<Seconds>(
        SystemClock::now().time_since_epoch()).count();
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    if (!g_mockTimeEnabled.exchange(true)) {
        g_mockTime.store(std::chrono::duration_cast<Seconds>(
            SystemClock::now().time_since_epoch()).count());
    }
}

void DisableMockTime() {
    g_mockTimeEnabled.store(false);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTime(int64_t timestamp) {
    g_mockTime.store(timestamp);
}

void AdvanceMockTime(Seconds duration) {
    g_mockTime.fetch_add(duration.count());
}

} // namespace util
} // namespace refindex
