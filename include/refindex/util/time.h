// REFINDEX - Time Utilities
// Copyright (c) 2024 REFINDEX Developers
// MIT License
//
// Provides time-related utilities:
// - Unix timestamps
// - Mock time for testing

#ifndef REFINDEX_UTIL_TIME_H
#define REFINDEX_UTIL_TIME_H

#include <chrono>
#include <cstdint>

namespace refindex {
namespace util {

// ============================================================================
// Type Aliases
// ============================================================================

using Seconds = std::chrono::seconds;
using SystemClock = std::chrono::system_clock;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Get current Unix timestamp in seconds (mock time aware)
int64_t GetTime();

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Enable mock time mode
void EnableMockTime();

/// Disable mock time mode
void DisableMockTime();

/// Check if mock time is enabled
bool IsMockTimeEnabled();

/// Set mock time (only takes effect while mock time is enabled)
void SetMockTime(int64_t timestamp);

/// Advance mock time by duration
void AdvanceMockTime(Seconds duration);

} // namespace util
} // namespace refindex

#endif // REFINDEX_UTIL_TIME_H
