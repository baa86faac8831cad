// STARDUST - Time Utilities
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// Wall clock access with a mock-time override. Timelock and expiration
// checks read the clock through GetTime() so tests can move it.

#ifndef STARDUST_UTIL_TIME_H
#define STARDUST_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace stardust {
namespace util {

using Milliseconds = std::chrono::milliseconds;
using Seconds = std::chrono::seconds;
using SteadyTimePoint = std::chrono::steady_clock::time_point;

constexpr int64_t MILLIS_PER_SECOND = 1000;

/// Current Unix time in seconds (mock time when enabled)
int64_t GetTime();

/// Current Unix time in milliseconds (mock time when enabled)
int64_t GetTimeMillis();

/// Monotonic clock, never mocked
SteadyTimePoint GetSteadyTime();

/// Render a duration as e.g. "1.5s" or "250ms"
std::string FormatDurationMillis(Milliseconds duration);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Freeze GetTime() at the current mock value (initialized to now)
void EnableMockTime();

void DisableMockTime();

bool IsMockTimeEnabled();

/// Set the mock time and enable it
void SetMockTime(int64_t timestamp);

void AdvanceMockTime(Seconds duration);

int64_t GetMockTime();

/// Enables mock time for a scope and restores the real clock afterwards
class ScopedMockTime {
public:
    explicit ScopedMockTime(int64_t timestamp) { SetMockTime(timestamp); }
    ~ScopedMockTime() { DisableMockTime(); }

    ScopedMockTime(const ScopedMockTime&) = delete;
    ScopedMockTime& operator=(const ScopedMockTime&) = delete;
};

} // namespace util
} // namespace stardust

#endif // STARDUST_UTIL_TIME_H
