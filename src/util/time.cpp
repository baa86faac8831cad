// STARDUST - Time Utilities Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/util/time.h"

#include <atomic>
#include <sstream>

namespace stardust {
namespace util {

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};

    int64_t RealTime() {
        return std::chrono::duration_cast<Seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
}

// ============================================================================
// Clock Access
// ============================================================================

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return RealTime();
}

int64_t GetTimeMillis() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load() * MILLIS_PER_SECOND;
    }
    return std::chrono::duration_cast<Milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

SteadyTimePoint GetSteadyTime() {
    return std::chrono::steady_clock::now();
}

std::string FormatDurationMillis(Milliseconds duration) {
    std::ostringstream oss;
    auto ms = duration.count();
    if (ms < MILLIS_PER_SECOND) {
        oss << ms << "ms";
    } else if (ms % MILLIS_PER_SECOND == 0) {
        oss << ms / MILLIS_PER_SECOND << "s";
    } else {
        oss << ms / MILLIS_PER_SECOND << "." << (ms % MILLIS_PER_SECOND) / 100 << "s";
    }
    return oss.str();
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    int64_t expected = 0;
    g_mockTime.compare_exchange_strong(expected, RealTime());
    g_mockTimeEnabled.store(true);
}

void DisableMockTime() {
    g_mockTimeEnabled.store(false);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTime(int64_t timestamp) {
    g_mockTime.store(timestamp);
    g_mockTimeEnabled.store(true);
}

void AdvanceMockTime(Seconds duration) {
    g_mockTime.fetch_add(duration.count());
}

int64_t GetMockTime() {
    return g_mockTime.load();
}

} // namespace util
} // namespace stardust
