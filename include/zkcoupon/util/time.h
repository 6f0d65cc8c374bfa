// ZKCOUPON - Time Utilities
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License
//
// Wall-clock access for expiry decisions. Every component reads "now"
// through GetTime() so tests can freeze and advance the clock with the
// mock time facility.

#ifndef ZKCOUPON_UTIL_TIME_H
#define ZKCOUPON_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace zkcoupon {
namespace util {

using SystemClock = std::chrono::system_clock;
using SystemTimePoint = std::chrono::system_clock::time_point;

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

/// Current Unix timestamp in milliseconds (mock time when enabled)
int64_t GetTimeMillis();

// ============================================================================
// Formatting
// ============================================================================

/// Format a Unix timestamp as ISO 8601 UTC ("2024-01-15T10:30:00Z")
std::string FormatISO8601(int64_t timestamp);

/// Format a duration in seconds ("1d 2h 3m 4s")
std::string FormatDuration(int64_t seconds);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Freeze the clock at the current time (or the last mock time set)
void EnableMockTime();

void DisableMockTime();

bool IsMockTimeEnabled();

void SetMockTime(int64_t timestamp);

void AdvanceMockTime(int64_t seconds);

int64_t GetMockTime();

/// Enables mock time at `timestamp` for the lifetime of the object
class ScopedMockTime {
public:
    explicit ScopedMockTime(int64_t timestamp);
    ~ScopedMockTime();

    ScopedMockTime(const ScopedMockTime&) = delete;
    ScopedMockTime& operator=(const ScopedMockTime&) = delete;

    void Advance(int64_t seconds) { AdvanceMockTime(seconds); }

private:
    bool wasEnabled_;
    int64_t previous_;
};

} // namespace util
} // namespace zkcoupon

#endif // ZKCOUPON_UTIL_TIME_H
