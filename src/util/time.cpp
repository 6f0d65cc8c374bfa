// ZKCOUPON - Time Utilities Implementation
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License

#include "zkcoupon/util/time.h"

#include <atomic>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace zkcoupon {
namespace util {

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
    return std::chrono::duration_cast<std::chrono::seconds>(
        SystemClock::now().time_since_epoch()).count();
}

int64_t GetTimeMillis() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load() * 1000;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        SystemClock::now().time_since_epoch()).count();
}

// ============================================================================
// Formatting
// ============================================================================

std::string FormatISO8601(int64_t timestamp) {
    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm tmBuf;
    gmtime_r(&time, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string FormatDuration(int64_t seconds) {
    if (seconds < 0) {
        return "-" + FormatDuration(-seconds);
    }
    if (seconds == 0) {
        return "0s";
    }

    int64_t days = seconds / SECONDS_PER_DAY;
    seconds %= SECONDS_PER_DAY;
    int64_t hours = seconds / SECONDS_PER_HOUR;
    seconds %= SECONDS_PER_HOUR;
    int64_t minutes = seconds / SECONDS_PER_MINUTE;
    seconds %= SECONDS_PER_MINUTE;

    std::ostringstream oss;
    const char* sep = "";
    if (days > 0) { oss << days << "d"; sep = " "; }
    if (hours > 0) { oss << sep << hours << "h"; sep = " "; }
    if (minutes > 0) { oss << sep << minutes << "m"; sep = " "; }
    if (seconds > 0) { oss << sep << seconds << "s"; }
    return oss.str();
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    if (!g_mockTimeEnabled.load() && g_mockTime.load() == 0) {
        g_mockTime.store(GetTime());
    }
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
}

void AdvanceMockTime(int64_t seconds) {
    g_mockTime.fetch_add(seconds);
}

int64_t GetMockTime() {
    return g_mockTime.load();
}

ScopedMockTime::ScopedMockTime(int64_t timestamp)
    : wasEnabled_(IsMockTimeEnabled()), previous_(GetMockTime()) {
    SetMockTime(timestamp);
    EnableMockTime();
}

ScopedMockTime::~ScopedMockTime() {
    SetMockTime(previous_);
    if (!wasEnabled_) {
        DisableMockTime();
    }
}

} // namespace util
} // namespace zkcoupon
