#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "common/calendar_date.hpp"

namespace tokentally {

struct CacheUsage {
    uint64_t write = 0;
    uint64_t read = 0;
};

struct TokenUsage {
    uint64_t input = 0;
    uint64_t output = 0;
    uint64_t reasoning = 0;
    CacheUsage cache;
};

// One usage event as written by the assistant to a single part file.
struct UsagePart {
    std::string id;
    std::string messageId;
    std::string sessionId;
    std::string eventType;
    std::optional<TokenUsage> tokens;
    double cost = 0.0;
};

struct UsageMetrics {
    uint64_t totalInputTokens = 0;
    uint64_t totalOutputTokens = 0;
    uint64_t totalReasoningTokens = 0;
    uint64_t totalCacheWriteTokens = 0;
    uint64_t totalCacheReadTokens = 0;
    double totalCost = 0.0;
    uint64_t totalInteractions = 0;
    std::chrono::system_clock::time_point lastUpdated;
};

inline bool operator==(const UsageMetrics &a, const UsageMetrics &b)
{
    return a.totalInputTokens == b.totalInputTokens
        && a.totalOutputTokens == b.totalOutputTokens
        && a.totalReasoningTokens == b.totalReasoningTokens
        && a.totalCacheWriteTokens == b.totalCacheWriteTokens
        && a.totalCacheReadTokens == b.totalCacheReadTokens
        && a.totalCost == b.totalCost
        && a.totalInteractions == b.totalInteractions
        && a.lastUpdated == b.lastUpdated;
}

inline bool operator!=(const UsageMetrics &a, const UsageMetrics &b)
{
    return !(a == b);
}

struct FileMetadata {
    std::filesystem::path path;
    std::filesystem::file_time_type modified;
};

// Persisted daily rollup. Counters are stored as SQLite INTEGER (signed 64-bit).
struct UsageSnapshot {
    CalendarDate date;
    int64_t inputTokens = 0;
    int64_t outputTokens = 0;
    int64_t reasoningTokens = 0;
    int64_t cacheWriteTokens = 0;
    int64_t cacheReadTokens = 0;
    double totalCost = 0.0;
    int64_t interactionCount = 0;
    std::string createdAt;
};

struct WeekSummary {
    CalendarDate startDate;
    CalendarDate endDate;
    int64_t totalInputTokens = 0;
    int64_t totalOutputTokens = 0;
    int64_t totalReasoningTokens = 0;
    int64_t totalCacheWriteTokens = 0;
    int64_t totalCacheReadTokens = 0;
    double totalCost = 0.0;
    int64_t totalInteractions = 0;
    int daysWithData = 0;
};

} // namespace tokentally
