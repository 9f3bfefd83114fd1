#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/calendar_date.hpp"
#include "common/models.hpp"

namespace tokentally {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
    std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline void to_json(nlohmann::json &j, const CalendarDate &date)
{
    j = date.toString();
}

inline void to_json(nlohmann::json &j, const UsageMetrics &metrics)
{
    j = nlohmann::json{
        {"totalInputTokens", metrics.totalInputTokens},
        {"totalOutputTokens", metrics.totalOutputTokens},
        {"totalReasoningTokens", metrics.totalReasoningTokens},
        {"totalCacheWriteTokens", metrics.totalCacheWriteTokens},
        {"totalCacheReadTokens", metrics.totalCacheReadTokens},
        {"totalCost", metrics.totalCost},
        {"totalInteractions", metrics.totalInteractions},
        {"lastUpdated", toIso8601Utc(metrics.lastUpdated)}
    };
}

inline void to_json(nlohmann::json &j, const UsageSnapshot &snapshot)
{
    j = nlohmann::json{
        {"date", snapshot.date},
        {"inputTokens", snapshot.inputTokens},
        {"outputTokens", snapshot.outputTokens},
        {"reasoningTokens", snapshot.reasoningTokens},
        {"cacheWriteTokens", snapshot.cacheWriteTokens},
        {"cacheReadTokens", snapshot.cacheReadTokens},
        {"totalCost", snapshot.totalCost},
        {"interactionCount", snapshot.interactionCount},
        {"createdAt", snapshot.createdAt}
    };
}

inline void to_json(nlohmann::json &j, const WeekSummary &summary)
{
    j = nlohmann::json{
        {"startDate", summary.startDate},
        {"endDate", summary.endDate},
        {"totalInputTokens", summary.totalInputTokens},
        {"totalOutputTokens", summary.totalOutputTokens},
        {"totalReasoningTokens", summary.totalReasoningTokens},
        {"totalCacheWriteTokens", summary.totalCacheWriteTokens},
        {"totalCacheReadTokens", summary.totalCacheReadTokens},
        {"totalCost", summary.totalCost},
        {"totalInteractions", summary.totalInteractions},
        {"daysWithData", summary.daysWithData}
    };
}

} // namespace tokentally
