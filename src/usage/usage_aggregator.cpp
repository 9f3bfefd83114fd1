#include "usage/usage_aggregator.hpp"

namespace tokentally {

void UsageAggregator::add(const UsagePart &part)
{
    if (!part.tokens.has_value()) {
        return;
    }

    const TokenUsage &tokens = *part.tokens;
    m_totals.totalInputTokens += tokens.input;
    m_totals.totalOutputTokens += tokens.output;
    m_totals.totalReasoningTokens += tokens.reasoning;
    m_totals.totalCacheWriteTokens += tokens.cache.write;
    m_totals.totalCacheReadTokens += tokens.cache.read;
    m_totals.totalCost += part.cost;
    ++m_totals.totalInteractions;
}

UsageMetrics UsageAggregator::finalize(std::chrono::system_clock::time_point now) &&
{
    UsageMetrics metrics = m_totals;
    metrics.lastUpdated = now;
    m_totals = UsageMetrics{};
    return metrics;
}

} // namespace tokentally
