#pragma once

#include <chrono>

#include "common/models.hpp"

namespace tokentally {

// Folds usage parts into running totals. finalize() consumes the
// accumulator, so it is only callable on an rvalue:
//
//   UsageAggregator aggregator;
//   for (const auto &part : parts) aggregator.add(part);
//   const UsageMetrics metrics = std::move(aggregator).finalize();
class UsageAggregator {
public:
    UsageAggregator() = default;

    // Parts without tokens contribute nothing, not even an interaction.
    void add(const UsagePart &part);

    UsageMetrics finalize(
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) &&;

private:
    UsageMetrics m_totals;
};

} // namespace tokentally
