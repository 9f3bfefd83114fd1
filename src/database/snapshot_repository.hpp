#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "common/calendar_date.hpp"
#include "common/models.hpp"
#include "database/database_manager.hpp"

namespace tokentally {

// Typed access to usage_snapshots: one row per calendar day. Every method
// takes the connection guard for its duration and throws
// DatabaseError::Query on SQLite failures. Absent rows are never errors.
class SnapshotRepository {
public:
    explicit SnapshotRepository(std::shared_ptr<DatabaseManager> db);

    // Upsert: an existing row for `date` is replaced.
    void saveSnapshot(const CalendarDate &date, const UsageMetrics &metrics);

    std::optional<UsageSnapshot> getSnapshot(const CalendarDate &date) const;

    // Inclusive on both ends, ascending by date.
    std::vector<UsageSnapshot> getRange(const CalendarDate &start,
                                        const CalendarDate &end) const;

    std::optional<UsageSnapshot> getLatest() const;

    // Removes rows dated before today (UTC) minus retentionDays.
    // A negative retentionDays throws DatabaseError::Query.
    std::size_t deleteOld(int retentionDays);
    std::size_t deleteOlderThan(const CalendarDate &cutoff);

    // Seven days starting at weekStart.
    WeekSummary getWeekSummary(const CalendarDate &weekStart) const;

    std::size_t count() const;

private:
    std::shared_ptr<DatabaseManager> m_db;
};

} // namespace tokentally
