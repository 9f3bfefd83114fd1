#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "common/calendar_date.hpp"
#include "common/models.hpp"
#include "database/database_manager.hpp"
#include "database/snapshot_repository.hpp"

namespace tokentally {

/**
 * DataCollector persists at most one snapshot per UTC day per process run.
 *
 * The last-collection date lives only in memory. After a restart the first
 * collectAndSave() of the day writes again and replaces that day's row.
 */
class DataCollector {
public:
    using TodayProvider = std::function<CalendarDate()>;

    explicit DataCollector(std::shared_ptr<DatabaseManager> db,
                           TodayProvider today = TodayProvider());

    // Saves today's snapshot unless one was already saved by this instance
    // today. Returns true when a row was written.
    // Throws CollectorError::Database or CollectorError::Lock.
    bool collectAndSave(const UsageMetrics &metrics);

    // The decision collectAndSave() would take now, without saving.
    // Throws CollectorError::Lock.
    bool shouldCollect() const;

    std::optional<CalendarDate> lastCollectionDate() const;

    SnapshotRepository &repository() { return m_repository; }

private:
    CalendarDate today() const;
    std::unique_lock<std::mutex> acquireLock() const;

    SnapshotRepository m_repository;
    TodayProvider m_today;

    mutable std::mutex m_mutex;
    std::optional<CalendarDate> m_lastCollection;
};

} // namespace tokentally
