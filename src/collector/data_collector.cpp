#include "collector/data_collector.hpp"

#include <system_error>
#include <utility>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace tokentally {

DataCollector::DataCollector(std::shared_ptr<DatabaseManager> db, TodayProvider today)
    : m_repository(std::move(db))
    , m_today(std::move(today))
{
}

CalendarDate DataCollector::today() const
{
    return m_today ? m_today() : CalendarDate::todayUtc();
}

std::unique_lock<std::mutex> DataCollector::acquireLock() const
{
    std::unique_lock<std::mutex> lock(m_mutex, std::defer_lock);
    try {
        lock.lock();
    } catch (const std::system_error &ex) {
        throw CollectorError(CollectorError::Kind::Lock,
                             std::string("failed to acquire collection lock: ") + ex.what());
    }
    return lock;
}

bool DataCollector::collectAndSave(const UsageMetrics &metrics)
{
    const auto lock = acquireLock();

    // The check and the save form one critical section.
    const CalendarDate current = today();
    if (m_lastCollection.has_value() && *m_lastCollection == current) {
        return false;
    }

    try {
        m_repository.saveSnapshot(current, metrics);
    } catch (const DatabaseError &ex) {
        TTLOG_ERROR(QStringLiteral("DataCollector"),
                    QStringLiteral("collectAndSave"),
                    QStringLiteral("snapshot_save_failed"),
                    QString::fromStdString(ex.what()),
                    QStringLiteral("sqlite_upsert"),
                    QString(),
                    QString(),
                    (nlohmann::json{{"date", current.toString()}}));
        throw CollectorError::fromDatabase(ex);
    }
    m_lastCollection = current;

    TTLOG_INFO(QStringLiteral("DataCollector"),
               QStringLiteral("collectAndSave"),
               QStringLiteral("snapshot_saved"),
               QStringLiteral("first_collection_today"),
               QStringLiteral("sqlite_upsert"),
               QString(),
               QString(),
               (nlohmann::json{{"date", current.toString()},
                               {"interactions", metrics.totalInteractions}}));
    return true;
}

bool DataCollector::shouldCollect() const
{
    const auto lock = acquireLock();
    return !m_lastCollection.has_value() || *m_lastCollection != today();
}

std::optional<CalendarDate> DataCollector::lastCollectionDate() const
{
    const auto lock = acquireLock();
    return m_lastCollection;
}

} // namespace tokentally
