#include "database/snapshot_repository.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <utility>

#include <sqlite3.h>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "database/sqlite_statement.hpp"

namespace tokentally {

namespace {

constexpr const char *kSnapshotColumns =
    "SELECT date, input_tokens, output_tokens, reasoning_tokens, "
    "cache_write_tokens, cache_read_tokens, total_cost, interaction_count, "
    "created_at FROM usage_snapshots ";

// SQLite INTEGER is signed 64-bit.
int64_t toInteger(uint64_t value)
{
    constexpr auto kMax = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    return value > kMax ? std::numeric_limits<int64_t>::max()
                        : static_cast<int64_t>(value);
}

UsageSnapshot rowToSnapshot(sqlite3_stmt *stmt)
{
    const std::string dateText = columnText(stmt, 0);
    const auto date = CalendarDate::parse(dateText);
    if (!date.has_value()) {
        throw DatabaseError(DatabaseError::Kind::Query,
                            "invalid snapshot date in database: '" + dateText + "'");
    }

    UsageSnapshot snapshot;
    snapshot.date = *date;
    snapshot.inputTokens = sqlite3_column_int64(stmt, 1);
    snapshot.outputTokens = sqlite3_column_int64(stmt, 2);
    snapshot.reasoningTokens = sqlite3_column_int64(stmt, 3);
    snapshot.cacheWriteTokens = sqlite3_column_int64(stmt, 4);
    snapshot.cacheReadTokens = sqlite3_column_int64(stmt, 5);
    snapshot.totalCost = sqlite3_column_double(stmt, 6);
    snapshot.interactionCount = sqlite3_column_int64(stmt, 7);
    snapshot.createdAt = columnText(stmt, 8);
    return snapshot;
}

} // namespace

SnapshotRepository::SnapshotRepository(std::shared_ptr<DatabaseManager> db)
    : m_db(std::move(db))
{
}

void SnapshotRepository::saveSnapshot(const CalendarDate &date, const UsageMetrics &metrics)
{
    const auto conn = m_db->connection();
    Statement stmt(conn.get(),
                   "INSERT OR REPLACE INTO usage_snapshots "
                   "(date, input_tokens, output_tokens, reasoning_tokens, "
                   "cache_write_tokens, cache_read_tokens, total_cost, "
                   "interaction_count, created_at) "
                   "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);");
    bindText(stmt.get(), 1, date.toString());
    sqlite3_bind_int64(stmt.get(), 2, toInteger(metrics.totalInputTokens));
    sqlite3_bind_int64(stmt.get(), 3, toInteger(metrics.totalOutputTokens));
    sqlite3_bind_int64(stmt.get(), 4, toInteger(metrics.totalReasoningTokens));
    sqlite3_bind_int64(stmt.get(), 5, toInteger(metrics.totalCacheWriteTokens));
    sqlite3_bind_int64(stmt.get(), 6, toInteger(metrics.totalCacheReadTokens));
    sqlite3_bind_double(stmt.get(), 7, metrics.totalCost);
    sqlite3_bind_int64(stmt.get(), 8, toInteger(metrics.totalInteractions));
    bindText(stmt.get(), 9, toIso8601Utc(std::chrono::system_clock::now()));
    stmt.run();
}

std::optional<UsageSnapshot> SnapshotRepository::getSnapshot(const CalendarDate &date) const
{
    const auto conn = m_db->connection();
    const std::string sql = std::string(kSnapshotColumns) + "WHERE date = ? LIMIT 1;";
    Statement stmt(conn.get(), sql.c_str());
    bindText(stmt.get(), 1, date.toString());

    if (!stmt.step()) {
        return std::nullopt;
    }
    return rowToSnapshot(stmt.get());
}

std::vector<UsageSnapshot> SnapshotRepository::getRange(const CalendarDate &start,
                                                        const CalendarDate &end) const
{
    const auto conn = m_db->connection();
    const std::string sql = std::string(kSnapshotColumns)
        + "WHERE date >= ? AND date <= ? ORDER BY date ASC;";
    Statement stmt(conn.get(), sql.c_str());
    bindText(stmt.get(), 1, start.toString());
    bindText(stmt.get(), 2, end.toString());

    std::vector<UsageSnapshot> snapshots;
    while (stmt.step()) {
        snapshots.push_back(rowToSnapshot(stmt.get()));
    }
    return snapshots;
}

std::optional<UsageSnapshot> SnapshotRepository::getLatest() const
{
    const auto conn = m_db->connection();
    const std::string sql = std::string(kSnapshotColumns) + "ORDER BY date DESC LIMIT 1;";
    Statement stmt(conn.get(), sql.c_str());

    if (!stmt.step()) {
        return std::nullopt;
    }
    return rowToSnapshot(stmt.get());
}

std::size_t SnapshotRepository::deleteOld(int retentionDays)
{
    if (retentionDays < 0) {
        throw DatabaseError(DatabaseError::Kind::Query, "retention days must not be negative");
    }
    return deleteOlderThan(CalendarDate::todayUtc().addDays(-retentionDays));
}

std::size_t SnapshotRepository::deleteOlderThan(const CalendarDate &cutoff)
{
    std::size_t deleted = 0;
    {
        const auto conn = m_db->connection();
        Statement stmt(conn.get(), "DELETE FROM usage_snapshots WHERE date < ?;");
        bindText(stmt.get(), 1, cutoff.toString());
        stmt.run();
        deleted = static_cast<std::size_t>(sqlite3_changes(conn.get()));
    }

    if (deleted > 0) {
        TTLOG_INFO(QStringLiteral("SnapshotRepository"),
                   QStringLiteral("deleteOlderThan"),
                   QStringLiteral("snapshots_pruned"),
                   QStringLiteral("retention_policy"),
                   QStringLiteral("sqlite_delete"),
                   QString(),
                   QString(),
                   (nlohmann::json{{"cutoff", cutoff.toString()},
                                   {"deleted", deleted}}));
    }
    return deleted;
}

WeekSummary SnapshotRepository::getWeekSummary(const CalendarDate &weekStart) const
{
    WeekSummary summary;
    summary.startDate = weekStart;
    summary.endDate = weekStart.addDays(6);

    for (const auto &snapshot : getRange(summary.startDate, summary.endDate)) {
        summary.totalInputTokens += snapshot.inputTokens;
        summary.totalOutputTokens += snapshot.outputTokens;
        summary.totalReasoningTokens += snapshot.reasoningTokens;
        summary.totalCacheWriteTokens += snapshot.cacheWriteTokens;
        summary.totalCacheReadTokens += snapshot.cacheReadTokens;
        summary.totalCost += snapshot.totalCost;
        summary.totalInteractions += snapshot.interactionCount;
        ++summary.daysWithData;
    }
    return summary;
}

std::size_t SnapshotRepository::count() const
{
    const auto conn = m_db->connection();
    Statement stmt(conn.get(), "SELECT COUNT(*) FROM usage_snapshots;");
    if (!stmt.step()) {
        return 0;
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

} // namespace tokentally
