#pragma once

namespace tokentally::schema {

constexpr const char *kCreateSchemaVersionTable =
    "CREATE TABLE IF NOT EXISTS schema_version ("
    "    version INTEGER PRIMARY KEY,"
    "    applied_at TEXT NOT NULL"
    ")";

// Original layout; the date column gained UNIQUE in migration 2.
constexpr const char *kCreateUsageSnapshotsTable =
    "CREATE TABLE IF NOT EXISTS usage_snapshots ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    date TEXT NOT NULL,"
    "    input_tokens INTEGER NOT NULL,"
    "    output_tokens INTEGER NOT NULL,"
    "    reasoning_tokens INTEGER NOT NULL,"
    "    cache_write_tokens INTEGER NOT NULL,"
    "    cache_read_tokens INTEGER NOT NULL,"
    "    total_cost REAL NOT NULL,"
    "    interaction_count INTEGER NOT NULL,"
    "    created_at TEXT NOT NULL"
    ")";

constexpr const char *kCreateDateIndex =
    "CREATE INDEX IF NOT EXISTS idx_usage_snapshots_date "
    "ON usage_snapshots(date)";

// Rebuilds usage_snapshots with a unique date, keeping the newest row
// (highest id) of any duplicated day.
constexpr const char *kUniqueDateRebuild =
    "CREATE TABLE usage_snapshots_new ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    date TEXT NOT NULL UNIQUE,"
    "    input_tokens INTEGER NOT NULL,"
    "    output_tokens INTEGER NOT NULL,"
    "    reasoning_tokens INTEGER NOT NULL,"
    "    cache_write_tokens INTEGER NOT NULL,"
    "    cache_read_tokens INTEGER NOT NULL,"
    "    total_cost REAL NOT NULL,"
    "    interaction_count INTEGER NOT NULL,"
    "    created_at TEXT NOT NULL"
    ");"
    "INSERT INTO usage_snapshots_new "
    "SELECT id, date, input_tokens, output_tokens, reasoning_tokens, "
    "cache_write_tokens, cache_read_tokens, total_cost, interaction_count, created_at "
    "FROM usage_snapshots "
    "WHERE id IN (SELECT MAX(id) FROM usage_snapshots GROUP BY date);"
    "DROP TABLE usage_snapshots;"
    "ALTER TABLE usage_snapshots_new RENAME TO usage_snapshots;"
    "CREATE INDEX IF NOT EXISTS idx_usage_snapshots_date "
    "ON usage_snapshots(date DESC);";

} // namespace tokentally::schema
