#include "database/migrations.hpp"

#include <chrono>

#include <sqlite3.h>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "database/schema.hpp"
#include "database/sqlite_statement.hpp"

namespace tokentally {

namespace {

void rollbackQuietly(sqlite3 *db)
{
    // The migration's own error is the one reported to the caller.
    sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
}

void applySingleMigration(sqlite3 *db, const Migration &migration)
{
    execOrThrow(db, "BEGIN IMMEDIATE;", DatabaseError::Kind::Migration);

    try {
        execOrThrow(db, migration.sql, DatabaseError::Kind::Migration);

        Statement record(db,
                         "INSERT INTO schema_version (version, applied_at) VALUES (?, ?);");
        sqlite3_bind_int(record.get(), 1, migration.version);
        bindText(record.get(), 2, toIso8601Utc(std::chrono::system_clock::now()));
        record.run();

        execOrThrow(db, "COMMIT;", DatabaseError::Kind::Migration);
    } catch (const DatabaseError &ex) {
        rollbackQuietly(db);
        throw DatabaseError(DatabaseError::Kind::Migration,
                            "migration " + std::to_string(migration.version)
                                + " (" + migration.description + ") failed: " + ex.what());
    }
}

} // namespace

const std::vector<Migration> &builtinMigrations()
{
    static const std::vector<Migration> migrations = {
        {
            1,
            "Initial schema - create usage_snapshots and schema_version tables",
            std::string(schema::kCreateSchemaVersionTable) + ";\n"
                + schema::kCreateUsageSnapshotsTable + ";\n"
                + schema::kCreateDateIndex + ";",
        },
        {
            2,
            "Add UNIQUE constraint to date column to prevent duplicates",
            schema::kUniqueDateRebuild,
        },
    };
    return migrations;
}

int currentSchemaVersion(sqlite3 *db)
{
    Statement exists(db,
                     "SELECT COUNT(*) FROM sqlite_master "
                     "WHERE type = 'table' AND name = 'schema_version';");
    if (!exists.step() || sqlite3_column_int(exists.get(), 0) == 0) {
        return 0;
    }

    Statement version(db, "SELECT MAX(version) FROM schema_version;");
    if (!version.step() || sqlite3_column_type(version.get(), 0) == SQLITE_NULL) {
        return 0;
    }
    return sqlite3_column_int(version.get(), 0);
}

int applyMigrations(sqlite3 *db)
{
    return applyMigrations(db, builtinMigrations());
}

int applyMigrations(sqlite3 *db, const std::vector<Migration> &migrations)
{
    const int current = currentSchemaVersion(db);

    int applied = 0;
    for (const auto &migration : migrations) {
        if (migration.version <= current) {
            continue;
        }

        applySingleMigration(db, migration);
        ++applied;

        TTLOG_INFO(QStringLiteral("Migrations"),
                   QStringLiteral("applyMigrations"),
                   QStringLiteral("migration_applied"),
                   QStringLiteral("schema_behind"),
                   QStringLiteral("sqlite_transaction"),
                   QString(),
                   QString(),
                   (nlohmann::json{{"version", migration.version},
                                   {"description", migration.description}}));
    }
    return applied;
}

} // namespace tokentally
