#pragma once

#include <string>
#include <vector>

struct sqlite3;

namespace tokentally {

struct Migration {
    int version = 0;
    std::string description;
    std::string sql;
};

// Every schema step, in ascending version order.
const std::vector<Migration> &builtinMigrations();

// Highest version recorded in schema_version, 0 for a fresh database.
// Throws DatabaseError::Query.
int currentSchemaVersion(sqlite3 *db);

/**
 * Apply every migration whose version is above the current schema version.
 *
 * Each migration runs in its own transaction together with its
 * schema_version row. A failing migration is rolled back and reported as
 * DatabaseError::Migration; migrations applied before it stay committed.
 *
 * Returns the number of migrations applied (0 when already up to date).
 */
int applyMigrations(sqlite3 *db);
int applyMigrations(sqlite3 *db, const std::vector<Migration> &migrations);

} // namespace tokentally
