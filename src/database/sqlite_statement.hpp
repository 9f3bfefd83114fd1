#pragma once

#include <cstdint>
#include <string>

#include <sqlite3.h>

#include "common/errors.hpp"

namespace tokentally {

// Owns one prepared statement for the duration of a scope.
class Statement {
public:
    Statement(sqlite3 *db, const char *sql);
    ~Statement();

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return m_stmt;
    }

    // SQLITE_ROW -> true, SQLITE_DONE -> false, anything else throws Query.
    bool step();

    // For statements that return no rows; throws Query unless SQLITE_DONE.
    void run();

private:
    sqlite3 *m_db = nullptr;
    sqlite3_stmt *m_stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const std::string &sql,
                 DatabaseError::Kind kind = DatabaseError::Kind::Query);

void bindText(sqlite3_stmt *stmt, int index, const std::string &value);
std::string columnText(sqlite3_stmt *stmt, int index);

} // namespace tokentally
