#include "database/sqlite_statement.hpp"

namespace tokentally {

Statement::Statement(sqlite3 *db, const char *sql)
    : m_db(db)
{
    if (sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
        throw DatabaseError(DatabaseError::Kind::Query,
                            std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
    }
}

Statement::~Statement()
{
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
    }
}

bool Statement::step()
{
    const int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw DatabaseError(DatabaseError::Kind::Query,
                        std::string("sqlite step failed: ") + sqlite3_errmsg(m_db));
}

void Statement::run()
{
    if (step()) {
        throw DatabaseError(DatabaseError::Kind::Query,
                            "statement unexpectedly returned rows");
    }
}

void execOrThrow(sqlite3 *db, const std::string &sql, DatabaseError::Kind kind)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw DatabaseError(kind, message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

} // namespace tokentally
