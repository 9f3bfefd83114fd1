#include "database/database_manager.hpp"

#include <sqlite3.h>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "database/migrations.hpp"
#include "database/sqlite_statement.hpp"

namespace tokentally {

namespace {

// Readers in another process wait this long for a writer before SQLITE_BUSY.
constexpr int kBusyTimeoutMs = 5000;

void ensureDirectory(const std::filesystem::path &path)
{
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return;
    }

    std::error_code error;
    std::filesystem::create_directories(parent, error);
    if (error) {
        throw DatabaseError(DatabaseError::Kind::Io,
                            "cannot create database directory " + parent.string()
                                + ": " + error.message());
    }
}

void configureConnection(sqlite3 *db)
{
    Statement journal(db, "PRAGMA journal_mode=WAL;");
    const std::string mode = journal.step() ? columnText(journal.get(), 0) : std::string();
    if (mode != "wal") {
        TTLOG_WARN(QStringLiteral("DatabaseManager"),
                   QStringLiteral("configureConnection"),
                   QStringLiteral("wal_unavailable"),
                   QStringLiteral("journal_mode_rejected"),
                   QStringLiteral("sqlite_pragma"),
                   QString(),
                   QString(),
                   (nlohmann::json{{"mode", mode}}));
    }

    execOrThrow(db, "PRAGMA foreign_keys=ON;", DatabaseError::Kind::Connection);
    execOrThrow(db, "PRAGMA synchronous=NORMAL;", DatabaseError::Kind::Connection);
    sqlite3_busy_timeout(db, kBusyTimeoutMs);
}

} // namespace

struct DatabaseManager::Impl {
    std::filesystem::path path;
    sqlite3 *db = nullptr;
    mutable std::mutex mutex;

    ~Impl()
    {
        if (db) {
            sqlite3_close(db);
            db = nullptr;
        }
    }
};

DatabaseManager::Connection::Connection(std::mutex &mutex, sqlite3 *db)
    : m_lock(mutex)
    , m_db(db)
{
}

DatabaseManager::DatabaseManager(const std::filesystem::path &path)
    : impl(std::make_unique<Impl>())
{
    impl->path = path;
    ensureDirectory(path);

    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.string().c_str(), &impl->db, flags, nullptr) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        throw DatabaseError(DatabaseError::Kind::Connection,
                            "failed to open database " + path.string() + ": " + message);
    }

    try {
        configureConnection(impl->db);
    } catch (const DatabaseError &ex) {
        throw DatabaseError(DatabaseError::Kind::Connection,
                            std::string("failed to configure database: ") + ex.what());
    }

    try {
        applyMigrations(impl->db);
    } catch (const DatabaseError &ex) {
        if (ex.kind() == DatabaseError::Kind::Migration) {
            throw;
        }
        // Reading schema_version failed: the file is not a usable database.
        throw DatabaseError(DatabaseError::Kind::Connection,
                            std::string("cannot read schema version: ") + ex.what());
    }

    TTLOG_DEBUG(QStringLiteral("DatabaseManager"),
                QStringLiteral("DatabaseManager"),
                QStringLiteral("database_opened"),
                QStringLiteral("startup"),
                QStringLiteral("sqlite_open"),
                QString(),
                QString(),
                (nlohmann::json{{"path", path.string()},
                                {"schemaVersion", currentSchemaVersion(impl->db)}}));
}

DatabaseManager::~DatabaseManager() = default;

DatabaseManager::Connection DatabaseManager::connection() const
{
    return Connection(impl->mutex, impl->db);
}

const std::filesystem::path &DatabaseManager::path() const
{
    return impl->path;
}

int DatabaseManager::schemaVersion() const
{
    const Connection conn = connection();
    return currentSchemaVersion(conn.get());
}

bool DatabaseManager::integrityCheck(std::string *message) const
{
    const Connection conn = connection();
    Statement stmt(conn.get(), "PRAGMA integrity_check;");

    if (!stmt.step()) {
        if (message) {
            *message = "integrity_check failed to return a result";
        }
        return false;
    }

    const std::string result = columnText(stmt.get(), 0);
    if (message) {
        *message = result;
    }
    return result == "ok";
}

} // namespace tokentally
