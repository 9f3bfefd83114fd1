#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

struct sqlite3;

namespace tokentally {

/**
 * DatabaseManager owns the single SQLite connection to the snapshot database.
 *
 * Construction creates missing parent directories, opens (or creates) the
 * file, enables WAL journaling, foreign keys and synchronous=NORMAL, then
 * brings the schema up to date. Any failure throws DatabaseError
 * (Io, Connection or Migration) and leaves no open handle behind.
 *
 * The connection is handed out through Connection guards; holding one grants
 * exclusive use of the handle until it goes out of scope. Other processes
 * (e.g. a history viewer) share the file through SQLite's own WAL locking.
 */
class DatabaseManager {
public:
    class Connection {
    public:
        sqlite3 *get() const
        {
            return m_db;
        }

    private:
        friend class DatabaseManager;
        Connection(std::mutex &mutex, sqlite3 *db);

        std::unique_lock<std::mutex> m_lock;
        sqlite3 *m_db = nullptr;
    };

    explicit DatabaseManager(const std::filesystem::path &path);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager &) = delete;
    DatabaseManager &operator=(const DatabaseManager &) = delete;

    Connection connection() const;

    const std::filesystem::path &path() const;
    int schemaVersion() const;

    // PRAGMA integrity_check; message receives SQLite's verdict.
    bool integrityCheck(std::string *message = nullptr) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace tokentally
