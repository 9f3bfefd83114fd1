#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <sqlite3.h>

#include <filesystem>
#include <fstream>
#include <memory>

#include "common/errors.hpp"
#include "database/database_manager.hpp"
#include "database/sqlite_statement.hpp"

namespace fs = std::filesystem;

class DatabaseManagerTests : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void testCreatesParentDirectories();
    void testConnectionPragmas();
    void testReopenKeepsSchema();
    void testIntegrityCheck();
    void testUncreatableDirectoryIsIoError();
    void testGarbageFileIsConnectionError();

private:
    fs::path tempPath() const { return fs::path(m_tempDir->path().toStdString()); }
    std::unique_ptr<QTemporaryDir> m_tempDir;
};

void DatabaseManagerTests::init()
{
    m_tempDir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_tempDir->isValid());
}

void DatabaseManagerTests::testCreatesParentDirectories()
{
    const fs::path path = tempPath() / "nested" / "deeper" / "usage.db";
    tokentally::DatabaseManager db(path);
    QVERIFY(fs::exists(path));
    QVERIFY(db.path() == path);
    QCOMPARE(db.schemaVersion(), 2);
}

void DatabaseManagerTests::testConnectionPragmas()
{
    tokentally::DatabaseManager db(tempPath() / "usage.db");
    const auto conn = db.connection();

    tokentally::Statement journal(conn.get(), "PRAGMA journal_mode;");
    QVERIFY(journal.step());
    QCOMPARE(QString::fromStdString(tokentally::columnText(journal.get(), 0)),
             QStringLiteral("wal"));

    tokentally::Statement foreignKeys(conn.get(), "PRAGMA foreign_keys;");
    QVERIFY(foreignKeys.step());
    QCOMPARE(sqlite3_column_int(foreignKeys.get(), 0), 1);

    tokentally::Statement synchronous(conn.get(), "PRAGMA synchronous;");
    QVERIFY(synchronous.step());
    // NORMAL
    QCOMPARE(sqlite3_column_int(synchronous.get(), 0), 1);
}

void DatabaseManagerTests::testReopenKeepsSchema()
{
    const fs::path path = tempPath() / "usage.db";
    {
        tokentally::DatabaseManager db(path);
        QCOMPARE(db.schemaVersion(), 2);
    }
    tokentally::DatabaseManager reopened(path);
    QCOMPARE(reopened.schemaVersion(), 2);

    const auto conn = reopened.connection();
    tokentally::Statement rows(conn.get(), "SELECT COUNT(*) FROM schema_version;");
    QVERIFY(rows.step());
    QCOMPARE(sqlite3_column_int(rows.get(), 0), 2);
}

void DatabaseManagerTests::testIntegrityCheck()
{
    tokentally::DatabaseManager db(tempPath() / "usage.db");
    std::string message;
    QVERIFY(db.integrityCheck(&message));
    QCOMPARE(QString::fromStdString(message), QStringLiteral("ok"));
    QVERIFY(db.integrityCheck());
}

void DatabaseManagerTests::testUncreatableDirectoryIsIoError()
{
    const fs::path blocker = tempPath() / "blocker";
    {
        std::ofstream out(blocker);
        out << "not a directory";
    }

    bool thrown = false;
    try {
        tokentally::DatabaseManager db(blocker / "sub" / "usage.db");
    } catch (const tokentally::DatabaseError &ex) {
        thrown = true;
        QVERIFY(ex.kind() == tokentally::DatabaseError::Kind::Io);
    }
    QVERIFY(thrown);
}

void DatabaseManagerTests::testGarbageFileIsConnectionError()
{
    const fs::path path = tempPath() / "garbage.db";
    {
        std::ofstream out(path, std::ios::binary);
        for (int i = 0; i < 256; ++i) {
            out << "this is definitely not an sqlite database file ";
        }
    }

    bool thrown = false;
    try {
        tokentally::DatabaseManager db(path);
    } catch (const tokentally::DatabaseError &ex) {
        thrown = true;
        QVERIFY(ex.kind() == tokentally::DatabaseError::Kind::Connection);
    }
    QVERIFY(thrown);
}

QTEST_MAIN(DatabaseManagerTests)
#include "test_database_manager.moc"
