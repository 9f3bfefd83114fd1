#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

#include <nlohmann/json.hpp>

#include "common/calendar_date.hpp"
#include "database/database_manager.hpp"
#include "database/snapshot_repository.hpp"
#include "report/ReportCli.hpp"

namespace fs = std::filesystem;

class ReportCliTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testMissingCommandPrintsUsage();
    void testCollectJson();
    void testCollectForceOverwrites();
    void testCollectWithoutStorage();
    void testHistoryJson();
    void testHistoryRejectsBadDates();
    void testLatestMarkdown();
    void testWeekJson();
    void testPrune();
    void testStatusJson();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    fs::path storageRoot() const;
    fs::path dbPath() const;
    void writeUsageFile(const std::string &name, int input);
    void seedSnapshots();
    int runCli(const QStringList &args, std::string &out);
};

void ReportCliTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    qunsetenv("XDG_DATA_HOME");
    qputenv("TOKENTALLY_STORAGE_DIR", QByteArray::fromStdString(storageRoot().string()));
    qputenv("TOKENTALLY_DB_PATH", QByteArray::fromStdString(dbPath().string()));
    qunsetenv("TOKENTALLY_RETENTION_DAYS");
}

void ReportCliTests::cleanupTestCase()
{
    qunsetenv("TOKENTALLY_STORAGE_DIR");
    qunsetenv("TOKENTALLY_DB_PATH");
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ReportCliTests::init()
{
    std::error_code error;
    fs::remove_all(storageRoot(), error);
    fs::remove_all(dbPath().parent_path(), error);
    fs::create_directories(storageRoot());
}

fs::path ReportCliTests::storageRoot() const
{
    return fs::path(m_tempDir.path().toStdString()) / "storage" / "part";
}

fs::path ReportCliTests::dbPath() const
{
    return fs::path(m_tempDir.path().toStdString()) / "db" / "usage.db";
}

void ReportCliTests::writeUsageFile(const std::string &name, int input)
{
    const fs::path path = storageRoot() / "ses_1" / name;
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << "{\"type\":\"step-finish\",\"tokens\":{\"input\":" << input
        << ",\"output\":10},\"cost\":0.01}";
}

void ReportCliTests::seedSnapshots()
{
    auto db = std::make_shared<tokentally::DatabaseManager>(dbPath());
    tokentally::SnapshotRepository repository(db);
    tokentally::UsageMetrics metrics;
    metrics.totalInputTokens = 100;
    metrics.totalInteractions = 1;
    repository.saveSnapshot(tokentally::CalendarDate{2025, 1, 6}, metrics);
    metrics.totalInputTokens = 200;
    repository.saveSnapshot(tokentally::CalendarDate{2025, 1, 8}, metrics);
    metrics.totalInputTokens = 400;
    repository.saveSnapshot(tokentally::CalendarDate{2025, 1, 20}, metrics);
}

int ReportCliTests::runCli(const QStringList &args, std::string &out)
{
    std::stringstream buffer;
    auto *oldBuf = std::cout.rdbuf(buffer.rdbuf());
    auto *oldErr = std::cerr.rdbuf(buffer.rdbuf());

    tokentally::ReportCli cli;
    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    for (const QString &arg : args) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }

    const int result = cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());

    std::cout.rdbuf(oldBuf);
    std::cerr.rdbuf(oldErr);
    out = buffer.str();
    return result;
}

void ReportCliTests::testMissingCommandPrintsUsage()
{
    std::string output;
    QCOMPARE(runCli({"tokentally-report"}, output), 1);
    QVERIFY(output.find("Usage:") != std::string::npos);

    QCOMPARE(runCli({"tokentally-report", "unknown"}, output), 1);
    QVERIFY(output.find("Usage:") != std::string::npos);
}

void ReportCliTests::testCollectJson()
{
    writeUsageFile("prt_1.json", 100);
    writeUsageFile("prt_2.json", 50);

    std::string output;
    QCOMPARE(runCli({"tokentally-report", "collect", "--format", "json"}, output), 0);

    const auto parsed = nlohmann::json::parse(output);
    QVERIFY(parsed.value("saved", false));
    QCOMPARE(parsed.at("metrics").value("totalInputTokens", 0), 150);
    QCOMPARE(parsed.at("metrics").value("totalInteractions", 0), 2);

    auto db = std::make_shared<tokentally::DatabaseManager>(dbPath());
    tokentally::SnapshotRepository repository(db);
    const auto snapshot = repository.getSnapshot(tokentally::CalendarDate::todayUtc());
    QVERIFY(snapshot.has_value());
    QCOMPARE(snapshot->inputTokens, int64_t(150));
}

void ReportCliTests::testCollectForceOverwrites()
{
    writeUsageFile("prt_1.json", 100);

    std::string output;
    QCOMPARE(runCli({"tokentally-report", "collect"}, output), 0);
    QVERIFY(output.find("Snapshot saved.") != std::string::npos);

    writeUsageFile("prt_2.json", 900);
    QCOMPARE(runCli({"tokentally-report", "collect", "--force", "--format", "json"}, output), 0);
    const auto parsed = nlohmann::json::parse(output);
    QVERIFY(parsed.value("saved", false));

    auto db = std::make_shared<tokentally::DatabaseManager>(dbPath());
    tokentally::SnapshotRepository repository(db);
    QCOMPARE(repository.count(), size_t(1));
    QCOMPARE(repository.getLatest()->inputTokens, int64_t(1000));
}

void ReportCliTests::testCollectWithoutStorage()
{
    std::error_code error;
    fs::remove_all(storageRoot(), error);

    std::string output;
    QCOMPARE(runCli({"tokentally-report", "collect"}, output), 2);
    QVERIFY(output.find("Usage data unavailable") != std::string::npos);
}

void ReportCliTests::testHistoryJson()
{
    seedSnapshots();

    std::string output;
    QCOMPARE(runCli({"tokentally-report", "history",
                     "--from", "2025-01-01",
                     "--to", "2025-01-10",
                     "--format", "json"}, output), 0);

    const auto parsed = nlohmann::json::parse(output);
    QVERIFY(parsed.contains("snapshots"));
    const auto &snapshots = parsed.at("snapshots");
    QCOMPARE(snapshots.size(), size_t(2));
    QCOMPARE(QString::fromStdString(snapshots.at(0).value("date", "")),
             QStringLiteral("2025-01-06"));
    QCOMPARE(QString::fromStdString(snapshots.at(1).value("date", "")),
             QStringLiteral("2025-01-08"));
}

void ReportCliTests::testHistoryRejectsBadDates()
{
    std::string output;
    QCOMPARE(runCli({"tokentally-report", "history", "--from", "2025-13-01",
                     "--to", "2025-01-10"}, output), 1);
    QCOMPARE(runCli({"tokentally-report", "history", "--from", "2025-01-01"}, output), 1);
    QCOMPARE(runCli({"tokentally-report", "history", "--from", "2025-01-01",
                     "--to", "2025-01-10", "--format", "xml"}, output), 1);
}

void ReportCliTests::testLatestMarkdown()
{
    std::string output;
    QCOMPARE(runCli({"tokentally-report", "latest"}, output), 0);
    QVERIFY(output.find("No snapshots recorded yet.") != std::string::npos);

    seedSnapshots();
    QCOMPARE(runCli({"tokentally-report", "latest"}, output), 0);
    QVERIFY(output.find("2025-01-20") != std::string::npos);
}

void ReportCliTests::testWeekJson()
{
    seedSnapshots();

    std::string output;
    QCOMPARE(runCli({"tokentally-report", "week", "--start", "2025-01-06",
                     "--format", "json"}, output), 0);
    const auto parsed = nlohmann::json::parse(output);
    QCOMPARE(parsed.value("daysWithData", 0), 2);
    QCOMPARE(parsed.value("totalInputTokens", 0), 300);
    QCOMPARE(QString::fromStdString(parsed.value("endDate", "")), QStringLiteral("2025-01-12"));
}

void ReportCliTests::testPrune()
{
    seedSnapshots();

    std::string output;
    QCOMPARE(runCli({"tokentally-report", "prune", "--days", "-3"}, output), 1);
    QCOMPARE(runCli({"tokentally-report", "prune", "--days", "0"}, output), 0);
    QVERIFY(output.find("Deleted 3 snapshot(s)") != std::string::npos);

    auto db = std::make_shared<tokentally::DatabaseManager>(dbPath());
    tokentally::SnapshotRepository repository(db);
    QCOMPARE(repository.count(), size_t(0));
}

void ReportCliTests::testStatusJson()
{
    seedSnapshots();

    std::string output;
    QCOMPARE(runCli({"tokentally-report", "status", "--format", "json"}, output), 0);
    const auto parsed = nlohmann::json::parse(output);
    QCOMPARE(parsed.value("schemaVersion", 0), 2);
    QCOMPARE(parsed.value("snapshots", 0), 3);
    QCOMPARE(parsed.value("retentionDays", 0), 365);
    QVERIFY(parsed.value("healthy", false));
    QVERIFY(parsed.value("storageFound", false));
}

QTEST_MAIN(ReportCliTests)
#include "test_report_cli.moc"
