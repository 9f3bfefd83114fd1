#include "report/ReportCli.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>

#include <nlohmann/json.hpp>

#include "collector/data_collector.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"
#include "database/database_manager.hpp"
#include "database/snapshot_repository.hpp"
#include "usage/usage_reader.hpp"

namespace tokentally {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  tokentally-report collect [--force] [--format markdown|json]\n"
        "  tokentally-report history --from DATE --to DATE [--format markdown|json]\n"
        "  tokentally-report latest [--format markdown|json]\n"
        "  tokentally-report week --start DATE [--format markdown|json]\n"
        "  tokentally-report prune [--days N]\n"
        "  tokentally-report status [--format markdown|json]\n"
        "DATE is YYYY-MM-DD (UTC).\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("markdown");
    }
    return value.toLower();
}

bool isValidFormat(const QString &format)
{
    return format == QStringLiteral("markdown") || format == QStringLiteral("json");
}

void renderMetricsMarkdown(const UsageMetrics &metrics)
{
    std::cout << "| Metric | Value |\n";
    std::cout << "|---|---:|\n";
    std::cout << "| Input tokens | " << metrics.totalInputTokens << " |\n";
    std::cout << "| Output tokens | " << metrics.totalOutputTokens << " |\n";
    std::cout << "| Reasoning tokens | " << metrics.totalReasoningTokens << " |\n";
    std::cout << "| Cache write tokens | " << metrics.totalCacheWriteTokens << " |\n";
    std::cout << "| Cache read tokens | " << metrics.totalCacheReadTokens << " |\n";
    std::cout << "| Cost (USD) | " << std::fixed << std::setprecision(4)
              << metrics.totalCost << " |\n";
    std::cout << "| Interactions | " << metrics.totalInteractions << " |\n";
}

void renderSnapshotsMarkdown(const std::vector<UsageSnapshot> &snapshots)
{
    if (snapshots.empty()) {
        std::cout << "No snapshots in this period.\n";
        return;
    }

    std::cout << "| Date | Input | Output | Reasoning | Cache write | Cache read | Cost | Interactions |\n";
    std::cout << "|---|---:|---:|---:|---:|---:|---:|---:|\n";
    for (const auto &snapshot : snapshots) {
        std::cout << "| " << snapshot.date.toString()
                  << " | " << snapshot.inputTokens
                  << " | " << snapshot.outputTokens
                  << " | " << snapshot.reasoningTokens
                  << " | " << snapshot.cacheWriteTokens
                  << " | " << snapshot.cacheReadTokens
                  << " | " << std::fixed << std::setprecision(4) << snapshot.totalCost
                  << " | " << snapshot.interactionCount << " |\n";
    }
}

void logCommand(const QString &where, const QString &what, const nlohmann::json &context)
{
    TTLOG_INFO(QStringLiteral("ReportCli"),
               where,
               what,
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               context);
}

} // namespace

int ReportCli::run(int argc, char *argv[])
{
    // CLI entry: parse the subcommand and delegate to the handler.
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    m_settings = loadSettings();

    const QString command = args.at(1);
    logCommand(QStringLiteral("run"), QStringLiteral("report_cli_command"),
               nlohmann::json{{"command", command.toStdString()}});

    try {
        if (command == QStringLiteral("collect")) {
            return runCollect(args);
        }
        if (command == QStringLiteral("history")) {
            return runHistory(args);
        }
        if (command == QStringLiteral("latest")) {
            return runLatest(args);
        }
        if (command == QStringLiteral("week")) {
            return runWeek(args);
        }
        if (command == QStringLiteral("prune")) {
            return runPrune(args);
        }
        if (command == QStringLiteral("status")) {
            return runStatus(args);
        }
    } catch (const ReaderError &ex) {
        std::cerr << "Usage data unavailable: " << ex.what() << std::endl;
        return 2;
    } catch (const CollectorError &ex) {
        std::cerr << "Collection failed: " << ex.what() << std::endl;
        return 3;
    } catch (const DatabaseError &ex) {
        std::cerr << "Database error: " << ex.what() << std::endl;
        return 3;
    }

    std::cerr << usageText().toStdString();
    return 1;
}

std::optional<CalendarDate> ReportCli::parseDate(const QString &value) const
{
    return CalendarDate::parse(value.trimmed().toStdString());
}

int ReportCli::runCollect(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!isValidFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }
    const bool force = args.contains(QStringLiteral("--force"));

    UsageReader reader(m_settings.storageRoot, UsageReader::Clock(), m_settings.cacheTtl);
    const UsageMetrics metrics = reader.getUsage();

    auto db = std::make_shared<DatabaseManager>(m_settings.databasePath);
    DataCollector collector(db);
    bool saved = false;
    const CalendarDate today = CalendarDate::todayUtc();
    if (force) {
        collector.repository().saveSnapshot(today, metrics);
        saved = true;
    } else {
        saved = collector.collectAndSave(metrics);
    }

    logCommand(QStringLiteral("runCollect"), QStringLiteral("report_collect"),
               nlohmann::json{{"saved", saved}, {"force", force}});

    if (format == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["date"] = today;
        payload["saved"] = saved;
        payload["metrics"] = metrics;
        std::cout << payload.dump(2) << std::endl;
        return 0;
    }

    std::cout << "# Usage collected for " << today.toString() << "\n\n";
    std::cout << "Storage: " << m_settings.storageRoot.string() << "\n";
    std::cout << "Database: " << m_settings.databasePath.string() << "\n\n";
    renderMetricsMarkdown(metrics);
    std::cout << "\n" << (saved ? "Snapshot saved." : "Snapshot already saved today.")
              << "\n";
    return 0;
}

int ReportCli::runHistory(const QStringList &args)
{
    const auto from = parseDate(getArgValue(args, QStringLiteral("--from")));
    const auto to = parseDate(getArgValue(args, QStringLiteral("--to")));
    if (!from.has_value() || !to.has_value()) {
        std::cerr << "Invalid or missing date. Use YYYY-MM-DD." << std::endl;
        return 1;
    }
    const QString format = getFormat(args);
    if (!isValidFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    auto db = std::make_shared<DatabaseManager>(m_settings.databasePath);
    SnapshotRepository repository(db);
    const auto snapshots = repository.getRange(*from, *to);

    logCommand(QStringLiteral("runHistory"), QStringLiteral("report_history"),
               nlohmann::json{{"snapshots", snapshots.size()},
                              {"format", format.toStdString()}});

    if (format == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["from"] = *from;
        payload["to"] = *to;
        payload["snapshots"] = snapshots;
        std::cout << payload.dump(2) << std::endl;
        return 0;
    }

    std::cout << "# Usage History\n\n";
    std::cout << "Period: " << from->toString() << " -> " << to->toString() << "\n";
    std::cout << "Days with data: " << snapshots.size() << "\n\n";
    renderSnapshotsMarkdown(snapshots);
    return 0;
}

int ReportCli::runLatest(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!isValidFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    auto db = std::make_shared<DatabaseManager>(m_settings.databasePath);
    SnapshotRepository repository(db);
    const auto latest = repository.getLatest();

    if (format == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["latest"] = latest.has_value() ? nlohmann::json(*latest) : nlohmann::json();
        std::cout << payload.dump(2) << std::endl;
        return 0;
    }

    if (!latest.has_value()) {
        std::cout << "No snapshots recorded yet.\n";
        return 0;
    }
    std::cout << "# Latest Snapshot\n\n";
    renderSnapshotsMarkdown({*latest});
    return 0;
}

int ReportCli::runWeek(const QStringList &args)
{
    const auto start = parseDate(getArgValue(args, QStringLiteral("--start")));
    if (!start.has_value()) {
        std::cerr << "Invalid or missing --start. Use YYYY-MM-DD." << std::endl;
        return 1;
    }
    const QString format = getFormat(args);
    if (!isValidFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    auto db = std::make_shared<DatabaseManager>(m_settings.databasePath);
    SnapshotRepository repository(db);
    const WeekSummary summary = repository.getWeekSummary(*start);

    if (format == QStringLiteral("json")) {
        std::cout << nlohmann::json(summary).dump(2) << std::endl;
        return 0;
    }

    std::cout << "# Week " << summary.startDate.toString() << " -> "
              << summary.endDate.toString() << "\n\n";
    std::cout << "Days with data: " << summary.daysWithData << "\n";
    std::cout << "Input tokens: " << summary.totalInputTokens << "\n";
    std::cout << "Output tokens: " << summary.totalOutputTokens << "\n";
    std::cout << "Reasoning tokens: " << summary.totalReasoningTokens << "\n";
    std::cout << "Cache write tokens: " << summary.totalCacheWriteTokens << "\n";
    std::cout << "Cache read tokens: " << summary.totalCacheReadTokens << "\n";
    std::cout << "Cost (USD): " << std::fixed << std::setprecision(4)
              << summary.totalCost << "\n";
    std::cout << "Interactions: " << summary.totalInteractions << "\n";
    return 0;
}

int ReportCli::runPrune(const QStringList &args)
{
    int days = m_settings.retentionDays;
    const QString daysValue = getArgValue(args, QStringLiteral("--days"));
    if (!daysValue.isEmpty()) {
        bool ok = false;
        days = daysValue.toInt(&ok);
        if (!ok || days < 0) {
            std::cerr << "Invalid --days. Use a non-negative integer." << std::endl;
            return 1;
        }
    }

    auto db = std::make_shared<DatabaseManager>(m_settings.databasePath);
    SnapshotRepository repository(db);
    const std::size_t deleted = repository.deleteOld(days);

    logCommand(QStringLiteral("runPrune"), QStringLiteral("report_prune"),
               nlohmann::json{{"days", days}, {"deleted", deleted}});

    std::cout << "Deleted " << deleted << " snapshot(s) older than " << days
              << " day(s).\n";
    return 0;
}

int ReportCli::runStatus(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!isValidFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    auto db = std::make_shared<DatabaseManager>(m_settings.databasePath);
    SnapshotRepository repository(db);

    std::string integrity;
    const bool healthy = db->integrityCheck(&integrity);
    std::error_code storageError;
    const bool storageExists = std::filesystem::is_directory(m_settings.storageRoot, storageError);

    nlohmann::json payload = {
        {"storageRoot", m_settings.storageRoot.string()},
        {"storageFound", storageExists},
        {"databasePath", db->path().string()},
        {"schemaVersion", db->schemaVersion()},
        {"snapshots", repository.count()},
        {"retentionDays", m_settings.retentionDays},
        {"integrity", integrity},
        {"healthy", healthy}
    };

    if (format == QStringLiteral("json")) {
        std::cout << payload.dump(2) << std::endl;
        return healthy ? 0 : 4;
    }

    std::cout << "# tokentally status\n\n";
    std::cout << "Storage root: " << m_settings.storageRoot.string()
              << (storageExists ? "" : " (missing)") << "\n";
    std::cout << "Database: " << db->path().string() << "\n";
    std::cout << "Schema version: " << db->schemaVersion() << "\n";
    std::cout << "Snapshots: " << repository.count() << "\n";
    std::cout << "Retention: " << m_settings.retentionDays << " day(s)\n";
    std::cout << "Integrity: " << integrity << "\n";
    return healthy ? 0 : 4;
}

} // namespace tokentally
