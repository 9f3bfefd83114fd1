#include "usage/usage_reader.hpp"

#include <string>
#include <utility>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/calendar_date.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "usage/usage_aggregator.hpp"
#include "usage/usage_parser.hpp"

namespace tokentally {

namespace {

// File names are arbitrary bytes; log them as valid UTF-8.
std::string loggablePath(const std::filesystem::path &path)
{
    return QString::fromStdString(path.string()).toStdString();
}

StorageScanner makeScanner(const std::filesystem::path &storageRoot)
{
    try {
        return StorageScanner(storageRoot);
    } catch (const ScanError &ex) {
        throw ReaderError::fromScan(ex);
    }
}

} // namespace

UsageReader::UsageReader(const std::filesystem::path &storageRoot,
                         Clock clock,
                         std::chrono::seconds cacheTtl)
    : m_scanner(makeScanner(storageRoot))
    , m_clock(std::move(clock))
    , m_cacheTtl(cacheTtl)
{
}

std::chrono::system_clock::time_point UsageReader::now() const
{
    return m_clock ? m_clock() : std::chrono::system_clock::now();
}

bool UsageReader::cacheIsFresh(std::chrono::system_clock::time_point at) const
{
    if (!m_cache.has_value()) {
        return false;
    }
    // A clock that moved backwards invalidates the cache as well.
    if (at < m_cache->cachedAt) {
        return false;
    }
    return at - m_cache->cachedAt < m_cacheTtl;
}

UsageMetrics UsageReader::getUsage()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const auto at = now();
    if (cacheIsFresh(at)) {
        return m_cache->metrics;
    }

    const auto files = scanFiles(std::nullopt);
    if (files.empty()) {
        throw ReaderError(ReaderError::Kind::NoData,
                          "no usage files under " + m_scanner.storagePath().string());
    }

    ParsePass pass = parseFiles(files);
    m_files = std::move(pass.files);

    if (pass.parts.empty()) {
        throw ReaderError(ReaderError::Kind::NoData,
                          "no usage part carries token data");
    }

    UsageAggregator aggregator;
    for (const auto &part : pass.parts) {
        aggregator.add(part);
    }
    const UsageMetrics metrics = std::move(aggregator).finalize(at);
    m_cache = CachedMetrics{metrics, at};

    TTLOG_INFO(QStringLiteral("UsageReader"),
               QStringLiteral("getUsage"),
               QStringLiteral("usage_refreshed"),
               QStringLiteral("cache_expired"),
               QStringLiteral("directory_scan"),
               QString(),
               QString(),
               (nlohmann::json{{"files", files.size()},
                               {"parts", pass.parts.size()},
                               {"reused", pass.reused},
                               {"skipped", pass.skipped},
                               {"interactions", metrics.totalInteractions}}));
    return metrics;
}

UsageMetrics UsageReader::getUsageToday()
{
    const CalendarDate today = CalendarDate::fromTimePointUtc(now());
    return aggregateWindow(today.startOfDayUtc(), std::nullopt, "today");
}

UsageMetrics UsageReader::getUsageMonth()
{
    const CalendarDate today = CalendarDate::fromTimePointUtc(now());
    return aggregateWindow(today.firstOfMonth().startOfDayUtc(), std::nullopt, "month");
}

UsageMetrics UsageReader::getUsageLastMonth()
{
    const CalendarDate today = CalendarDate::fromTimePointUtc(now());
    return aggregateWindow(today.firstOfPreviousMonth().startOfDayUtc(),
                           today.firstOfMonth().startOfDayUtc(),
                           "last_month");
}

void UsageReader::invalidate()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache.reset();
}

std::vector<FileMetadata> UsageReader::scanFiles(
    const std::optional<std::chrono::system_clock::time_point> &since) const
{
    try {
        if (since.has_value()) {
            return m_scanner.scanModifiedSince(StorageScanner::toFileTime(*since));
        }
        return m_scanner.scanWithMetadata();
    } catch (const ScanError &ex) {
        TTLOG_ERROR(QStringLiteral("UsageReader"),
                    QStringLiteral("scanFiles"),
                    QStringLiteral("scan_failed"),
                    QString::fromStdString(ex.what()),
                    QStringLiteral("directory_scan"),
                    QString(),
                    QString(),
                    (nlohmann::json{{"root", loggablePath(m_scanner.storagePath())}}));
        throw ReaderError::fromScan(ex);
    }
}

UsageReader::ParsePass UsageReader::parseFiles(const std::vector<FileMetadata> &files) const
{
    ParsePass pass;
    pass.files.reserve(files.size());

    for (const auto &file : files) {
        const std::string key = file.path.string();

        const auto cached = m_files.find(key);
        if (cached != m_files.end() && cached->second.modified == file.modified) {
            if (cached->second.part.has_value()) {
                pass.parts.push_back(*cached->second.part);
            }
            pass.files.emplace(key, cached->second);
            ++pass.reused;
            continue;
        }

        ParseOutcome outcome = parseUsageFile(file.path);
        switch (outcome.kind) {
        case ParseOutcome::Kind::Relevant:
            pass.parts.push_back(*outcome.part);
            pass.files.emplace(key, CachedFile{file.modified, std::move(outcome.part)});
            break;
        case ParseOutcome::Kind::Irrelevant:
            pass.files.emplace(key, CachedFile{file.modified, std::nullopt});
            break;
        case ParseOutcome::Kind::Malformed:
            // Not remembered; retried on the next refresh.
            ++pass.skipped;
            TTLOG_DEBUG(QStringLiteral("UsageReader"),
                        QStringLiteral("parseFiles"),
                        QStringLiteral("usage_file_skipped"),
                        QString::fromStdString(outcome.error->message),
                        outcome.error->kind == ParseError::Kind::Io
                            ? QStringLiteral("read_file")
                            : QStringLiteral("json_parse"),
                        QString(),
                        QString(),
                        (nlohmann::json{{"path", loggablePath(file.path)}}));
            break;
        }
    }

    if (pass.skipped > 0) {
        TTLOG_WARN(QStringLiteral("UsageReader"),
                   QStringLiteral("parseFiles"),
                   QStringLiteral("usage_files_skipped"),
                   QStringLiteral("parse_error"),
                   QStringLiteral("json_parse"),
                   QString(),
                   QString(),
                   (nlohmann::json{{"skipped", pass.skipped},
                                   {"total", files.size()}}));
    }
    return pass;
}

UsageMetrics UsageReader::aggregateWindow(
    std::chrono::system_clock::time_point from,
    std::optional<std::chrono::system_clock::time_point> to,
    const char *window)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<FileMetadata> files = scanFiles(from);
    if (to.has_value()) {
        const auto limit = StorageScanner::toFileTime(*to);
        std::vector<FileMetadata> bounded;
        for (auto &file : files) {
            if (file.modified < limit) {
                bounded.push_back(std::move(file));
            }
        }
        files = std::move(bounded);
    }

    if (files.empty()) {
        throw ReaderError(ReaderError::Kind::NoData,
                          std::string("no usage files for window ") + window);
    }

    ParsePass pass = parseFiles(files);
    for (auto &entry : pass.files) {
        m_files[entry.first] = std::move(entry.second);
    }

    if (pass.parts.empty()) {
        throw ReaderError(ReaderError::Kind::NoData,
                          std::string("no token data for window ") + window);
    }

    UsageAggregator aggregator;
    for (const auto &part : pass.parts) {
        aggregator.add(part);
    }
    return std::move(aggregator).finalize(now());
}

} // namespace tokentally
