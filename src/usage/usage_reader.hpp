#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/models.hpp"
#include "common/settings.hpp"
#include "usage/storage_scanner.hpp"

namespace tokentally {

/**
 * UsageReader is the read path used by the panel for live totals:
 * scan -> parse -> aggregate, behind a short-lived cache.
 *
 * - getUsage() serves the cached metrics while they are younger than the
 *   cache TTL (5 minutes by default) and never touches the disk then.
 * - A refresh recomputes totals from scratch over every file currently on
 *   disk. Parsed parts are remembered per file and reused while the file's
 *   modification time is unchanged.
 * - Files that fail to parse are logged and skipped. Only a missing or
 *   unreadable storage root (ReaderError::Scan) or an empty corpus
 *   (ReaderError::NoData) is reported.
 *
 * All methods are safe to call from several threads.
 */
class UsageReader {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    // Throws ReaderError::Scan when the storage root does not exist.
    explicit UsageReader(const std::filesystem::path &storageRoot,
                         Clock clock = Clock(),
                         std::chrono::seconds cacheTtl = kUsageCacheTtl);

    UsageMetrics getUsage();

    // Windowed totals over files modified in the current UTC day, the
    // current UTC month and the previous UTC month. These bypass the cache.
    UsageMetrics getUsageToday();
    UsageMetrics getUsageMonth();
    UsageMetrics getUsageLastMonth();

    // Forces the next getUsage() to rescan.
    void invalidate();

    const std::filesystem::path &storagePath() const { return m_scanner.storagePath(); }

private:
    struct CachedFile {
        std::filesystem::file_time_type modified;
        // Empty when the file parsed but carries no tokens.
        std::optional<UsagePart> part;
    };

    struct CachedMetrics {
        UsageMetrics metrics;
        std::chrono::system_clock::time_point cachedAt;
    };

    struct ParsePass {
        std::vector<UsagePart> parts;
        std::unordered_map<std::string, CachedFile> files;
        size_t reused = 0;
        size_t skipped = 0;
    };

    std::chrono::system_clock::time_point now() const;
    bool cacheIsFresh(std::chrono::system_clock::time_point at) const;

    std::vector<FileMetadata> scanFiles(
        const std::optional<std::chrono::system_clock::time_point> &since) const;
    ParsePass parseFiles(const std::vector<FileMetadata> &files) const;
    UsageMetrics aggregateWindow(std::chrono::system_clock::time_point from,
                                 std::optional<std::chrono::system_clock::time_point> to,
                                 const char *window);

    StorageScanner m_scanner;
    Clock m_clock;
    std::chrono::seconds m_cacheTtl;

    mutable std::mutex m_mutex;
    std::optional<CachedMetrics> m_cache;
    std::unordered_map<std::string, CachedFile> m_files;
};

} // namespace tokentally
