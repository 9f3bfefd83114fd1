#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <vector>

#include "common/models.hpp"

namespace tokentally {

/**
 * StorageScanner walks the usage part tree and collects every "*.json" file,
 * at any depth. Symlinks are not followed.
 *
 * - The root must exist: construction and every scan throw
 *   ScanError::NotFound otherwise, and ScanError::Io when the root cannot be
 *   opened.
 * - Unreadable subdirectories and entries are skipped silently.
 * - Returned paths are in traversal order; callers must not rely on it.
 */
class StorageScanner {
public:
    explicit StorageScanner(std::filesystem::path storagePath);

    std::vector<std::filesystem::path> scan() const;
    std::vector<FileMetadata> scanWithMetadata() const;
    std::vector<FileMetadata> scanModifiedSince(std::filesystem::file_time_type cutoff) const;

    const std::filesystem::path &storagePath() const { return m_storagePath; }

    static std::filesystem::file_time_type toFileTime(
        std::chrono::system_clock::time_point timestamp);

private:
    void checkRoot() const;
    void walk(const std::function<void(const std::filesystem::directory_entry &)> &visit) const;

    std::filesystem::path m_storagePath;
};

} // namespace tokentally
