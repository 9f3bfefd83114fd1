#include "usage/storage_scanner.hpp"

#include <utility>

#include "common/errors.hpp"

namespace tokentally {

namespace fs = std::filesystem;

namespace {

bool isJsonFile(const fs::directory_entry &entry)
{
    std::error_code error;
    if (!entry.is_regular_file(error) || error) {
        return false;
    }
    return entry.path().extension() == ".json";
}

} // namespace

StorageScanner::StorageScanner(fs::path storagePath)
    : m_storagePath(std::move(storagePath))
{
    checkRoot();
}

void StorageScanner::checkRoot() const
{
    std::error_code error;
    const fs::file_status status = fs::status(m_storagePath, error);
    if (status.type() == fs::file_type::not_found) {
        throw ScanError(ScanError::Kind::NotFound,
                        "storage directory not found: " + m_storagePath.string());
    }
    if (error) {
        throw ScanError(ScanError::Kind::Io,
                        "cannot access storage directory " + m_storagePath.string()
                            + ": " + error.message());
    }
    if (status.type() != fs::file_type::directory) {
        throw ScanError(ScanError::Kind::Io,
                        "storage path is not a directory: " + m_storagePath.string());
    }
}

// A failed read abandons only the directory being read.
void StorageScanner::walk(
    const std::function<void(const fs::directory_entry &)> &visit) const
{
    checkRoot();

    std::vector<fs::path> pending{m_storagePath};
    while (!pending.empty()) {
        const fs::path dir = std::move(pending.back());
        pending.pop_back();

        std::error_code error;
        fs::directory_iterator it(dir, error);
        if (error) {
            if (dir == m_storagePath) {
                throw ScanError(ScanError::Kind::Io,
                                "cannot read storage directory " + dir.string()
                                    + ": " + error.message());
            }
            continue;
        }

        for (const fs::directory_iterator end; it != end; it.increment(error)) {
            if (error) {
                break;
            }
            const fs::directory_entry &entry = *it;

            std::error_code statusError;
            const fs::file_status linkStatus = entry.symlink_status(statusError);
            if (statusError || fs::is_symlink(linkStatus)) {
                continue;
            }
            if (fs::is_directory(linkStatus)) {
                pending.push_back(entry.path());
                continue;
            }
            if (isJsonFile(entry)) {
                visit(entry);
            }
        }
    }
}

std::vector<fs::path> StorageScanner::scan() const
{
    std::vector<fs::path> files;
    walk([&files](const fs::directory_entry &entry) {
        files.push_back(entry.path());
    });
    return files;
}

std::vector<FileMetadata> StorageScanner::scanWithMetadata() const
{
    std::vector<FileMetadata> files;
    walk([&files](const fs::directory_entry &entry) {
        std::error_code error;
        const auto modified = entry.last_write_time(error);
        if (error) {
            return;
        }
        files.push_back(FileMetadata{entry.path(), modified});
    });
    return files;
}

std::vector<FileMetadata> StorageScanner::scanModifiedSince(
    fs::file_time_type cutoff) const
{
    std::vector<FileMetadata> files;
    walk([&files, cutoff](const fs::directory_entry &entry) {
        std::error_code error;
        const auto modified = entry.last_write_time(error);
        if (error || modified < cutoff) {
            return;
        }
        files.push_back(FileMetadata{entry.path(), modified});
    });
    return files;
}

fs::file_time_type StorageScanner::toFileTime(
    std::chrono::system_clock::time_point timestamp)
{
    // C++17 has no clock_cast; translate through both clocks' "now".
    const auto sysNow = std::chrono::system_clock::now();
    const auto fileNow = fs::file_time_type::clock::now();
    return fileNow
        + std::chrono::duration_cast<fs::file_time_type::duration>(timestamp - sysNow);
}

} // namespace tokentally
