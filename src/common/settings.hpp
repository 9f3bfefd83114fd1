#pragma once

#include <chrono>
#include <filesystem>

namespace tokentally {

constexpr int kDefaultRetentionDays = 365;
constexpr std::chrono::minutes kUsageCacheTtl{5};

// Runtime locations and policy knobs, resolved from the environment.
struct Settings {
    std::filesystem::path storageRoot;
    std::filesystem::path databasePath;
    int retentionDays = kDefaultRetentionDays;
    std::chrono::seconds cacheTtl = kUsageCacheTtl;
    bool traceEnabled = false;
};

// $XDG_DATA_HOME, else $HOME/.local/share, else a relative fallback.
std::filesystem::path dataHomeDir();

std::filesystem::path defaultStorageRoot();
std::filesystem::path defaultDatabasePath();

/**
 * Environment overrides:
 * - TOKENTALLY_STORAGE_DIR: usage part tree to scan
 * - TOKENTALLY_DB_PATH: SQLite database file
 * - TOKENTALLY_RETENTION_DAYS: snapshot retention for pruning
 * - TOKENTALLY_TRACE=1: enable debug/trace logging
 */
Settings loadSettings();

} // namespace tokentally
