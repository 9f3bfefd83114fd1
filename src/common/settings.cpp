#include "common/settings.hpp"

#include <QString>
#include <QtGlobal>

namespace tokentally {

namespace {

std::filesystem::path envPath(const char *name)
{
    const QString value = qEnvironmentVariable(name);
    if (value.isEmpty()) {
        return {};
    }
    return std::filesystem::path(value.toStdString());
}

} // namespace

std::filesystem::path dataHomeDir()
{
    const auto xdg = envPath("XDG_DATA_HOME");
    if (!xdg.empty()) {
        return xdg;
    }
    const auto home = envPath("HOME");
    if (!home.empty()) {
        return home / ".local/share";
    }
    return std::filesystem::path(".local/share");
}

std::filesystem::path defaultStorageRoot()
{
    return dataHomeDir() / "opencode/storage/part";
}

std::filesystem::path defaultDatabasePath()
{
    return dataHomeDir() / "tokentally/usage.db";
}

Settings loadSettings()
{
    Settings settings;

    const auto storage = envPath("TOKENTALLY_STORAGE_DIR");
    settings.storageRoot = storage.empty() ? defaultStorageRoot() : storage;

    const auto database = envPath("TOKENTALLY_DB_PATH");
    settings.databasePath = database.empty() ? defaultDatabasePath() : database;

    bool ok = false;
    const int retention = qEnvironmentVariableIntValue("TOKENTALLY_RETENTION_DAYS", &ok);
    if (ok && retention >= 0) {
        settings.retentionDays = retention;
    }

    settings.traceEnabled = qEnvironmentVariableIntValue("TOKENTALLY_TRACE") == 1;
    return settings;
}

} // namespace tokentally
