#pragma once

#include <optional>

#include <QString>
#include <QStringList>

#include "common/calendar_date.hpp"
#include "common/settings.hpp"

namespace tokentally {

class ReportCli
{
public:
    // CLI dispatcher for collection, history reports and maintenance.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    // Each subcommand opens the database from Settings and renders output
    // as markdown (default) or json.
    int runCollect(const QStringList &args);
    int runHistory(const QStringList &args);
    int runLatest(const QStringList &args);
    int runWeek(const QStringList &args);
    int runPrune(const QStringList &args);
    int runStatus(const QStringList &args);

    std::optional<CalendarDate> parseDate(const QString &value) const;

    Settings m_settings;
};

} // namespace tokentally
