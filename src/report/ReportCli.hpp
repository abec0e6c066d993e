#pragma once

#include <QString>
#include <QStringList>

namespace matchwatch {

class ReportCli
{
public:
    // CLI dispatcher for history reports.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    // Both subcommands read the persisted history file written by the daemon.
    int runHistoryReport(const QStringList &args);
    int runSummaryReport(const QStringList &args);
};

} // namespace matchwatch
