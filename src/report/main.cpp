#include <QCoreApplication>

#include "report/ReportCli.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

#include <cstring>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // --trace is a process-wide switch, not a report option; drop it before
    // ReportCli sees the command line.
    bool trace = qEnvironmentVariableIntValue("MATCHWATCH_TRACE") == 1;
    int kept = 0;
    for (int i = 0; i < argc; ++i) {
        if (std::strcmp(argv[i], "--trace") == 0) {
            trace = true;
            continue;
        }
        argv[kept++] = argv[i];
    }

    matchwatch::logging::initLogging(QStringLiteral("matchwatch-report"), trace);
    MWLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("report_cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               matchwatch::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"args", kept}}));

    matchwatch::ReportCli cli;
    return cli.run(kept, argv);
}
