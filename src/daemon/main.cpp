#include <memory>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QGuiApplication>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/matchwatch_version.hpp"
#include "daemon/matchwatch_daemon.hpp"

namespace {

bool hasFlag(int argc, char *argv[], const char *flag)
{
    for (int i = 1; i < argc; ++i) {
        if (QString::fromLocal8Bit(argv[i]) == QLatin1String(flag)) {
            return true;
        }
    }
    return false;
}

} // namespace

int main(int argc, char *argv[])
{
    // Screen capture needs a GUI application; the state channel alone does not.
    std::unique_ptr<QCoreApplication> app;
    if (hasFlag(argc, argv, "--no-vision")) {
        app = std::make_unique<QCoreApplication>(argc, argv);
    } else {
        app = std::make_unique<QGuiApplication>(argc, argv);
    }

    QCoreApplication::setApplicationName(QStringLiteral("matchwatch-daemon"));
    QCoreApplication::setApplicationVersion(QStringLiteral(MATCHWATCH_VERSION));
    qInfo() << "Matchwatch daemon starting...";

    const bool earlyTrace = hasFlag(argc, argv, "--trace")
        || qEnvironmentVariableIntValue("MATCHWATCH_TRACE") == 1;
    matchwatch::logging::initLogging(QStringLiteral("matchwatch-daemon"), earlyTrace);

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Watches a live match and derives tactical and visual events."));
    parser.addHelpOption();
    parser.addVersionOption();
    matchwatch::addCommandLineOptions(parser);
    parser.process(*app);

    matchwatch::WatchConfig config;
    try {
        config = matchwatch::loadConfig(parser);
    } catch (const matchwatch::ConfigError &ex) {
        qWarning().noquote() << "Matchwatch: invalid configuration:" << ex.what();
        MWLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("config_invalid"),
                    QStringLiteral("startup"),
                    QStringLiteral("fail_fast"),
                    matchwatch::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"error", ex.what()}}));
        return 1;
    }
    matchwatch::logging::initLogging(QStringLiteral("matchwatch-daemon"), config.trace);

    MWLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("daemon_start"),
               QStringLiteral("user_start"),
               QStringLiteral("resolved_config"),
               matchwatch::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"version", MATCHWATCH_VERSION}}));

    // The daemon lives for the lifetime of the process.
    std::unique_ptr<matchwatch::MatchwatchDaemon> daemon;
    try {
        daemon = std::make_unique<matchwatch::MatchwatchDaemon>(config);
    } catch (const matchwatch::ConfigError &ex) {
        qWarning().noquote() << "Matchwatch: cannot start:" << ex.what();
        return 1;
    }
    daemon->start();

    const int rc = app->exec();
    daemon->stop();
    return rc;
}
