#include "daemon/matchwatch_daemon.hpp"

#include <utility>

#include <QCoreApplication>
#include <QDebug>

#include "common/logging.hpp"
#include "common/matchwatch_version.hpp"
#include "daemon/matchwatch_api_server.hpp"

#include <nlohmann/json.hpp>

namespace matchwatch {

MatchwatchDaemon::MatchwatchDaemon(WatchConfig config,
                                   DaemonCollaborators collaborators,
                                   QObject *parent)
    : QObject(parent)
    , m_config(std::move(config))
{
    validateConfig(m_config);

    m_journal = std::make_unique<VisualEventJournal>();
    m_detector = std::make_unique<TacticalEventDetector>(m_config.detector, m_journal.get());
    m_history = std::make_unique<HistoryStore>(m_config.history);

    m_fetcher = std::move(collaborators.fetcher);
    if (!m_fetcher) {
        m_fetcher = std::make_unique<SeriesStateClient>(m_config.state);
    }
    m_poller = std::make_unique<StatePoller>(m_config.state.seriesId, m_config.poller,
                                             *m_fetcher, *m_detector, *m_history, m_token);

    if (m_config.vision.enabled) {
        m_capture = std::move(collaborators.capture);
        if (!m_capture) {
            m_capture = std::make_unique<QtScreenCapture>();
        }
        m_classifier = std::move(collaborators.classifier);
        if (!m_classifier) {
            m_classifier = std::make_unique<OllamaClassifier>(m_config.classifier);
        }
        m_frameSlot = std::make_unique<FrameSlot>();
        m_frameProducer = std::make_unique<FrameProducer>(m_config.vision, *m_capture,
                                                          *m_frameSlot, m_token);
        m_frameClassifier = std::make_unique<FrameClassifier>(
            m_config.classifier, *m_classifier, *m_frameSlot, m_token, m_journal.get());
    }
}

MatchwatchDaemon::~MatchwatchDaemon()
{
    stop();
}

void MatchwatchDaemon::start()
{
    if (m_started) {
        return;
    }
    m_started = true;

    qInfo() << "Matchwatch: daemon starting (version" << MATCHWATCH_VERSION << ")";
    MWLOG_INFO(QStringLiteral("MatchwatchDaemon"),
               QStringLiteral("start"),
               QStringLiteral("daemon_start"),
               QStringLiteral("user_start"),
               QStringLiteral("threads"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"seriesId", m_config.state.seriesId},
                               {"vision", m_config.vision.enabled},
                               {"api", m_config.api.enabled},
                               {"historyFile", m_config.history.filePath}}));

    if (m_config.api.enabled && !m_apiServer) {
        m_apiServer = std::make_unique<MatchwatchApiServer>(m_config.api, *m_detector,
                                                            *m_history, *m_journal);
        if (!m_apiServer->start()) {
            qWarning() << "Matchwatch: API server unavailable, continuing without it";
        }
    }

    m_poller->start();
    if (m_frameProducer) {
        m_frameProducer->start();
        m_frameClassifier->start();
    }

    if (auto *app = QCoreApplication::instance()) {
        connect(app, &QCoreApplication::aboutToQuit, this, &MatchwatchDaemon::stop,
                Qt::UniqueConnection);
    }
}

void MatchwatchDaemon::stop()
{
    if (!m_started) {
        return;
    }
    m_started = false;

    qInfo() << "Matchwatch: stopping loops";
    m_token.requestStop();
    m_poller->wait();
    if (m_frameProducer) {
        m_frameProducer->wait();
        m_frameClassifier->wait();
    }

    MWLOG_INFO(QStringLiteral("MatchwatchDaemon"),
               QStringLiteral("stop"),
               QStringLiteral("daemon_stop"),
               QStringLiteral("shutdown"),
               QStringLiteral("cancellation_token"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"snapshots", m_history->size()},
                               {"tacticalEvents", m_detector->eventLogSize()}}));
}

} // namespace matchwatch
