#include "daemon/state_poller.hpp"

#include <utility>

#include <QUuid>

#include "common/logging.hpp"
#include "daemon/snapshot_differ.hpp"

namespace matchwatch {

StatePoller::StatePoller(std::string seriesId,
                         PollerConfig config,
                         StateFetcher &fetcher,
                         TacticalEventDetector &detector,
                         HistoryStore &history,
                         const CancellationToken &token)
    : m_seriesId(std::move(seriesId))
    , m_config(config)
    , m_fetcher(fetcher)
    , m_detector(detector)
    , m_history(history)
    , m_token(token)
{
}

StatePoller::~StatePoller()
{
    // The owner is expected to request stop first; joining a live loop here
    // would block until the shared token fires.
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void StatePoller::start()
{
    if (m_thread.joinable()) {
        return;
    }
    m_running = true;
    m_thread = std::thread([this]() { run(); });
}

void StatePoller::wait()
{
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

bool StatePoller::isRunning() const
{
    return m_running.load();
}

void StatePoller::run()
{
    MWLOG_INFO(QStringLiteral("StatePoller"),
               QStringLiteral("run"),
               QStringLiteral("poller_started"),
               QStringLiteral("daemon_start"),
               QStringLiteral("fixed_interval"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"seriesId", m_seriesId},
                               {"intervalMs", m_config.pollInterval.count()}}));

    while (!m_token.stopRequested()) {
        const TickResult result = runTick();
        const auto delay = result == TickResult::Failed
            ? m_config.errorBackoff
            : m_config.pollInterval;
        if (m_token.waitFor(delay)) {
            break;
        }
    }

    m_running = false;
    MWLOG_INFO(QStringLiteral("StatePoller"),
               QStringLiteral("run"),
               QStringLiteral("poller_stopped"),
               QStringLiteral("stop_requested"),
               QStringLiteral("cancellation_token"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"accepted", m_accepted.load()},
                               {"skipped", m_skipped.load()},
                               {"failed", m_failed.load()}}));
}

TickResult StatePoller::runTick()
{
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    logging::CorrelationScope corrScope(corrId);

    try {
        const std::optional<Snapshot> current = m_fetcher.fetchSnapshot(m_seriesId);
        if (!current.has_value() || current->players.empty()) {
            ++m_skipped;
            MWLOG_DEBUG(QStringLiteral("StatePoller"),
                        QStringLiteral("runTick"),
                        QStringLiteral("tick_skipped"),
                        QStringLiteral("no_data"),
                        QStringLiteral("keep_previous"),
                        logging::defaultWho(),
                        corrId,
                        nlohmann::json::object());
            return TickResult::Skipped;
        }

        processSnapshot(*current);
        ++m_accepted;
        return TickResult::Accepted;
    } catch (const std::exception &ex) {
        ++m_failed;
        MWLOG_ERROR(QStringLiteral("StatePoller"),
                    QStringLiteral("runTick"),
                    QStringLiteral("tick_failed"),
                    QStringLiteral("exception"),
                    QStringLiteral("backoff"),
                    logging::defaultWho(),
                    corrId,
                    (nlohmann::json{{"what", ex.what()},
                                    {"backoffMs", m_config.errorBackoff.count()}}));
        return TickResult::Failed;
    }
}

void StatePoller::processSnapshot(const Snapshot &current)
{
    const auto changes = SnapshotDiffer::diff(m_previous, current);
    for (const auto &change : changes) {
        m_detector.processChange(change, current);
    }
    m_history.append(current);
    m_previous = current;

    MWLOG_DEBUG(QStringLiteral("StatePoller"),
                QStringLiteral("processSnapshot"),
                QStringLiteral("snapshot_accepted"),
                QStringLiteral("poll_tick"),
                QStringLiteral("diff_detect_persist"),
                logging::defaultWho(),
                logging::currentCorrelationId(),
                (nlohmann::json{{"gameId", current.gameId},
                                {"players", current.players.size()},
                                {"changes", changes.size()}}));
}

} // namespace matchwatch
