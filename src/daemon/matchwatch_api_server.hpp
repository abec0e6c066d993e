#pragma once

#include <QObject>
#include <QLocalServer>
#include <QLocalSocket>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "daemon/history_store.hpp"
#include "daemon/tactical_event_detector.hpp"
#include "daemon/visual_event_journal.hpp"

namespace matchwatch {

/**
 * MatchwatchApiServer exposes the pipeline's consumer surface over a local
 * UNIX socket using a minimal JSON-RPC-like protocol: one request object per
 * connection, one response object back.
 */
class MatchwatchApiServer : public QObject
{
    Q_OBJECT
public:
    MatchwatchApiServer(ApiConfig config,
                        TacticalEventDetector &detector,
                        HistoryStore &history,
                        VisualEventJournal &journal,
                        QObject *parent = nullptr);
    ~MatchwatchApiServer() override;

    // Start listening on $XDG_RUNTIME_DIR/matchwatch.sock unless configured otherwise.
    bool start();
    QString socketPath() const;

    // Process a single JSON-RPC payload without a socket round-trip.
    QByteArray handleRequestPayload(const QByteArray &payload);

private slots:
    void handleNewConnection();
    void handleClientReadyRead();

private:
    void handleRequest(QLocalSocket *socket, const QByteArray &payload);
    nlohmann::json dispatch(const std::string &method, const nlohmann::json &params);
    QByteArray makeErrorResponse(const QString &message, int id = -1) const;
    QByteArray makeResultResponse(const nlohmann::json &result, int id) const;

    ApiConfig m_config;
    TacticalEventDetector &m_detector;
    HistoryStore &m_history;
    VisualEventJournal &m_journal;
    QLocalServer m_server;
};

} // namespace matchwatch
