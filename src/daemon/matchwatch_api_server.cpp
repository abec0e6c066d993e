#include "daemon/matchwatch_api_server.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <QDebug>
#include <QUuid>

#include <unistd.h>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/snapshot_summary.hpp"

namespace matchwatch {

namespace {

constexpr std::size_t kMaxLimit = 1000;

// Thrown for requests that are well-formed JSON but invalid for the method.
class InvalidParams : public std::runtime_error {
public:
    explicit InvalidParams(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

QString runtimeSocketPath(const ApiConfig &config)
{
    if (!config.socketName.empty()) {
        return QString::fromStdString(config.socketName);
    }

    QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (runtimeDir.isEmpty()) {
        runtimeDir =
            QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    }
    if (runtimeDir.isEmpty()) {
        runtimeDir = QStringLiteral("/run/user/%1").arg(getuid());
    }
    return runtimeDir + QStringLiteral("/matchwatch.sock");
}

std::size_t limitParam(const nlohmann::json &params, std::size_t fallback)
{
    if (!params.contains("limit")) {
        return fallback;
    }
    const auto &value = params.at("limit");
    if (!value.is_number_integer() || value.get<long long>() < 0) {
        throw InvalidParams("limit must be a non-negative integer");
    }
    const auto limit = static_cast<std::size_t>(value.get<long long>());
    return limit > kMaxLimit ? kMaxLimit : limit;
}

} // namespace

MatchwatchApiServer::MatchwatchApiServer(ApiConfig config,
                                         TacticalEventDetector &detector,
                                         HistoryStore &history,
                                         VisualEventJournal &journal,
                                         QObject *parent)
    : QObject(parent)
    , m_config(std::move(config))
    , m_detector(detector)
    , m_history(history)
    , m_journal(journal)
{
}

MatchwatchApiServer::~MatchwatchApiServer() = default;

QString MatchwatchApiServer::socketPath() const
{
    return runtimeSocketPath(m_config);
}

bool MatchwatchApiServer::start()
{
    const QString path = socketPath();
    if (path.contains('/')) {
        const QFileInfo socketInfo(path);
        if (!QDir().mkpath(socketInfo.absolutePath())) {
            qWarning() << "Failed to create runtime socket directory"
                       << socketInfo.absolutePath();
            return false;
        }

        if (QFile::exists(path)) {
            if (!QLocalServer::removeServer(path)) {
                qWarning() << "Failed to remove existing Matchwatch socket" << path;
                return false;
            }
        }
    } else {
        QLocalServer::removeServer(path);
    }

    if (!m_server.listen(path)) {
        qWarning() << "Failed to listen on Matchwatch socket" << path
                   << m_server.errorString();
        return false;
    }

    connect(&m_server, &QLocalServer::newConnection,
            this, &MatchwatchApiServer::handleNewConnection);

    qInfo() << "Matchwatch API server listening on" << path;
    return true;
}

void MatchwatchApiServer::handleNewConnection()
{
    while (m_server.hasPendingConnections()) {
        QLocalSocket *socket = m_server.nextPendingConnection();
        if (!socket) {
            continue;
        }
        connect(socket, &QLocalSocket::readyRead,
                this, &MatchwatchApiServer::handleClientReadyRead);
        connect(socket, &QLocalSocket::disconnected,
                socket, &QObject::deleteLater);
    }
}

void MatchwatchApiServer::handleClientReadyRead()
{
    auto *socket = qobject_cast<QLocalSocket *>(sender());
    if (!socket) {
        return;
    }

    const QByteArray payload = socket->readAll();
    if (payload.isEmpty()) {
        return;
    }

    handleRequest(socket, payload);
}

void MatchwatchApiServer::handleRequest(QLocalSocket *socket, const QByteArray &payload)
{
    if (!socket) {
        return;
    }
    const QByteArray response = handleRequestPayload(payload);
    socket->write(response);
    socket->flush();
    socket->disconnectFromServer();
}

QByteArray MatchwatchApiServer::handleRequestPayload(const QByteArray &payload)
{
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    logging::CorrelationScope corrScope(corrId);
    const auto parsed = nlohmann::json::parse(payload.toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        MWLOG_WARN(QStringLiteral("MatchwatchApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QStringLiteral("parse_payload"),
                   QStringLiteral("json_parse"),
                   logging::defaultWho(),
                   corrId,
                   nlohmann::json::object());
        return makeErrorResponse("Invalid JSON payload");
    }

    int id = -1;
    if (parsed.contains("id") && parsed["id"].is_number_integer()) {
        id = parsed["id"].get<int>();
    }

    if (!parsed.contains("method") || !parsed["method"].is_string()) {
        MWLOG_WARN(QStringLiteral("MatchwatchApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QStringLiteral("missing_method"),
                   QStringLiteral("json_parse"),
                   logging::defaultWho(),
                   corrId,
                   nlohmann::json::object());
        return makeErrorResponse("Missing method", id);
    }

    const std::string method = parsed["method"].get<std::string>();
    nlohmann::json params = nlohmann::json::object();
    if (parsed.contains("params")) {
        if (!parsed["params"].is_object()) {
            return makeErrorResponse("Invalid params", id);
        }
        params = parsed["params"];
    }

    MWLOG_INFO(QStringLiteral("MatchwatchApiServer"),
               QStringLiteral("handleRequest"),
               QStringLiteral("api_request_received"),
               QStringLiteral("client_call"),
               QStringLiteral("json_rpc"),
               logging::defaultWho(),
               corrId,
               (nlohmann::json{{"method", method}}));

    const auto start = std::chrono::steady_clock::now();
    try {
        const nlohmann::json result = dispatch(method, params);
        if (result.is_null()) {
            return makeErrorResponse("Unknown method", id);
        }
        MWLOG_INFO(QStringLiteral("MatchwatchApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_completed"),
                   QStringLiteral("client_call"),
                   QStringLiteral("json_rpc"),
                   logging::defaultWho(),
                   corrId,
                   (nlohmann::json{{"method", method},
                                   {"durationMs",
                                    std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::steady_clock::now() - start).count()}}));
        return makeResultResponse(result, id);
    } catch (const InvalidParams &ex) {
        return makeErrorResponse(QString::fromUtf8(ex.what()), id);
    } catch (const std::exception &ex) {
        MWLOG_ERROR(QStringLiteral("MatchwatchApiServer"),
                    QStringLiteral("handleRequest"),
                    QStringLiteral("api_request_error"),
                    QStringLiteral("exception"),
                    QStringLiteral("json_rpc"),
                    logging::defaultWho(),
                    corrId,
                    (nlohmann::json{{"what", ex.what()}}));
        return makeErrorResponse(QString::fromUtf8(ex.what()), id);
    }
}

nlohmann::json MatchwatchApiServer::dispatch(const std::string &method,
                                             const nlohmann::json &params)
{
    nlohmann::json result = nlohmann::json::object();

    if (method == "get_latest_events") {
        result["events"] = m_detector.latestEvents(
            limitParam(params, TacticalEventDetector::kExposedCount));
        return result;
    }

    if (method == "get_tactical_conclusions") {
        const auto conclusions = m_detector.tacticalConclusions(
            limitParam(params, TacticalEventDetector::kExposedCount));
        result["conclusions"] = conclusions;
        result["text"] = conclusionsText(conclusions);
        return result;
    }

    if (method == "clear_event_log") {
        result["cleared"] = m_detector.eventLogSize();
        m_detector.clearEventLog();
        return result;
    }

    if (method == "get_visual_events") {
        result["events"] = m_journal.recentVisualEvents(
            limitParam(params, VisualEventJournal::kDefaultCapacity));
        return result;
    }

    if (method == "get_history") {
        const std::string format = params.value("format", "json");
        const auto entries = m_history.readPersisted();
        if (format == "text") {
            result["text"] = renderHistoryText(entries);
        } else if (format == "json") {
            result["entries"] = entries;
        } else {
            throw InvalidParams("format must be json or text");
        }
        return result;
    }

    if (method == "get_recent_snapshots") {
        result["snapshots"] = m_history.recent(limitParam(params, HistoryStore::kDefaultRecent));
        return result;
    }

    if (method == "get_summary") {
        const auto latest = m_history.latest();
        result["stats"] = statsSummary(latest);
        result["round"] = roundStatus(latest);
        result["conclusions"] = conclusionsText(m_detector.tacticalConclusions());
        return result;
    }

    return nullptr;
}

QByteArray MatchwatchApiServer::makeErrorResponse(const QString &message, int id) const
{
    nlohmann::json response;
    response["error"] = message.toStdString();
    response["id"] = id;
    return QByteArray::fromStdString(response.dump());
}

QByteArray MatchwatchApiServer::makeResultResponse(const nlohmann::json &result, int id) const
{
    nlohmann::json response;
    response["result"] = result;
    response["id"] = id;
    return QByteArray::fromStdString(
        response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

} // namespace matchwatch
