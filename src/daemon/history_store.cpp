#include "daemon/history_store.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace matchwatch {

namespace {

void setError(std::string *errorMessage, const std::string &message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

} // namespace

std::optional<std::vector<HistoryEntry>> loadHistoryFile(const QString &path,
                                                         std::string *errorMessage)
{
    QFile file(path);
    if (!file.exists()) {
        setError(errorMessage, "history file not found: " + path.toStdString());
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        setError(errorMessage, "cannot open history file: " + file.errorString().toStdString());
        return std::nullopt;
    }

    const auto parsed = nlohmann::json::parse(file.readAll().toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        setError(errorMessage, "history file is not a JSON array");
        return std::nullopt;
    }

    std::vector<HistoryEntry> entries;
    entries.reserve(parsed.size());
    try {
        for (const auto &item : parsed) {
            if (!item.is_object()) {
                setError(errorMessage, "history entry is not an object");
                return std::nullopt;
            }
            entries.push_back(item.get<HistoryEntry>());
        }
    } catch (const nlohmann::json::exception &ex) {
        setError(errorMessage, std::string("malformed history entry: ") + ex.what());
        return std::nullopt;
    }
    return entries;
}

HistoryStore::HistoryStore(HistoryConfig config)
    : m_config(std::move(config))
    , m_filePath(QString::fromStdString(m_config.filePath))
    , m_window(m_config.windowSize)
{
}

bool HistoryStore::append(const Snapshot &snapshot)
{
    if (snapshot.players.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_window.push(snapshot);
    persistLocked();
    return true;
}

bool HistoryStore::persistLocked()
{
    if (m_filePath.isEmpty()) {
        return true;
    }

    nlohmann::json entries = nlohmann::json::array();
    for (std::size_t i = 0; i < m_window.size(); ++i) {
        entries.push_back(nlohmann::json(toHistoryEntry(m_window.at(i))));
    }

    auto fail = [this](const QString &why, const QString &detail) {
        ++m_writeFailures;
        MWLOG_ERROR(QStringLiteral("HistoryStore"),
                    QStringLiteral("persist"),
                    QStringLiteral("history_write_failed"),
                    why,
                    QStringLiteral("qsavefile"),
                    logging::defaultWho(),
                    logging::currentCorrelationId(),
                    (nlohmann::json{{"path", m_filePath.toStdString()},
                                    {"detail", detail.toStdString()},
                                    {"failures", m_writeFailures}}));
        return false;
    };

    const QFileInfo info(m_filePath);
    if (!QDir().mkpath(info.absolutePath())) {
        return fail(QStringLiteral("mkdir"), info.absolutePath());
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return fail(QStringLiteral("open"), file.errorString());
    }
    const QByteArray data = QByteArray::fromStdString(
        entries.dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
    if (file.write(data) != data.size()) {
        const QString error = file.errorString();
        file.cancelWriting();
        return fail(QStringLiteral("write"), error);
    }
    if (!file.commit()) {
        return fail(QStringLiteral("commit"), file.errorString());
    }

    MWLOG_DEBUG(QStringLiteral("HistoryStore"),
                QStringLiteral("persist"),
                QStringLiteral("history_written"),
                QStringLiteral("snapshot_accepted"),
                QStringLiteral("qsavefile"),
                logging::defaultWho(),
                logging::currentCorrelationId(),
                (nlohmann::json{{"entries", entries.size()}}));
    return true;
}

std::vector<Snapshot> HistoryStore::recent(std::size_t limit) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_window.newest(limit);
}

std::optional<Snapshot> HistoryStore::latest() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_window.empty()) {
        return std::nullopt;
    }
    return m_window.back();
}

std::size_t HistoryStore::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_window.size();
}

std::size_t HistoryStore::capacity() const
{
    return m_window.capacity();
}

std::vector<HistoryEntry> HistoryStore::readPersisted() const
{
    std::string error;
    auto entries = loadHistoryFile(m_filePath, &error);
    if (!entries.has_value()) {
        MWLOG_DEBUG(QStringLiteral("HistoryStore"),
                    QStringLiteral("readPersisted"),
                    QStringLiteral("history_unreadable"),
                    QStringLiteral("load_failed"),
                    QStringLiteral("json_parse"),
                    logging::defaultWho(),
                    logging::currentCorrelationId(),
                    (nlohmann::json{{"error", error}}));
        return {};
    }
    return *entries;
}

QString HistoryStore::filePath() const
{
    return m_filePath;
}

std::size_t HistoryStore::writeFailures() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_writeFailures;
}

} // namespace matchwatch
