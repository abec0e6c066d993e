#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <cstdio>
#include <map>
#include <memory>
#include <mutex>

namespace matchwatch::logging {

namespace {

constexpr qint64 kRotateAtBytes = 5 * 1024 * 1024;
const QString kFallbackProcess = QStringLiteral("matchwatch");

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

// Owns the open log files of this process. Files stay open between events and
// are reopened when the log directory changes or a file is rotated.
class LogSink
{
public:
    void configure(const QString &processName, bool traceEnabled)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_processName = processName;
        m_traceEnabled = traceEnabled;
    }

    bool traceEnabled() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_traceEnabled;
    }

    QString processName() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_processName;
    }

    void write(LogLevel level, const QString &process, const QByteArray &line)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (level == LogLevel::Debug && !m_traceEnabled) {
            return;
        }

        const QString dir = logsDirPath();
        const QString base = dir + QDir::separator() + (process.isEmpty() ? kFallbackProcess : process);
        append(dir, base + QStringLiteral(".log"), line);
        if (m_traceEnabled) {
            append(dir, base + QStringLiteral("-trace.log"), line);
        }
    }

private:
    void append(const QString &dir, const QString &path, const QByteArray &line)
    {
        QFile *file = openFile(dir, path);
        if (file == nullptr) {
            std::fprintf(stderr, "%s\n", line.constData());
            return;
        }

        if (file->size() >= kRotateAtBytes) {
            file->close();
            const QString rotated = path + QStringLiteral(".1");
            QFile::remove(rotated);
            QFile::rename(path, rotated);
            if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                m_files.erase(path);
                std::fprintf(stderr, "%s\n", line.constData());
                return;
            }
        }

        file->write(line);
        file->write("\n");
        file->flush();
    }

    QFile *openFile(const QString &dir, const QString &path)
    {
        auto it = m_files.find(path);
        if (it != m_files.end()) {
            // The file may have been removed underneath us (tests wipe HOME).
            if (QFileInfo::exists(path)) {
                return it->second.get();
            }
            m_files.erase(it);
        }

        QDir().mkpath(dir);
        auto file = std::make_unique<QFile>(path);
        if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            return nullptr;
        }
        QFile *raw = file.get();
        m_files.emplace(path, std::move(file));
        return raw;
    }

    mutable std::mutex m_mutex;
    QString m_processName;
    bool m_traceEnabled = false;
    std::map<QString, std::unique_ptr<QFile>> m_files;
};

LogSink &sink()
{
    static LogSink instance;
    return instance;
}

thread_local QString t_corrId;

std::string threadTag()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16)
        .toStdString();
}

} // namespace

QString logsDirPath()
{
    const QString home = qEnvironmentVariable("HOME");
    const QString relative = QStringLiteral(".local/share/matchwatch/logs");
    return home.isEmpty() ? relative : home + QLatin1Char('/') + relative;
}

void initLogging(const QString &processName, bool traceEnabled)
{
    sink().configure(processName, traceEnabled);
}

bool isTraceEnabled()
{
    return sink().traceEnabled();
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    const QString configured = sink().processName();
    if (!configured.isEmpty()) {
        return configured;
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return kFallbackProcess;
}

QString defaultWho()
{
    static const QString who = [] {
        char hostname[256] = {};
        if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
            hostname[0] = '\0';
        }
        return QStringLiteral("host:%1,uid:%2")
            .arg(QString::fromUtf8(hostname))
            .arg(static_cast<int>(getuid()));
    }();
    return who;
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;

    nlohmann::json record;
    record["ts"] = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString();
    record["level"] = levelName(level);
    record["process"] = process.toStdString();
    record["thread"] = threadTag();
    record["component"] = component.toStdString();
    record["where"] = where.toStdString();
    record["what"] = what.toStdString();
    record["why"] = why.toStdString();
    record["how"] = how.toStdString();
    record["who"] = who.toStdString();
    record["corr"] = (correlationId.isEmpty() ? t_corrId : correlationId).toStdString();
    record["context"] = context;

    // Context may carry raw remote text; invalid UTF-8 is replaced, not thrown.
    const std::string line = record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    sink().write(level, process, QByteArray::fromStdString(line));
}

} // namespace matchwatch::logging
