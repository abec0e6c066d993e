#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace matchwatch::logging {

// Debug lines are only written when trace mode is on.
enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Names the log files ($HOME/.local/share/matchwatch/logs/<processName>.log,
// plus <processName>-trace.log in trace mode). matchwatch-daemon and
// matchwatch-report call this first thing in main(); the daemon calls it again
// once --trace / MATCHWATCH_TRACE has been resolved from the full config.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Correlation ids are per thread. The poller opens one scope per poll tick and
// the API server one per request, so every line a tick or request produces
// (detector, history store, sink) carries the same "corr" value.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Writes one JSON line. `component` is the pipeline stage (StatePoller,
// FrameClassifier, HistoryStore, ...), `where` the method, `what` a
// snake_case event name, `why` the trigger (poll_tick, cooldown,
// stop_requested), `how` the mechanism. An empty correlationId falls back to
// the current scope. `context` may hold raw feed or model text.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
// "host:<hostname>,uid:<uid>" of the watching process.
QString defaultWho();
QString logsDirPath();

} // namespace matchwatch::logging

#define MWLOG_AT(level, component, where, what, why, how, who, corr, ctxJson) \
    ::matchwatch::logging::logEvent(::matchwatch::logging::LogLevel::level, \
                                    ::matchwatch::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define MWLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    MWLOG_AT(Debug, component, where, what, why, how, who, corr, ctxJson)
#define MWLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    MWLOG_AT(Info, component, where, what, why, how, who, corr, ctxJson)
#define MWLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    MWLOG_AT(Warn, component, where, what, why, how, who, corr, ctxJson)
#define MWLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    MWLOG_AT(Error, component, where, what, why, how, who, corr, ctxJson)
