#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace archscope::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Events go to $HOME/.local/share/archscope/logs/<process>.log as one JSON
// object per line. With trace enabled, debug events are written as well and
// every event is mirrored to <process>-trace.log.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Correlation ids are thread-local. One extraction run shares one id across
// the files it processes.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();
QString newCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope &) = delete;
    CorrelationScope &operator=(const CorrelationScope &) = delete;

private:
    QString m_prev;
};

// An empty correlationId falls back to the current thread's id.
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
QString defaultWho();
QString logsDirPath();

} // namespace archscope::logging

// The context argument is a single macro parameter: wrap braced JSON in
// parentheses.
#define ALOG_EVENT(level, component, where, what, why, how, who, corr, ctxJson) \
    ::archscope::logging::logEvent((level), ::archscope::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), \
                                   (ctxJson))

#define ALOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ALOG_EVENT(::archscope::logging::LogLevel::Debug, component, where, what, why, how, who, corr, ctxJson)

#define ALOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ALOG_EVENT(::archscope::logging::LogLevel::Info, component, where, what, why, how, who, corr, ctxJson)

#define ALOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ALOG_EVENT(::archscope::logging::LogLevel::Warn, component, where, what, why, how, who, corr, ctxJson)

#define ALOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ALOG_EVENT(::archscope::logging::LogLevel::Error, component, where, what, why, how, who, corr, ctxJson)
