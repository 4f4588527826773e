#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSysInfo>
#include <QThread>
#include <QUuid>

#include <cstdio>
#include <mutex>

namespace archscope::logging {

namespace {

constexpr qint64 kRotateAtBytes = 5 * 1024 * 1024;
constexpr int kRotatedGenerations = 3;

struct LogState {
    std::mutex mutex;
    QString processName;
    bool trace = false;
};

LogState &state()
{
    static LogState instance;
    return instance;
}

thread_local QString t_correlationId;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    }
    return "info";
}

// <name>.log -> <name>.log.1 -> ... -> <name>.log.N, oldest dropped.
void rotate(const QString &path)
{
    const QFileInfo info(path);
    if (!info.exists() || info.size() < kRotateAtBytes) {
        return;
    }
    QFile::remove(path + QStringLiteral(".%1").arg(kRotatedGenerations));
    for (int generation = kRotatedGenerations - 1; generation >= 1; --generation) {
        const QString from = path + QStringLiteral(".%1").arg(generation);
        if (QFile::exists(from)) {
            QFile::rename(from, path + QStringLiteral(".%1").arg(generation + 1));
        }
    }
    QFile::rename(path, path + QStringLiteral(".1"));
}

void appendLine(const QString &path, const QByteArray &line)
{
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }
    rotate(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line);
    file.write("\n");
}

QString threadLabel()
{
    QThread *thread = QThread::currentThread();
    if (thread && !thread->objectName().isEmpty()) {
        return thread->objectName();
    }
    return QString::number(reinterpret_cast<quintptr>(QThread::currentThreadId()), 16);
}

} // namespace

QString logsDirPath()
{
    const QString home = qEnvironmentVariable("HOME");
    const QString relative = QStringLiteral(".local/share/archscope/logs");
    return home.isEmpty() ? relative : QDir(home).filePath(relative);
}

void initLogging(const QString &processName, bool traceEnabled)
{
    LogState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.processName = processName;
    s.trace = traceEnabled;
}

bool isTraceEnabled()
{
    LogState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.trace;
}

void setCorrelationId(const QString &corrId)
{
    t_correlationId = corrId;
}

QString currentCorrelationId()
{
    return t_correlationId;
}

QString newCorrelationId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_correlationId)
{
    t_correlationId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_correlationId = m_prev;
}

QString defaultProcessName()
{
    {
        LogState &s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        if (!s.processName.isEmpty()) {
            return s.processName;
        }
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("archscope");
}

QString defaultWho()
{
    QString user = qEnvironmentVariable("USER");
    if (user.isEmpty()) {
        user = QStringLiteral("unknown");
    }
    return user + QLatin1Char('@') + QSysInfo::machineHostName();
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
    const nlohmann::json event = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", process.toStdString()},
        {"thread", threadLabel().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", (correlationId.isEmpty() ? t_correlationId : correlationId).toStdString()},
        {"context", context},
    };
    const QByteArray line = QByteArray::fromStdString(event.dump());
    const QDir logs(logsDirPath());

    LogState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    // Debug events only exist in trace mode; the trace file mirrors everything.
    if (level != LogLevel::Debug || s.trace) {
        appendLine(logs.filePath(process + QStringLiteral(".log")), line);
    }
    if (s.trace) {
        appendLine(logs.filePath(process + QStringLiteral("-trace.log")), line);
    }
}

} // namespace archscope::logging
