#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace testline::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;
// service.log -> service.log.1 -> service.log.2, oldest dropped.
constexpr int kRotatedGenerations = 2;

struct LogState {
    std::mutex mutex;
    QString processName;
    bool traceEnabled = false;
};

LogState &state()
{
    static LogState instance;
    return instance;
}

thread_local QString t_corrId;
thread_local CorrelationScope *t_scope = nullptr;

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

QString logFilePath(const QString &processName, const char *suffix)
{
    const QString base = processName.isEmpty() ? QStringLiteral("testline") : processName;
    return QDir(logsDirPath()).filePath(base + QString::fromLatin1(suffix));
}

void rotateIfNeeded(const QString &path)
{
    const QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    QFile::remove(path + QStringLiteral(".%1").arg(kRotatedGenerations));
    for (int generation = kRotatedGenerations - 1; generation >= 1; --generation) {
        QFile::rename(path + QStringLiteral(".%1").arg(generation),
                      path + QStringLiteral(".%1").arg(generation + 1));
    }
    QFile::rename(path, path + QStringLiteral(".1"));
}

// Caller holds the state mutex.
void appendLine(const QString &path, const QByteArray &line)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line);
    file.write("\n");
}

std::string threadId()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16)
        .toStdString();
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    std::lock_guard<std::mutex> lock(state().mutex);
    state().processName = processName;
    state().traceEnabled = traceEnabled;
}

bool isTraceEnabled()
{
    std::lock_guard<std::mutex> lock(state().mutex);
    return state().traceEnabled;
}

QString logsDirPath()
{
    const QString overridden = qEnvironmentVariable("TESTLINE_LOG_DIR");
    if (!overridden.isEmpty()) {
        return overridden;
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/testline/logs");
    }
    return home + QStringLiteral("/.local/share/testline/logs");
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
    : m_prevCorrId(t_corrId)
    , m_outer(t_scope)
{
    t_corrId = corrId;
    t_scope = this;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prevCorrId;
    t_scope = m_outer;
}

int CorrelationScope::warnings() const
{
    return m_warnings;
}

int CorrelationScope::errors() const
{
    return m_errors;
}

QString defaultProcessName()
{
    {
        std::lock_guard<std::mutex> lock(state().mutex);
        if (!state().processName.isEmpty()) {
            return state().processName;
        }
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("testline");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getuid()));
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
    for (CorrelationScope *scope = t_scope; scope; scope = scope->m_outer) {
        if (level == LogLevel::Warn) {
            scope->m_warnings++;
        } else if (level == LogLevel::Error) {
            scope->m_errors++;
        }
    }

    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const nlohmann::json record = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", process.toStdString()},
        {"thread", threadId()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", (correlationId.isEmpty() ? t_corrId : correlationId).toStdString()},
        {"context", context}
    };
    const QByteArray line = QByteArray::fromStdString(record.dump());

    std::lock_guard<std::mutex> lock(state().mutex);
    if (level != LogLevel::Debug || state().traceEnabled) {
        appendLine(logFilePath(process, ".log"), line);
    }
    if (state().traceEnabled) {
        appendLine(logFilePath(process, "-trace.log"), line);
    }
}

} // namespace testline::logging
