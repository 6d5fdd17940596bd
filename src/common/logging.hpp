#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace testline::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Set up logging for this process. Call once, early in main().
// Debug lines reach the main log only in trace mode; trace mode also mirrors
// every line into <process>-trace.log.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// $TESTLINE_LOG_DIR when set, else $HOME/.local/share/testline/logs.
QString logsDirPath();

void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

/**
 * Runs the enclosed code under one correlation id (one RPC request, one
 * refresh cycle) and tallies the WARN and ERROR lines logged on this thread
 * while it is open, so the caller can report them on its completion line.
 * Scopes nest; an inner scope's lines count for the outer scopes too.
 */
class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope &) = delete;
    CorrelationScope &operator=(const CorrelationScope &) = delete;

    int warnings() const;
    int errors() const;

private:
    friend void logEvent(LogLevel, const QString &, const QString &, const QString &,
                         const QString &, const QString &, const QString &,
                         const QString &, const QString &, const nlohmann::json &);

    QString m_prevCorrId;
    CorrelationScope *m_outer = nullptr;
    int m_warnings = 0;
    int m_errors = 0;
};

// One structured line. Pass empty strings for unknown fields; an empty
// correlationId falls back to the current scope's id.
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

} // namespace testline::logging

#define TLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::testline::logging::logEvent(::testline::logging::LogLevel::Debug, \
                                  ::testline::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::testline::logging::logEvent(::testline::logging::LogLevel::Info, \
                                  ::testline::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::testline::logging::logEvent(::testline::logging::LogLevel::Warn, \
                                  ::testline::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::testline::logging::logEvent(::testline::logging::LogLevel::Error, \
                                  ::testline::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
