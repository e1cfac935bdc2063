#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace zverify::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current run. Each call opens a new timestamped
// file under logDir; call early in main() once the configuration is known.
void initLogging(const QString &processName, const QString &logDir, bool traceEnabled);

bool isTraceEnabled();

// Path of the log file for the current run; empty before initLogging().
QString currentLogPath();

// Records lost because the log file could not be opened since initLogging().
int droppedRecordCount();

// Correlation support for linking all records of one phase run.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
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

// Audit copy of one line shown to the operator.
void logRenderedLine(const QString &line);

QString defaultProcessName();
QString defaultWho();

} // namespace zverify::logging

#define ZLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::zverify::logging::logEvent(::zverify::logging::LogLevel::Debug, \
                                 ::zverify::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ZLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::zverify::logging::logEvent(::zverify::logging::LogLevel::Info, \
                                 ::zverify::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ZLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::zverify::logging::logEvent(::zverify::logging::LogLevel::Warn, \
                                 ::zverify::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ZLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::zverify::logging::logEvent(::zverify::logging::LogLevel::Error, \
                                 ::zverify::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
