#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace zverify::logging {

namespace {

std::mutex g_logMutex;
bool g_traceEnabled = false;
QString g_processName;
QString g_logDir;
QString g_logPath;
int g_droppedRecords = 0;

thread_local QString t_corrId;

QString levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

// One file per run; the name carries the start time so concurrent or
// repeated runs never share a file.
QString runLogPath(const QString &logDir, const QString &processName)
{
    const QString base = processName.isEmpty()
        ? QStringLiteral("zverify")
        : processName;
    const QString stamp =
        QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd-HHmmss"));
    return logDir + QDir::separator() + base + QLatin1Char('-') + stamp
        + QStringLiteral(".log");
}

void writeLine(const QString &line)
{
    if (g_logPath.isEmpty()) {
        fprintf(stderr, "%s\n", line.toUtf8().constData());
        return;
    }

    QDir().mkpath(g_logDir);

    QFile file(g_logPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        // Operator output already reaches stdout; say once that the run log is lost.
        if (g_droppedRecords == 0) {
            fprintf(stderr, "zverify: cannot write log file %s: %s\n",
                    g_logPath.toUtf8().constData(),
                    file.errorString().toUtf8().constData());
        }
        ++g_droppedRecords;
        return;
    }

    file.write(line.toUtf8());
    file.write("\n");
}

} // namespace

void initLogging(const QString &processName, const QString &logDir, bool traceEnabled)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = processName;
    g_traceEnabled = traceEnabled;
    g_logDir = logDir;
    g_logPath = logDir.isEmpty() ? QString() : runLogPath(logDir, processName);
    g_droppedRecords = 0;
}

bool isTraceEnabled()
{
    return g_traceEnabled;
}

QString currentLogPath()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_logPath;
}

int droppedRecordCount()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_droppedRecords;
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
    if (!g_processName.isEmpty()) {
        return g_processName;
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("zverify");
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
    if (level == LogLevel::Debug && !g_traceEnabled) {
        return;
    }

    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;
    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", processName.toStdString()},
        {"pid", static_cast<int>(getpid())},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };

    const QString line = QString::fromStdString(payload.dump());

    std::lock_guard<std::mutex> lock(g_logMutex);
    writeLine(line);
}

void logRenderedLine(const QString &line)
{
    logEvent(LogLevel::Info,
             defaultProcessName(),
             QStringLiteral("Reporter"),
             QStringLiteral("render"),
             QStringLiteral("rendered_line"),
             QStringLiteral("operator_output"),
             QStringLiteral("report"),
             QString(),
             QString(),
             nlohmann::json{{"text", line.toStdString()}});
}

} // namespace zverify::logging
