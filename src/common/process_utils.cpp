#include "common/process_utils.hpp"

#include <QProcess>
#include <QStandardPaths>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace zverify {

CommandResult ProcessCommandRunner::run(const QString &program,
                                        const QStringList &arguments,
                                        int timeoutMs)
{
    CommandResult result;

    QProcess process;
    process.start(program, arguments);
    if (!process.waitForStarted()) {
        ZLOG_DEBUG(QStringLiteral("ProcessCommandRunner"),
                   QStringLiteral("run"),
                   QStringLiteral("command_start_failed"),
                   QStringLiteral("probe"),
                   QStringLiteral("qprocess"),
                   QString(),
                   QString(),
                   (nlohmann::json{{"program", program.toStdString()},
                                   {"error", process.errorString().toStdString()}}));
        return result;
    }
    result.started = true;

    process.closeWriteChannel();

    if (!process.waitForFinished(timeoutMs)) {
        // Hung tool: kill it and report the timeout.
        process.kill();
        process.waitForFinished(1000);
        result.timedOut = true;
        ZLOG_WARN(QStringLiteral("ProcessCommandRunner"),
                  QStringLiteral("run"),
                  QStringLiteral("command_timeout"),
                  QStringLiteral("probe"),
                  QStringLiteral("qprocess_kill"),
                  QString(),
                  QString(),
                  (nlohmann::json{{"program", program.toStdString()},
                                  {"args", arguments.join(QLatin1Char(' ')).toStdString()},
                                  {"timeoutMs", timeoutMs}}));
        return result;
    }

    if (process.exitStatus() != QProcess::NormalExit) {
        return result;
    }

    result.exitCode = process.exitCode();
    result.output = QString::fromUtf8(process.readAllStandardOutput()).trimmed().toStdString();

    ZLOG_DEBUG(QStringLiteral("ProcessCommandRunner"),
               QStringLiteral("run"),
               QStringLiteral("command_complete"),
               QStringLiteral("probe"),
               QStringLiteral("qprocess"),
               QString(),
               QString(),
               (nlohmann::json{{"program", program.toStdString()},
                               {"args", arguments.join(QLatin1Char(' ')).toStdString()},
                               {"exitCode", result.exitCode},
                               {"bytes", result.output.size()}}));
    return result;
}

bool ProcessCommandRunner::hasCommand(const QString &name)
{
    return !QStandardPaths::findExecutable(name).isEmpty();
}

} // namespace zverify
