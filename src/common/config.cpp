#include "common/config.hpp"

#include <QDir>

#include <limits>

namespace zverify {

namespace {

// Largest timeout whose millisecond value still fits in an int.
constexpr int kMaxTimeoutSeconds = std::numeric_limits<int>::max() / 1000;

bool envFlag(const char *name)
{
    return qEnvironmentVariableIntValue(name) == 1;
}

int envSeconds(const char *name, int fallbackMs)
{
    bool ok = false;
    const int seconds = qEnvironmentVariableIntValue(name, &ok);
    if (!ok || seconds <= 0 || seconds > kMaxTimeoutSeconds) {
        return fallbackMs;
    }
    return seconds * 1000;
}

} // namespace

QString Config::hostPath(const QString &path) const
{
    if (sysroot.isEmpty()) {
        return path;
    }
    return QDir::cleanPath(sysroot + QLatin1Char('/') + path);
}

Config loadConfig()
{
    Config cfg;

    const QString artifact = qEnvironmentVariable("ZVERIFY_ARTIFACT_PATH");
    if (!artifact.isEmpty()) {
        cfg.artifactPath = artifact;
    }
    const QString logDir = qEnvironmentVariable("ZVERIFY_LOG_DIR");
    if (!logDir.isEmpty()) {
        cfg.logDir = logDir;
    }
    cfg.sysroot = qEnvironmentVariable("ZVERIFY_SYSROOT");

    cfg.toolTimeoutMs = envSeconds("ZVERIFY_TOOL_TIMEOUT_SEC", cfg.toolTimeoutMs);
    cfg.syncTimeoutMs = envSeconds("ZVERIFY_SYNC_TIMEOUT_SEC", cfg.syncTimeoutMs);

    cfg.trace = envFlag("ZVERIFY_TRACE");
    cfg.requireRoot = !envFlag("ZVERIFY_SKIP_ROOT_CHECK");
    cfg.syncRepositories = !envFlag("ZVERIFY_NO_SYNC");
    cfg.runRoundTrip = !envFlag("ZVERIFY_NO_ROUNDTRIP");
    return cfg;
}

QString applyArguments(Config &cfg, const QStringList &args)
{
    for (int i = 0; i < args.size(); ++i) {
        const QString &arg = args.at(i);

        if (arg == QStringLiteral("--no-sync")) {
            cfg.syncRepositories = false;
            continue;
        }
        if (arg == QStringLiteral("--no-roundtrip")) {
            cfg.runRoundTrip = false;
            continue;
        }
        if (arg == QStringLiteral("--trace")) {
            cfg.trace = true;
            continue;
        }

        const bool takesValue = arg == QStringLiteral("--format")
            || arg == QStringLiteral("--artifact")
            || arg == QStringLiteral("--log-dir")
            || arg == QStringLiteral("--sysroot")
            || arg == QStringLiteral("--timeout");
        if (!takesValue) {
            return QStringLiteral("Unknown option: %1").arg(arg);
        }
        if (i + 1 >= args.size()) {
            return QStringLiteral("Missing value for %1").arg(arg);
        }
        const QString value = args.at(++i);

        if (arg == QStringLiteral("--format")) {
            const QString format = value.toLower();
            if (format != QStringLiteral("text") && format != QStringLiteral("json")) {
                return QStringLiteral("Invalid format. Use text or json.");
            }
            cfg.format = format;
        } else if (arg == QStringLiteral("--artifact")) {
            cfg.artifactPath = value;
        } else if (arg == QStringLiteral("--log-dir")) {
            cfg.logDir = value;
        } else if (arg == QStringLiteral("--sysroot")) {
            cfg.sysroot = value;
        } else {
            bool ok = false;
            const int seconds = value.toInt(&ok);
            if (!ok || seconds <= 0 || seconds > kMaxTimeoutSeconds) {
                return QStringLiteral("Invalid timeout: %1").arg(value);
            }
            cfg.toolTimeoutMs = seconds * 1000;
        }
    }
    return QString();
}

} // namespace zverify
