#pragma once

#include <QString>
#include <QStringList>

namespace zverify {

struct Thresholds {
    long long rootHardMinMb = 1024;
    long long rootSoftMinMb = 2048;
    long long varSoftMinMb = 2048;
    long long espSoftMinMb = 100;
    int poolCapacityWarnPercent = 80;
    int poolCapacityFailPercent = 90;
};

struct Config {
    QString artifactPath = QStringLiteral("/etc/zfs-update.conf");
    QString logDir = QStringLiteral("/var/log/zverify");
    // Prefix applied to every host file the probe inspects.
    QString sysroot;

    QString bootMenuConfigPath = QStringLiteral("/etc/zfsbootmenu/config.yaml");
    QString keyFilePath = QStringLiteral("/etc/zfs/zroot.key");
    QString hostIdPath = QStringLiteral("/etc/hostid");
    QString dracutConfigPath = QStringLiteral("/etc/dracut.conf.d/zfs.conf");
    QStringList dracutModuleDirs = {
        QStringLiteral("/usr/lib/dracut/modules.d"),
        QStringLiteral("/usr/share/dracut/modules.d"),
    };
    QStringList espCandidates = {
        QStringLiteral("/boot/efi"),
        QStringLiteral("/boot"),
        QStringLiteral("/efi"),
    };
    QString serviceDir = QStringLiteral("/etc/runit/runsvdir/default");
    QStringList storageServices = {
        QStringLiteral("zfs-import"),
        QStringLiteral("zfs-mount"),
        QStringLiteral("zfs-zed"),
    };

    int toolTimeoutMs = 60 * 1000;
    int syncTimeoutMs = 600 * 1000;

    Thresholds thresholds;

    bool requireRoot = true;
    bool syncRepositories = true;
    bool runRoundTrip = true;
    bool trace = false;
    QString format = QStringLiteral("text");

    // Resolve an absolute host path against sysroot.
    QString hostPath(const QString &path) const;
};

// Build a Config from ZVERIFY_* environment variables over the defaults.
Config loadConfig();

// Apply command-line flags on top of cfg. Returns an error message for an
// unknown flag or a bad value, an empty string on success.
QString applyArguments(Config &cfg, const QStringList &args);

} // namespace zverify
