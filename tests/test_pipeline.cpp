#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <algorithm>
#include <memory>
#include <sstream>

#include <nlohmann/json.hpp>

#include "artifact/artifact_store.hpp"
#include "common/config.hpp"
#include "common/logging.hpp"
#include "pipeline/phase_pipelines.hpp"
#include "test_support.hpp"

using namespace zverify;

class PipelineTests : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void testKernelUpdateWithoutPools();
    void testDegradedPoolBlocksUpdate();
    void testNoPendingUpdates();
    void testMissingPackageManager();
    void testPendingQueryFailure();
    void testPostWithoutArtifact();
    void testBootMenuEspUnmounted();
    void testPreThenPostAfterKernelUpdate();
    void testPoolListingTimeoutBlocksUpdate();
    void testArtifactWriteFailure();

private:
    void writeFile(const QString &relativePath, const QByteArray &content);
    void stockHost();
    nlohmann::json runPostJson(int *exitCode);

    std::unique_ptr<QTemporaryDir> m_root;
    Config m_config;
    FakeCommandRunner m_runner;
};

void PipelineTests::writeFile(const QString &relativePath, const QByteArray &content)
{
    const QString path = m_config.sysroot + relativePath;
    QVERIFY(QDir().mkpath(QFileInfo(path).absolutePath()));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write(content);
}

void PipelineTests::init()
{
    m_root = std::make_unique<QTemporaryDir>();
    QVERIFY(m_root->isValid());

    m_config = Config();
    m_config.sysroot = m_root->path() + QStringLiteral("/sysroot");
    m_config.artifactPath = m_root->path() + QStringLiteral("/zfs-update.conf");
    m_config.logDir = m_root->path() + QStringLiteral("/logs");
    m_config.requireRoot = false;
    m_config.syncRepositories = false;
    m_config.runRoundTrip = false;
    // Free space of the test machine must not decide the outcome.
    m_config.thresholds.rootHardMinMb = 0;
    m_config.thresholds.rootSoftMinMb = 0;
    m_config.thresholds.varSoftMinMb = 0;
    QVERIFY(QDir().mkpath(m_config.sysroot + QStringLiteral("/var")));

    logging::initLogging(QStringLiteral("zverify-test"), m_config.logDir, false);
    m_runner = FakeCommandRunner();
}

// Healthy traditional-boot host with the storage stack installed and no pools.
void PipelineTests::stockHost()
{
    for (const char *tool : {"xbps-install", "xbps-query", "uname", "lsmod", "modinfo", "zfs",
                             "zpool", "dracut", "lsinitrd"}) {
        m_runner.addTool(QString::fromLatin1(tool));
    }
    m_runner.respond(QStringLiteral("uname -r"), "6.6.30_1");
    m_runner.respond(QStringLiteral("lsmod"), "Module Size Used by\nzfs 6537216 0\nspl 135168 1 zfs");
    m_runner.respond(QStringLiteral("modinfo zfs"),
                     "version:        2.2.3-1\nvermagic:       6.6.30_1 SMP preempt mod_unload");
    m_runner.respond(QStringLiteral("zfs version"), "zfs-2.2.3-1\nzfs-kmod-2.2.3-1");
    m_runner.respond(QStringLiteral("zpool list -H -o name,health,capacity"), "");
    m_runner.respondToProgram(QStringLiteral("lsinitrd"),
                              "usr/lib/modules/6.6.30_1/extra/zfs/zfs.ko.xz\netc/hostid");
    m_runner.respond(QStringLiteral("xbps-install -un"), "", 6);
    m_runner.respond(QStringLiteral("dracut --version"), "dracut 059");

    writeFile(QStringLiteral("/boot/vmlinuz-6.6.30_1"), "kernel");
    writeFile(QStringLiteral("/boot/initramfs-6.6.30_1.img"), "image");
    writeFile(QStringLiteral("/lib/modules/6.6.30_1/extra/zfs/zfs.ko"), "module");
    writeFile(QStringLiteral("/etc/dracut.conf.d/zfs.conf"),
              "hostonly=\"yes\"\n"
              "add_dracutmodules+=\" zfs \"\n"
              "install_items+=\" /etc/hostid \"\n"
              "force_drivers+=\" zfs \"\n");
    QVERIFY(QDir().mkpath(m_config.sysroot + QStringLiteral("/usr/lib/dracut/modules.d/90zfs")));
}

nlohmann::json PipelineTests::runPostJson(int *exitCode)
{
    m_config.format = QStringLiteral("json");
    std::ostringstream out;
    *exitCode = PostUpdatePipeline(m_config, m_runner, out).run();
    return nlohmann::json::parse(out.str());
}

void PipelineTests::testKernelUpdateWithoutPools()
{
    stockHost();
    m_runner.respond(QStringLiteral("xbps-install -un"),
                     "linux6.6-6.6.31_1 update x86_64 https://repo-default.voidlinux.org/current 1 2");

    std::ostringstream out;
    const int exitCode = PreUpdatePipeline(m_config, m_runner, out).run();
    const QString text = QString::fromStdString(out.str());

    QCOMPARE(exitCode, 0);
    QVERIFY(text.contains(QStringLiteral("Reboot:  expected after update")));
    QVERIFY(!text.contains(QStringLiteral("[FAIL]")));

    const auto artifact = ArtifactStore(m_config.artifactPath).read();
    QVERIFY(artifact.has_value());
    QCOMPARE(artifact->pendingUpdates.kernel, 1);
    QCOMPARE(artifact->pendingUpdates.total, 1);
    QVERIFY(!artifact->poolsExist);
    QCOMPARE(QString::fromStdString(artifact->precheckLog), logging::currentLogPath());

    QFile file(m_config.artifactPath);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QVERIFY(file.readAll().contains("KERNEL_COUNT=1"));
}

void PipelineTests::testDegradedPoolBlocksUpdate()
{
    stockHost();
    m_runner.respond(QStringLiteral("xbps-install -un"), "firefox-126.0_1 update x86_64 r 1 2");
    m_runner.respond(QStringLiteral("zpool list -H -o name,health,capacity"),
                     "tank\tDEGRADED\t55%");
    m_runner.respond(QStringLiteral("zpool status tank"), "  pool: tank\n state: DEGRADED");
    m_runner.respond(QStringLiteral("zfs list -H -o name,mounted,mountpoint,canmount -t filesystem"),
                     "tank\tyes\t/tank\ton");

    std::ostringstream out;
    const int exitCode = PreUpdatePipeline(m_config, m_runner, out).run();
    const QString text = QString::fromStdString(out.str());

    QCOMPARE(exitCode, 1);
    QVERIFY(text.contains(QStringLiteral("[FAIL] pool-health")));
    QVERIFY(text.contains(QStringLiteral("Verdict: BLOCKED")));
    QVERIFY(!QFile::exists(m_config.artifactPath));
}

void PipelineTests::testNoPendingUpdates()
{
    stockHost();

    std::ostringstream out;
    const int exitCode = PreUpdatePipeline(m_config, m_runner, out).run();

    QCOMPARE(exitCode, 0);
    QVERIFY(QString::fromStdString(out.str()).contains(QStringLiteral("No pending updates")));
    QVERIFY(!QFile::exists(m_config.artifactPath));
    QVERIFY(!m_runner.calls().contains(QStringLiteral("lsmod")));
}

void PipelineTests::testMissingPackageManager()
{
    stockHost();
    m_runner.removeTool(QStringLiteral("xbps-query"));

    std::ostringstream out;
    const int exitCode = PreUpdatePipeline(m_config, m_runner, out).run();

    QCOMPARE(exitCode, 1);
    QVERIFY(QString::fromStdString(out.str())
                .contains(QStringLiteral("[ERROR] required command not found: xbps-query")));
    QVERIFY(!m_runner.calls().contains(QStringLiteral("xbps-install -un")));
}

void PipelineTests::testPendingQueryFailure()
{
    stockHost();
    m_config.syncRepositories = true;
    m_runner.respond(QStringLiteral("xbps-install -S"), "ERROR: failed to fetch", 1);

    std::ostringstream out;
    QCOMPARE(PreUpdatePipeline(m_config, m_runner, out).run(), 1);
    QVERIFY(QString::fromStdString(out.str()).contains(QStringLiteral("[ERROR]")));
    QVERIFY(!QFile::exists(m_config.artifactPath));
}

void PipelineTests::testPostWithoutArtifact()
{
    stockHost();

    int exitCode = -1;
    const auto payload = runPostJson(&exitCode);
    QCOMPARE(exitCode, 0);

    std::vector<std::string> names;
    for (const auto &result : payload.at("checks").at("results")) {
        names.push_back(result.at("check").get<std::string>());
    }
    const auto skipped = payload.at("checks").at("skipped").get<std::vector<std::string>>();
    for (const std::string drift : {"pool-presence-drift", "boot-method-drift",
                                    "kernel-update-activation"}) {
        QVERIFY(std::find(names.begin(), names.end(), drift) == names.end());
        QVERIFY(std::find(skipped.begin(), skipped.end(), drift) != skipped.end());
    }
    QVERIFY(std::find(names.begin(), names.end(), "storage-module-loaded") != names.end());
    QVERIFY(!payload.at("assessment").at("priorStateKnown").get<bool>());
    QCOMPARE(QString::fromStdString(payload.at("assessment").at("status").get<std::string>()),
             QStringLiteral("ready"));
}

void PipelineTests::testBootMenuEspUnmounted()
{
    stockHost();
    m_runner.addTool(QStringLiteral("generate-zbm"));
    m_runner.addTool(QStringLiteral("findmnt"));
    m_runner.addTool(QStringLiteral("blkid"));
    m_runner.respond(QStringLiteral("xbps-install -un"), "zfsbootmenu-2.3.0_1 update noarch r 1 2");

    std::ostringstream out;
    const int exitCode = PreUpdatePipeline(m_config, m_runner, out).run();
    const QString text = QString::fromStdString(out.str());

    QCOMPARE(exitCode, 1);
    QVERIFY(text.contains(QStringLiteral("[FAIL] boot-menu-esp")));
    QVERIFY(!QFile::exists(m_config.artifactPath));
}

void PipelineTests::testPreThenPostAfterKernelUpdate()
{
    stockHost();
    m_runner.respond(QStringLiteral("xbps-install -un"),
                     "linux6.6-6.6.31_1 update x86_64 r 1 2\nlinux6.6-headers-6.6.31_1 update x86_64 r 1 2");

    std::ostringstream preOut;
    QCOMPARE(PreUpdatePipeline(m_config, m_runner, preOut).run(), 0);
    QVERIFY(QFile::exists(m_config.artifactPath));

    // The update installed a newer kernel; the old one is still running.
    writeFile(QStringLiteral("/boot/vmlinuz-6.6.31_1"), "kernel");

    int exitCode = -1;
    const auto payload = runPostJson(&exitCode);
    QCOMPARE(exitCode, 0);
    QVERIFY(payload.at("assessment").at("priorStateKnown").get<bool>());
    QVERIFY(payload.at("assessment").at("kernelMismatch").get<bool>());
    QCOMPARE(QString::fromStdString(payload.at("assessment").at("status").get<std::string>()),
             QStringLiteral("reboot_required"));
    QCOMPARE(payload.at("priorState").at("kernel").get<std::string>(), std::string("6.6.30_1"));
}

void PipelineTests::testPoolListingTimeoutBlocksUpdate()
{
    stockHost();
    m_runner.respond(QStringLiteral("xbps-install -un"), "firefox-126.0_1 update x86_64 r 1 2");
    m_runner.timeOut(QStringLiteral("zpool list -H -o name,health,capacity"));

    std::ostringstream out;
    const int exitCode = PreUpdatePipeline(m_config, m_runner, out).run();
    const QString text = QString::fromStdString(out.str());

    QCOMPARE(exitCode, 1);
    QVERIFY(text.contains(QStringLiteral("[FAIL] pool-accessibility")));
    QVERIFY(text.contains(QStringLiteral("timed out")));
    QVERIFY(text.contains(QStringLiteral("Verdict: BLOCKED")));
    QVERIFY(!QFile::exists(m_config.artifactPath));
}

void PipelineTests::testArtifactWriteFailure()
{
    stockHost();
    m_runner.respond(QStringLiteral("xbps-install -un"), "firefox-126.0_1 update x86_64 r 1 2");
    // A regular file where the artifact directory should be.
    const QString blocker = m_root->path() + QStringLiteral("/blocker");
    QFile file(blocker);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.close();
    m_config.artifactPath = blocker + QStringLiteral("/zfs-update.conf");

    std::ostringstream out;
    const int exitCode = PreUpdatePipeline(m_config, m_runner, out).run();
    const QString text = QString::fromStdString(out.str());

    QCOMPARE(exitCode, 1);
    QVERIFY(!text.contains(QStringLiteral("[FAIL]")));
    QVERIFY(text.contains(QStringLiteral("could not save state")));
    QVERIFY(!QFile::exists(m_config.artifactPath));
}

QTEST_MAIN(PipelineTests)
#include "test_pipeline.moc"
