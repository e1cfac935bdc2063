#include "probe/system_probe.hpp"

#include <chrono>
#include <vector>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStorageInfo>
#include <QSysInfo>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "probe/tool_parsers.hpp"

namespace zverify {

namespace {

constexpr const char *kStorageModule = "zfs";
constexpr long long kBytesPerMb = 1024 * 1024;

std::optional<long long> freeMegabytes(const QString &path)
{
    if (!QFileInfo::exists(path)) {
        return std::nullopt;
    }
    QStorageInfo storage(path);
    if (!storage.isValid() || !storage.isReady()) {
        return std::nullopt;
    }
    return storage.bytesAvailable() / kBytesPerMb;
}

bool outputContains(const std::string &output, const char *needle)
{
    return output.find(needle) != std::string::npos;
}

} // namespace

SystemProbe::SystemProbe(const Config &config, CommandRunner &runner)
    : m_config(config)
    , m_runner(runner)
{
}

CommandResult SystemProbe::query(const QString &program, const QStringList &arguments)
{
    return m_runner.run(program, arguments, m_config.toolTimeoutMs);
}

std::optional<PendingUpdateCounts> SystemProbe::queryPendingUpdates(bool syncRepositories,
                                                                    std::string *error)
{
    if (syncRepositories) {
        const CommandResult sync = m_runner.run(QStringLiteral("xbps-install"),
                                                {QStringLiteral("-S")},
                                                m_config.syncTimeoutMs);
        if (!sync.ok()) {
            if (error) {
                *error = sync.timedOut ? "repository sync timed out"
                                       : "failed to sync package repositories";
            }
            return std::nullopt;
        }
    }

    // xbps-install exits non-zero when there is nothing to do, so only a
    // process that never ran (or hung) counts as a failed query.
    const CommandResult updates = query(QStringLiteral("xbps-install"), {QStringLiteral("-un")});
    if (!updates.started || updates.timedOut) {
        if (error) {
            *error = updates.timedOut ? "package update query timed out"
                                      : "could not run xbps-install";
        }
        return std::nullopt;
    }

    PendingUpdateCounts counts = parsePendingUpdates(updates.output);
    ZLOG_INFO(QStringLiteral("SystemProbe"),
              QStringLiteral("queryPendingUpdates"),
              QStringLiteral("pending_updates"),
              QStringLiteral("pre_update_phase"),
              QStringLiteral("xbps_install_dry_run"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"total", counts.total},
                              {"kernel", counts.kernel},
                              {"storage", counts.storage},
                              {"bootmenu", counts.bootMenu},
                              {"initramfsBuilder", counts.initramfsBuilder}}));
    return counts;
}

SystemSnapshot SystemProbe::collect(const ProbeOptions &options,
                                    const PendingUpdateCounts &pendingUpdates)
{
    SystemSnapshot snapshot;
    snapshot.timestamp = std::chrono::system_clock::now();
    const auto epochMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                             snapshot.timestamp.time_since_epoch())
                             .count();
    snapshot.id = "snapshot-" + std::to_string(epochMs);

    const QString hostname = QSysInfo::machineHostName();
    if (!hostname.isEmpty()) {
        snapshot.hostname = hostname.toStdString();
    }

    probeKernel(snapshot);
    probeStorageStack(snapshot);
    probePools(snapshot);
    probeBootMenu(snapshot);
    probeInitramfs(snapshot);
    probeHostFiles(snapshot);
    probeDiskSpace(snapshot);
    probeServices(snapshot);

    if (options.runRoundTrip && !snapshot.pools.empty()
        && snapshot.missingUserlandTools.empty()) {
        snapshot.roundTrip = runRoundTrip(snapshot.pools.front().name);
    }

    snapshot.pendingUpdates = pendingUpdates;

    ZLOG_INFO(QStringLiteral("SystemProbe"),
              QStringLiteral("collect"),
              QStringLiteral("snapshot_collected"),
              QStringLiteral("verification_run"),
              QStringLiteral("external_tools"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"id", snapshot.id},
                              {"runningKernel", snapshot.runningKernelVersion},
                              {"latestKernel", snapshot.latestInstalledKernelVersion},
                              {"pools", snapshot.pools.size()},
                              {"datasets", snapshot.datasets.size()},
                              {"bootMenu", snapshot.bootMethod == BootMethod::BootMenu}}));
    return snapshot;
}

void SystemProbe::probeKernel(SystemSnapshot &snapshot)
{
    const CommandResult uname = query(QStringLiteral("uname"), {QStringLiteral("-r")});
    if (uname.ok() && !uname.output.empty()) {
        snapshot.runningKernelVersion = uname.output;
    }

    const QDir bootDir(m_config.hostPath(QStringLiteral("/boot")));
    const QStringList images = bootDir.entryList({QStringLiteral("vmlinuz-*")},
                                                 QDir::Files);
    std::vector<std::string> names;
    names.reserve(images.size());
    for (const QString &image : images) {
        names.push_back(image.toStdString());
    }
    snapshot.latestInstalledKernelVersion = pickLatestKernel(names);
}

void SystemProbe::probeStorageStack(SystemSnapshot &snapshot)
{
    const CommandResult lsmod = query(QStringLiteral("lsmod"), {});
    if (lsmod.ok()) {
        snapshot.storageModuleLoaded = parseModuleLoaded(lsmod.output, kStorageModule);
    }

    const CommandResult modinfo = query(QStringLiteral("modinfo"),
                                        {QString::fromLatin1(kStorageModule)});
    if (modinfo.ok()) {
        snapshot.storageModuleVersion = parseModinfoField(modinfo.output, "version");
        snapshot.storageModuleKernel = parseModinfoField(modinfo.output, "vermagic");
    }

    if (snapshot.runningKernelVersion != kUnknown) {
        const std::string moduleRoot = "/lib/modules/" + snapshot.runningKernelVersion;
        snapshot.storageModuleFilePresent = false;
        snapshot.storageModuleFilePath = moduleRoot + "/extra/zfs/zfs.ko";
        for (const char *subdir : {"/extra/zfs", "/updates/dkms"}) {
            for (const char *suffix : {"", ".xz", ".zst", ".gz"}) {
                const std::string candidate = moduleRoot + subdir + "/zfs.ko" + suffix;
                if (QFileInfo::exists(m_config.hostPath(QString::fromStdString(candidate)))) {
                    snapshot.storageModuleFilePresent = true;
                    snapshot.storageModuleFilePath = candidate;
                    break;
                }
            }
            if (*snapshot.storageModuleFilePresent) {
                break;
            }
        }
    }

    for (const char *tool : {"zfs", "zpool"}) {
        if (!m_runner.hasCommand(QString::fromLatin1(tool))) {
            snapshot.missingUserlandTools.push_back(tool);
        }
    }

    if (m_runner.hasCommand(QStringLiteral("zfs"))) {
        const CommandResult version = query(QStringLiteral("zfs"), {QStringLiteral("version")});
        if (version.ok()) {
            snapshot.storageUserlandVersion = parseUserlandVersion(version.output);
        }
    }
}

void SystemProbe::probePools(SystemSnapshot &snapshot)
{
    if (!m_runner.hasCommand(QStringLiteral("zpool"))) {
        return;
    }

    const CommandResult list = query(QStringLiteral("zpool"),
                                     {QStringLiteral("list"), QStringLiteral("-H"),
                                      QStringLiteral("-o"),
                                      QStringLiteral("name,health,capacity")});
    snapshot.poolListingOk = list.ok();
    if (!list.ok()) {
        if (list.timedOut) {
            snapshot.poolListingError = "zpool list timed out";
        } else if (!list.started) {
            snapshot.poolListingError = "zpool list could not be started";
        } else {
            snapshot.poolListingError = "zpool list exited with status "
                + std::to_string(list.exitCode);
        }
        ZLOG_WARN(QStringLiteral("SystemProbe"),
                  QStringLiteral("probePools"),
                  QStringLiteral("pool_listing_failed"),
                  QStringLiteral("verification_run"),
                  QStringLiteral("zpool_list"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"exitCode", list.exitCode}, {"timedOut", list.timedOut}}));
        return;
    }

    snapshot.pools = parsePoolList(list.output);
    for (auto &pool : snapshot.pools) {
        const CommandResult status = query(QStringLiteral("zpool"),
                                           {QStringLiteral("status"),
                                            QString::fromStdString(pool.name)});
        pool.statusOk = status.ok();

        const CommandResult cacheFile = query(QStringLiteral("zpool"),
                                              {QStringLiteral("get"), QStringLiteral("-H"),
                                               QStringLiteral("-o"), QStringLiteral("value"),
                                               QStringLiteral("cachefile"),
                                               QString::fromStdString(pool.name)});
        if (cacheFile.ok()) {
            pool.cacheFile = parsePropertyValue(cacheFile.output);
        }
    }

    if (snapshot.pools.empty() || !m_runner.hasCommand(QStringLiteral("zfs"))) {
        return;
    }

    const CommandResult datasets = query(QStringLiteral("zfs"),
                                         {QStringLiteral("list"), QStringLiteral("-H"),
                                          QStringLiteral("-o"),
                                          QStringLiteral("name,mounted,mountpoint,canmount"),
                                          QStringLiteral("-t"), QStringLiteral("filesystem")});
    if (datasets.ok()) {
        snapshot.datasets = parseDatasetList(datasets.output);
    }

    const CommandResult snapshots = query(QStringLiteral("zfs"),
                                          {QStringLiteral("list"), QStringLiteral("-H"),
                                           QStringLiteral("-t"), QStringLiteral("snapshot"),
                                           QStringLiteral("-o"), QStringLiteral("name")});
    if (snapshots.ok()) {
        snapshot.snapshotCount = countListedLines(snapshots.output);
    }
}

void SystemProbe::probeBootMenu(SystemSnapshot &snapshot)
{
    if (!m_runner.hasCommand(QStringLiteral("generate-zbm"))) {
        snapshot.bootMethod = BootMethod::Traditional;
        return;
    }
    snapshot.bootMethod = BootMethod::BootMenu;

    QFile bootMenuConfig(m_config.hostPath(m_config.bootMenuConfigPath));
    if (bootMenuConfig.open(QIODevice::ReadOnly | QIODevice::Text)) {
        snapshot.bootMenuConfigPresent = true;
        snapshot.bootMenuConfigValid =
            bootMenuConfigLooksValid(bootMenuConfig.readAll().toStdString());
    }

    for (const QString &candidate : m_config.espCandidates) {
        const CommandResult fsType = query(QStringLiteral("findmnt"),
                                           {QStringLiteral("-n"), QStringLiteral("-o"),
                                            QStringLiteral("FSTYPE"), candidate});
        if (fsType.ok() && fsType.output == "vfat") {
            snapshot.espMounted = true;
            snapshot.espPath = candidate.toStdString();
            break;
        }
    }

    if (!snapshot.espMounted) {
        const CommandResult blkid = query(QStringLiteral("blkid"),
                                          {QStringLiteral("-t"), QStringLiteral("TYPE=vfat")});
        if (blkid.ok()) {
            snapshot.espCandidateDevice = parseBlkidVfatDevice(blkid.output);
        }
    } else {
        const QString espPath = m_config.hostPath(QString::fromStdString(snapshot.espPath));
        snapshot.espFreeMb = freeMegabytes(espPath);
        const QString zbmDir = espPath + QStringLiteral("/EFI/ZBM");
        snapshot.bootMenuImagePresent =
            QFileInfo::exists(zbmDir + QStringLiteral("/vmlinuz.efi"));
        snapshot.bootMenuBackupPresent =
            QFileInfo::exists(zbmDir + QStringLiteral("/vmlinuz-backup.efi"));
    }

    if (m_runner.hasCommand(QStringLiteral("efibootmgr"))) {
        const CommandResult entries = query(QStringLiteral("efibootmgr"), {});
        if (entries.ok() && !entries.output.empty()) {
            snapshot.bootMenuEfiEntryPresent = efiEntriesMention(entries.output);
        }
    }
}

void SystemProbe::probeInitramfs(SystemSnapshot &snapshot)
{
    snapshot.initramfsBuilderPresent = m_runner.hasCommand(QStringLiteral("dracut"));
    if (snapshot.initramfsBuilderPresent) {
        probeInitramfsBuilder(snapshot);
    }

    if (snapshot.runningKernelVersion == kUnknown) {
        return;
    }

    snapshot.initramfsPath = "/boot/initramfs-" + snapshot.runningKernelVersion + ".img";
    const QString imagePath = m_config.hostPath(QString::fromStdString(snapshot.initramfsPath));
    snapshot.initramfsImagePresent = QFileInfo::exists(imagePath);
    if (!*snapshot.initramfsImagePresent || !m_runner.hasCommand(QStringLiteral("lsinitrd"))) {
        return;
    }

    const CommandResult listing = query(QStringLiteral("lsinitrd"), {imagePath});
    if (!listing.ok() || listing.output.empty()) {
        return;
    }
    snapshot.initramfsHasStorageModule = outputContains(listing.output, "zfs.ko");
    snapshot.initramfsHasHostId = outputContains(listing.output, "etc/hostid");
}

void SystemProbe::probeInitramfsBuilder(SystemSnapshot &snapshot)
{
    const CommandResult version = query(QStringLiteral("dracut"), {QStringLiteral("--version")});
    if (version.ok()) {
        snapshot.initramfsBuilderVersion = parseDracutVersion(version.output);
    }

    QFile config(m_config.hostPath(m_config.dracutConfigPath));
    if (config.open(QIODevice::ReadOnly | QIODevice::Text)) {
        snapshot.initramfsConfigPresent = true;

        std::vector<std::string> required = {
            "add_dracutmodules+=\" zfs \"",
            "install_items+=\" /etc/hostid",
            "force_drivers+=\" zfs",
        };
        // Only encrypted roots need the key inside the image.
        if (QFileInfo::exists(m_config.hostPath(m_config.keyFilePath))) {
            required.push_back("install_items+=\" " + m_config.keyFilePath.toStdString());
        }
        snapshot.initramfsConfigMissing =
            missingConfigSettings(config.readAll().toStdString(), required);
    }

    for (const QString &dir : m_config.dracutModuleDirs) {
        const QDir modules(m_config.hostPath(dir));
        const QStringList matches = modules.entryList({QStringLiteral("*zfs*")},
                                                      QDir::Dirs | QDir::NoDotAndDotDot);
        for (const QString &match : matches) {
            snapshot.initramfsStorageModuleDirs.push_back(match.toStdString());
        }
    }
}

void SystemProbe::probeHostFiles(SystemSnapshot &snapshot)
{
    const CommandResult hostid = query(QStringLiteral("hostid"), {});
    if (hostid.ok()) {
        snapshot.hostIdCommand = parseHostIdCommand(hostid.output);
    }

    QFile hostIdFile(m_config.hostPath(m_config.hostIdPath));
    if (hostIdFile.open(QIODevice::ReadOnly)) {
        snapshot.hostIdFile = hostIdFromFileBytes(hostIdFile.readAll().toStdString());
    }

    snapshot.keyFilePath = m_config.keyFilePath.toStdString();
    const QFileInfo keyInfo(m_config.hostPath(m_config.keyFilePath));
    if (keyInfo.exists()) {
        snapshot.keyFileMode = permissionsToMode(keyInfo.permissions());
    }
}

void SystemProbe::probeDiskSpace(SystemSnapshot &snapshot)
{
    snapshot.rootFreeMb = freeMegabytes(m_config.hostPath(QStringLiteral("/")));
    snapshot.varFreeMb = freeMegabytes(m_config.hostPath(QStringLiteral("/var")));
}

void SystemProbe::probeServices(SystemSnapshot &snapshot)
{
    const QString serviceDir = m_config.hostPath(m_config.serviceDir);
    snapshot.serviceDirPresent = QFileInfo(serviceDir).isDir();
    if (!snapshot.serviceDirPresent) {
        return;
    }

    for (const QString &service : m_config.storageServices) {
        // runit enables a service with a symlink that may dangle under a sysroot.
        const QFileInfo link(serviceDir + QLatin1Char('/') + service);
        ServiceState state;
        state.name = service.toStdString();
        state.enabled = link.isSymLink() || link.exists();
        snapshot.services.push_back(state);
    }
}

RoundTripOutcome SystemProbe::runRoundTrip(const std::string &pool)
{
    RoundTripOutcome outcome;
    outcome.dataset = pool + "/zverify-roundtrip-" + std::to_string(getpid());
    const QString dataset = QString::fromStdString(outcome.dataset);
    const QString snapshotName = dataset + QStringLiteral("@probe");

    const CommandResult create = query(QStringLiteral("zfs"), {QStringLiteral("create"), dataset});
    outcome.created = create.ok();
    if (!outcome.created) {
        outcome.detail = "dataset creation failed";
        return outcome;
    }

    const CommandResult snap = query(QStringLiteral("zfs"),
                                     {QStringLiteral("snapshot"), snapshotName});
    outcome.snapshotted = snap.ok();

    bool snapshotRemoved = true;
    if (outcome.snapshotted) {
        snapshotRemoved = query(QStringLiteral("zfs"),
                                {QStringLiteral("destroy"), snapshotName}).ok();
    }

    QStringList destroyArgs = {QStringLiteral("destroy")};
    if (!snapshotRemoved) {
        destroyArgs << QStringLiteral("-r");
    }
    destroyArgs << dataset;
    const bool datasetRemoved = query(QStringLiteral("zfs"), destroyArgs).ok();
    outcome.cleanedUp = snapshotRemoved && datasetRemoved;

    if (!outcome.snapshotted) {
        outcome.detail = "snapshot creation failed";
    } else if (!snapshotRemoved) {
        outcome.detail = "snapshot deletion failed";
    }
    if (!datasetRemoved) {
        outcome.detail += outcome.detail.empty() ? "" : "; ";
        outcome.detail += "dataset deletion failed, manual cleanup required: zfs destroy -r "
            + outcome.dataset;
    }

    ZLOG_INFO(QStringLiteral("SystemProbe"),
              QStringLiteral("runRoundTrip"),
              QStringLiteral("round_trip_complete"),
              QStringLiteral("post_update_phase"),
              QStringLiteral("zfs_create_snapshot_destroy"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"dataset", outcome.dataset},
                              {"created", outcome.created},
                              {"snapshotted", outcome.snapshotted},
                              {"cleanedUp", outcome.cleanedUp}}));
    return outcome;
}

} // namespace zverify
