#include "checks/check_catalogue.hpp"

#include <cstdio>

namespace zverify {

namespace {

constexpr const char *kPoolCacheFile = "/etc/zfs/zpool.cache";

CheckOutcome pass(const std::string &message)
{
    return CheckOutcome{Severity::Pass, message};
}

CheckOutcome warn(const std::string &message)
{
    return CheckOutcome{Severity::Warn, message};
}

CheckOutcome fail(const std::string &message)
{
    return CheckOutcome{Severity::Fail, message};
}

bool isUnknown(const std::string &value)
{
    return value.empty() || value == kUnknown;
}

std::string joinNames(const std::vector<std::string> &names)
{
    std::string joined;
    for (const auto &name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}

std::string octalMode(int mode)
{
    char buffer[8] = {};
    std::snprintf(buffer, sizeof(buffer), "%04o", mode & 07777);
    return buffer;
}

bool always(const CheckContext &)
{
    return true;
}

bool poolsExist(const CheckContext &ctx)
{
    return !ctx.snapshot.pools.empty();
}

// A failed listing hides every pool, so the pool checks still run.
bool poolsExpected(const CheckContext &ctx)
{
    return poolsExist(ctx) || !ctx.snapshot.poolListingError.empty();
}

bool initramfsBuilderPresent(const CheckContext &ctx)
{
    return ctx.snapshot.initramfsBuilderPresent;
}

bool bootMenuSystem(const CheckContext &ctx)
{
    return ctx.snapshot.bootMethod == BootMethod::BootMenu;
}

bool priorKnown(const CheckContext &ctx)
{
    return ctx.prior != nullptr;
}

CheckOutcome checkModuleLoaded(const CheckContext &ctx)
{
    const auto &loaded = ctx.snapshot.storageModuleLoaded;
    if (!loaded.has_value()) {
        return warn("could not read the loaded kernel module list");
    }
    if (!*loaded) {
        return fail("zfs kernel module is not loaded");
    }
    return pass("zfs kernel module loaded (version " + ctx.snapshot.storageModuleVersion + ")");
}

CheckOutcome checkUserlandTools(const CheckContext &ctx)
{
    const auto &missing = ctx.snapshot.missingUserlandTools;
    if (!missing.empty()) {
        return fail("storage control commands not found: " + joinNames(missing));
    }
    return pass("zfs and zpool commands available (userland "
                + ctx.snapshot.storageUserlandVersion + ")");
}

CheckOutcome checkModuleFile(const CheckContext &ctx)
{
    const auto &snapshot = ctx.snapshot;
    if (!snapshot.storageModuleFilePresent.has_value()) {
        return warn("running kernel unknown; zfs module file not located");
    }
    if (!*snapshot.storageModuleFilePresent) {
        return warn("zfs module not found at " + snapshot.storageModuleFilePath
                    + "; kernel and zfs packages may be out of step");
    }
    return pass("zfs module present at " + snapshot.storageModuleFilePath);
}

CheckOutcome checkModuleKernelMatch(const CheckContext &ctx)
{
    const auto &snapshot = ctx.snapshot;
    if (isUnknown(snapshot.storageModuleKernel) || isUnknown(snapshot.runningKernelVersion)) {
        return warn("cannot compare module build kernel with running kernel");
    }
    if (snapshot.storageModuleKernel != snapshot.runningKernelVersion) {
        return warn("zfs module built for " + snapshot.storageModuleKernel
                    + " but running kernel is " + snapshot.runningKernelVersion);
    }
    return pass("zfs module matches running kernel " + snapshot.runningKernelVersion);
}

CheckOutcome checkVersionConsistency(const CheckContext &ctx)
{
    const auto &snapshot = ctx.snapshot;
    if (isUnknown(snapshot.storageModuleVersion) || isUnknown(snapshot.storageUserlandVersion)) {
        return warn("zfs module or userland version unknown (module "
                    + snapshot.storageModuleVersion + ", userland "
                    + snapshot.storageUserlandVersion + ")");
    }
    if (snapshot.storageModuleVersion != snapshot.storageUserlandVersion) {
        return warn("zfs module version " + snapshot.storageModuleVersion
                    + " differs from userland version " + snapshot.storageUserlandVersion);
    }
    return pass("zfs module and userland both at " + snapshot.storageModuleVersion);
}

CheckOutcome checkKernelVersions(const CheckContext &ctx)
{
    const auto &snapshot = ctx.snapshot;
    if (isUnknown(snapshot.runningKernelVersion)) {
        return warn("running kernel version unknown");
    }
    if (isUnknown(snapshot.latestInstalledKernelVersion)) {
        return warn("no kernel image found under /boot; installed kernel unknown");
    }
    if (snapshot.runningKernelVersion != snapshot.latestInstalledKernelVersion) {
        return pass("running " + snapshot.runningKernelVersion + ", newest installed "
                    + snapshot.latestInstalledKernelVersion + " (active after reboot)");
    }
    return pass("running the newest installed kernel " + snapshot.runningKernelVersion);
}

CheckOutcome checkPoolHealth(const CheckContext &ctx)
{
    if (!ctx.snapshot.poolListingOk) {
        return warn("pool health unknown: " + ctx.snapshot.poolListingError);
    }
    std::vector<std::string> unhealthy;
    std::vector<std::string> unknown;
    for (const auto &pool : ctx.snapshot.pools) {
        switch (pool.health) {
        case PoolHealth::Online:
            break;
        case PoolHealth::Degraded:
            unhealthy.push_back(pool.name + " (DEGRADED)");
            break;
        case PoolHealth::Faulted:
            unhealthy.push_back(pool.name + " (FAULTED)");
            break;
        case PoolHealth::Unavail:
            unhealthy.push_back(pool.name + " (UNAVAIL)");
            break;
        case PoolHealth::Unknown:
            unknown.push_back(pool.name);
            break;
        }
    }
    if (!unhealthy.empty()) {
        return fail("pools not ONLINE: " + joinNames(unhealthy));
    }
    if (!unknown.empty()) {
        return warn("pool health unknown: " + joinNames(unknown));
    }
    return pass(std::to_string(ctx.snapshot.pools.size()) + " pool(s) ONLINE");
}

CheckOutcome checkPoolAccess(const CheckContext &ctx)
{
    if (!ctx.snapshot.poolListingOk) {
        return fail(ctx.snapshot.poolListingError + "; pools cannot be inspected");
    }
    std::vector<std::string> failed;
    std::vector<std::string> unchecked;
    for (const auto &pool : ctx.snapshot.pools) {
        if (!pool.statusOk.has_value()) {
            unchecked.push_back(pool.name);
        } else if (!*pool.statusOk) {
            failed.push_back(pool.name);
        }
    }
    if (!failed.empty()) {
        return fail("zpool status failed for: " + joinNames(failed));
    }
    if (!unchecked.empty()) {
        return warn("pool status not queried for: " + joinNames(unchecked));
    }
    return pass("all pools answer zpool status");
}

CheckOutcome checkPoolCacheFile(const CheckContext &ctx)
{
    std::vector<std::string> wrong;
    std::vector<std::string> unknown;
    for (const auto &pool : ctx.snapshot.pools) {
        if (isUnknown(pool.cacheFile)) {
            unknown.push_back(pool.name);
        } else if (pool.cacheFile != kPoolCacheFile) {
            wrong.push_back(pool.name + " (" + pool.cacheFile + ")");
        }
    }
    if (!wrong.empty()) {
        return fail(std::string("pools not using ") + kPoolCacheFile + ": " + joinNames(wrong)
                    + "; fix with zpool set cachefile=" + kPoolCacheFile + " <pool>");
    }
    if (!unknown.empty()) {
        return warn("cachefile property unknown for: " + joinNames(unknown));
    }
    return pass(std::string("all pools use ") + kPoolCacheFile);
}

CheckOutcome checkDatasetMounts(const CheckContext &ctx)
{
    const auto &datasets = ctx.snapshot.datasets;
    // Every pool has at least its root dataset.
    if (datasets.empty()) {
        return warn("dataset listing unavailable");
    }

    std::vector<std::string> unmounted;
    for (const auto &dataset : datasets) {
        if (dataset.mountpoint.has_value() && dataset.canMount == "on" && !dataset.mounted) {
            unmounted.push_back(dataset.name + " -> " + *dataset.mountpoint);
        }
    }
    if (!unmounted.empty()) {
        return warn("datasets not mounted: " + joinNames(unmounted));
    }
    return pass(std::to_string(datasets.size()) + " dataset(s) checked, all expected mounts present");
}

CheckOutcome checkDiskSpace(const CheckContext &ctx)
{
    const auto &snapshot = ctx.snapshot;
    const auto &limits = ctx.thresholds;

    std::vector<std::string> failures;
    std::vector<std::string> warnings;

    if (!snapshot.rootFreeMb.has_value()) {
        warnings.push_back("free space on / unknown");
    } else if (*snapshot.rootFreeMb < limits.rootHardMinMb) {
        failures.push_back("/ has " + std::to_string(*snapshot.rootFreeMb) + " MiB free (minimum "
                           + std::to_string(limits.rootHardMinMb) + " MiB)");
    } else if (*snapshot.rootFreeMb < limits.rootSoftMinMb) {
        warnings.push_back("/ has only " + std::to_string(*snapshot.rootFreeMb) + " MiB free");
    }

    if (!snapshot.varFreeMb.has_value()) {
        warnings.push_back("free space on /var unknown");
    } else if (*snapshot.varFreeMb < limits.varSoftMinMb) {
        warnings.push_back("/var has only " + std::to_string(*snapshot.varFreeMb) + " MiB free");
    }

    for (const auto &pool : snapshot.pools) {
        if (!pool.capacityPercent.has_value()) {
            warnings.push_back("capacity of pool " + pool.name + " unknown");
            continue;
        }
        const int used = *pool.capacityPercent;
        if (used >= limits.poolCapacityFailPercent) {
            failures.push_back("pool " + pool.name + " is " + std::to_string(used) + "% full");
        } else if (used >= limits.poolCapacityWarnPercent) {
            warnings.push_back("pool " + pool.name + " is " + std::to_string(used) + "% full");
        }
    }

    if (!failures.empty()) {
        std::vector<std::string> all = failures;
        all.insert(all.end(), warnings.begin(), warnings.end());
        return fail(joinNames(all));
    }
    if (!warnings.empty()) {
        return warn(joinNames(warnings));
    }
    return pass("sufficient free space on /, /var and all pools");
}

CheckOutcome checkInitramfsBuilder(const CheckContext &ctx)
{
    if (!ctx.snapshot.initramfsBuilderPresent) {
        return fail("dracut not found; initramfs cannot be rebuilt");
    }
    return pass("dracut available");
}

CheckOutcome checkInitramfsConfig(const CheckContext &ctx)
{
    const auto &snapshot = ctx.snapshot;
    std::vector<std::string> failures;
    if (!snapshot.initramfsConfigPresent) {
        failures.push_back("dracut zfs configuration not found");
    }
    if (snapshot.initramfsStorageModuleDirs.empty()) {
        failures.push_back("no zfs dracut module installed");
    }
    if (!failures.empty()) {
        return fail(joinNames(failures));
    }
    if (!snapshot.initramfsConfigMissing.empty()) {
        return warn("dracut zfs configuration lacks: " + joinNames(snapshot.initramfsConfigMissing));
    }
    return pass("dracut " + snapshot.initramfsBuilderVersion + " configured for zfs (module "
                + joinNames(snapshot.initramfsStorageModuleDirs) + ")");
}

CheckOutcome checkInitramfsContents(const CheckContext &ctx)
{
    const auto &snapshot = ctx.snapshot;
    if (!snapshot.initramfsImagePresent.has_value()) {
        return warn("running kernel unknown; initramfs not inspected");
    }
    if (!*snapshot.initramfsImagePresent) {
        return fail("initramfs image missing: " + snapshot.initramfsPath);
    }
    if (!snapshot.initramfsHasStorageModule.has_value()) {
        return warn("could not list contents of " + snapshot.initramfsPath);
    }
    if (!*snapshot.initramfsHasStorageModule) {
        return fail(snapshot.initramfsPath + " does not contain the zfs module");
    }
    if (snapshot.initramfsHasHostId.has_value() && !*snapshot.initramfsHasHostId) {
        return warn(snapshot.initramfsPath + " contains zfs but no /etc/hostid");
    }
    return pass(snapshot.initramfsPath + " contains the zfs module");
}

CheckOutcome checkBootMenuConfig(const CheckContext &ctx)
{
    if (!ctx.snapshot.bootMenuConfigPresent) {
        return warn("ZFSBootMenu config not found; generate-zbm may need manual configuration");
    }
    if (!ctx.snapshot.bootMenuConfigValid) {
        return warn("ZFSBootMenu config has no Global section");
    }
    return pass("ZFSBootMenu config present");
}

CheckOutcome checkEsp(const CheckContext &ctx)
{
    const auto &snapshot = ctx.snapshot;
    if (snapshot.espMounted) {
        if (!snapshot.espFreeMb.has_value()) {
            return warn("ESP mounted at " + snapshot.espPath + " but free space unknown");
        }
        const std::string freeText = std::to_string(*snapshot.espFreeMb) + " MiB free";
        if (*snapshot.espFreeMb < ctx.thresholds.espSoftMinMb) {
            return warn("ESP at " + snapshot.espPath + " has only " + freeText);
        }
        return pass("ESP mounted at " + snapshot.espPath + " (" + freeText + ")");
    }
    if (!snapshot.espCandidateDevice.empty()) {
        return warn("ESP not mounted; candidate device " + snapshot.espCandidateDevice
                    + " should be mounted at " + snapshot.espPath);
    }
    return fail("ESP not mounted and no vfat partition found");
}

CheckOutcome checkBootMenuImage(const CheckContext &ctx)
{
    const auto &snapshot = ctx.snapshot;
    if (!snapshot.bootMenuImagePresent.has_value()) {
        return warn("ESP not mounted; boot menu EFI image not inspected");
    }
    if (*snapshot.bootMenuImagePresent) {
        return pass("boot menu EFI image present");
    }
    if (snapshot.bootMenuBackupPresent.value_or(false)) {
        return warn("boot menu EFI image missing but backup image exists");
    }
    return warn("boot menu EFI image and backup both missing; run generate-zbm");
}

CheckOutcome checkBootMenuEntry(const CheckContext &ctx)
{
    const auto &entry = ctx.snapshot.bootMenuEfiEntryPresent;
    if (!entry.has_value()) {
        return warn("EFI boot entries could not be listed");
    }
    if (!*entry) {
        return warn("no ZFSBootMenu EFI boot entry found");
    }
    return pass("ZFSBootMenu EFI boot entry present");
}

CheckOutcome checkHostId(const CheckContext &ctx)
{
    const auto &snapshot = ctx.snapshot;
    if (isUnknown(snapshot.hostIdFile)) {
        return warn("host id file missing or malformed");
    }
    if (isUnknown(snapshot.hostIdCommand)) {
        return warn("hostid command output unavailable");
    }
    if (snapshot.hostIdCommand != snapshot.hostIdFile) {
        return warn("hostid reports " + snapshot.hostIdCommand + " but host id file holds "
                    + snapshot.hostIdFile);
    }
    return pass("host id " + snapshot.hostIdFile + " consistent");
}

CheckOutcome checkKeyPermissions(const CheckContext &ctx)
{
    const int mode = ctx.snapshot.keyFileMode.value_or(0);
    if ((mode & 0177) != 0) {
        return warn(ctx.snapshot.keyFilePath + " has mode " + octalMode(mode)
                    + "; expected 0600 or stricter");
    }
    return pass(ctx.snapshot.keyFilePath + " has mode " + octalMode(mode));
}

CheckOutcome checkServices(const CheckContext &ctx)
{
    std::vector<std::string> disabled;
    for (const auto &service : ctx.snapshot.services) {
        if (!service.enabled) {
            disabled.push_back(service.name);
        }
    }
    if (!disabled.empty()) {
        return warn("storage services not enabled: " + joinNames(disabled));
    }
    return pass("storage services enabled");
}

CheckOutcome checkRoundTrip(const CheckContext &ctx)
{
    const RoundTripOutcome &outcome = *ctx.snapshot.roundTrip;
    if (outcome.created && outcome.snapshotted && outcome.cleanedUp) {
        return pass("create, snapshot and destroy succeeded on " + outcome.dataset);
    }
    return fail("round-trip test on " + outcome.dataset + " failed: " + outcome.detail);
}

CheckOutcome checkRollbackSnapshots(const CheckContext &ctx)
{
    const auto &count = ctx.snapshot.snapshotCount;
    if (!count.has_value()) {
        return warn("snapshots could not be listed");
    }
    if (*count == 0) {
        return warn("no snapshots available to roll back to");
    }
    return pass(std::to_string(*count) + " snapshot(s) available for rollback");
}

CheckOutcome checkPoolDrift(const CheckContext &ctx)
{
    const bool poolsNow = !ctx.snapshot.pools.empty();
    if (ctx.prior->poolsExist && !poolsNow) {
        return fail("pools were present before the update and are no longer visible");
    }
    if (!ctx.prior->poolsExist && poolsNow) {
        return pass("pools visible now that were absent before the update");
    }
    return pass(poolsNow ? "pools still present" : "no pools before or after the update");
}

CheckOutcome checkBootMethodDrift(const CheckContext &ctx)
{
    if (ctx.prior->bootMethod != ctx.snapshot.bootMethod) {
        return warn(std::string("boot method changed during the update (now ")
                    + (ctx.snapshot.bootMethod == BootMethod::BootMenu ? "boot menu"
                                                                       : "traditional")
                    + ")");
    }
    return pass("boot method unchanged");
}

CheckOutcome checkKernelActivation(const CheckContext &ctx)
{
    const auto &snapshot = ctx.snapshot;
    if (isUnknown(snapshot.latestInstalledKernelVersion)) {
        return warn("no kernel image found under /boot");
    }
    if (snapshot.latestInstalledKernelVersion == ctx.prior->currentKernel) {
        return warn("kernel update was queued but no newer kernel image is installed");
    }
    if (snapshot.runningKernelVersion == snapshot.latestInstalledKernelVersion) {
        return pass("running the newly installed kernel " + snapshot.runningKernelVersion);
    }
    return pass("kernel " + snapshot.latestInstalledKernelVersion
                + " installed; active after reboot");
}

} // namespace

std::vector<CheckDefinition> defaultCatalogue()
{
    return {
        {"storage-module-loaded", true, kBothPhases, always, checkModuleLoaded},
        {"storage-userland-tools", true, kBothPhases, always, checkUserlandTools},
        {"storage-module-file", false, kBothPhases, always, checkModuleFile},
        {"kernel-module-version-match", false, kBothPhases, always, checkModuleKernelMatch},
        {"storage-version-consistency", false, kBothPhases, always, checkVersionConsistency},
        {"kernel-versions", false, kBothPhases, always, checkKernelVersions},
        {"pool-health", true, kBothPhases, poolsExpected, checkPoolHealth},
        {"pool-accessibility", true, kBothPhases, poolsExpected, checkPoolAccess},
        {"pool-cachefile", true, kBothPhases, poolsExist, checkPoolCacheFile},
        {"dataset-mounts", false, kBothPhases, poolsExist, checkDatasetMounts},
        {"disk-space", true, kBothPhases, always, checkDiskSpace},
        {"initramfs-builder", true, kBothPhases, always, checkInitramfsBuilder},
        {"initramfs-builder-config", true, kBothPhases, initramfsBuilderPresent,
         checkInitramfsConfig},
        {"initramfs-storage-module", true, kBothPhases, always, checkInitramfsContents},
        {"boot-menu-config", false, kBothPhases, bootMenuSystem, checkBootMenuConfig},
        {"boot-menu-esp", true, kBothPhases, bootMenuSystem, checkEsp},
        {"boot-menu-efi-image", false, kBothPhases, bootMenuSystem, checkBootMenuImage},
        {"boot-menu-efi-entry", false, kBothPhases, bootMenuSystem, checkBootMenuEntry},
        {"host-id-consistency", false, kBothPhases, always, checkHostId},
        {"encryption-key-permissions", false, kBothPhases,
         [](const CheckContext &ctx) { return ctx.snapshot.keyFileMode.has_value(); },
         checkKeyPermissions},
        {"storage-services", false, kBothPhases,
         [](const CheckContext &ctx) { return ctx.snapshot.serviceDirPresent; },
         checkServices},
        {"storage-round-trip", true, kPostPhase,
         [](const CheckContext &ctx) {
             return poolsExist(ctx) && ctx.snapshot.roundTrip.has_value();
         },
         checkRoundTrip},
        {"rollback-snapshots", false, kPostPhase, poolsExist, checkRollbackSnapshots},
        {"pool-presence-drift", true, kPostPhase, priorKnown, checkPoolDrift},
        {"boot-method-drift", false, kPostPhase, priorKnown, checkBootMethodDrift},
        {"kernel-update-activation", false, kPostPhase,
         [](const CheckContext &ctx) {
             return priorKnown(ctx) && ctx.prior->pendingUpdates.kernel > 0;
         },
         checkKernelActivation},
    };
}

} // namespace zverify
