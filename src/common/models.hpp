#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace zverify {

// Sentinel for facts the probe could not obtain.
inline constexpr const char *kUnknown = "unknown";

struct PoolInfo {
    std::string name;
    PoolHealth health = PoolHealth::Unknown;
    std::optional<int> capacityPercent;
    // Outcome of `zpool status <pool>`; unset when it was not queried.
    std::optional<bool> statusOk;
    std::string cacheFile = kUnknown;
};

struct DatasetInfo {
    std::string name;
    bool mounted = false;
    // Unset for "none", "legacy" and "-".
    std::optional<std::string> mountpoint;
    std::string canMount = "on";
};

struct PendingUpdateCounts {
    int storage = 0;
    int bootMenu = 0;
    int initramfsBuilder = 0;
    int kernel = 0;
    int other = 0;
    int total = 0;
    std::vector<std::string> packages;
};

struct ServiceState {
    std::string name;
    bool enabled = false;
};

struct RoundTripOutcome {
    std::string dataset;
    bool created = false;
    bool snapshotted = false;
    bool cleanedUp = false;
    std::string detail;
};

/**
 * Facts observed at one point in time. Built once by SystemProbe and then
 * only read; every field has an explicit unknown representation.
 */
struct SystemSnapshot {
    std::string id;
    std::chrono::system_clock::time_point timestamp;
    std::string hostname = kUnknown;

    std::string runningKernelVersion = kUnknown;
    std::string latestInstalledKernelVersion = kUnknown;

    std::optional<bool> storageModuleLoaded;
    std::string storageModuleVersion = kUnknown;
    std::string storageModuleKernel = kUnknown;
    std::string storageUserlandVersion = kUnknown;
    std::vector<std::string> missingUserlandTools;
    // zfs.ko under /lib/modules/<running kernel>; unset while the kernel is unknown.
    std::optional<bool> storageModuleFilePresent;
    std::string storageModuleFilePath;

    bool poolListingOk = false;
    // Why `zpool list` produced no listing; empty when it succeeded or never ran.
    std::string poolListingError;
    std::vector<PoolInfo> pools;
    std::vector<DatasetInfo> datasets;
    // Number of snapshots across all pools; unset when they could not be listed.
    std::optional<int> snapshotCount;

    BootMethod bootMethod = BootMethod::Traditional;
    bool espMounted = false;
    std::string espPath = "/boot/efi";
    std::string espCandidateDevice;
    std::optional<long long> espFreeMb;
    bool bootMenuConfigPresent = false;
    bool bootMenuConfigValid = false;
    std::optional<bool> bootMenuImagePresent;
    std::optional<bool> bootMenuBackupPresent;
    std::optional<bool> bootMenuEfiEntryPresent;

    bool initramfsBuilderPresent = false;
    std::string initramfsBuilderVersion = kUnknown;
    bool initramfsConfigPresent = false;
    std::vector<std::string> initramfsConfigMissing;
    std::vector<std::string> initramfsStorageModuleDirs;
    std::string initramfsPath;
    std::optional<bool> initramfsImagePresent;
    std::optional<bool> initramfsHasStorageModule;
    std::optional<bool> initramfsHasHostId;

    std::string hostIdCommand = kUnknown;
    std::string hostIdFile = kUnknown;

    std::string keyFilePath;
    // Permission bits of the key file; unset when no key file exists.
    std::optional<int> keyFileMode;

    std::optional<long long> rootFreeMb;
    std::optional<long long> varFreeMb;

    bool serviceDirPresent = false;
    std::vector<ServiceState> services;

    std::optional<RoundTripOutcome> roundTrip;

    PendingUpdateCounts pendingUpdates;
};

struct CheckResult {
    std::string checkName;
    Severity severity = Severity::Pass;
    std::string message;
    std::chrono::system_clock::time_point observedAt;
    bool fatalOnFail = false;
};

struct PhaseVerdict {
    int passCount = 0;
    int warnCount = 0;
    int failCount = 0;
    bool fatal = false;
    std::vector<std::string> fatalChecks;
};

struct UpdateImpact {
    bool trivial = true;
    bool storageAffecting = false;
    bool kernelAffecting = false;
    bool rebootExpected = false;
    bool initramfsRebuildExpected = false;
    bool bootMenuRegenerationExpected = false;
};

/**
 * Handoff written at the end of a successful pre-update phase and read back
 * by the post-update phase. Never modified after it is written.
 */
struct Artifact {
    BootMethod bootMethod = BootMethod::Traditional;
    bool poolsExist = false;
    bool espMounted = false;
    std::string espPath = "/boot/efi";

    PendingUpdateCounts pendingUpdates;

    std::string currentKernel = kUnknown;
    std::string latestKernel = kUnknown;
    std::string storageModuleVersion = kUnknown;
    std::string storageUserlandVersion = kUnknown;
    std::string hostname;

    std::string checkDate;
    std::chrono::system_clock::time_point createdAt;
    std::string precheckLog;
    int precheckWarnings = 0;
};

struct PostAssessment {
    bool priorStateKnown = false;
    bool kernelMismatch = false;
    bool rebootRequired = false;
    std::vector<std::string> reasons;
    PostStatus status = PostStatus::Ready;
};

} // namespace zverify
