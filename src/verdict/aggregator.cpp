#include "verdict/aggregator.hpp"

namespace zverify {

namespace {

bool isUnknown(const std::string &value)
{
    return value.empty() || value == kUnknown;
}

} // namespace

PhaseVerdict aggregate(const std::vector<CheckResult> &results)
{
    PhaseVerdict verdict;
    for (const auto &result : results) {
        switch (result.severity) {
        case Severity::Pass:
            ++verdict.passCount;
            break;
        case Severity::Warn:
            ++verdict.warnCount;
            break;
        case Severity::Fail:
            ++verdict.failCount;
            if (result.fatalOnFail) {
                verdict.fatal = true;
                verdict.fatalChecks.push_back(result.checkName);
            }
            break;
        }
    }
    return verdict;
}

UpdateImpact classifyPendingUpdates(const PendingUpdateCounts &counts)
{
    UpdateImpact impact;
    impact.storageAffecting = counts.storage > 0 || counts.bootMenu > 0
        || counts.initramfsBuilder > 0;
    impact.kernelAffecting = counts.kernel > 0;
    impact.rebootExpected = counts.kernel > 0 || counts.storage > 0;
    // dracut hooks run for kernel and zfs package updates alike.
    impact.initramfsRebuildExpected = counts.kernel > 0 || counts.storage > 0
        || counts.initramfsBuilder > 0;
    impact.bootMenuRegenerationExpected = counts.bootMenu > 0 || counts.kernel > 0
        || counts.storage > 0;
    impact.trivial = !impact.storageAffecting && !impact.kernelAffecting;
    return impact;
}

bool detectKernelMismatch(const SystemSnapshot &snapshot)
{
    if (isUnknown(snapshot.runningKernelVersion)
        || isUnknown(snapshot.latestInstalledKernelVersion)) {
        return false;
    }
    return snapshot.runningKernelVersion != snapshot.latestInstalledKernelVersion;
}

PostAssessment assessPostUpdate(const SystemSnapshot &snapshot,
                                const Artifact *prior,
                                const PhaseVerdict &verdict)
{
    PostAssessment assessment;
    assessment.priorStateKnown = prior != nullptr;
    assessment.kernelMismatch = detectKernelMismatch(snapshot);

    if (assessment.kernelMismatch) {
        assessment.reasons.push_back("running kernel " + snapshot.runningKernelVersion
                                     + " differs from installed kernel "
                                     + snapshot.latestInstalledKernelVersion);
    } else if (isUnknown(snapshot.runningKernelVersion)
               || isUnknown(snapshot.latestInstalledKernelVersion)) {
        assessment.reasons.push_back("running or installed kernel version unknown");
    }

    if (prior) {
        if (prior->pendingUpdates.kernel > 0) {
            assessment.reasons.push_back("kernel packages were updated");
        }
        if (prior->pendingUpdates.storage > 0) {
            const bool versionsDiffer = isUnknown(snapshot.storageModuleVersion)
                || isUnknown(snapshot.storageUserlandVersion)
                || snapshot.storageModuleVersion != snapshot.storageUserlandVersion;
            if (versionsDiffer) {
                assessment.reasons.push_back("zfs was updated and loaded module "
                                             + snapshot.storageModuleVersion
                                             + " does not match userland "
                                             + snapshot.storageUserlandVersion);
            }
        }
    }

    assessment.rebootRequired = !assessment.reasons.empty();

    if (verdict.fatal) {
        assessment.status = PostStatus::Broken;
    } else if (assessment.rebootRequired) {
        assessment.status = PostStatus::RebootRequired;
    } else {
        assessment.status = PostStatus::Ready;
    }
    return assessment;
}

} // namespace zverify
