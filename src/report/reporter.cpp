#include "report/reporter.hpp"

#include <QString>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace zverify {

namespace {

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

std::string resultLine(const CheckResult &result)
{
    return "[" + toSeverityString(result.severity) + "] " + result.checkName + ": "
        + result.message;
}

std::string postStatusHeadline(PostStatus status)
{
    switch (status) {
    case PostStatus::Ready:
        return "SYSTEM READY";
    case PostStatus::RebootRequired:
        return "REBOOT REQUIRED";
    case PostStatus::Broken:
        return "SYSTEM BROKEN - do not reboot until the failures above are fixed";
    }
    return "SYSTEM BROKEN";
}

nlohmann::json checksJson(const CheckRun &checks)
{
    return nlohmann::json{
        {"results", checks.results},
        {"skipped", checks.skipped}
    };
}

} // namespace

int exitCodeFor(const PhaseVerdict &verdict)
{
    return verdict.fatal ? 1 : 0;
}

Reporter::Reporter(std::ostream &out, ReportFormat format)
    : m_out(out)
    , m_format(format)
{
}

void Reporter::line(const std::string &text)
{
    m_out << text << "\n";
    logging::logRenderedLine(QString::fromStdString(text));
}

void Reporter::emitJson(const nlohmann::json &payload)
{
    m_out << payload.dump(2) << std::endl;
    logging::logRenderedLine(QString::fromStdString(payload.dump()));
}

void Reporter::renderSystemSummary(const SystemSnapshot &snapshot)
{
    line("Host:    " + snapshot.hostname);
    line("Kernel:  running " + snapshot.runningKernelVersion + ", newest installed "
         + snapshot.latestInstalledKernelVersion);
    line("ZFS:     module " + snapshot.storageModuleVersion + ", userland "
         + snapshot.storageUserlandVersion);

    if (snapshot.pools.empty()) {
        line("Pools:   none");
    } else {
        std::vector<std::string> pools;
        for (const auto &pool : snapshot.pools) {
            std::string entry = pool.name + " (" + toHealthString(pool.health);
            if (pool.capacityPercent) {
                entry += ", " + std::to_string(*pool.capacityPercent) + "%";
            }
            pools.push_back(entry + ")");
        }
        line("Pools:   " + joinNames(pools));
    }

    if (snapshot.bootMethod == BootMethod::BootMenu) {
        line("Boot:    ZFSBootMenu, ESP " + snapshot.espPath
             + (snapshot.espMounted ? " (mounted)" : " (not mounted)"));
    } else {
        line("Boot:    traditional bootloader");
    }
}

void Reporter::renderChecks(const CheckRun &checks)
{
    std::vector<const CheckResult *> blocking;
    for (const auto &result : checks.results) {
        if (result.severity == Severity::Fail && result.fatalOnFail) {
            blocking.push_back(&result);
        }
    }

    if (!blocking.empty()) {
        line();
        line("-- Blocking failures --");
        for (const CheckResult *result : blocking) {
            line(resultLine(*result));
        }
    }

    line();
    line("-- Checks --");
    for (const auto &result : checks.results) {
        line(resultLine(result));
    }
    if (!checks.skipped.empty()) {
        line("Skipped (not applicable): " + joinNames(checks.skipped));
    }
}

void Reporter::renderVerdict(const PhaseVerdict &verdict)
{
    line();
    line("Result:  " + std::to_string(verdict.passCount) + " passed, "
         + std::to_string(verdict.warnCount) + " warnings, "
         + std::to_string(verdict.failCount) + " failed");
}

void Reporter::renderPre(const PreUpdateReport &report)
{
    if (m_format == ReportFormat::Json) {
        nlohmann::json payload;
        payload["phase"] = toPhaseString(Phase::Pre);
        payload["snapshot"] = report.snapshot;
        payload["checks"] = checksJson(report.checks);
        payload["verdict"] = report.verdict;
        payload["impact"] = report.impact;
        payload["artifact"] = nlohmann::json{
            {"path", report.artifactPath},
            {"written", report.artifactWritten},
            {"error", report.artifactError}
        };
        payload["exitCode"] = report.artifactWritten ? exitCodeFor(report.verdict) : 1;
        emitJson(payload);
        return;
    }

    line("== ZFS pre-update verification ==");
    renderSystemSummary(report.snapshot);

    const auto &counts = report.snapshot.pendingUpdates;
    line();
    line("Pending updates: " + std::to_string(counts.total) + " (zfs "
         + std::to_string(counts.storage) + ", kernel " + std::to_string(counts.kernel)
         + ", dracut " + std::to_string(counts.initramfsBuilder) + ", zfsbootmenu "
         + std::to_string(counts.bootMenu) + ", other " + std::to_string(counts.other) + ")");

    renderChecks(report.checks);
    renderVerdict(report.verdict);

    if (report.verdict.fatal) {
        line("Verdict: BLOCKED - fatal checks failed: " + joinNames(report.verdict.fatalChecks));
        line("Do not apply updates until these are resolved.");
        return;
    }

    if (report.impact.trivial) {
        line("Impact:  no zfs, boot or kernel packages affected");
    } else {
        if (report.impact.kernelAffecting) {
            line("Impact:  kernel packages will be updated");
        }
        if (report.impact.storageAffecting) {
            line("Impact:  zfs or boot stack packages will be updated");
        }
        if (report.impact.initramfsRebuildExpected) {
            line("         initramfs will be rebuilt");
        }
        if (report.impact.bootMenuRegenerationExpected) {
            line("         boot menu images should be regenerated");
        }
    }
    line(std::string("Reboot:  ") + (report.impact.rebootExpected ? "expected after update"
                                                                  : "not expected"));

    if (report.artifactWritten) {
        line("State saved to " + report.artifactPath);
        line("Verdict: OK to proceed with the update");
    } else {
        line("Verdict: BLOCKED - could not save state: " + report.artifactError);
    }
}

void Reporter::renderPost(const PostUpdateReport &report)
{
    if (m_format == ReportFormat::Json) {
        nlohmann::json payload;
        payload["phase"] = toPhaseString(Phase::Post);
        payload["snapshot"] = report.snapshot;
        payload["checks"] = checksJson(report.checks);
        payload["verdict"] = report.verdict;
        payload["assessment"] = report.assessment;
        payload["priorState"] = report.prior
            ? nlohmann::json{{"createdAt", toIso8601Utc(report.prior->createdAt)},
                             {"checkDate", report.prior->checkDate},
                             {"kernel", report.prior->currentKernel},
                             {"pendingUpdates", report.prior->pendingUpdates}}
            : nlohmann::json();
        payload["exitCode"] = exitCodeFor(report.verdict);
        emitJson(payload);
        return;
    }

    line("== ZFS post-update verification ==");
    renderSystemSummary(report.snapshot);

    line();
    if (report.prior) {
        line("Pre-update state from " + report.prior->checkDate + " (kernel "
             + report.prior->currentKernel + ", "
             + std::to_string(report.prior->pendingUpdates.total) + " updates queued)");
    } else {
        line("No pre-update state found; comparison checks skipped");
    }

    renderChecks(report.checks);
    renderVerdict(report.verdict);

    if (report.verdict.fatal) {
        line("Fatal checks failed: " + joinNames(report.verdict.fatalChecks));
    }
    for (const auto &reason : report.assessment.reasons) {
        line("Reboot reason: " + reason);
    }
    line("Verdict: " + postStatusHeadline(report.assessment.status));
}

void Reporter::renderEnvironmentError(Phase phase, const std::vector<std::string> &problems)
{
    if (m_format == ReportFormat::Json) {
        emitJson(nlohmann::json{
            {"phase", toPhaseString(phase)},
            {"environmentErrors", problems},
            {"exitCode", 1}
        });
        return;
    }

    line("== ZFS " + std::string(phase == Phase::Pre ? "pre" : "post")
         + "-update verification ==");
    for (const auto &problem : problems) {
        line("[ERROR] " + problem);
    }
    line("Verdict: cannot verify this system");
}

void Reporter::renderNoUpdates(const PendingUpdateCounts &pendingUpdates)
{
    if (m_format == ReportFormat::Json) {
        emitJson(nlohmann::json{
            {"phase", toPhaseString(Phase::Pre)},
            {"pendingUpdates", pendingUpdates},
            {"exitCode", 0}
        });
        return;
    }

    line("== ZFS pre-update verification ==");
    line("No pending updates; nothing to verify.");
}

} // namespace zverify
