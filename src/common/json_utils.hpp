#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace zverify {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
    std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline std::string toHealthString(PoolHealth health)
{
    switch (health) {
    case PoolHealth::Online:
        return "ONLINE";
    case PoolHealth::Degraded:
        return "DEGRADED";
    case PoolHealth::Faulted:
        return "FAULTED";
    case PoolHealth::Unavail:
        return "UNAVAIL";
    case PoolHealth::Unknown:
        return "UNKNOWN";
    }
    return "UNKNOWN";
}

inline std::string toBootMethodString(BootMethod method)
{
    switch (method) {
    case BootMethod::Traditional:
        return "traditional";
    case BootMethod::BootMenu:
        return "boot_menu";
    }
    return "traditional";
}

inline std::string toSeverityString(Severity severity)
{
    switch (severity) {
    case Severity::Pass:
        return "PASS";
    case Severity::Warn:
        return "WARN";
    case Severity::Fail:
        return "FAIL";
    }
    return "FAIL";
}

inline std::string toCategoryString(UpdateCategory category)
{
    switch (category) {
    case UpdateCategory::Storage:
        return "storage";
    case UpdateCategory::BootMenu:
        return "bootmenu";
    case UpdateCategory::InitramfsBuilder:
        return "initramfs_builder";
    case UpdateCategory::Kernel:
        return "kernel";
    case UpdateCategory::Other:
        return "other";
    }
    return "other";
}

inline std::string toPhaseString(Phase phase)
{
    return phase == Phase::Pre ? "pre" : "post";
}

inline std::string toPostStatusString(PostStatus status)
{
    switch (status) {
    case PostStatus::Ready:
        return "ready";
    case PostStatus::RebootRequired:
        return "reboot_required";
    case PostStatus::Broken:
        return "broken";
    }
    return "broken";
}

inline void to_json(nlohmann::json &j, const Severity &severity)
{
    j = toSeverityString(severity);
}

inline void to_json(nlohmann::json &j, const PoolInfo &pool)
{
    j = nlohmann::json{
        {"name", pool.name},
        {"health", toHealthString(pool.health)},
        {"capacityPercent", pool.capacityPercent.has_value()
                                ? nlohmann::json(*pool.capacityPercent)
                                : nlohmann::json()}
    };
}

inline void to_json(nlohmann::json &j, const DatasetInfo &dataset)
{
    j = nlohmann::json{
        {"name", dataset.name},
        {"mounted", dataset.mounted},
        {"mountpoint", dataset.mountpoint.has_value()
                           ? nlohmann::json(*dataset.mountpoint)
                           : nlohmann::json()},
        {"canmount", dataset.canMount}
    };
}

inline void to_json(nlohmann::json &j, const PendingUpdateCounts &counts)
{
    j = nlohmann::json{
        {"storage", counts.storage},
        {"bootmenu", counts.bootMenu},
        {"initramfsBuilder", counts.initramfsBuilder},
        {"kernel", counts.kernel},
        {"other", counts.other},
        {"total", counts.total},
        {"packages", counts.packages}
    };
}

inline void to_json(nlohmann::json &j, const CheckResult &result)
{
    j = nlohmann::json{
        {"check", result.checkName},
        {"severity", result.severity},
        {"message", result.message},
        {"observedAt", toIso8601Utc(result.observedAt)},
        {"fatalOnFail", result.fatalOnFail}
    };
}

inline void to_json(nlohmann::json &j, const PhaseVerdict &verdict)
{
    j = nlohmann::json{
        {"passCount", verdict.passCount},
        {"warnCount", verdict.warnCount},
        {"failCount", verdict.failCount},
        {"fatal", verdict.fatal},
        {"fatalChecks", verdict.fatalChecks}
    };
}

inline void to_json(nlohmann::json &j, const UpdateImpact &impact)
{
    j = nlohmann::json{
        {"trivial", impact.trivial},
        {"storageAffecting", impact.storageAffecting},
        {"kernelAffecting", impact.kernelAffecting},
        {"rebootExpected", impact.rebootExpected},
        {"initramfsRebuildExpected", impact.initramfsRebuildExpected},
        {"bootMenuRegenerationExpected", impact.bootMenuRegenerationExpected}
    };
}

inline void to_json(nlohmann::json &j, const PostAssessment &assessment)
{
    j = nlohmann::json{
        {"priorStateKnown", assessment.priorStateKnown},
        {"kernelMismatch", assessment.kernelMismatch},
        {"rebootRequired", assessment.rebootRequired},
        {"reasons", assessment.reasons},
        {"status", toPostStatusString(assessment.status)}
    };
}

// Summary form used by reports; the full probe detail stays in the log.
inline void to_json(nlohmann::json &j, const SystemSnapshot &snapshot)
{
    j = nlohmann::json{
        {"id", snapshot.id},
        {"timestamp", toIso8601Utc(snapshot.timestamp)},
        {"hostname", snapshot.hostname},
        {"runningKernelVersion", snapshot.runningKernelVersion},
        {"latestInstalledKernelVersion", snapshot.latestInstalledKernelVersion},
        {"storageModuleVersion", snapshot.storageModuleVersion},
        {"storageUserlandVersion", snapshot.storageUserlandVersion},
        {"pools", snapshot.pools},
        {"datasets", snapshot.datasets},
        {"bootMethod", toBootMethodString(snapshot.bootMethod)},
        {"espMounted", snapshot.espMounted},
        {"espPath", snapshot.espPath},
        {"pendingUpdates", snapshot.pendingUpdates}
    };
}

} // namespace zverify
