#pragma once

#include <vector>

#include "common/models.hpp"

namespace zverify {

// Fold check results into counts. The phase is fatal when any result is a
// FAIL from a check registered as fatal.
PhaseVerdict aggregate(const std::vector<CheckResult> &results);

// Pre-update judgment over the pending package set.
UpdateImpact classifyPendingUpdates(const PendingUpdateCounts &counts);

// Exact string comparison of running and newest installed kernel. Never
// flagged while either side is unknown.
bool detectKernelMismatch(const SystemSnapshot &snapshot);

/**
 * Post-update decision table:
 * - BROKEN when the verdict is fatal
 * - REBOOT_REQUIRED when the kernel mismatches, either kernel version is
 *   unknown, a kernel package was queued, or storage packages were queued
 *   and module and userland versions disagree
 * - READY otherwise
 *
 * prior may be null, in which case only the kernel facts contribute.
 */
PostAssessment assessPostUpdate(const SystemSnapshot &snapshot,
                                const Artifact *prior,
                                const PhaseVerdict &verdict);

} // namespace zverify
