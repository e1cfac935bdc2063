#pragma once

#include <functional>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"

namespace zverify {

struct CheckContext {
    const SystemSnapshot &snapshot;
    // Handoff from the pre-update phase; null when none was found.
    const Artifact *prior = nullptr;
    Thresholds thresholds;
    Phase phase = Phase::Pre;
};

struct CheckOutcome {
    Severity severity = Severity::Pass;
    std::string message;
};

// Bits of CheckDefinition::phases.
constexpr unsigned kPrePhase = 1u << 0;
constexpr unsigned kPostPhase = 1u << 1;
constexpr unsigned kBothPhases = kPrePhase | kPostPhase;

struct CheckDefinition {
    std::string name;
    bool fatalOnFail = false;
    unsigned phases = kBothPhases;
    // Precondition; a check whose precondition fails is skipped, not failed.
    std::function<bool(const CheckContext &)> applies;
    std::function<CheckOutcome(const CheckContext &)> evaluate;
};

/**
 * The ordered catalogue shared by both phases. Fatal-class checks report
 * FAIL for their failure condition, the others WARN; an unknown observation
 * is never a PASS.
 */
std::vector<CheckDefinition> defaultCatalogue();

} // namespace zverify
