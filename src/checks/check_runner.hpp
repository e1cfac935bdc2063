#pragma once

#include <string>
#include <vector>

#include "checks/check_catalogue.hpp"
#include "common/models.hpp"

namespace zverify {

struct CheckRun {
    // In catalogue order; skipped checks never appear here.
    std::vector<CheckResult> results;
    std::vector<std::string> skipped;
};

// Executes a catalogue in order for one phase. Never stops early and never
// lets an exception escape: a throwing check becomes a FAIL result.
class CheckRunner
{
public:
    CheckRunner();
    explicit CheckRunner(std::vector<CheckDefinition> catalogue);

    CheckRun run(const CheckContext &context) const;

    const std::vector<CheckDefinition> &catalogue() const { return m_catalogue; }

private:
    std::vector<CheckDefinition> m_catalogue;
};

} // namespace zverify
