#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "checks/check_runner.hpp"
#include "common/models.hpp"

namespace zverify {

enum class ReportFormat {
    Text,
    Json
};

struct PreUpdateReport {
    SystemSnapshot snapshot;
    CheckRun checks;
    PhaseVerdict verdict;
    UpdateImpact impact;
    std::string artifactPath;
    bool artifactWritten = false;
    std::string artifactError;
};

struct PostUpdateReport {
    SystemSnapshot snapshot;
    CheckRun checks;
    PhaseVerdict verdict;
    PostAssessment assessment;
    std::optional<Artifact> prior;
};

// 0 when the phase may proceed (warnings allowed), 1 when it is blocked.
int exitCodeFor(const PhaseVerdict &verdict);

/**
 * Renders phase outcomes for the operator. Text output puts blocking
 * failures first and mirrors every line into the run log; JSON output is a
 * single document. Holds no state besides the stream and format.
 */
class Reporter
{
public:
    Reporter(std::ostream &out, ReportFormat format);

    void renderPre(const PreUpdateReport &report);
    void renderPost(const PostUpdateReport &report);
    void renderEnvironmentError(Phase phase, const std::vector<std::string> &problems);
    void renderNoUpdates(const PendingUpdateCounts &pendingUpdates);

private:
    void line(const std::string &text = std::string());
    void emitJson(const nlohmann::json &payload);

    void renderSystemSummary(const SystemSnapshot &snapshot);
    void renderChecks(const CheckRun &checks);
    void renderVerdict(const PhaseVerdict &verdict);

    std::ostream &m_out;
    ReportFormat m_format;
};

} // namespace zverify
