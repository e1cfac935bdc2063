#include "pipeline/phase_pipelines.hpp"

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "artifact/artifact_store.hpp"
#include "checks/check_runner.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "pipeline/environment.hpp"
#include "probe/system_probe.hpp"
#include "report/reporter.hpp"
#include "verdict/aggregator.hpp"

namespace zverify {

namespace {

ReportFormat reportFormat(const Config &config)
{
    return config.format == QStringLiteral("json") ? ReportFormat::Json : ReportFormat::Text;
}

QString makeRunId(Phase phase)
{
    const auto now = std::chrono::system_clock::now();
    const auto epochMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                             now.time_since_epoch())
                             .count();
    return QStringLiteral("%1-%2")
        .arg(phase == Phase::Pre ? QStringLiteral("pre") : QStringLiteral("post"))
        .arg(epochMs);
}

nlohmann::json problemsJson(const std::vector<std::string> &problems)
{
    return nlohmann::json{{"problems", problems}};
}

} // namespace

PreUpdatePipeline::PreUpdatePipeline(const Config &config, CommandRunner &runner,
                                     std::ostream &out)
    : m_config(config)
    , m_runner(runner)
    , m_out(out)
{
}

int PreUpdatePipeline::run()
{
    const QString runId = makeRunId(Phase::Pre);
    logging::CorrelationScope scope(runId);
    Reporter reporter(m_out, reportFormat(m_config));

    ZLOG_INFO(QStringLiteral("PreUpdatePipeline"),
              QStringLiteral("run"),
              QStringLiteral("phase_start"),
              QStringLiteral("pre_update_phase"),
              QStringLiteral("pipeline"),
              logging::defaultWho(),
              runId,
              (nlohmann::json{{"artifact", m_config.artifactPath.toStdString()},
                              {"sync", m_config.syncRepositories}}));

    const auto problems = validateEnvironment(m_config, m_runner,
                                              {QStringLiteral("xbps-install"),
                                               QStringLiteral("xbps-query")});
    if (!problems.empty()) {
        ZLOG_ERROR(QStringLiteral("PreUpdatePipeline"),
                   QStringLiteral("run"),
                   QStringLiteral("environment_invalid"),
                   QStringLiteral("pre_update_phase"),
                   QStringLiteral("validateEnvironment"),
                   logging::defaultWho(),
                   runId,
                   problemsJson(problems));
        reporter.renderEnvironmentError(Phase::Pre, problems);
        return 1;
    }

    SystemProbe probe(m_config, m_runner);
    std::string queryError;
    const auto pending = probe.queryPendingUpdates(m_config.syncRepositories, &queryError);
    if (!pending) {
        ZLOG_ERROR(QStringLiteral("PreUpdatePipeline"),
                   QStringLiteral("run"),
                   QStringLiteral("pending_query_failed"),
                   QStringLiteral("pre_update_phase"),
                   QStringLiteral("xbps-install"),
                   logging::defaultWho(),
                   runId,
                   (nlohmann::json{{"error", queryError}}));
        reporter.renderEnvironmentError(Phase::Pre, {queryError});
        return 1;
    }

    if (pending->total == 0) {
        reporter.renderNoUpdates(*pending);
        return 0;
    }

    PreUpdateReport report;
    report.snapshot = probe.collect(ProbeOptions{}, *pending);

    const CheckContext context{report.snapshot, nullptr, m_config.thresholds, Phase::Pre};
    report.checks = CheckRunner().run(context);
    report.verdict = aggregate(report.checks.results);
    report.impact = classifyPendingUpdates(*pending);
    report.artifactPath = m_config.artifactPath.toStdString();

    // A blocked run must not leave a handoff behind for the update to consume.
    if (!report.verdict.fatal) {
        const ArtifactStore store(m_config.artifactPath);
        const Artifact artifact = ArtifactStore::fromSnapshot(report.snapshot,
                                                              logging::currentLogPath(),
                                                              report.verdict.warnCount);
        report.artifactWritten = store.write(artifact, &report.artifactError);
        if (!report.artifactWritten) {
            ZLOG_ERROR(QStringLiteral("PreUpdatePipeline"),
                       QStringLiteral("run"),
                       QStringLiteral("artifact_write_failed"),
                       QStringLiteral("pre_update_phase"),
                       QStringLiteral("ArtifactStore::write"),
                       logging::defaultWho(),
                       runId,
                       (nlohmann::json{{"error", report.artifactError}}));
        }
    }

    reporter.renderPre(report);

    const int exitCode = report.verdict.fatal || !report.artifactWritten ? 1 : 0;
    ZLOG_INFO(QStringLiteral("PreUpdatePipeline"),
              QStringLiteral("run"),
              QStringLiteral("phase_complete"),
              QStringLiteral("pre_update_phase"),
              QStringLiteral("pipeline"),
              logging::defaultWho(),
              runId,
              (nlohmann::json{{"verdict", report.verdict},
                              {"impact", report.impact},
                              {"exitCode", exitCode}}));
    return exitCode;
}

PostUpdatePipeline::PostUpdatePipeline(const Config &config, CommandRunner &runner,
                                       std::ostream &out)
    : m_config(config)
    , m_runner(runner)
    , m_out(out)
{
}

int PostUpdatePipeline::run()
{
    const QString runId = makeRunId(Phase::Post);
    logging::CorrelationScope scope(runId);
    Reporter reporter(m_out, reportFormat(m_config));

    ZLOG_INFO(QStringLiteral("PostUpdatePipeline"),
              QStringLiteral("run"),
              QStringLiteral("phase_start"),
              QStringLiteral("post_update_phase"),
              QStringLiteral("pipeline"),
              logging::defaultWho(),
              runId,
              (nlohmann::json{{"artifact", m_config.artifactPath.toStdString()},
                              {"roundTrip", m_config.runRoundTrip}}));

    const auto problems = validateEnvironment(m_config, m_runner, {});
    if (!problems.empty()) {
        ZLOG_ERROR(QStringLiteral("PostUpdatePipeline"),
                   QStringLiteral("run"),
                   QStringLiteral("environment_invalid"),
                   QStringLiteral("post_update_phase"),
                   QStringLiteral("validateEnvironment"),
                   logging::defaultWho(),
                   runId,
                   problemsJson(problems));
        reporter.renderEnvironmentError(Phase::Post, problems);
        return 1;
    }

    PostUpdateReport report;
    report.prior = ArtifactStore(m_config.artifactPath).read();

    ProbeOptions options;
    options.runRoundTrip = m_config.runRoundTrip;
    SystemProbe probe(m_config, m_runner);
    report.snapshot = probe.collect(options);

    const Artifact *prior = report.prior ? &*report.prior : nullptr;
    const CheckContext context{report.snapshot, prior, m_config.thresholds, Phase::Post};
    report.checks = CheckRunner().run(context);
    report.verdict = aggregate(report.checks.results);
    report.assessment = assessPostUpdate(report.snapshot, prior, report.verdict);

    reporter.renderPost(report);

    const int exitCode = exitCodeFor(report.verdict);
    ZLOG_INFO(QStringLiteral("PostUpdatePipeline"),
              QStringLiteral("run"),
              QStringLiteral("phase_complete"),
              QStringLiteral("post_update_phase"),
              QStringLiteral("pipeline"),
              logging::defaultWho(),
              runId,
              (nlohmann::json{{"verdict", report.verdict},
                              {"assessment", report.assessment},
                              {"exitCode", exitCode}}));
    return exitCode;
}

} // namespace zverify
