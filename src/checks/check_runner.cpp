#include "checks/check_runner.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace zverify {

namespace {

unsigned phaseBit(Phase phase)
{
    return phase == Phase::Pre ? kPrePhase : kPostPhase;
}

} // namespace

CheckRunner::CheckRunner()
    : m_catalogue(defaultCatalogue())
{
}

CheckRunner::CheckRunner(std::vector<CheckDefinition> catalogue)
    : m_catalogue(std::move(catalogue))
{
}

CheckRun CheckRunner::run(const CheckContext &context) const
{
    CheckRun checkRun;
    const QString corrId = logging::currentCorrelationId();

    for (const auto &check : m_catalogue) {
        if ((check.phases & phaseBit(context.phase)) == 0) {
            continue;
        }

        CheckResult result;
        result.checkName = check.name;
        result.fatalOnFail = check.fatalOnFail;

        try {
            if (check.applies && !check.applies(context)) {
                checkRun.skipped.push_back(check.name);
                ZLOG_DEBUG(QStringLiteral("CheckRunner"),
                           QStringLiteral("run"),
                           QStringLiteral("check_skipped"),
                           QStringLiteral("precondition_not_met"),
                           QStringLiteral("catalogue"),
                           logging::defaultWho(),
                           corrId,
                           (nlohmann::json{{"check", check.name}}));
                continue;
            }
            const CheckOutcome outcome = check.evaluate(context);
            result.severity = outcome.severity;
            result.message = outcome.message;
        } catch (const std::exception &ex) {
            result.severity = Severity::Fail;
            result.message = std::string("check raised an error: ") + ex.what();
            ZLOG_ERROR(QStringLiteral("CheckRunner"),
                       QStringLiteral("run"),
                       QStringLiteral("check_exception"),
                       QStringLiteral("catalogue"),
                       QStringLiteral("std::exception"),
                       logging::defaultWho(),
                       corrId,
                       (nlohmann::json{{"check", check.name}, {"error", ex.what()}}));
        }
        result.observedAt = std::chrono::system_clock::now();

        if (result.severity == Severity::Pass) {
            ZLOG_DEBUG(QStringLiteral("CheckRunner"),
                       QStringLiteral("run"),
                       QStringLiteral("check_result"),
                       QStringLiteral("catalogue"),
                       QStringLiteral("evaluate"),
                       logging::defaultWho(),
                       corrId,
                       (nlohmann::json{{"check", check.name}, {"message", result.message}}));
        } else {
            ZLOG_WARN(QStringLiteral("CheckRunner"),
                      QStringLiteral("run"),
                      QStringLiteral("check_result"),
                      QStringLiteral("catalogue"),
                      QStringLiteral("evaluate"),
                      logging::defaultWho(),
                      corrId,
                      (nlohmann::json{{"check", check.name},
                                      {"severity", toSeverityString(result.severity)},
                                      {"fatalOnFail", result.fatalOnFail},
                                      {"message", result.message}}));
        }
        checkRun.results.push_back(std::move(result));
    }

    return checkRun;
}

} // namespace zverify
