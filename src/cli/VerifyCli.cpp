#include "cli/VerifyCli.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "pipeline/phase_pipelines.hpp"
#include "zverify_version.hpp"

namespace zverify {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  zverify pre  [options]   verify the system before applying package updates\n"
        "  zverify post [options]   verify the system after applying package updates\n"
        "  zverify --version\n"
        "\n"
        "Options:\n"
        "  --format text|json   report format (default text)\n"
        "  --artifact PATH      pre/post handoff file (default /etc/zfs-update.conf)\n"
        "  --log-dir DIR        directory for per-run logs (default /var/log/zverify)\n"
        "  --sysroot DIR        inspect host files below DIR\n"
        "  --timeout SEC        timeout for each external command (default 60)\n"
        "  --no-sync            pre: do not sync package repositories first\n"
        "  --no-roundtrip       post: skip the create/snapshot/destroy test\n"
        "  --trace              write debug records to the log\n");
}

} // namespace

int VerifyCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    if (command == QStringLiteral("--version")) {
        std::cout << "zverify " << ZVERIFY_VERSION << std::endl;
        return 0;
    }
    if (command == QStringLiteral("--help") || command == QStringLiteral("-h")) {
        std::cout << usageText().toStdString();
        return 0;
    }
    if (command == QStringLiteral("pre") || command == QStringLiteral("post")) {
        return runPhase(command, args.mid(2));
    }

    std::cerr << "Unknown command: " << command.toStdString() << "\n"
              << usageText().toStdString();
    return 1;
}

int VerifyCli::runPhase(const QString &command, const QStringList &flags)
{
    Config config = loadConfig();
    const QString error = applyArguments(config, flags);
    if (!error.isEmpty()) {
        std::cerr << error.toStdString() << "\n" << usageText().toStdString();
        return 1;
    }

    logging::initLogging(QStringLiteral("zverify-") + command, config.logDir, config.trace);
    ZLOG_INFO(QStringLiteral("VerifyCli"),
              QStringLiteral("runPhase"),
              QStringLiteral("verify_cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"command", command.toStdString()},
                              {"version", ZVERIFY_VERSION},
                              {"format", config.format.toStdString()},
                              {"log", logging::currentLogPath().toStdString()}}));

    ProcessCommandRunner runner;
    if (command == QStringLiteral("pre")) {
        PreUpdatePipeline pipeline(config, runner, std::cout);
        return pipeline.run();
    }
    PostUpdatePipeline pipeline(config, runner, std::cout);
    return pipeline.run();
}

} // namespace zverify
