#include "pipeline/environment.hpp"

#include <unistd.h>

namespace zverify {

std::vector<std::string> validateEnvironment(const Config &config,
                                             CommandRunner &runner,
                                             const QStringList &requiredTools)
{
    std::vector<std::string> problems;
    if (config.requireRoot && geteuid() != 0) {
        problems.push_back("must be run as root");
    }
    for (const QString &tool : requiredTools) {
        if (!runner.hasCommand(tool)) {
            problems.push_back("required command not found: " + tool.toStdString());
        }
    }
    return problems;
}

} // namespace zverify
