#pragma once

#include <string>
#include <vector>

#include <QStringList>

#include "common/config.hpp"
#include "common/process_utils.hpp"

namespace zverify {

// Upfront environment errors: missing root privilege (unless disabled in
// config) and absent required tools. Empty when the phase may run.
std::vector<std::string> validateEnvironment(const Config &config,
                                             CommandRunner &runner,
                                             const QStringList &requiredTools);

} // namespace zverify
