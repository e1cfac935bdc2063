#pragma once

#include <ostream>

#include "common/config.hpp"
#include "common/process_utils.hpp"

namespace zverify {

// Pre-update phase: gate an upcoming package update and hand the observed
// state to the post-update phase. Returns the process exit code.
class PreUpdatePipeline
{
public:
    PreUpdatePipeline(const Config &config, CommandRunner &runner, std::ostream &out);

    int run();

private:
    const Config &m_config;
    CommandRunner &m_runner;
    std::ostream &m_out;
};

// Post-update phase: verify the system after the update and decide whether
// it is ready, needs a reboot, or is broken. Returns the process exit code.
class PostUpdatePipeline
{
public:
    PostUpdatePipeline(const Config &config, CommandRunner &runner, std::ostream &out);

    int run();

private:
    const Config &m_config;
    CommandRunner &m_runner;
    std::ostream &m_out;
};

} // namespace zverify
