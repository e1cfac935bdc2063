#pragma once

#include <string>

#include <QString>
#include <QStringList>

namespace zverify {

struct CommandResult {
    bool started = false;
    bool timedOut = false;
    int exitCode = -1;
    // Trimmed standard output.
    std::string output;

    bool ok() const { return started && !timedOut && exitCode == 0; }
};

/**
 * Seam between the probe and the host. Every external tool the verifier
 * consults goes through this interface so tests can substitute canned output.
 */
class CommandRunner
{
public:
    virtual ~CommandRunner() = default;

    // Never throws; failures are reported through CommandResult.
    virtual CommandResult run(const QString &program, const QStringList &arguments,
                              int timeoutMs) = 0;

    virtual bool hasCommand(const QString &name) = 0;
};

class ProcessCommandRunner : public CommandRunner
{
public:
    CommandResult run(const QString &program, const QStringList &arguments,
                      int timeoutMs) override;

    bool hasCommand(const QString &name) override;
};

} // namespace zverify
