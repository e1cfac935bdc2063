#pragma once

#include <QString>
#include <QStringList>

namespace zverify {

class VerifyCli
{
public:
    // CLI dispatcher for the pre-update and post-update phases.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    int runPhase(const QString &command, const QStringList &flags);
};

} // namespace zverify
