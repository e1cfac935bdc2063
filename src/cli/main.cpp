#include <QCoreApplication>

#include <vector>

#include "cli/VerifyCli.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("zverify"));

    // QCoreApplication may strip Qt options; hand the remaining arguments on.
    const QStringList arguments = QCoreApplication::arguments();
    std::vector<QByteArray> localArgs;
    std::vector<char *> rawArgs;
    localArgs.reserve(arguments.size());
    for (const QString &arg : arguments) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }

    zverify::VerifyCli cli;
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
