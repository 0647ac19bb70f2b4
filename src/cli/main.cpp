#include <QCoreApplication>

#include <vector>

#include "cli/ReconcileCli.hpp"
#include "common/krecon_version.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("krecon"));
    QCoreApplication::setApplicationVersion(QStringLiteral(KRECON_VERSION));

    bool trace = qEnvironmentVariableIntValue("KRECON_TRACE") == 1;
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    krecon::logging::initLogging(QStringLiteral("krecon"), trace);
    KLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("cli_start"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              krecon::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"args", filteredArgs.size()},
                              {"version", KRECON_VERSION}}));

    krecon::ReconcileCli cli;
    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
