#include <iostream>

#include <QCoreApplication>

#include <nlohmann/json.hpp>

#include "cli/ImprintCli.hpp"
#include "common/imprint_version.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "worker/worker_main.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("imprint"));
    QCoreApplication::setApplicationVersion(QStringLiteral(IMPRINT_VERSION));

    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    // The elevated half of a write: same binary, different role.
    if (args.contains(QStringLiteral("--worker"))) {
        return imprint::runWorker(args);
    }

    bool trace = qEnvironmentVariableIntValue("IMPRINT_TRACE") == 1;
    QStringList filteredArgs;
    filteredArgs.reserve(args.size());
    for (const QString &arg : args) {
        if (arg == QStringLiteral("--trace")) {
            trace = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    imprint::logging::initLogging(QStringLiteral("imprint"), trace);

    if (imprint::isRunningAsRoot()) {
        std::cerr << "Error: Please run as a normal user. "
                     "The application will request privileges when needed."
                  << std::endl;
        return 1;
    }

    ILOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("cli_start"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              imprint::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"args", filteredArgs.size()}}));

    imprint::ImprintCli cli;
    return cli.run(filteredArgs);
}
