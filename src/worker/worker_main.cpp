#include "worker/worker_main.hpp"

#include <iostream>

#include <QtGlobal>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "worker/event_codec.hpp"
#include "worker/transfer_job.hpp"
#include "worker/worker_invocation.hpp"

namespace imprint {

int runWorker(const QStringList &args)
{
    const bool trace = args.contains(QStringLiteral("--trace"))
        || qEnvironmentVariableIntValue("IMPRINT_TRACE") == 1;
    logging::initLogging(QStringLiteral("imprint-worker"), trace);

    WorkerInvocation invocation;
    try {
        invocation = WorkerInvocation::fromArguments(args);
    } catch (const ImprintError &ex) {
        ILOG_ERROR(QStringLiteral("Worker"),
                   QStringLiteral("runWorker"),
                   QStringLiteral("invocation_rejected"),
                   QString::fromUtf8(ex.what()),
                   QStringLiteral("argv"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"argc", args.size()}}));
        std::cerr << ex.what() << std::endl;
        return 2;
    }

    logging::CorrelationScope corrScope(QString::fromStdString(invocation.correlationId));

    ILOG_INFO(QStringLiteral("Worker"),
              QStringLiteral("runWorker"),
              QStringLiteral("worker_started"),
              QStringLiteral("elevated_write"),
              QStringLiteral("transfer_job"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"device", invocation.devicePath},
                              {"image", invocation.imageUrl}}));

    // stdout carries only the event stream.
    ProcessCommandRunner runner;
    TransferJob job([](const TransferEvent &event) {
        std::cout << encodeEventLine(event) << '\n';
        std::cout.flush();
    }, runner);

    const bool finished = job.run(invocation);

    ILOG_INFO(QStringLiteral("Worker"),
              QStringLiteral("runWorker"),
              QStringLiteral("worker_exiting"),
              finished ? QStringLiteral("finished") : QStringLiteral("error"),
              QStringLiteral("transfer_job"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              nlohmann::json::object());
    return finished ? 0 : 1;
}

} // namespace imprint
