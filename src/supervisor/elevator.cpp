#include "supervisor/elevator.hpp"

#include <QStandardPaths>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace imprint {

namespace {

std::unique_ptr<QProcess> startForwarded(const QString &program,
                                         const QStringList &args,
                                         QString *error)
{
    auto process = std::make_unique<QProcess>();
    process->setProcessChannelMode(QProcess::ForwardedErrorChannel);
    process->setInputChannelMode(QProcess::ForwardedInputChannel);
    process->start(program, args);
    if (!process->waitForStarted()) {
        if (error) {
            *error = process->errorString();
        }
        return nullptr;
    }
    return process;
}

} // namespace

HelperElevator::HelperElevator()
    : m_helpers({QStringLiteral("sudo"), QStringLiteral("pkexec")})
{
}

HelperElevator::HelperElevator(const QStringList &helpers)
    : m_helpers(helpers)
{
}

std::unique_ptr<QProcess> HelperElevator::run(const QStringList &argv)
{
    QString firstError;
    for (const QString &helper : m_helpers) {
        const QString helperPath = QStandardPaths::findExecutable(helper);
        if (helperPath.isEmpty()) {
            if (firstError.isEmpty()) {
                firstError = helper + QStringLiteral(" not found");
            }
            continue;
        }

        QString error;
        auto process = startForwarded(helperPath, argv, &error);
        if (process) {
            ILOG_INFO(QStringLiteral("Elevator"),
                      QStringLiteral("HelperElevator::run"),
                      QStringLiteral("worker_spawned"),
                      QStringLiteral("privileged_write"),
                      helper,
                      logging::defaultWho(),
                      logging::currentCorrelationId(),
                      (nlohmann::json{{"helper", helperPath.toStdString()},
                                      {"pid", process->processId()}}));
            return process;
        }

        ILOG_WARN(QStringLiteral("Elevator"),
                  QStringLiteral("HelperElevator::run"),
                  QStringLiteral("helper_spawn_failed"),
                  error,
                  helper,
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  (nlohmann::json{{"helper", helperPath.toStdString()}}));
        if (firstError.isEmpty()) {
            firstError = error;
        }
    }

    throw ImprintError(ErrorKind::ElevationFailed,
                       "Failed to spawn privileged process: "
                           + (firstError.isEmpty() ? std::string("no elevation helper configured")
                                                   : firstError.toStdString()));
}

std::unique_ptr<QProcess> DirectElevator::run(const QStringList &argv)
{
    if (argv.isEmpty()) {
        throw ImprintError(ErrorKind::ElevationFailed,
                           "Failed to spawn privileged process: empty command");
    }

    QString error;
    auto process = startForwarded(argv.first(), argv.mid(1), &error);
    if (!process) {
        throw ImprintError(ErrorKind::ElevationFailed,
                           "Failed to spawn privileged process: " + error.toStdString());
    }
    return process;
}

std::unique_ptr<Elevator> makeElevatorFromEnvironment()
{
    const QString choice = qEnvironmentVariable("IMPRINT_ELEVATOR").trimmed().toLower();
    if (choice == QLatin1String("none")) {
        return std::make_unique<DirectElevator>();
    }
    if (choice == QLatin1String("sudo") || choice == QLatin1String("pkexec")) {
        return std::make_unique<HelperElevator>(QStringList{choice});
    }
    return std::make_unique<HelperElevator>();
}

} // namespace imprint
