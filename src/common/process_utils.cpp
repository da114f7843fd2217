#include "common/process_utils.hpp"

#include <QCoreApplication>
#include <QFileInfo>
#include <QProcess>

#include <unistd.h>

#include "common/logging.hpp"
#include <nlohmann/json.hpp>

namespace imprint {

CommandResult ProcessCommandRunner::run(const QString &program, const QStringList &args)
{
    CommandResult result;

    QProcess proc;
    proc.start(program, args);
    if (!proc.waitForStarted()) {
        ILOG_WARN(QStringLiteral("ProcessUtils"),
                  QStringLiteral("run"),
                  QStringLiteral("command_start_failed"),
                  proc.errorString(),
                  QStringLiteral("qprocess"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"program", program.toStdString()}}));
        return result;
    }
    result.started = true;

    // Host tools like mount can take a while on slow media; no timeout.
    proc.waitForFinished(-1);
    result.crashed = proc.exitStatus() != QProcess::NormalExit;
    result.exitCode = proc.exitCode();
    result.standardOutput = proc.readAllStandardOutput();
    result.standardError = proc.readAllStandardError();

    ILOG_DEBUG(QStringLiteral("ProcessUtils"),
               QStringLiteral("run"),
               QStringLiteral("command_finished"),
               QStringLiteral("host_tool"),
               QStringLiteral("qprocess"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"program", program.toStdString()},
                               {"args", args.join(QLatin1Char(' ')).toStdString()},
                               {"exitCode", result.exitCode},
                               {"crashed", result.crashed}}));
    return result;
}

QString selfExecutablePath()
{
    if (QCoreApplication::instance()) {
        const QString path = QCoreApplication::applicationFilePath();
        if (!path.isEmpty()) {
            return path;
        }
    }
    const QFileInfo self(QStringLiteral("/proc/self/exe"));
    if (self.exists()) {
        return self.canonicalFilePath();
    }
    return QStringLiteral("imprint");
}

QString configDirPath()
{
    const QString overrideDir = qEnvironmentVariable("IMPRINT_CONFIG_DIR");
    if (!overrideDir.isEmpty()) {
        return overrideDir;
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QString();
    }
    return home + QStringLiteral("/.config/imprint");
}

bool isRunningAsRoot()
{
    return geteuid() == 0;
}

} // namespace imprint
