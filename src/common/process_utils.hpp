#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace imprint {

struct CommandResult {
    bool started = false;
    bool crashed = false;
    int exitCode = -1;
    QByteArray standardOutput;
    QByteArray standardError;

    bool succeeded() const { return started && !crashed && exitCode == 0; }
};

// Runs host tools (mount, umount, partprobe, lsblk). Injected so callers can
// be exercised without touching real block devices.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual CommandResult run(const QString &program, const QStringList &args) = 0;
};

class ProcessCommandRunner : public CommandRunner {
public:
    CommandResult run(const QString &program, const QStringList &args) override;
};

QString selfExecutablePath();
QString configDirPath();
bool isRunningAsRoot();

} // namespace imprint
