#pragma once

#include <QString>
#include <QStringList>

namespace imprint {

class ImprintCli
{
public:
    // CLI dispatcher for catalog browsing, drive listing, settings and writes.
    // returns exit code
    int run(const QStringList &args);

private:
    int runDevices(const QStringList &args);
    int runOsList(const QStringList &args);
    int runDrives(const QStringList &args);
    int runSettings(const QStringList &args);
    int runSshKeys(const QStringList &args);

    // Supervised write: resolves the image and drive, confirms, launches the
    // elevated worker and renders its events until a terminal state.
    int runWrite(const QStringList &args);
};

} // namespace imprint
