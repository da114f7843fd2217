#pragma once

#include <memory>

#include <QProcess>
#include <QStringList>

namespace imprint {

// Launches the worker command with elevated privileges. argv[0] is the
// program. Implementations return an already started process whose stdout
// is readable; stderr and stdin stay attached to the terminal so a helper
// can prompt for credentials. Throws ImprintError(ElevationFailed).
class Elevator {
public:
    virtual ~Elevator() = default;
    virtual std::unique_ptr<QProcess> run(const QStringList &argv) = 0;
};

// sudo first, then pkexec.
class HelperElevator : public Elevator {
public:
    HelperElevator();
    explicit HelperElevator(const QStringList &helpers);

    std::unique_ptr<QProcess> run(const QStringList &argv) override;

private:
    QStringList m_helpers;
};

// Runs argv as-is. Used for "IMPRINT_ELEVATOR=none" and tests.
class DirectElevator : public Elevator {
public:
    std::unique_ptr<QProcess> run(const QStringList &argv) override;
};

// Honours IMPRINT_ELEVATOR (sudo, pkexec or none); defaults to sudo, pkexec.
std::unique_ptr<Elevator> makeElevatorFromEnvironment();

} // namespace imprint
