#pragma once

#include <memory>

#include <QByteArray>
#include <QMetaType>
#include <QObject>
#include <QProcess>

#include "common/models.hpp"
#include "supervisor/elevator.hpp"
#include "worker/worker_invocation.hpp"

namespace imprint {

/**
 * Unprivileged side of a write: launches the worker through an Elevator,
 * decodes its stdout line by line and relays each event in order.
 *
 * Malformed or unknown lines are skipped. Events after the first terminal
 * event are dropped. A worker that exits non-zero without having sent an
 * Error is reported through workerCrashed(). finished() fires exactly once
 * per successful start().
 */
class WorkerSupervisor : public QObject
{
    Q_OBJECT
public:
    explicit WorkerSupervisor(Elevator &elevator, QObject *parent = nullptr);
    ~WorkerSupervisor() override;

    // Returns false (after emitting launchFailed) when the worker could not
    // be started.
    bool start(const WorkerInvocation &invocation, const QString &program);

    // Stops relaying and terminates the worker: SIGTERM, then SIGKILL after
    // killGraceMs.
    void abort();

    bool isRunning() const;
    void setKillGraceMs(int ms);

signals:
    void eventReceived(const imprint::TransferEvent &event);
    void launchFailed(const QString &message);
    void workerCrashed(int exitCode, const QString &message);
    void finished(bool success);

private slots:
    void onReadyRead();
    void onProcessFinished(int exitCode, QProcess::ExitStatus status);

private:
    void consumeLines(bool flushPartial);
    void relay(const TransferEvent &event);

    Elevator &m_elevator;
    std::unique_ptr<QProcess> m_process;
    QByteArray m_pending;
    bool m_sawTerminal = false;
    bool m_sawFinished = false;
    bool m_sawError = false;
    bool m_aborted = false;
    int m_killGraceMs = 3000;
};

} // namespace imprint

Q_DECLARE_METATYPE(imprint::TransferEvent)
