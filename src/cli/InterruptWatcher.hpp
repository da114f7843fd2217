#pragma once

#include <QObject>
#include <QSocketNotifier>

#include <memory>

namespace imprint {

class WorkerSupervisor;
class WriteSession;

/**
 * Turns SIGINT/SIGTERM into a queued interrupted() signal on the event loop.
 *
 * The handler only writes a byte to a socket pair; a QSocketNotifier on the
 * other end emits interrupted(). Only one watcher may exist at a time; the
 * previous dispositions are restored when it is destroyed.
 */
class InterruptWatcher : public QObject
{
    Q_OBJECT
public:
    explicit InterruptWatcher(QObject *parent = nullptr);
    ~InterruptWatcher() override;

    // False when the socket pair or the handlers could not be installed.
    bool isActive() const { return m_notifier != nullptr; }

signals:
    void interrupted(int signalNumber);

private slots:
    void onReadable();

private:
    std::unique_ptr<QSocketNotifier> m_notifier;
    bool m_handlersInstalled = false;
};

// Ctrl-C during a write: abort the session, then stop the worker.
void abortOnInterrupt(InterruptWatcher &watcher, WorkerSupervisor &supervisor,
                      WriteSession &session);

} // namespace imprint
