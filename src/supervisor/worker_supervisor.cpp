#include "supervisor/worker_supervisor.hpp"

#include <QPointer>
#include <QTimer>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "worker/event_codec.hpp"

namespace imprint {

WorkerSupervisor::WorkerSupervisor(Elevator &elevator, QObject *parent)
    : QObject(parent)
    , m_elevator(elevator)
{
    qRegisterMetaType<imprint::TransferEvent>("imprint::TransferEvent");
}

WorkerSupervisor::~WorkerSupervisor()
{
    if (m_process) {
        m_process->disconnect(this);
        if (m_process->state() != QProcess::NotRunning) {
            m_process->kill();
            m_process->waitForFinished(m_killGraceMs);
        }
    }
}

bool WorkerSupervisor::isRunning() const
{
    return m_process && m_process->state() != QProcess::NotRunning;
}

void WorkerSupervisor::setKillGraceMs(int ms)
{
    m_killGraceMs = ms;
}

bool WorkerSupervisor::start(const WorkerInvocation &invocation, const QString &program)
{
    if (isRunning()) {
        emit launchFailed(QStringLiteral("A write is already in progress"));
        return false;
    }

    m_pending.clear();
    m_sawTerminal = false;
    m_sawFinished = false;
    m_sawError = false;
    m_aborted = false;
    if (m_process) {
        m_process.release()->deleteLater();
    }

    QStringList argv;
    argv << program << invocation.toArguments();

    try {
        m_process = m_elevator.run(argv);
    } catch (const ImprintError &ex) {
        ILOG_ERROR(QStringLiteral("WorkerSupervisor"),
                   QStringLiteral("start"),
                   QStringLiteral("worker_launch_failed"),
                   QString::fromUtf8(ex.what()),
                   QStringLiteral("elevator"),
                   logging::defaultWho(),
                   logging::currentCorrelationId(),
                   (nlohmann::json{{"device", invocation.devicePath}}));
        emit launchFailed(QString::fromUtf8(ex.what()));
        return false;
    }

    connect(m_process.get(), &QProcess::readyReadStandardOutput,
            this, &WorkerSupervisor::onReadyRead);
    connect(m_process.get(),
            QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
            this, &WorkerSupervisor::onProcessFinished);

    ILOG_INFO(QStringLiteral("WorkerSupervisor"),
              QStringLiteral("start"),
              QStringLiteral("worker_started"),
              QStringLiteral("user_write_request"),
              QStringLiteral("elevator"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"device", invocation.devicePath},
                              {"image", invocation.imageUrl},
                              {"pid", m_process->processId()}}));

    // Output written before the connection was made is still buffered.
    if (m_process->bytesAvailable() > 0) {
        onReadyRead();
    }
    return true;
}

void WorkerSupervisor::abort()
{
    if (!isRunning() || m_aborted) {
        return;
    }
    m_aborted = true;

    ILOG_WARN(QStringLiteral("WorkerSupervisor"),
              QStringLiteral("abort"),
              QStringLiteral("worker_abort"),
              QStringLiteral("user_cancel"),
              QStringLiteral("sigterm_then_sigkill"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"pid", m_process->processId()}}));

    // A worker started through pkexec runs with all ids set to root, so
    // these signals fail with EPERM and the write runs to completion.
    m_process->terminate();
    QPointer<QProcess> process(m_process.get());
    QTimer::singleShot(m_killGraceMs, this, [process]() {
        if (process && process->state() != QProcess::NotRunning) {
            process->kill();
        }
    });
}

void WorkerSupervisor::onReadyRead()
{
    if (!m_process) {
        return;
    }
    m_pending += m_process->readAllStandardOutput();
    consumeLines(false);
}

void WorkerSupervisor::consumeLines(bool flushPartial)
{
    int newline = m_pending.indexOf('\n');
    while (newline >= 0) {
        const QByteArray line = m_pending.left(newline);
        m_pending.remove(0, newline + 1);

        const auto event = decodeEventLine(line.toStdString());
        if (event) {
            relay(*event);
        } else {
            ILOG_DEBUG(QStringLiteral("WorkerSupervisor"),
                       QStringLiteral("consumeLines"),
                       QStringLiteral("worker_line_skipped"),
                       QStringLiteral("malformed_or_unknown"),
                       QStringLiteral("json_line_decode"),
                       logging::defaultWho(),
                       logging::currentCorrelationId(),
                       (nlohmann::json{{"line", line.left(256).toStdString()}}));
        }
        newline = m_pending.indexOf('\n');
    }

    if (flushPartial && !m_pending.isEmpty()) {
        const auto event = decodeEventLine(m_pending.toStdString());
        m_pending.clear();
        if (event) {
            relay(*event);
        }
    }
}

void WorkerSupervisor::relay(const TransferEvent &event)
{
    if (m_aborted || m_sawTerminal) {
        return;
    }
    if (event.kind == TransferEventKind::Finished) {
        m_sawTerminal = true;
        m_sawFinished = true;
    } else if (event.kind == TransferEventKind::Error) {
        m_sawTerminal = true;
        m_sawError = true;
    }
    emit eventReceived(event);
}

void WorkerSupervisor::onProcessFinished(int exitCode, QProcess::ExitStatus status)
{
    m_pending += m_process->readAllStandardOutput();
    consumeLines(true);

    const bool crashed = status != QProcess::NormalExit;

    ILOG_INFO(QStringLiteral("WorkerSupervisor"),
              QStringLiteral("onProcessFinished"),
              QStringLiteral("worker_exited"),
              m_aborted ? QStringLiteral("aborted") : QStringLiteral("completed"),
              QStringLiteral("qprocess"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"exitCode", exitCode},
                              {"crashed", crashed},
                              {"sawFinished", m_sawFinished},
                              {"sawError", m_sawError}}));

    if (!m_aborted && !m_sawError) {
        if (crashed || exitCode != 0) {
            emit workerCrashed(crashed ? -1 : exitCode,
                               QStringLiteral("Worker process exited with code %1")
                                   .arg(crashed ? -1 : exitCode));
        } else if (!m_sawFinished) {
            emit workerCrashed(exitCode,
                               QStringLiteral("Worker process exited without reporting a result"));
        }
    }

    emit finished(m_sawFinished && !m_aborted && !crashed && exitCode == 0);
}

} // namespace imprint
