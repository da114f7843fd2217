#include "cli/InterruptWatcher.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <sys/socket.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "cli/WriteSession.hpp"
#include "common/logging.hpp"
#include "supervisor/worker_supervisor.hpp"

namespace imprint {

namespace {

int g_signalFds[2] = {-1, -1};
struct sigaction g_previousInt;
struct sigaction g_previousTerm;

extern "C" void forwardSignal(int signalNumber)
{
    const int savedErrno = errno;
    const unsigned char byte = static_cast<unsigned char>(signalNumber);
    // Async-signal-safe; a full pipe only drops a duplicate notification.
    [[maybe_unused]] const ssize_t n = ::write(g_signalFds[0], &byte, 1);
    errno = savedErrno;
}

void closeSignalFds()
{
    for (int &fd : g_signalFds) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
}

} // namespace

InterruptWatcher::InterruptWatcher(QObject *parent)
    : QObject(parent)
{
    if (g_signalFds[0] >= 0) {
        ILOG_WARN(QStringLiteral("InterruptWatcher"),
                  QStringLiteral("InterruptWatcher"),
                  QStringLiteral("watcher_already_active"),
                  QStringLiteral("single_instance"),
                  QStringLiteral("socketpair"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  nlohmann::json::object());
        return;
    }

    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0, g_signalFds) != 0) {
        const int err = errno;
        g_signalFds[0] = g_signalFds[1] = -1;
        ILOG_WARN(QStringLiteral("InterruptWatcher"),
                  QStringLiteral("InterruptWatcher"),
                  QStringLiteral("socketpair_failed"),
                  QString::fromUtf8(std::strerror(err)),
                  QStringLiteral("socketpair"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  nlohmann::json::object());
        return;
    }

    struct sigaction action {};
    action.sa_handler = forwardSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &action, &g_previousInt) != 0) {
        closeSignalFds();
        return;
    }
    if (::sigaction(SIGTERM, &action, &g_previousTerm) != 0) {
        ::sigaction(SIGINT, &g_previousInt, nullptr);
        closeSignalFds();
        return;
    }
    m_handlersInstalled = true;

    m_notifier = std::make_unique<QSocketNotifier>(g_signalFds[1], QSocketNotifier::Read);
    connect(m_notifier.get(),
            QOverload<QSocketDescriptor, QSocketNotifier::Type>::of(&QSocketNotifier::activated),
            this, &InterruptWatcher::onReadable);
}

InterruptWatcher::~InterruptWatcher()
{
    if (!m_handlersInstalled) {
        return;
    }
    m_notifier.reset();
    ::sigaction(SIGINT, &g_previousInt, nullptr);
    ::sigaction(SIGTERM, &g_previousTerm, nullptr);
    closeSignalFds();
}

void InterruptWatcher::onReadable()
{
    unsigned char byte = 0;
    while (::read(g_signalFds[1], &byte, 1) == 1) {
        ILOG_INFO(QStringLiteral("InterruptWatcher"),
                  QStringLiteral("onReadable"),
                  QStringLiteral("signal_received"),
                  QStringLiteral("user_interrupt"),
                  QStringLiteral("self_pipe"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  (nlohmann::json{{"signal", static_cast<int>(byte)}}));
        emit interrupted(static_cast<int>(byte));
    }
}

void abortOnInterrupt(InterruptWatcher &watcher, WorkerSupervisor &supervisor,
                      WriteSession &session)
{
    QObject::connect(&watcher, &InterruptWatcher::interrupted, &supervisor,
                     [&supervisor, &session](int) {
                         session.abort();
                         supervisor.abort();
                     });
}

} // namespace imprint
