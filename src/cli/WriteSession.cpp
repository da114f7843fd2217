#include "cli/WriteSession.hpp"

namespace imprint {

std::string toSessionStateString(SessionState state)
{
    switch (state) {
    case SessionState::Idle:
        return "Idle";
    case SessionState::Authenticating:
        return "Authenticating";
    case SessionState::Writing:
        return "Writing";
    case SessionState::Verifying:
        return "Verifying";
    case SessionState::Finished:
        return "Finished";
    case SessionState::Failed:
        return "Failed";
    case SessionState::Aborted:
        return "Aborted";
    }
    return "Idle";
}

bool WriteSession::isActive() const
{
    return m_state == SessionState::Authenticating
        || m_state == SessionState::Writing
        || m_state == SessionState::Verifying;
}

bool WriteSession::isTerminal() const
{
    return m_state == SessionState::Finished
        || m_state == SessionState::Failed
        || m_state == SessionState::Aborted;
}

bool WriteSession::begin()
{
    if (isActive()) {
        return false;
    }
    m_state = SessionState::Authenticating;
    m_writePercent = 0.0;
    m_verifyPercent = 0.0;
    m_status = "Waiting for authentication...";
    m_error.clear();
    return true;
}

bool WriteSession::apply(const TransferEvent &event)
{
    if (!isActive()) {
        return false;
    }

    // The first worker output proves elevation succeeded.
    if (m_state == SessionState::Authenticating) {
        m_state = SessionState::Writing;
    }

    switch (event.kind) {
    case TransferEventKind::Progress:
        m_writePercent = event.percent;
        break;
    case TransferEventKind::VerifyProgress:
        m_verifyPercent = event.percent;
        break;
    case TransferEventKind::Phase:
        m_state = event.phase == TransferPhase::Verifying ? SessionState::Verifying
                                                          : SessionState::Writing;
        break;
    case TransferEventKind::Status:
        m_status = event.message;
        break;
    case TransferEventKind::Error:
        fail(event.message);
        break;
    case TransferEventKind::Finished:
        m_state = SessionState::Finished;
        m_writePercent = 100.0;
        m_verifyPercent = 100.0;
        m_status = "Write successful";
        break;
    }
    return true;
}

void WriteSession::launchFailed(const std::string &message)
{
    if (!isActive()) {
        return;
    }
    fail(message);
}

void WriteSession::workerCrashed(const std::string &message)
{
    if (!isActive()) {
        return;
    }
    fail(message);
}

void WriteSession::abort()
{
    if (!isActive()) {
        return;
    }
    m_state = SessionState::Aborted;
    m_status = "Write aborted";
}

void WriteSession::fail(const std::string &message)
{
    m_state = SessionState::Failed;
    m_error = message;
}

} // namespace imprint
