#pragma once

#include <string>

#include "common/models.hpp"

namespace imprint {

enum class SessionState {
    Idle,
    Authenticating,
    Writing,
    Verifying,
    Finished,
    Failed,
    Aborted
};

std::string toSessionStateString(SessionState state);

// Front-end view of one write attempt, driven only by relayed TransferEvents
// and supervisor failures. Terminal states ignore further input until the
// next begin().
class WriteSession
{
public:
    SessionState state() const { return m_state; }
    double writePercent() const { return m_writePercent; }
    double verifyPercent() const { return m_verifyPercent; }
    const std::string &statusText() const { return m_status; }
    const std::string &errorText() const { return m_error; }

    bool isActive() const;
    bool isTerminal() const;

    // Idle or terminal -> Authenticating. Returns false while a write is active.
    bool begin();

    // Returns true when the event changed the session.
    bool apply(const TransferEvent &event);

    void launchFailed(const std::string &message);
    void workerCrashed(const std::string &message);
    void abort();

private:
    void fail(const std::string &message);

    SessionState m_state = SessionState::Idle;
    double m_writePercent = 0.0;
    double m_verifyPercent = 0.0;
    std::string m_status;
    std::string m_error;
};

} // namespace imprint
