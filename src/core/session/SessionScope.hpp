#pragma once

#include "core/session/SessionStore.hpp"

namespace Enclave {

enum class CleanupPolicy {
    Keep,
    DestroyOnExit
};

// Ensures a session for the lifetime of the scope; with DestroyOnExit the
// directory is removed on every exit path.
class SessionScope {
public:
    SessionScope(SessionStore& store, const QString& sessionId,
                 CleanupPolicy policy = CleanupPolicy::Keep);
    ~SessionScope();

    SessionScope(const SessionScope&) = delete;
    SessionScope& operator=(const SessionScope&) = delete;

    bool isValid() const { return session_.hasValue(); }
    SessionError error() const { return session_.error(); }
    const Session& session() const { return session_.value(); }
    QString sessionId() const { return sessionId_; }

    CleanupPolicy policy() const { return policy_; }
    void setPolicy(CleanupPolicy policy) { policy_ = policy; }

private:
    SessionStore& store_;
    QString sessionId_;
    CleanupPolicy policy_;
    Expected<Session, SessionError> session_;
};

} // namespace Enclave
