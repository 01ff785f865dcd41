#include "SessionScope.hpp"
#include "core/common/Logger.hpp"

namespace Enclave {

SessionScope::SessionScope(SessionStore& store, const QString& sessionId, CleanupPolicy policy)
    : store_(store)
    , sessionId_(sessionId)
    , policy_(policy)
    , session_(store.ensure(sessionId)) {
    if (session_.hasError()) {
        ENCLAVE_ERROR("Session scope for '{}' could not be acquired: {}",
                      sessionId.toStdString(), toString(session_.error()).toStdString());
    }
}

SessionScope::~SessionScope() {
    if (policy_ != CleanupPolicy::DestroyOnExit || session_.hasError()) {
        return;
    }

    auto removed = store_.destroy(sessionId_);
    if (removed.hasError()) {
        ENCLAVE_WARN("Session {} could not be removed on scope exit: {}",
                     sessionId_.toStdString(), toString(removed.error()).toStdString());
    }
}

} // namespace Enclave
