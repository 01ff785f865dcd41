#pragma once

#include <QtCore/QString>
#include <QtCore/QVariantMap>
#include <memory>

#include "core/common/Config.hpp"
#include "core/common/Expected.hpp"
#include "core/engine/ContainerEngine.hpp"
#include "core/policy/PolicyGate.hpp"
#include "core/sandbox/ExecutionTypes.hpp"
#include "core/sandbox/SandboxExecutor.hpp"
#include "core/session/SessionStore.hpp"

namespace Enclave {

/**
 * @brief One-call entry point: policy gate, then sandboxed execution
 *
 * run() resolves the session id (explicit argument, then the
 * __sandbox_session_id__ context key, then a fresh UUID that is written back
 * into the context), rejects the snippet before any container exists when
 * the gate does not accept it, and otherwise hands it to the executor.
 */
class SandboxInterpreter {
public:
    static constexpr const char* SessionContextKey = "__sandbox_session_id__";

    SandboxInterpreter(std::unique_ptr<ContainerEngine> engine,
                       const Config::SandboxSettings& settings,
                       PolicyGate gate = PolicyGate());
    ~SandboxInterpreter();

    SandboxInterpreter(const SandboxInterpreter&) = delete;
    SandboxInterpreter& operator=(const SandboxInterpreter&) = delete;

    // Docker client on the configured socket, allow-list from the policy section
    static Expected<std::unique_ptr<SandboxInterpreter>, AllowListError> fromConfig(const Config& config);

    ExecutionResult run(const QString& code, QVariantMap& context,
                        const QString& sessionId = QString());

    // Gate verdict only, no execution
    AllowListVerdict validate(const QString& code) const;

    static QString formatResult(const ExecutionResult& result);

    ResourceLimits defaultLimits() const;
    void setDefaultLimits(const ResourceLimits& limits);

    // Disabling the gate leaves the container as the only barrier
    void setPolicyEnabled(bool enabled);
    bool isPolicyEnabled() const;

    SessionStore& sessionStore();
    SandboxExecutor& executor();
    const PolicyGate& policyGate() const;

private:
    class SandboxInterpreterPrivate;
    std::unique_ptr<SandboxInterpreterPrivate> d;
};

} // namespace Enclave
