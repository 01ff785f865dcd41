#include "SandboxInterpreter.hpp"
#include "core/common/Logger.hpp"
#include "core/engine/DockerEngineClient.hpp"
#include "core/sandbox/ScriptComposer.hpp"

namespace Enclave {

class SandboxInterpreter::SandboxInterpreterPrivate {
public:
    SandboxInterpreterPrivate(std::unique_ptr<ContainerEngine> engine,
                              const Config::SandboxSettings& settings,
                              PolicyGate policyGate)
        : engine(std::move(engine))
        , store(settings.baseDirectory, settings.mountPath)
        , executor(*this->engine, store, optionsFrom(settings))
        , gate(std::move(policyGate)) {
        limits.memoryLimit = settings.memoryLimit;
        limits.cpuQuota = settings.cpuQuota;
        limits.timeoutSeconds = settings.timeoutSeconds;
        limits.enableNetwork = settings.enableNetwork;
    }

    static SandboxOptions optionsFrom(const Config::SandboxSettings& settings) {
        SandboxOptions options;
        options.imageName = settings.imageName;
        options.imageTag = settings.imageTag;
        options.user = settings.user;
        options.tmpfsSize = settings.tmpfsSize;
        return options;
    }

    std::unique_ptr<ContainerEngine> engine;
    SessionStore store;
    SandboxExecutor executor;
    PolicyGate gate;
    ResourceLimits limits;
    bool policyEnabled = true;
};

SandboxInterpreter::SandboxInterpreter(std::unique_ptr<ContainerEngine> engine,
                                       const Config::SandboxSettings& settings,
                                       PolicyGate gate)
    : d(std::make_unique<SandboxInterpreterPrivate>(std::move(engine), settings, std::move(gate))) {
}

SandboxInterpreter::~SandboxInterpreter() = default;

Expected<std::unique_ptr<SandboxInterpreter>, AllowListError>
SandboxInterpreter::fromConfig(const Config& config) {
    const Config::SandboxSettings sandbox = config.getSandboxSettings();
    const Config::PolicySettings policy = config.getPolicySettings();

    AllowList allowList = AllowList::defaults();
    if (!policy.allowListPath.isEmpty()) {
        auto loaded = AllowList::fromJsonFile(policy.allowListPath);
        if (loaded.hasError()) {
            return makeUnexpected(loaded.error());
        }
        allowList = loaded.value();
    } else {
        allowList.setAllowRelativeImports(policy.allowRelativeImports);
        allowList.setDetectDynamicImports(policy.detectDynamicImports);
    }

    auto engine = std::make_unique<DockerEngineClient>(sandbox.dockerSocket);
    return std::make_unique<SandboxInterpreter>(std::move(engine), sandbox, PolicyGate(allowList));
}

ExecutionResult SandboxInterpreter::run(const QString& code, QVariantMap& context,
                                        const QString& sessionId) {
    QString resolved = sessionId;
    if (resolved.isEmpty()) {
        resolved = context.value(SessionContextKey).toString();
    }
    if (resolved.isEmpty()) {
        resolved = SessionStore::generateSessionId();
        context.insert(SessionContextKey, resolved);
        ENCLAVE_INFO("Generated session id {}", resolved.toStdString());
    }

    if (d->policyEnabled) {
        const AllowListVerdict verdict = d->gate.validate(code);
        if (!verdict.accepted) {
            ExecutionResult rejected;
            rejected.sessionId = resolved;
            rejected.status = verdict.kind == AllowListVerdict::Kind::ParseError
                                  ? ExecutionStatus::ParseError
                                  : ExecutionStatus::PolicyViolation;
            rejected.diagnostic = verdict.message;
            return rejected;
        }
    }

    ExecutionRequest request;
    request.code = code;
    request.context = context;
    request.context.remove(SessionContextKey);
    request.sessionId = resolved;
    request.limits = d->limits;
    return d->executor.execute(request);
}

AllowListVerdict SandboxInterpreter::validate(const QString& code) const {
    return d->gate.validate(code);
}

QString SandboxInterpreter::formatResult(const ExecutionResult& result) {
    switch (result.status) {
    case ExecutionStatus::Success:
        return result.output;
    case ExecutionStatus::ExecutionFailed:
        // Uncaught exceptions already carry the marker from the composed script
        if (result.output.startsWith(QLatin1String(ScriptComposer::ErrorMarker))) {
            return result.output;
        }
        return QString(ScriptComposer::ErrorMarker) + QLatin1Char('\n') + result.output;
    case ExecutionStatus::Timeout:
        return "TIMEOUT: " + result.diagnostic;
    case ExecutionStatus::ParseError:
    case ExecutionStatus::PolicyViolation:
        return result.diagnostic;
    case ExecutionStatus::InfrastructureUnavailable:
    case ExecutionStatus::ImageMissing:
    case ExecutionStatus::LaunchFailed:
    case ExecutionStatus::Unexpected:
        return "SANDBOX ERROR:\n" + result.diagnostic;
    }
    return result.output;
}

ResourceLimits SandboxInterpreter::defaultLimits() const {
    return d->limits;
}

void SandboxInterpreter::setDefaultLimits(const ResourceLimits& limits) {
    d->limits = limits;
}

void SandboxInterpreter::setPolicyEnabled(bool enabled) {
    if (!enabled) {
        ENCLAVE_WARN("Import policy gate disabled");
    }
    d->policyEnabled = enabled;
}

bool SandboxInterpreter::isPolicyEnabled() const {
    return d->policyEnabled;
}

SessionStore& SandboxInterpreter::sessionStore() {
    return d->store;
}

SandboxExecutor& SandboxInterpreter::executor() {
    return d->executor;
}

const PolicyGate& SandboxInterpreter::policyGate() const {
    return d->gate;
}

} // namespace Enclave
