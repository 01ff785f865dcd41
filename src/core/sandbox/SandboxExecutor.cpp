#include "SandboxExecutor.hpp"
#include "core/common/Config.hpp"
#include "core/common/Logger.hpp"
#include "core/sandbox/ScriptComposer.hpp"

#include <QtCore/QElapsedTimer>
#include <limits>

namespace Enclave {

namespace {

// Force-removes the container when the execution scope unwinds
class ContainerTeardown {
public:
    explicit ContainerTeardown(ContainerEngine& engine) : engine_(engine) {}
    ~ContainerTeardown() {
        if (containerId_.isEmpty()) {
            return;
        }
        ENCLAVE_DEBUG("Stage {}: removing container {}",
                      toString(ExecutionStage::Teardown).toStdString(), containerId_.left(12).toStdString());
        auto removed = engine_.removeContainer(containerId_, true);
        if (removed.hasError()) {
            ENCLAVE_WARN("Container {} could not be removed: {}",
                         containerId_.left(12).toStdString(), removed.error().describe().toStdString());
        }
    }

    ContainerTeardown(const ContainerTeardown&) = delete;
    ContainerTeardown& operator=(const ContainerTeardown&) = delete;

    void track(const QString& containerId) { containerId_ = containerId; }

private:
    ContainerEngine& engine_;
    QString containerId_;
};

class StagedScriptCleanup {
public:
    StagedScriptCleanup(SessionStore& store, const StagedScript& script)
        : store_(store), script_(script) {}
    ~StagedScriptCleanup() {
        auto removed = store_.removeStagedScript(script_);
        if (removed.hasError()) {
            ENCLAVE_WARN("Staged script {} was left behind", script_.hostPath.toStdString());
        }
    }

    StagedScriptCleanup(const StagedScriptCleanup&) = delete;
    StagedScriptCleanup& operator=(const StagedScriptCleanup&) = delete;

private:
    SessionStore& store_;
    StagedScript script_;
};

ExecutionResult failure(ExecutionResult result, ExecutionStatus status, const QString& diagnostic) {
    result.status = status;
    result.diagnostic = diagnostic;
    ENCLAVE_ERROR("Execution in session {} ended with {}: {}", result.sessionId.toStdString(),
                  toString(status).toStdString(), diagnostic.toStdString());
    return result;
}

} // namespace

QString toString(ExecutionStage stage) {
    switch (stage) {
    case ExecutionStage::Staging: return "Staging";
    case ExecutionStage::Launching: return "Launching";
    case ExecutionStage::Running: return "Running";
    case ExecutionStage::Collecting: return "Collecting";
    case ExecutionStage::Teardown: return "Teardown";
    case ExecutionStage::Done: return "Done";
    }
    return "Unknown";
}

SandboxExecutor::SandboxExecutor(ContainerEngine& engine, SessionStore& store, SandboxOptions options)
    : engine_(engine)
    , store_(store)
    , options_(std::move(options)) {
}

AvailabilityReport SandboxExecutor::checkAvailability() {
    AvailabilityReport report;

    auto ping = engine_.ping();
    if (ping.hasError()) {
        report.status = ExecutionStatus::InfrastructureUnavailable;
        report.message = "Docker is not available: " + ping.error().describe();
        return report;
    }

    auto image = engine_.imageExists(options_.image());
    if (image.hasError()) {
        report.status = ExecutionStatus::InfrastructureUnavailable;
        report.message = "Could not inspect image '" + options_.image() + "': " + image.error().describe();
        return report;
    }
    if (!image.value()) {
        report.status = ExecutionStatus::ImageMissing;
        report.message = QString("Docker image '%1' not found. Build it with: "
                                 "docker build -f docker/Dockerfile.sandbox -t %1 .").arg(options_.image());
        return report;
    }

    report.available = true;
    report.status = ExecutionStatus::Success;
    return report;
}

ContainerSpec SandboxExecutor::buildContainerSpec(const Session& session, const StagedScript& script,
                                                  const ResourceLimits& limits, qint64 memoryBytes) const {
    ContainerSpec spec;
    spec.image = options_.image();
    spec.command = QStringList{"python3", script.containerPath};
    spec.user = options_.user;
    spec.workingDirectory = session.mountPath;
    spec.environment = QStringList{"PYTHONUNBUFFERED=1", "PYTHONDONTWRITEBYTECODE=1"};
    spec.mounts.append(BindMount{session.hostPath, session.mountPath, false});
    spec.memoryBytes = memoryBytes;
    spec.cpuQuota = limits.cpuQuota;
    spec.cpuPeriod = 100000;
    spec.networkEnabled = limits.enableNetwork;
    spec.dropCapabilities = QStringList{"ALL"};
    spec.securityOptions = QStringList{"no-new-privileges"};
    spec.tmpfs.insert("/tmp", QString("size=%1,mode=1777").arg(options_.tmpfsSize));
    return spec;
}

ExecutionResult SandboxExecutor::execute(const ExecutionRequest& request) {
    ExecutionResult result;
    result.sessionId = request.sessionId;

    const AvailabilityReport availability = checkAvailability();
    if (!availability.available) {
        return failure(result, availability.status, availability.message);
    }

    const qint64 memoryBytes = parseMemoryLimit(request.limits.memoryLimit);
    if (memoryBytes < 0) {
        return failure(result, ExecutionStatus::LaunchFailed,
                       "Invalid memory limit '" + request.limits.memoryLimit + "'");
    }
    // The wait is given in milliseconds as an int
    if (request.limits.timeoutSeconds <= 0 ||
        request.limits.timeoutSeconds > std::numeric_limits<int>::max() / 1000 ||
        request.limits.cpuQuota < 0) {
        return failure(result, ExecutionStatus::LaunchFailed, "Invalid resource limits");
    }

    QElapsedTimer timer;
    timer.start();

    ENCLAVE_DEBUG("Stage {}: session {}", toString(ExecutionStage::Staging).toStdString(),
                  request.sessionId.toStdString());
    auto session = store_.ensure(request.sessionId);
    if (session.hasError()) {
        return failure(result, ExecutionStatus::Unexpected,
                       "Session directory unavailable: " + toString(session.error()));
    }

    auto staged = store_.stageScript(request.sessionId, ScriptComposer::compose(request.code, request.context));
    if (staged.hasError()) {
        return failure(result, ExecutionStatus::Unexpected,
                       "Failed to stage script: " + toString(staged.error()));
    }

    // Declared before the container guard so the script outlives the container
    StagedScriptCleanup scriptCleanup(store_, staged.value());
    ContainerTeardown teardown(engine_);

    ENCLAVE_DEBUG("Stage {}: image {}, memory {}, cpu quota {}, network {}",
                  toString(ExecutionStage::Launching).toStdString(), options_.image().toStdString(),
                  memoryBytes, request.limits.cpuQuota, request.limits.enableNetwork ? "on" : "off");
    auto containerId = engine_.createContainer(
        buildContainerSpec(session.value(), staged.value(), request.limits, memoryBytes));
    if (containerId.hasError()) {
        return failure(result, ExecutionStatus::LaunchFailed,
                       "Failed to create container: " + containerId.error().describe());
    }
    teardown.track(containerId.value());

    auto started = engine_.startContainer(containerId.value());
    if (started.hasError()) {
        return failure(result, ExecutionStatus::LaunchFailed,
                       "Failed to start container: " + started.error().describe());
    }

    ENCLAVE_DEBUG("Stage {}: container {}, timeout {}s", toString(ExecutionStage::Running).toStdString(),
                  containerId.value().left(12).toStdString(), request.limits.timeoutSeconds);
    auto exitCode = engine_.waitContainer(containerId.value(), request.limits.timeoutSeconds * 1000);
    if (exitCode.hasError()) {
        if (exitCode.error().code == EngineError::Timeout) {
            // Partial output helps explain what was running
            auto partial = engine_.containerLogs(containerId.value());
            if (partial.hasValue()) {
                result.output = QString::fromUtf8(partial.value());
            }
            result.status = ExecutionStatus::Timeout;
            result.diagnostic = QString("Execution timed out after %1 seconds").arg(request.limits.timeoutSeconds);
            ENCLAVE_WARN("Session {}: {}", request.sessionId.toStdString(), result.diagnostic.toStdString());
            return result;
        }
        return failure(result, ExecutionStatus::Unexpected,
                       "Waiting for container failed: " + exitCode.error().describe());
    }
    result.exitCode = exitCode.value();
    result.exitCodeAvailable = true;

    ENCLAVE_DEBUG("Stage {}: exit code {}", toString(ExecutionStage::Collecting).toStdString(), result.exitCode);
    auto logs = engine_.containerLogs(containerId.value());
    if (logs.hasError()) {
        return failure(result, ExecutionStatus::Unexpected,
                       "Failed to collect container output: " + logs.error().describe());
    }
    result.output = QString::fromUtf8(logs.value());
    result.status = result.exitCode == 0 ? ExecutionStatus::Success : ExecutionStatus::ExecutionFailed;

    ENCLAVE_INFO("Session {}: {} (exit code {}) in {} ms", request.sessionId.toStdString(),
                 toString(result.status).toStdString(), result.exitCode, timer.elapsed());
    return result;
}

} // namespace Enclave
