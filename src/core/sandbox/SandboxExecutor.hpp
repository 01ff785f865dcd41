#pragma once

#include <QtCore/QString>

#include "core/engine/ContainerEngine.hpp"
#include "core/sandbox/ExecutionTypes.hpp"
#include "core/session/SessionStore.hpp"

namespace Enclave {

enum class ExecutionStage {
    Staging,
    Launching,
    Running,
    Collecting,
    Teardown,
    Done
};

QString toString(ExecutionStage stage);

struct SandboxOptions {
    QString imageName = "enclave-python-sandbox";
    QString imageTag = "latest";
    QString user = "sandbox";
    QString tmpfsSize = "100M";

    QString image() const { return imageTag.isEmpty() ? imageName : imageName + QLatin1Char(':') + imageTag; }
};

struct AvailabilityReport {
    bool available = false;
    ExecutionStatus status = ExecutionStatus::InfrastructureUnavailable;
    QString message;
};

/**
 * @brief Runs one snippet in one fresh container
 *
 * execute() stages the composed script in the session directory, creates a
 * container with the directory bind-mounted read-write, waits for it with a
 * wall-clock limit and collects the combined log stream. The container is
 * force-removed and the staged script deleted on every path out of
 * execute(); neither failure replaces the result.
 *
 * Every outcome, including engine faults, is reported through the returned
 * ExecutionResult. Calls may run concurrently.
 */
class SandboxExecutor {
public:
    SandboxExecutor(ContainerEngine& engine, SessionStore& store,
                    SandboxOptions options = SandboxOptions());

    AvailabilityReport checkAvailability();

    ExecutionResult execute(const ExecutionRequest& request);

    const SandboxOptions& options() const { return options_; }

private:
    ContainerSpec buildContainerSpec(const Session& session, const StagedScript& script,
                                     const ResourceLimits& limits, qint64 memoryBytes) const;

    ContainerEngine& engine_;
    SessionStore& store_;
    SandboxOptions options_;
};

} // namespace Enclave
