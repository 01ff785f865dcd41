#pragma once

#include <QtCore/QString>
#include <QtCore/QVariantMap>

namespace Enclave {

enum class ExecutionStatus {
    Success,
    ExecutionFailed,
    Timeout,
    InfrastructureUnavailable,
    ImageMissing,
    LaunchFailed,
    Unexpected,
    ParseError,
    PolicyViolation
};

QString toString(ExecutionStatus status);

struct ResourceLimits {
    QString memoryLimit = "512m";   // docker-style size
    qint64 cpuQuota = 100000;       // microseconds per 100ms period
    int timeoutSeconds = 30;
    bool enableNetwork = false;
};

struct ExecutionRequest {
    QString code;
    QVariantMap context;            // rehydrated as globals; must be JSON-representable
    QString sessionId;
    ResourceLimits limits;
};

struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::Unexpected;
    QString output;                 // combined stdout and stderr
    int exitCode = -1;
    bool exitCodeAvailable = false;
    QString diagnostic;             // engine or gate detail for operators
    QString sessionId;

    bool succeeded() const { return status == ExecutionStatus::Success; }
};

} // namespace Enclave
