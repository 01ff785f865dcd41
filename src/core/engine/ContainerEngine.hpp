#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QMap>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include "core/common/Expected.hpp"

namespace Enclave {

enum class EngineError {
    Unreachable,     // daemon socket missing or refusing connections
    NotFound,        // image or container does not exist
    RequestFailed,   // daemon answered with an error status
    Timeout,
    ProtocolError    // response could not be understood
};

QString toString(EngineError error);

struct EngineFault {
    EngineError code = EngineError::ProtocolError;
    QString detail;   // daemon message or transport error text

    QString describe() const;
};

struct BindMount {
    QString hostPath;
    QString containerPath;
    bool readOnly = false;
};

struct ContainerSpec {
    QString image;
    QStringList command;
    QString user;
    QString workingDirectory;
    QStringList environment;      // NAME=value
    QList<BindMount> mounts;
    qint64 memoryBytes = 0;      // 0 = unlimited
    qint64 cpuQuota = 0;         // microseconds per cpuPeriod, 0 = unlimited
    qint64 cpuPeriod = 100000;
    bool networkEnabled = false;
    QStringList dropCapabilities;
    QStringList securityOptions;
    QMap<QString, QString> tmpfs; // container path -> mount options
};

// Narrow client contract over a container runtime
class ContainerEngine {
public:
    virtual ~ContainerEngine() = default;

    virtual Expected<void, EngineFault> ping() = 0;
    virtual Expected<bool, EngineFault> imageExists(const QString& image) = 0;

    // Returns the container id
    virtual Expected<QString, EngineFault> createContainer(const ContainerSpec& spec) = 0;
    virtual Expected<void, EngineFault> startContainer(const QString& containerId) = 0;

    // Blocks until the container exits; a Timeout fault after timeoutMs
    virtual Expected<int, EngineFault> waitContainer(const QString& containerId, int timeoutMs) = 0;

    // Combined stdout and stderr in the order they were produced
    virtual Expected<QByteArray, EngineFault> containerLogs(const QString& containerId) = 0;
    virtual Expected<void, EngineFault> removeContainer(const QString& containerId, bool force) = 0;
};

} // namespace Enclave
