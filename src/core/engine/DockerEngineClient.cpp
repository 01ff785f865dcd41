#include "DockerEngineClient.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QElapsedTimer>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtNetwork/QLocalSocket>

namespace Enclave {

namespace {

QJsonArray toJsonArray(const QStringList& values) {
    QJsonArray array;
    for (const QString& value : values) {
        array.append(value);
    }
    return array;
}

QString daemonMessage(const QByteArray& body) {
    const QJsonDocument document = QJsonDocument::fromJson(body);
    if (document.isObject() && document.object().contains("message")) {
        return document.object().value("message").toString();
    }
    return QString::fromUtf8(body).trimmed();
}

} // namespace

DockerEngineClient::DockerEngineClient(const QString& socketPath)
    : socketPath_(discoverSocketPath(socketPath)) {
    ENCLAVE_DEBUG("Docker engine socket: {}", socketPath_.toStdString());
}

QString DockerEngineClient::discoverSocketPath(const QString& configured) {
    if (!configured.isEmpty()) {
        return configured;
    }

    const QString dockerHost = qEnvironmentVariable("DOCKER_HOST");
    if (dockerHost.startsWith(QLatin1String("unix://"))) {
        return dockerHost.mid(7);
    }

    const QString desktopSocket = QDir::homePath() + "/.docker/run/docker.sock";
    if (QFileInfo::exists(desktopSocket)) {
        return desktopSocket;
    }
    return QStringLiteral("/var/run/docker.sock");
}

Expected<void, EngineFault> DockerEngineClient::ping() {
    auto response = request("GET", "/_ping", QByteArray(), ConnectTimeoutMs);
    if (response.hasError()) {
        return makeUnexpected(response.error());
    }
    if (response.value().statusCode != 200) {
        return makeUnexpected(faultFromResponse(response.value()));
    }
    return {};
}

Expected<bool, EngineFault> DockerEngineClient::imageExists(const QString& image) {
    auto response = request("GET", "/images/" + HttpWire::encodePathSegment(image) + "/json",
                            QByteArray(), requestTimeoutMs_);
    if (response.hasError()) {
        return makeUnexpected(response.error());
    }

    const int status = response.value().statusCode;
    if (status == 200) {
        return true;
    }
    if (status == 404) {
        return false;
    }
    return makeUnexpected(faultFromResponse(response.value()));
}

QByteArray DockerEngineClient::containerCreateBody(const ContainerSpec& spec) {
    QJsonObject hostConfig;

    QJsonArray binds;
    for (const BindMount& mount : spec.mounts) {
        binds.append(QString("%1:%2:%3").arg(mount.hostPath, mount.containerPath,
                                             mount.readOnly ? QStringLiteral("ro") : QStringLiteral("rw")));
    }
    hostConfig["Binds"] = binds;

    if (spec.memoryBytes > 0) {
        hostConfig["Memory"] = spec.memoryBytes;
        // Equal to Memory: no swap on top of the ceiling
        hostConfig["MemorySwap"] = spec.memoryBytes;
    }
    if (spec.cpuQuota > 0) {
        hostConfig["CpuQuota"] = spec.cpuQuota;
        hostConfig["CpuPeriod"] = spec.cpuPeriod;
    }
    hostConfig["NetworkMode"] = spec.networkEnabled ? "bridge" : "none";
    if (!spec.dropCapabilities.isEmpty()) {
        hostConfig["CapDrop"] = toJsonArray(spec.dropCapabilities);
    }
    if (!spec.securityOptions.isEmpty()) {
        hostConfig["SecurityOpt"] = toJsonArray(spec.securityOptions);
    }
    if (!spec.tmpfs.isEmpty()) {
        QJsonObject tmpfs;
        for (auto it = spec.tmpfs.constBegin(); it != spec.tmpfs.constEnd(); ++it) {
            tmpfs[it.key()] = it.value();
        }
        hostConfig["Tmpfs"] = tmpfs;
    }

    QJsonObject body;
    body["Image"] = spec.image;
    body["Cmd"] = toJsonArray(spec.command);
    if (!spec.user.isEmpty()) {
        body["User"] = spec.user;
    }
    if (!spec.workingDirectory.isEmpty()) {
        body["WorkingDir"] = spec.workingDirectory;
    }
    if (!spec.environment.isEmpty()) {
        body["Env"] = toJsonArray(spec.environment);
    }
    body["Tty"] = false;
    body["AttachStdout"] = false;
    body["AttachStderr"] = false;
    body["NetworkDisabled"] = !spec.networkEnabled;
    body["HostConfig"] = hostConfig;

    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

Expected<QString, EngineFault> DockerEngineClient::createContainer(const ContainerSpec& spec) {
    auto response = request("POST", "/containers/create", containerCreateBody(spec), requestTimeoutMs_);
    if (response.hasError()) {
        return makeUnexpected(response.error());
    }
    if (response.value().statusCode != 201) {
        return makeUnexpected(faultFromResponse(response.value()));
    }

    const QJsonDocument document = QJsonDocument::fromJson(response.value().body);
    const QString id = document.object().value("Id").toString();
    if (id.isEmpty()) {
        return makeUnexpected(EngineFault{EngineError::ProtocolError, "create response carries no container id"});
    }

    const QJsonArray warnings = document.object().value("Warnings").toArray();
    for (const QJsonValue& warning : warnings) {
        ENCLAVE_WARN("Docker: {}", warning.toString().toStdString());
    }

    ENCLAVE_DEBUG("Created container {}", id.left(12).toStdString());
    return id;
}

Expected<void, EngineFault> DockerEngineClient::startContainer(const QString& containerId) {
    auto response = request("POST", "/containers/" + HttpWire::encodePathSegment(containerId) + "/start",
                            QByteArray(), requestTimeoutMs_);
    if (response.hasError()) {
        return makeUnexpected(response.error());
    }

    // 304: already running
    const int status = response.value().statusCode;
    if (status != 204 && status != 304) {
        return makeUnexpected(faultFromResponse(response.value()));
    }
    return {};
}

Expected<int, EngineFault> DockerEngineClient::waitContainer(const QString& containerId, int timeoutMs) {
    auto response = request("POST",
                            "/containers/" + HttpWire::encodePathSegment(containerId) +
                                "/wait?condition=not-running",
                            QByteArray(), timeoutMs);
    if (response.hasError()) {
        return makeUnexpected(response.error());
    }
    if (response.value().statusCode != 200) {
        return makeUnexpected(faultFromResponse(response.value()));
    }

    const QJsonObject result = QJsonDocument::fromJson(response.value().body).object();
    if (!result.contains("StatusCode")) {
        return makeUnexpected(EngineFault{EngineError::ProtocolError, "wait response carries no StatusCode"});
    }

    const QJsonObject waitError = result.value("Error").toObject();
    if (!waitError.value("Message").toString().isEmpty()) {
        ENCLAVE_WARN("Container {} wait reported: {}", containerId.left(12).toStdString(),
                     waitError.value("Message").toString().toStdString());
    }
    return result.value("StatusCode").toInt();
}

Expected<QByteArray, EngineFault> DockerEngineClient::containerLogs(const QString& containerId) {
    auto response = request("GET",
                            "/containers/" + HttpWire::encodePathSegment(containerId) +
                                "/logs?stdout=1&stderr=1",
                            QByteArray(), requestTimeoutMs_);
    if (response.hasError()) {
        return makeUnexpected(response.error());
    }
    if (response.value().statusCode != 200) {
        return makeUnexpected(faultFromResponse(response.value()));
    }
    return HttpWire::demultiplexLogs(response.value().body);
}

Expected<void, EngineFault> DockerEngineClient::removeContainer(const QString& containerId, bool force) {
    auto response = request("DELETE",
                            "/containers/" + HttpWire::encodePathSegment(containerId) +
                                (force ? "?force=1" : ""),
                            QByteArray(), requestTimeoutMs_);
    if (response.hasError()) {
        return makeUnexpected(response.error());
    }
    if (response.value().statusCode != 204) {
        return makeUnexpected(faultFromResponse(response.value()));
    }
    return {};
}

Expected<HttpResponse, EngineFault> DockerEngineClient::request(const QByteArray& method,
                                                                const QByteArray& path,
                                                                const QByteArray& body,
                                                                int timeoutMs) const {
    QLocalSocket socket;
    socket.connectToServer(socketPath_);
    if (!socket.waitForConnected(ConnectTimeoutMs)) {
        return makeUnexpected(EngineFault{EngineError::Unreachable,
                                          QString("%1: %2").arg(socketPath_, socket.errorString())});
    }

    const QByteArray target = "/" + QByteArray(ApiVersion) + path;
    ENCLAVE_TRACE("Docker request {} {}", method.toStdString(), target.toStdString());

    QElapsedTimer timer;
    timer.start();
    auto remaining = [&timer, timeoutMs]() {
        return timeoutMs < 0 ? -1 : qMax<qint64>(0, timeoutMs - timer.elapsed());
    };

    socket.write(HttpWire::buildRequest(method, target, body));
    while (socket.bytesToWrite() > 0) {
        if (!socket.waitForBytesWritten(static_cast<int>(remaining()))) {
            return makeUnexpected(EngineFault{EngineError::Unreachable,
                                              QString("write failed: %1").arg(socket.errorString())});
        }
    }

    QByteArray raw;
    bool closed = false;
    while (true) {
        raw.append(socket.readAll());
        if (socket.state() == QLocalSocket::UnconnectedState) {
            closed = true;
        }

        auto parsed = HttpWire::parseResponse(raw, closed);
        if (parsed.hasError()) {
            return makeUnexpected(EngineFault{EngineError::ProtocolError, parsed.error()});
        }
        if (parsed.value().complete) {
            ENCLAVE_TRACE("Docker response {} for {} {}", parsed.value().statusCode,
                          method.toStdString(), target.toStdString());
            return parsed.value();
        }

        if (timeoutMs >= 0 && remaining() == 0) {
            return makeUnexpected(EngineFault{EngineError::Timeout,
                                              QString("%1 %2 exceeded %3 ms")
                                                  .arg(QString::fromLatin1(method),
                                                       QString::fromLatin1(target))
                                                  .arg(timeoutMs)});
        }

        if (!socket.waitForReadyRead(static_cast<int>(remaining()))) {
            if (socket.error() != QLocalSocket::SocketTimeoutError) {
                // Peer closed; pick up whatever arrived with the close
                closed = true;
                raw.append(socket.readAll());
                auto last = HttpWire::parseResponse(raw, true);
                if (last.hasError()) {
                    return makeUnexpected(EngineFault{EngineError::ProtocolError, last.error()});
                }
                return last.value();
            }
        }
    }
}

EngineFault DockerEngineClient::faultFromResponse(const HttpResponse& response) {
    EngineFault fault;
    fault.code = response.statusCode == 404 ? EngineError::NotFound : EngineError::RequestFailed;
    fault.detail = QString("HTTP %1: %2").arg(response.statusCode).arg(daemonMessage(response.body));
    return fault;
}

} // namespace Enclave
