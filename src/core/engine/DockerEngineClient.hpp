#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>

#include "core/engine/ContainerEngine.hpp"
#include "core/engine/HttpWire.hpp"

namespace Enclave {

/**
 * @brief Docker Engine API client over the daemon's unix domain socket
 *
 * Each call opens its own QLocalSocket connection and blocks until the
 * response is complete, so one client may be shared between threads. The
 * calling thread does not need an event loop.
 */
class DockerEngineClient : public ContainerEngine {
public:
    static constexpr const char* ApiVersion = "v1.41";
    static constexpr int DefaultRequestTimeoutMs = 30000;
    static constexpr int ConnectTimeoutMs = 5000;

    // An empty socketPath is resolved with discoverSocketPath()
    explicit DockerEngineClient(const QString& socketPath = QString());

    // Configured path, then DOCKER_HOST (unix:// only), then the per-user
    // Docker Desktop socket, then /var/run/docker.sock
    static QString discoverSocketPath(const QString& configured = QString());

    QString socketPath() const { return socketPath_; }

    void setRequestTimeout(int milliseconds) { requestTimeoutMs_ = milliseconds; }
    int requestTimeout() const { return requestTimeoutMs_; }

    Expected<void, EngineFault> ping() override;
    Expected<bool, EngineFault> imageExists(const QString& image) override;
    Expected<QString, EngineFault> createContainer(const ContainerSpec& spec) override;
    Expected<void, EngineFault> startContainer(const QString& containerId) override;
    Expected<int, EngineFault> waitContainer(const QString& containerId, int timeoutMs) override;
    Expected<QByteArray, EngineFault> containerLogs(const QString& containerId) override;
    Expected<void, EngineFault> removeContainer(const QString& containerId, bool force) override;

    // Body sent to POST /containers/create
    static QByteArray containerCreateBody(const ContainerSpec& spec);

private:
    // timeoutMs < 0 waits without limit
    Expected<HttpResponse, EngineFault> request(const QByteArray& method,
                                                const QByteArray& path,
                                                const QByteArray& body,
                                                int timeoutMs) const;

    static EngineFault faultFromResponse(const HttpResponse& response);

    QString socketPath_;
    int requestTimeoutMs_ = DefaultRequestTimeoutMs;
};

} // namespace Enclave
