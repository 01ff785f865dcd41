#include "MockComponents.hpp"

#include <QtCore/QElapsedTimer>
#include <QtCore/QMutexLocker>
#include <QtNetwork/QLocalServer>
#include <QtNetwork/QLocalSocket>

namespace Enclave {
namespace Test {

// FakeContainerEngine

void FakeContainerEngine::failOn(const QString& operation, EngineError code, const QString& detail) {
    QMutexLocker locker(&mutex_);
    faults_.insert(operation, EngineFault{code, detail});
}

void FakeContainerEngine::setOutcome(int exitCode, const QByteArray& logs) {
    QMutexLocker locker(&mutex_);
    outcome_.exitCode = exitCode;
    outcome_.logs = logs;
}

bool FakeContainerEngine::takeFault(const QString& operation, EngineFault& fault) {
    QMutexLocker locker(&mutex_);
    auto it = faults_.find(operation);
    if (it == faults_.end()) {
        return false;
    }
    fault = it.value();
    return true;
}

void FakeContainerEngine::record(const QString& call) {
    QMutexLocker locker(&mutex_);
    calls_.append(call);
}

Expected<void, EngineFault> FakeContainerEngine::ping() {
    record("ping");
    EngineFault fault;
    if (takeFault("ping", fault)) {
        return makeUnexpected(fault);
    }
    return {};
}

Expected<bool, EngineFault> FakeContainerEngine::imageExists(const QString& image) {
    record("imageExists " + image);
    EngineFault fault;
    if (takeFault("imageExists", fault)) {
        return makeUnexpected(fault);
    }
    return imagePresent_;
}

Expected<QString, EngineFault> FakeContainerEngine::createContainer(const ContainerSpec& spec) {
    record("create");
    EngineFault fault;
    if (takeFault("create", fault)) {
        return makeUnexpected(fault);
    }

    QMutexLocker locker(&mutex_);
    const QString id = QString("fake%1").arg(nextId_++, 8, 10, QLatin1Char('0'));
    containers_.insert(id, spec);
    createdSpecs_.append(spec);
    return id;
}

Expected<void, EngineFault> FakeContainerEngine::startContainer(const QString& containerId) {
    record("start " + containerId);
    EngineFault fault;
    if (takeFault("start", fault)) {
        return makeUnexpected(fault);
    }

    QMutexLocker locker(&mutex_);
    if (!containers_.contains(containerId)) {
        return makeUnexpected(EngineFault{EngineError::NotFound, "no such container"});
    }
    return {};
}

Expected<int, EngineFault> FakeContainerEngine::waitContainer(const QString& containerId, int timeoutMs) {
    record("wait " + containerId);
    ContainerSpec spec;
    RunHook hook;
    RunOutcome outcome;
    {
        QMutexLocker locker(&mutex_);
        lastWaitTimeoutMs_ = timeoutMs;
        if (!containers_.contains(containerId)) {
            return makeUnexpected(EngineFault{EngineError::NotFound, "no such container"});
        }
        spec = containers_.value(containerId);
        hook = runHook_;
        outcome = outcome_;
    }

    EngineFault fault;
    if (takeFault("wait", fault)) {
        return makeUnexpected(fault);
    }

    if (hook) {
        outcome = hook(spec);
    }

    QMutexLocker locker(&mutex_);
    finished_.insert(containerId, outcome);
    return outcome.exitCode;
}

Expected<QByteArray, EngineFault> FakeContainerEngine::containerLogs(const QString& containerId) {
    record("logs " + containerId);
    EngineFault fault;
    if (takeFault("logs", fault)) {
        return makeUnexpected(fault);
    }

    QMutexLocker locker(&mutex_);
    return finished_.value(containerId, outcome_).logs;
}

Expected<void, EngineFault> FakeContainerEngine::removeContainer(const QString& containerId, bool force) {
    record(QString("remove %1%2").arg(containerId, force ? " force" : ""));
    EngineFault fault;
    if (takeFault("remove", fault)) {
        return makeUnexpected(fault);
    }

    QMutexLocker locker(&mutex_);
    if (containers_.remove(containerId) == 0) {
        return makeUnexpected(EngineFault{EngineError::NotFound, "no such container"});
    }
    removed_.append(containerId);
    return {};
}

QStringList FakeContainerEngine::calls() const {
    QMutexLocker locker(&mutex_);
    return calls_;
}

QList<ContainerSpec> FakeContainerEngine::createdSpecs() const {
    QMutexLocker locker(&mutex_);
    return createdSpecs_;
}

QStringList FakeContainerEngine::removedContainers() const {
    QMutexLocker locker(&mutex_);
    return removed_;
}

QStringList FakeContainerEngine::liveContainers() const {
    QMutexLocker locker(&mutex_);
    return containers_.keys();
}

int FakeContainerEngine::lastWaitTimeoutMs() const {
    QMutexLocker locker(&mutex_);
    return lastWaitTimeoutMs_;
}

// FakeDockerDaemon

FakeDockerDaemon::FakeDockerDaemon(const QString& socketPath, QObject* parent)
    : QObject(parent)
    , socketPath_(socketPath) {
}

FakeDockerDaemon::~FakeDockerDaemon() {
    stop();
}

bool FakeDockerDaemon::start() {
    running_ = true;
    listening_ = false;
    startFailed_ = false;
    thread_.reset(QThread::create([this]() { serve(); }));
    thread_->start();

    QElapsedTimer timer;
    timer.start();
    while (!listening_ && timer.elapsed() < 5000) {
        QThread::msleep(5);
    }
    return listening_ && !startFailed_;
}

void FakeDockerDaemon::stop() {
    running_ = false;
    if (thread_) {
        thread_->wait();
        thread_.reset();
    }
}

void FakeDockerDaemon::setResponse(const QByteArray& method, const QByteArray& pathPrefix,
                                   const QByteArray& rawResponse, int delayMs) {
    QMutexLocker locker(&mutex_);
    routes_.append(Route{method, pathPrefix, rawResponse, delayMs});
}

QList<QByteArray> FakeDockerDaemon::requests() const {
    QMutexLocker locker(&mutex_);
    return requests_;
}

QByteArray FakeDockerDaemon::lastBody() const {
    QMutexLocker locker(&mutex_);
    return lastBody_;
}

QByteArray FakeDockerDaemon::jsonResponse(int status, const QByteArray& json) {
    return "HTTP/1.1 " + QByteArray::number(status) + " Fake\r\n"
           "Content-Type: application/json\r\n"
           "Content-Length: " + QByteArray::number(json.size()) + "\r\n"
           "\r\n" + json;
}

QByteArray FakeDockerDaemon::emptyResponse(int status) {
    return "HTTP/1.1 " + QByteArray::number(status) + " Fake\r\n\r\n";
}

QByteArray FakeDockerDaemon::chunkedResponse(int status, const QList<QByteArray>& chunks) {
    QByteArray response = "HTTP/1.1 " + QByteArray::number(status) + " Fake\r\n"
                          "Transfer-Encoding: chunked\r\n"
                          "\r\n";
    for (const QByteArray& chunk : chunks) {
        response += QByteArray::number(chunk.size(), 16) + "\r\n" + chunk + "\r\n";
    }
    response += "0\r\n\r\n";
    return response;
}

FakeDockerDaemon::Route FakeDockerDaemon::match(const QByteArray& method, const QByteArray& target) const {
    QMutexLocker locker(&mutex_);
    for (const Route& route : routes_) {
        if (route.method == method && target.startsWith(route.pathPrefix)) {
            return route;
        }
    }
    return Route{method, target, jsonResponse(404, "{\"message\":\"no route\"}"), 0};
}

void FakeDockerDaemon::serve() {
    QLocalServer server;
    QLocalServer::removeServer(socketPath_);
    if (!server.listen(socketPath_)) {
        startFailed_ = true;
        listening_ = true;
        return;
    }
    listening_ = true;

    while (running_) {
        bool timedOut = false;
        if (!server.waitForNewConnection(50, &timedOut)) {
            continue;
        }
        QLocalSocket* socket = server.nextPendingConnection();
        if (!socket) {
            continue;
        }

        QByteArray raw;
        while (true) {
            raw += socket->readAll();
            const int headerEnd = raw.indexOf("\r\n\r\n");
            if (headerEnd >= 0) {
                qint64 contentLength = 0;
                for (const QByteArray& line : raw.left(headerEnd).split('\n')) {
                    if (line.toLower().startsWith("content-length:")) {
                        contentLength = line.mid(15).trimmed().toLongLong();
                    }
                }
                if (raw.size() - headerEnd - 4 >= contentLength) {
                    break;
                }
            }
            if (!socket->waitForReadyRead(1000)) {
                break;
            }
        }

        const int lineEnd = raw.indexOf("\r\n");
        const QList<QByteArray> requestLine = raw.left(lineEnd).split(' ');
        const QByteArray method = requestLine.value(0);
        QByteArray target = requestLine.value(1);
        const int versionEnd = target.indexOf('/', 1);
        if (target.startsWith("/v1.") && versionEnd > 0) {
            target = target.mid(versionEnd);
        }
        const int bodyStart = raw.indexOf("\r\n\r\n");
        const QByteArray body = bodyStart >= 0 ? raw.mid(bodyStart + 4) : QByteArray();

        {
            QMutexLocker locker(&mutex_);
            requests_.append(method + " " + target);
            lastBody_ = body;
        }

        const Route route = match(method, target);
        QElapsedTimer delay;
        delay.start();
        while (running_ && delay.elapsed() < route.delayMs) {
            QThread::msleep(10);
        }

        if (socket->state() == QLocalSocket::ConnectedState) {
            socket->write(route.response);
            while (socket->bytesToWrite() > 0 && socket->waitForBytesWritten(1000)) {
            }
            socket->disconnectFromServer();
            if (socket->state() != QLocalSocket::UnconnectedState) {
                socket->waitForDisconnected(1000);
            }
        }
        delete socket;
    }

    server.close();
}

} // namespace Test
} // namespace Enclave
