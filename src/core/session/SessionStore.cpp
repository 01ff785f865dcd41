#include "SessionStore.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QDirIterator>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QUuid>

#include <algorithm>

namespace Enclave {

namespace {

// The container runs under its own uid and must be able to write artifacts
constexpr QFileDevice::Permissions sharedDirectoryPermissions =
    QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner |
    QFileDevice::ReadGroup | QFileDevice::WriteGroup | QFileDevice::ExeGroup |
    QFileDevice::ReadOther | QFileDevice::WriteOther | QFileDevice::ExeOther;

constexpr QFileDevice::Permissions scriptPermissions =
    QFileDevice::ReadOwner | QFileDevice::WriteOwner |
    QFileDevice::ReadGroup | QFileDevice::ReadOther;

bool isContainedIn(const QString& path, const QString& directory) {
    return path.startsWith(directory + QLatin1Char('/'));
}

} // namespace

const QRegularExpression SessionStore::sessionIdPattern_(QStringLiteral("^[A-Za-z0-9._-]+$"));

QString toString(SessionError error) {
    switch (error) {
    case SessionError::InvalidSessionId: return "invalid session id";
    case SessionError::CreateFailed: return "session directory could not be created";
    case SessionError::NotFound: return "not found";
    case SessionError::PathEscape: return "path escapes the session directory";
    case SessionError::ReadFailed: return "read failed";
    case SessionError::WriteFailed: return "write failed";
    case SessionError::DeleteFailed: return "delete failed";
    }
    return "unknown session error";
}

SessionStore::SessionStore(const QString& baseDirectory, const QString& mountPath)
    : baseDirectory_(QDir::cleanPath(QDir(baseDirectory).absolutePath()))
    , mountPath_(mountPath) {
}

bool SessionStore::isValidSessionId(const QString& sessionId) {
    if (sessionId.isEmpty() || sessionId.size() > MaxSessionIdLength) {
        return false;
    }
    if (sessionId == QLatin1String(".") || sessionId == QLatin1String("..")) {
        return false;
    }
    return sessionIdPattern_.match(sessionId).hasMatch();
}

QString SessionStore::generateSessionId() {
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

QString SessionStore::sessionPath(const QString& sessionId) const {
    return baseDirectory_ + QLatin1Char('/') + sessionId;
}

bool SessionStore::exists(const QString& sessionId) const {
    return isValidSessionId(sessionId) && QFileInfo(sessionPath(sessionId)).isDir();
}

Expected<Session, SessionError> SessionStore::ensure(const QString& sessionId) {
    if (!isValidSessionId(sessionId)) {
        ENCLAVE_WARN("Rejected session id '{}'", sessionId.toStdString());
        return makeUnexpected(SessionError::InvalidSessionId);
    }

    const QString path = sessionPath(sessionId);
    const QFileInfo info(path);
    if (info.exists() && !info.isDir()) {
        ENCLAVE_ERROR("Session path {} exists and is not a directory", path.toStdString());
        return makeUnexpected(SessionError::CreateFailed);
    }

    if (!info.exists()) {
        if (!QDir().mkpath(path)) {
            ENCLAVE_ERROR("Failed to create session directory {}", path.toStdString());
            return makeUnexpected(SessionError::CreateFailed);
        }
        if (!QFile::setPermissions(path, sharedDirectoryPermissions)) {
            ENCLAVE_WARN("Could not open permissions on session directory {}", path.toStdString());
        }
        ENCLAVE_INFO("Created session {} at {}", sessionId.toStdString(), path.toStdString());
    }

    const QFileInfo created(path);
    Session session;
    session.id = sessionId;
    session.hostPath = path;
    session.mountPath = mountPath_;
    session.createdAt = created.birthTime().isValid() ? created.birthTime() : created.lastModified();
    return session;
}

Expected<QStringList, SessionError> SessionStore::listArtifacts(const QString& sessionId) const {
    if (!isValidSessionId(sessionId)) {
        return makeUnexpected(SessionError::InvalidSessionId);
    }

    QStringList artifacts;
    const QString root = sessionPath(sessionId);
    if (!QFileInfo(root).isDir()) {
        return artifacts;
    }

    const QDir rootDir(root);
    QDirIterator it(root, QDir::Files | QDir::Hidden | QDir::NoSymLinks, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        if (it.fileName().startsWith(QLatin1String(ScriptPrefix))) {
            continue;
        }
        artifacts.append(rootDir.relativeFilePath(it.filePath()));
    }

    std::sort(artifacts.begin(), artifacts.end());
    return artifacts;
}

Expected<QByteArray, SessionError> SessionStore::readArtifact(const QString& sessionId,
                                                              const QString& relativePath) const {
    if (!isValidSessionId(sessionId)) {
        return makeUnexpected(SessionError::InvalidSessionId);
    }
    if (relativePath.isEmpty() || QDir::isAbsolutePath(relativePath)) {
        ENCLAVE_WARN("Rejected artifact path '{}' for session {}",
                     relativePath.toStdString(), sessionId.toStdString());
        return makeUnexpected(SessionError::PathEscape);
    }

    const QString root = sessionPath(sessionId);
    const QString candidate = QDir::cleanPath(root + QLatin1Char('/') + relativePath);
    if (!isContainedIn(candidate, root)) {
        ENCLAVE_WARN("Artifact path '{}' escapes session {}",
                     relativePath.toStdString(), sessionId.toStdString());
        return makeUnexpected(SessionError::PathEscape);
    }

    const QFileInfo info(candidate);
    if (!info.exists()) {
        return makeUnexpected(SessionError::NotFound);
    }

    // Symlinks are followed before the containment check is repeated
    const QString canonicalRoot = QFileInfo(root).canonicalFilePath();
    const QString canonicalPath = info.canonicalFilePath();
    if (canonicalRoot.isEmpty() || !isContainedIn(canonicalPath, canonicalRoot)) {
        ENCLAVE_WARN("Artifact '{}' resolves outside session {}",
                     relativePath.toStdString(), sessionId.toStdString());
        return makeUnexpected(SessionError::PathEscape);
    }
    if (!QFileInfo(canonicalPath).isFile()) {
        return makeUnexpected(SessionError::NotFound);
    }

    QFile file(canonicalPath);
    if (!file.open(QIODevice::ReadOnly)) {
        ENCLAVE_ERROR("Failed to read artifact {}: {}",
                      canonicalPath.toStdString(), file.errorString().toStdString());
        return makeUnexpected(SessionError::ReadFailed);
    }
    return file.readAll();
}

Expected<void, SessionError> SessionStore::destroy(const QString& sessionId) {
    if (!isValidSessionId(sessionId)) {
        return makeUnexpected(SessionError::InvalidSessionId);
    }

    QDir dir(sessionPath(sessionId));
    if (!dir.exists()) {
        return {};
    }
    if (!dir.removeRecursively()) {
        ENCLAVE_ERROR("Failed to remove session directory {}", dir.path().toStdString());
        return makeUnexpected(SessionError::DeleteFailed);
    }

    ENCLAVE_INFO("Destroyed session {}", sessionId.toStdString());
    return {};
}

Expected<StagedScript, SessionError> SessionStore::stageScript(const QString& sessionId,
                                                              const QString& script) {
    auto session = ensure(sessionId);
    if (session.hasError()) {
        return makeUnexpected(session.error());
    }

    const QString suffix = QUuid::createUuid().toString(QUuid::Id128).left(8);
    StagedScript staged;
    staged.fileName = QLatin1String(ScriptPrefix) + suffix + QLatin1String(".py");
    staged.hostPath = session.value().hostPath + QLatin1Char('/') + staged.fileName;
    staged.containerPath = mountPath_ + QLatin1Char('/') + staged.fileName;

    QFile file(staged.hostPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        ENCLAVE_ERROR("Failed to stage script {}: {}",
                      staged.hostPath.toStdString(), file.errorString().toStdString());
        return makeUnexpected(SessionError::WriteFailed);
    }

    const QByteArray bytes = script.toUtf8();
    if (file.write(bytes) != bytes.size()) {
        ENCLAVE_ERROR("Short write while staging {}", staged.hostPath.toStdString());
        file.close();
        file.remove();
        return makeUnexpected(SessionError::WriteFailed);
    }
    file.close();

    if (!QFile::setPermissions(staged.hostPath, scriptPermissions)) {
        ENCLAVE_WARN("Could not set permissions on {}", staged.hostPath.toStdString());
    }

    ENCLAVE_DEBUG("Staged script {} ({} bytes)", staged.hostPath.toStdString(), bytes.size());
    return staged;
}

Expected<void, SessionError> SessionStore::removeStagedScript(const StagedScript& script) {
    if (!QFileInfo::exists(script.hostPath)) {
        return {};
    }
    if (!QFile::remove(script.hostPath)) {
        ENCLAVE_WARN("Failed to remove staged script {}", script.hostPath.toStdString());
        return makeUnexpected(SessionError::DeleteFailed);
    }
    return {};
}

} // namespace Enclave
