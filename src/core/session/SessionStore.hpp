#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QDateTime>
#include <QtCore/QRegularExpression>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include "core/common/Expected.hpp"

namespace Enclave {

enum class SessionError {
    InvalidSessionId,
    CreateFailed,
    NotFound,
    PathEscape,
    ReadFailed,
    WriteFailed,
    DeleteFailed
};

QString toString(SessionError error);

struct Session {
    QString id;
    QString hostPath;     // absolute directory on the host
    QString mountPath;    // where the directory appears inside the container
    QDateTime createdAt;
};

struct StagedScript {
    QString fileName;
    QString hostPath;
    QString containerPath;
};

/**
 * @brief Per-session working directories under a common base directory
 *
 * A session directory is created on first use, survives across executions
 * and is removed only by destroy(). Staged scripts carry a reserved prefix so
 * they never show up as artifacts.
 */
class SessionStore {
public:
    static constexpr const char* ScriptPrefix = "__enclave_script_";
    static constexpr int MaxSessionIdLength = 128;

    explicit SessionStore(const QString& baseDirectory = "/tmp/sandboxes",
                          const QString& mountPath = "/sandbox");

    QString baseDirectory() const { return baseDirectory_; }
    QString mountPath() const { return mountPath_; }

    static bool isValidSessionId(const QString& sessionId);
    static QString generateSessionId();

    QString sessionPath(const QString& sessionId) const;
    bool exists(const QString& sessionId) const;

    Expected<Session, SessionError> ensure(const QString& sessionId);
    Expected<QStringList, SessionError> listArtifacts(const QString& sessionId) const;
    Expected<QByteArray, SessionError> readArtifact(const QString& sessionId,
                                                    const QString& relativePath) const;
    Expected<void, SessionError> destroy(const QString& sessionId);

    Expected<StagedScript, SessionError> stageScript(const QString& sessionId, const QString& script);
    Expected<void, SessionError> removeStagedScript(const StagedScript& script);

private:
    static const QRegularExpression sessionIdPattern_;

    QString baseDirectory_;
    QString mountPath_;
};

} // namespace Enclave
