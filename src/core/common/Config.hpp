#pragma once

#include <QtCore/QSettings>
#include <QtCore/QString>
#include <QtCore/QVariant>
#include <memory>

namespace Enclave {

class Config {
public:
    static Config& instance();

    // Native settings store for the given organization/application
    void initialize(const QString& organizationName = "Enclave",
                    const QString& applicationName = "Enclave");

    // Settings read from (and written back to) an INI file
    void initializeFromFile(const QString& iniPath);

    bool isInitialized() const;

    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);

    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    int getInt(const QString& key, int defaultValue = 0) const;
    bool getBool(const QString& key, bool defaultValue = false) const;

    struct SandboxSettings {
        QString baseDirectory = "/tmp/sandboxes";
        QString mountPath = "/sandbox";
        QString imageName = "enclave-python-sandbox";
        QString imageTag = "latest";
        QString memoryLimit = "512m";
        qint64 cpuQuota = 100000;  // microseconds per 100ms period, 100000 = one CPU
        int timeoutSeconds = 30;
        bool enableNetwork = false;
        QString user = "sandbox";
        QString tmpfsSize = "100M";
        QString dockerSocket;      // empty = autodetect
    };

    struct PolicySettings {
        QString allowListPath;     // empty = compiled-in defaults
        bool allowRelativeImports = false;
        bool detectDynamicImports = true;
    };

    struct LogSettings {
        QString filePath = "enclave.log";
        QString level = "warn";
    };

    SandboxSettings getSandboxSettings() const;
    PolicySettings getPolicySettings() const;
    LogSettings getLogSettings() const;

    void setSandboxSettings(const SandboxSettings& settings);
    void setPolicySettings(const PolicySettings& settings);
    void setLogSettings(const LogSettings& settings);

    void sync();

private:
    Config() = default;
    std::unique_ptr<QSettings> settings_;
};

// Docker-style size ("512m", "1g", "2048k", "1048576") to bytes; -1 when malformed
qint64 parseMemoryLimit(const QString& text);

} // namespace Enclave
