#include "Config.hpp"
#include "Logger.hpp"

#include <limits>

namespace Enclave {

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName) {
    settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    ENCLAVE_INFO("Config initialized for {}/{}",
                 organizationName.toStdString(), applicationName.toStdString());
}

void Config::initializeFromFile(const QString& iniPath) {
    settings_ = std::make_unique<QSettings>(iniPath, QSettings::IniFormat);
    if (settings_->status() != QSettings::NoError) {
        ENCLAVE_WARN("Config file {} could not be read, using defaults", iniPath.toStdString());
    }
    ENCLAVE_INFO("Config initialized from {}", iniPath.toStdString());
}

bool Config::isInitialized() const {
    return settings_ != nullptr;
}

QVariant Config::getValue(const QString& key, const QVariant& defaultValue) const {
    if (!settings_) return defaultValue;
    return settings_->value(key, defaultValue);
}

void Config::setValue(const QString& key, const QVariant& value) {
    if (settings_) {
        settings_->setValue(key, value);
    }
}

QString Config::getString(const QString& key, const QString& defaultValue) const {
    return getValue(key, defaultValue).toString();
}

int Config::getInt(const QString& key, int defaultValue) const {
    return getValue(key, defaultValue).toInt();
}

bool Config::getBool(const QString& key, bool defaultValue) const {
    return getValue(key, defaultValue).toBool();
}

Config::SandboxSettings Config::getSandboxSettings() const {
    SandboxSettings defaults;
    SandboxSettings settings;
    settings.baseDirectory = getString("sandbox/baseDirectory", defaults.baseDirectory);
    settings.mountPath = getString("sandbox/mountPath", defaults.mountPath);
    settings.imageName = getString("sandbox/imageName", defaults.imageName);
    settings.imageTag = getString("sandbox/imageTag", defaults.imageTag);
    settings.memoryLimit = getString("sandbox/memoryLimit", defaults.memoryLimit);
    settings.cpuQuota = getValue("sandbox/cpuQuota", defaults.cpuQuota).toLongLong();
    settings.timeoutSeconds = getInt("sandbox/timeoutSeconds", defaults.timeoutSeconds);
    settings.enableNetwork = getBool("sandbox/enableNetwork", defaults.enableNetwork);
    settings.user = getString("sandbox/user", defaults.user);
    settings.tmpfsSize = getString("sandbox/tmpfsSize", defaults.tmpfsSize);
    settings.dockerSocket = getString("sandbox/dockerSocket");
    return settings;
}

Config::PolicySettings Config::getPolicySettings() const {
    PolicySettings defaults;
    PolicySettings settings;
    settings.allowListPath = getString("policy/allowListPath");
    settings.allowRelativeImports = getBool("policy/allowRelativeImports", defaults.allowRelativeImports);
    settings.detectDynamicImports = getBool("policy/detectDynamicImports", defaults.detectDynamicImports);
    return settings;
}

Config::LogSettings Config::getLogSettings() const {
    LogSettings defaults;
    LogSettings settings;
    settings.filePath = getString("log/filePath", defaults.filePath);
    settings.level = getString("log/level", defaults.level);
    return settings;
}

void Config::setSandboxSettings(const SandboxSettings& settings) {
    setValue("sandbox/baseDirectory", settings.baseDirectory);
    setValue("sandbox/mountPath", settings.mountPath);
    setValue("sandbox/imageName", settings.imageName);
    setValue("sandbox/imageTag", settings.imageTag);
    setValue("sandbox/memoryLimit", settings.memoryLimit);
    setValue("sandbox/cpuQuota", settings.cpuQuota);
    setValue("sandbox/timeoutSeconds", settings.timeoutSeconds);
    setValue("sandbox/enableNetwork", settings.enableNetwork);
    setValue("sandbox/user", settings.user);
    setValue("sandbox/tmpfsSize", settings.tmpfsSize);
    setValue("sandbox/dockerSocket", settings.dockerSocket);
}

void Config::setPolicySettings(const PolicySettings& settings) {
    setValue("policy/allowListPath", settings.allowListPath);
    setValue("policy/allowRelativeImports", settings.allowRelativeImports);
    setValue("policy/detectDynamicImports", settings.detectDynamicImports);
}

void Config::setLogSettings(const LogSettings& settings) {
    setValue("log/filePath", settings.filePath);
    setValue("log/level", settings.level);
}

void Config::sync() {
    if (settings_) {
        settings_->sync();
    }
}

qint64 parseMemoryLimit(const QString& text) {
    QString value = text.trimmed().toLower();
    if (value.isEmpty()) {
        return -1;
    }

    qint64 multiplier = 1;
    const QChar suffix = value.back();
    if (suffix.isLetter()) {
        switch (suffix.toLatin1()) {
        case 'b': multiplier = 1; break;
        case 'k': multiplier = 1024LL; break;
        case 'm': multiplier = 1024LL * 1024; break;
        case 'g': multiplier = 1024LL * 1024 * 1024; break;
        default: return -1;
        }
        value.chop(1);
    }

    bool ok = false;
    const qint64 amount = value.toLongLong(&ok);
    if (!ok || amount <= 0 || amount > std::numeric_limits<qint64>::max() / multiplier) {
        return -1;
    }
    return amount * multiplier;
}

} // namespace Enclave
