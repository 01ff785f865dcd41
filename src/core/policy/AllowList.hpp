#pragma once

#include <QtCore/QMap>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include "core/common/Expected.hpp"

namespace Enclave {

enum class AllowListError {
    FileNotFound,
    ParseFailed,
    InvalidFormat
};

QString toString(AllowListError error);

/**
 * @brief Set of importable top-level module names
 *
 * Lookup is an exact, case-sensitive match on the name as written. Entries
 * mapped to false are kept so that a file can remove a default.
 */
class AllowList {
public:
    AllowList() = default;

    // Standard library plus the data and document libraries shipped in the image
    static AllowList defaults();

    // {"modules": {"name": bool}, "allowRelativeImports": bool,
    //  "detectDynamicImports": bool, "extendDefaults": bool}
    static Expected<AllowList, AllowListError> fromJsonFile(const QString& path);
    static Expected<AllowList, AllowListError> fromJson(const QByteArray& json);

    bool permits(const QString& moduleName) const;
    void setPermitted(const QString& moduleName, bool permitted);
    QStringList permittedModules() const;

    bool allowRelativeImports() const { return allowRelativeImports_; }
    void setAllowRelativeImports(bool allow) { allowRelativeImports_ = allow; }

    bool detectDynamicImports() const { return detectDynamicImports_; }
    void setDetectDynamicImports(bool detect) { detectDynamicImports_ = detect; }

    // Human readable overview appended to violation messages
    QString categorySummary() const;

private:
    QMap<QString, bool> modules_;
    bool allowRelativeImports_ = false;
    bool detectDynamicImports_ = true;
};

} // namespace Enclave
