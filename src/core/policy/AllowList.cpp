#include "AllowList.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QFile>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QSet>

namespace Enclave {

namespace {

const char* const standardLibrary[] = {
    "sys", "os", "math", "random", "datetime", "time", "json", "csv", "io",
    "collections", "itertools", "functools", "operator", "re", "string",
    "textwrap", "unicodedata", "struct", "codecs", "base64", "binascii",
    "hashlib", "hmac", "secrets", "pathlib", "glob", "fnmatch", "tempfile",
    "shutil", "pickle", "shelve", "sqlite3", "gzip", "bz2", "lzma", "zipfile",
    "tarfile", "configparser", "argparse", "logging", "warnings", "traceback",
    "decimal", "fractions", "statistics", "enum", "typing", "copy", "pprint",
    "heapq", "bisect", "array", "queue", "threading", "multiprocessing",
    "subprocess", "socket", "ssl", "email", "urllib", "http", "html", "xml",
    "webbrowser", "uuid", "contextlib", "abc", "dataclasses", nullptr
};

// Distribution names are listed next to their import names
const char* const scientificLibraries[] = {
    "numpy", "np", "pandas", "pd", "matplotlib", "plt", "scipy", "sklearn",
    "scikit-learn", nullptr
};

const char* const documentLibraries[] = {
    "pdfplumber", "fitz", "pymupdf", "docx", "python-docx", "pptx",
    "python-pptx", "openpyxl", nullptr
};

const char* const utilityLibraries[] = {
    "chardet", "magic", "python-magic", nullptr
};

QStringList toList(const char* const* names) {
    QStringList list;
    for (int i = 0; names[i]; ++i) {
        list.append(QString::fromLatin1(names[i]));
    }
    return list;
}

} // namespace

QString toString(AllowListError error) {
    switch (error) {
    case AllowListError::FileNotFound: return "allow-list file not found";
    case AllowListError::ParseFailed: return "allow-list file is not valid JSON";
    case AllowListError::InvalidFormat: return "allow-list file has an invalid format";
    }
    return "unknown allow-list error";
}

AllowList AllowList::defaults() {
    AllowList list;
    for (const char* const* group : {standardLibrary, scientificLibraries,
                                     documentLibraries, utilityLibraries}) {
        for (const QString& name : toList(group)) {
            list.modules_.insert(name, true);
        }
    }
    return list;
}

Expected<AllowList, AllowListError> AllowList::fromJsonFile(const QString& path) {
    QFile file(path);
    if (!file.exists()) {
        ENCLAVE_ERROR("Allow-list file does not exist: {}", path.toStdString());
        return makeUnexpected(AllowListError::FileNotFound);
    }
    if (!file.open(QIODevice::ReadOnly)) {
        ENCLAVE_ERROR("Cannot open allow-list file {}: {}",
                      path.toStdString(), file.errorString().toStdString());
        return makeUnexpected(AllowListError::FileNotFound);
    }

    auto result = fromJson(file.readAll());
    if (result.hasValue()) {
        ENCLAVE_INFO("Loaded allow-list from {} ({} permitted modules)",
                     path.toStdString(), result.value().permittedModules().size());
    }
    return result;
}

Expected<AllowList, AllowListError> AllowList::fromJson(const QByteArray& json) {
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        ENCLAVE_ERROR("Allow-list JSON parse error at offset {}: {}",
                      parseError.offset, parseError.errorString().toStdString());
        return makeUnexpected(AllowListError::ParseFailed);
    }
    if (!document.isObject()) {
        return makeUnexpected(AllowListError::InvalidFormat);
    }

    const QJsonObject root = document.object();
    const QJsonValue modules = root.value("modules");
    if (!modules.isObject()) {
        ENCLAVE_ERROR("Allow-list is missing the \"modules\" object");
        return makeUnexpected(AllowListError::InvalidFormat);
    }

    for (const char* flag : {"allowRelativeImports", "detectDynamicImports", "extendDefaults"}) {
        const QJsonValue value = root.value(QLatin1String(flag));
        if (!value.isUndefined() && !value.isBool()) {
            ENCLAVE_ERROR("Allow-list option \"{}\" must be a boolean", flag);
            return makeUnexpected(AllowListError::InvalidFormat);
        }
    }

    AllowList list = root.value("extendDefaults").toBool(false) ? defaults() : AllowList();

    const QJsonObject entries = modules.toObject();
    for (auto it = entries.constBegin(); it != entries.constEnd(); ++it) {
        if (!it.value().isBool() || it.key().isEmpty()) {
            ENCLAVE_ERROR("Allow-list entry \"{}\" must map to a boolean", it.key().toStdString());
            return makeUnexpected(AllowListError::InvalidFormat);
        }
        list.setPermitted(it.key(), it.value().toBool());
    }

    list.allowRelativeImports_ = root.value("allowRelativeImports").toBool(false);
    list.detectDynamicImports_ = root.value("detectDynamicImports").toBool(true);
    return list;
}

bool AllowList::permits(const QString& moduleName) const {
    return modules_.value(moduleName, false);
}

void AllowList::setPermitted(const QString& moduleName, bool permitted) {
    modules_.insert(moduleName, permitted);
}

QStringList AllowList::permittedModules() const {
    QStringList names;
    for (auto it = modules_.constBegin(); it != modules_.constEnd(); ++it) {
        if (it.value()) {
            names.append(it.key());
        }
    }
    return names;
}

QString AllowList::categorySummary() const {
    QSet<QString> grouped;
    auto permittedFrom = [this, &grouped](const char* const* group) {
        QStringList names;
        for (const QString& name : toList(group)) {
            grouped.insert(name);
            if (permits(name)) {
                names.append(name);
            }
        }
        return names;
    };

    QStringList lines;
    if (!permittedFrom(standardLibrary).isEmpty()) {
        lines.append("- Standard Python library modules");
    }
    for (const char* const* group : {scientificLibraries, documentLibraries, utilityLibraries}) {
        const QStringList names = permittedFrom(group);
        if (!names.isEmpty()) {
            lines.append("- " + names.join(", "));
        }
    }

    QStringList extra;
    for (const QString& name : permittedModules()) {
        if (!grouped.contains(name)) {
            extra.append(name);
        }
    }
    if (!extra.isEmpty()) {
        lines.append("- " + extra.join(", "));
    }

    if (lines.isEmpty()) {
        return "No imports are allowed.";
    }
    return "Allowed libraries:\n" + lines.join(QLatin1Char('\n'));
}

} // namespace Enclave
