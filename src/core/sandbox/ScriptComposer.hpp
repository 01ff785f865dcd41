#pragma once

#include <QtCore/QString>
#include <QtCore/QVariantMap>

namespace Enclave {

/**
 * @brief Wraps a snippet into a standalone Python 3 script
 *
 * The snippet and the context travel base64-encoded inside the script, so
 * neither is ever spliced into Python source. The context is serialized as
 * JSON and rebuilt with json.loads into the snippet's globals. The snippet is
 * compiled as "<snippet>" and executed in a try block; any exception prints
 * "EXECUTION ERROR:" and the traceback to stderr and exits with status 1.
 */
class ScriptComposer {
public:
    static QString compose(const QString& snippet, const QVariantMap& context = QVariantMap());

    static constexpr const char* ErrorMarker = "EXECUTION ERROR:";
};

} // namespace Enclave
