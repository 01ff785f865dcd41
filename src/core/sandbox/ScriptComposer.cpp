#include "ScriptComposer.hpp"

#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QStringList>

namespace Enclave {

QString ScriptComposer::compose(const QString& snippet, const QVariantMap& context) {
    QStringList lines;
    lines << "#!/usr/bin/env python3"
          << "# -*- coding: utf-8 -*-"
          << "import sys"
          << "import json"
          << "import base64"
          << "import traceback"
          << ""
          << "__enclave_globals__ = {\"__name__\": \"__main__\", \"__builtins__\": __builtins__}";

    if (!context.isEmpty()) {
        const QByteArray json = QJsonDocument(QJsonObject::fromVariantMap(context))
                                    .toJson(QJsonDocument::Compact);
        lines << QString("__enclave_globals__.update(json.loads(base64.b64decode(\"%1\").decode(\"utf-8\")))")
                     .arg(QString::fromLatin1(json.toBase64()));
    }

    lines << QString("__enclave_source__ = base64.b64decode(\"%1\").decode(\"utf-8\")")
                 .arg(QString::fromLatin1(snippet.toUtf8().toBase64()))
          << ""
          << "try:"
          << "    exec(compile(__enclave_source__, \"<snippet>\", \"exec\"), __enclave_globals__)"
          << "except Exception:"
          << QString("    print(\"%1\", file=sys.stderr)").arg(ErrorMarker)
          << "    traceback.print_exc()"
          << "    sys.stdout.flush()"
          << "    sys.stderr.flush()"
          << "    sys.exit(1)"
          << "";

    return lines.join(QLatin1Char('\n'));
}

} // namespace Enclave
