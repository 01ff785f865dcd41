#include "HttpWire.hpp"

#include <QtCore/QUrl>

namespace Enclave {

namespace {

const QByteArray crlf("\r\n");

enum class ChunkState {
    Incomplete,
    Complete,
    Malformed
};

ChunkState decodeChunked(const QByteArray& data, QByteArray& body) {
    body.clear();
    int pos = 0;
    while (true) {
        const int lineEnd = data.indexOf(crlf, pos);
        if (lineEnd < 0) {
            return ChunkState::Incomplete;
        }

        QByteArray sizeField = data.mid(pos, lineEnd - pos);
        const int extension = sizeField.indexOf(';');
        if (extension >= 0) {
            sizeField.truncate(extension);
        }
        bool ok = false;
        const qint64 size = sizeField.trimmed().toLongLong(&ok, 16);
        if (!ok || size < 0) {
            return ChunkState::Malformed;
        }

        pos = lineEnd + crlf.size();
        if (size == 0) {
            // Trailers are not used by the daemon
            return ChunkState::Complete;
        }
        if (data.size() < pos + size + crlf.size()) {
            return ChunkState::Incomplete;
        }
        body.append(data.mid(pos, size));
        pos += size;
        if (data.mid(pos, crlf.size()) != crlf) {
            return ChunkState::Malformed;
        }
        pos += crlf.size();
    }
}

quint32 readBigEndian32(const QByteArray& data, int offset) {
    const auto* bytes = reinterpret_cast<const uchar*>(data.constData() + offset);
    return (quint32(bytes[0]) << 24) | (quint32(bytes[1]) << 16) |
           (quint32(bytes[2]) << 8) | quint32(bytes[3]);
}

bool looksMultiplexed(const QByteArray& stream) {
    if (stream.size() < 8) {
        return false;
    }
    const char type = stream.at(0);
    return (type == 0 || type == 1 || type == 2) &&
           stream.at(1) == 0 && stream.at(2) == 0 && stream.at(3) == 0;
}

} // namespace

QByteArray HttpWire::buildRequest(const QByteArray& method, const QByteArray& target,
                                  const QByteArray& body, const QByteArray& contentType) {
    QByteArray request;
    request.append(method).append(' ').append(target).append(" HTTP/1.1\r\n");
    request.append("Host: docker\r\n");
    request.append("User-Agent: enclave\r\n");
    request.append("Accept: application/json\r\n");
    request.append("Connection: close\r\n");
    if (!body.isEmpty()) {
        request.append("Content-Type: ").append(contentType).append(crlf);
    }
    request.append("Content-Length: ").append(QByteArray::number(body.size())).append(crlf);
    request.append(crlf);
    request.append(body);
    return request;
}

Expected<HttpResponse, QString> HttpWire::parseResponse(const QByteArray& raw, bool connectionClosed) {
    HttpResponse response;

    const int headerEnd = raw.indexOf("\r\n\r\n");
    if (headerEnd < 0) {
        if (connectionClosed) {
            return makeUnexpected(raw.isEmpty() ? QString("connection closed without a response")
                                                : QString("connection closed inside the response header"));
        }
        return response;
    }

    const QList<QByteArray> lines = raw.left(headerEnd).split('\n');
    const QByteArray statusLine = lines.first().trimmed();
    if (!statusLine.startsWith("HTTP/1.")) {
        return makeUnexpected(QString("malformed status line: %1").arg(QString::fromLatin1(statusLine.left(80))));
    }

    const int firstSpace = statusLine.indexOf(' ');
    const int secondSpace = statusLine.indexOf(' ', firstSpace + 1);
    bool ok = false;
    response.statusCode = statusLine.mid(firstSpace + 1,
                                         secondSpace < 0 ? -1 : secondSpace - firstSpace - 1).toInt(&ok);
    if (firstSpace < 0 || !ok) {
        return makeUnexpected(QString("malformed status line: %1").arg(QString::fromLatin1(statusLine.left(80))));
    }
    if (secondSpace > 0) {
        response.reasonPhrase = statusLine.mid(secondSpace + 1);
    }

    for (int i = 1; i < lines.size(); ++i) {
        const QByteArray line = lines.at(i).trimmed();
        const int colon = line.indexOf(':');
        if (colon <= 0) {
            continue;
        }
        response.headers.insert(line.left(colon).trimmed().toLower(), line.mid(colon + 1).trimmed());
    }

    const QByteArray payload = raw.mid(headerEnd + 4);

    if (response.header("transfer-encoding").toLower().contains("chunked")) {
        switch (decodeChunked(payload, response.body)) {
        case ChunkState::Complete:
            response.complete = true;
            return response;
        case ChunkState::Malformed:
            return makeUnexpected(QString("malformed chunked body"));
        case ChunkState::Incomplete:
            if (connectionClosed) {
                return makeUnexpected(QString("connection closed inside a chunked body"));
            }
            return response;
        }
    }

    const QByteArray lengthField = response.header("content-length");
    if (!lengthField.isEmpty()) {
        const qint64 length = lengthField.toLongLong(&ok);
        if (!ok || length < 0) {
            return makeUnexpected(QString("invalid Content-Length"));
        }
        if (payload.size() >= length) {
            response.body = payload.left(length);
            response.complete = true;
            return response;
        }
        if (connectionClosed) {
            return makeUnexpected(QString("connection closed after %1 of %2 body bytes")
                                      .arg(payload.size()).arg(length));
        }
        return response;
    }

    // 1xx, 204 and 304 never carry a body
    if (response.statusCode == 204 || response.statusCode == 304 ||
        (response.statusCode >= 100 && response.statusCode < 200)) {
        response.complete = true;
        return response;
    }

    response.body = payload;
    response.complete = connectionClosed;
    return response;
}

QByteArray HttpWire::demultiplexLogs(const QByteArray& stream) {
    if (!looksMultiplexed(stream)) {
        return stream;
    }

    QByteArray combined;
    int pos = 0;
    while (pos + 8 <= stream.size()) {
        const quint32 length = readBigEndian32(stream, pos + 4);
        pos += 8;
        const int available = qMin<qint64>(length, stream.size() - pos);
        combined.append(stream.constData() + pos, available);
        pos += available;
    }
    return combined;
}

QByteArray HttpWire::encodePathSegment(const QString& segment) {
    return QUrl::toPercentEncoding(segment, ":/@");
}

} // namespace Enclave
