#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QMap>
#include <QtCore/QString>

#include "core/common/Expected.hpp"

namespace Enclave {

struct HttpResponse {
    int statusCode = 0;
    QByteArray reasonPhrase;
    QMap<QByteArray, QByteArray> headers;   // names lower-cased
    QByteArray body;                        // de-chunked
    bool complete = false;

    QByteArray header(const QByteArray& name) const { return headers.value(name.toLower()); }
};

/**
 * @brief Minimal HTTP/1.1 framing for talking to a daemon over a local socket
 *
 * Requests are always sent with "Connection: close". Responses may be
 * delimited by Content-Length, by chunked transfer encoding, or by the peer
 * closing the connection.
 */
class HttpWire {
public:
    static QByteArray buildRequest(const QByteArray& method,
                                   const QByteArray& target,
                                   const QByteArray& body = QByteArray(),
                                   const QByteArray& contentType = "application/json");

    // Parses what has been received so far. A response that is still
    // missing bytes comes back with complete == false unless the peer has
    // already closed, in which case truncation is an error.
    static Expected<HttpResponse, QString> parseResponse(const QByteArray& raw, bool connectionClosed);

    // Splits a multiplexed log stream (8-byte frame headers) into one
    // buffer in arrival order. Streams without frame headers, as produced
    // for TTY containers, are returned unchanged.
    static QByteArray demultiplexLogs(const QByteArray& stream);

    static QByteArray encodePathSegment(const QString& segment);
};

} // namespace Enclave
