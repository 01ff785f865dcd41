#include <QtTest/QtTest>

#include "../src/core/engine/HttpWire.hpp"

using namespace Enclave;

namespace {

QByteArray frame(char stream, const QByteArray& payload) {
    QByteArray header(8, '\0');
    header[0] = stream;
    const quint32 size = static_cast<quint32>(payload.size());
    header[4] = static_cast<char>((size >> 24) & 0xff);
    header[5] = static_cast<char>((size >> 16) & 0xff);
    header[6] = static_cast<char>((size >> 8) & 0xff);
    header[7] = static_cast<char>(size & 0xff);
    return header + payload;
}

} // namespace

class TestHttpWire : public QObject {
    Q_OBJECT

private slots:
    void testBuildRequestWithoutBody() {
        const QByteArray request = HttpWire::buildRequest("GET", "/v1.41/_ping");

        QVERIFY(request.startsWith("GET /v1.41/_ping HTTP/1.1\r\n"));
        QVERIFY(request.contains("\r\nHost: docker\r\n"));
        QVERIFY(request.contains("\r\nConnection: close\r\n"));
        QVERIFY(request.contains("\r\nContent-Length: 0\r\n"));
        QVERIFY(!request.contains("Content-Type"));
        QVERIFY(request.endsWith("\r\n\r\n"));
    }

    void testBuildRequestWithBody() {
        const QByteArray body = R"({"Image":"python"})";
        const QByteArray request = HttpWire::buildRequest("POST", "/v1.41/containers/create", body);

        QVERIFY(request.contains("\r\nContent-Type: application/json\r\n"));
        QVERIFY(request.contains("\r\nContent-Length: " + QByteArray::number(body.size()) + "\r\n"));
        QVERIFY(request.endsWith("\r\n\r\n" + body));
    }

    void testContentLengthResponse() {
        const QByteArray raw = "HTTP/1.1 200 OK\r\n"
                               "Content-Type: application/json\r\n"
                               "Content-Length: 11\r\n"
                               "\r\n"
                               "{\"ok\":true}";
        auto parsed = HttpWire::parseResponse(raw, false);
        QVERIFY(parsed.hasValue());

        const HttpResponse& response = parsed.value();
        QVERIFY(response.complete);
        QCOMPARE(response.statusCode, 200);
        QCOMPARE(response.reasonPhrase, QByteArray("OK"));
        QCOMPARE(response.header("Content-Type"), QByteArray("application/json"));
        QCOMPARE(response.body, QByteArray("{\"ok\":true}"));
    }

    void testPartialResponsesAreIncomplete() {
        const QByteArray full = "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhello";

        const int headerCut = static_cast<int>(full.indexOf("\r\n\r\n")) + 2;
        const int bodyCut = static_cast<int>(full.size()) - 1;
        for (int cut : {0, 10, headerCut, bodyCut}) {
            auto parsed = HttpWire::parseResponse(full.left(cut), false);
            QVERIFY(parsed.hasValue());
            QVERIFY(!parsed.value().complete);
        }
    }

    void testTruncationAfterCloseIsAnError() {
        QVERIFY(HttpWire::parseResponse("", true).hasError());
        QVERIFY(HttpWire::parseResponse("HTTP/1.1 200 OK\r\nContent-Le", true).hasError());

        auto truncated = HttpWire::parseResponse("HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhel", true);
        QVERIFY(truncated.hasError());
        QVERIFY(truncated.error().contains("3 of 5"));
    }

    void testChunkedResponse() {
        const QByteArray raw = "HTTP/1.1 200 OK\r\n"
                               "Transfer-Encoding: chunked\r\n"
                               "\r\n"
                               "5\r\nhello\r\n"
                               "7;ext=1\r\n, world\r\n"
                               "0\r\n\r\n";
        auto parsed = HttpWire::parseResponse(raw, false);
        QVERIFY(parsed.hasValue());
        QVERIFY(parsed.value().complete);
        QCOMPARE(parsed.value().body, QByteArray("hello, world"));

        auto partial = HttpWire::parseResponse(raw.left(raw.indexOf("7;ext")), false);
        QVERIFY(partial.hasValue());
        QVERIFY(!partial.value().complete);

        QVERIFY(HttpWire::parseResponse(raw.left(raw.indexOf("7;ext")), true).hasError());
    }

    void testMalformedChunk() {
        auto parsed = HttpWire::parseResponse("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n", false);
        QVERIFY(parsed.hasError());
    }

    void testBodylessStatuses() {
        auto noContent = HttpWire::parseResponse("HTTP/1.1 204 No Content\r\n\r\n", false);
        QVERIFY(noContent.hasValue());
        QVERIFY(noContent.value().complete);
        QCOMPARE(noContent.value().statusCode, 204);
        QVERIFY(noContent.value().body.isEmpty());

        auto notModified = HttpWire::parseResponse("HTTP/1.1 304 Not Modified\r\n\r\n", false);
        QVERIFY(notModified.value().complete);
    }

    void testCloseDelimitedBody() {
        const QByteArray raw = "HTTP/1.0 200 OK\r\n\r\nstreamed output";

        auto open = HttpWire::parseResponse(raw, false);
        QVERIFY(open.hasValue());
        QVERIFY(!open.value().complete);

        auto closed = HttpWire::parseResponse(raw, true);
        QVERIFY(closed.hasValue());
        QVERIFY(closed.value().complete);
        QCOMPARE(closed.value().body, QByteArray("streamed output"));
    }

    void testMalformedStatusLine() {
        QVERIFY(HttpWire::parseResponse("SSH-2.0-OpenSSH\r\n\r\n", false).hasError());
        QVERIFY(HttpWire::parseResponse("HTTP/1.1 abc Bad\r\n\r\n", false).hasError());
    }

    void testDemultiplexLogs() {
        const QByteArray stream = frame(1, "4\n") + frame(2, "Traceback\n") + frame(1, "done\n");
        QCOMPARE(HttpWire::demultiplexLogs(stream), QByteArray("4\nTraceback\ndone\n"));
    }

    void testDemultiplexTruncatedFrame() {
        QByteArray stream = frame(1, "complete\n") + frame(2, "cut short");
        stream.chop(3);
        QCOMPARE(HttpWire::demultiplexLogs(stream), QByteArray("complete\ncut sh"));
    }

    void testRawStreamPassesThrough() {
        QCOMPARE(HttpWire::demultiplexLogs("plain tty output\n"), QByteArray("plain tty output\n"));
        QCOMPARE(HttpWire::demultiplexLogs(QByteArray()), QByteArray());
    }

    void testEncodePathSegment() {
        QCOMPARE(HttpWire::encodePathSegment("enclave-python-sandbox:latest"),
                 QByteArray("enclave-python-sandbox:latest"));
        QCOMPARE(HttpWire::encodePathSegment("registry.local/team/image:1.0"),
                 QByteArray("registry.local/team/image:1.0"));
        QCOMPARE(HttpWire::encodePathSegment("a b?c"), QByteArray("a%20b%3Fc"));
    }
};

int runTestHttpWire(int argc, char** argv) {
    TestHttpWire test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_http_wire.moc"
