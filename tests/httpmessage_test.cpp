#include <QByteArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <gtest/gtest.h>

import relaygate.backend.httpmessage;

using Status = HttpRequestParser::Status;

TEST(HttpRequestParserTest, ParsesRequestWithBody)
{
    const QByteArray raw = "POST /connect?verbose=1 HTTP/1.1\r\n"
                           "Host: 127.0.0.1:18080\r\n"
                           "content-type: application/json\r\n"
                           "Content-Length: 13\r\n"
                           "\r\n"
                           "{\"port\":1080}";
    const HttpRequestParser::Result result = HttpRequestParser::parse(raw);
    ASSERT_EQ(result.status, Status::Complete);
    EXPECT_EQ(result.request.method, QByteArray("POST"));
    EXPECT_EQ(result.request.path, QStringLiteral("/connect"));
    EXPECT_EQ(result.request.query, QStringLiteral("verbose=1"));
    EXPECT_EQ(result.request.header("Content-Type"), QByteArray("application/json"));
    EXPECT_EQ(result.request.header("HOST"), QByteArray("127.0.0.1:18080"));
    EXPECT_EQ(result.request.body, QByteArray("{\"port\":1080}"));
}

TEST(HttpRequestParserTest, WaitsForHeadersAndBody)
{
    EXPECT_EQ(HttpRequestParser::parse("GET /status HTTP/1.1\r\nHost: x\r\n").status, Status::Incomplete);
    EXPECT_EQ(HttpRequestParser::parse("POST /connect HTTP/1.1\r\nContent-Length: 10\r\n\r\n{\"a\"").status,
              Status::Incomplete);
}

TEST(HttpRequestParserTest, RequestWithoutBodyIsComplete)
{
    const HttpRequestParser::Result result = HttpRequestParser::parse("GET /health HTTP/1.0\r\n\r\n");
    ASSERT_EQ(result.status, Status::Complete);
    EXPECT_TRUE(result.request.body.isEmpty());
    EXPECT_EQ(result.request.version, QByteArray("HTTP/1.0"));
}

TEST(HttpRequestParserTest, RejectsMalformedFraming)
{
    const QByteArray cases[] = {
        "GARBAGE\r\n\r\n",
        "GET status HTTP/1.1\r\n\r\n",
        "GET /status HTTP/2\r\n\r\n",
        "GET /status HTTP/1.1\r\nNoColonHere\r\n\r\n",
        "POST /connect HTTP/1.1\r\nContent-Length: abc\r\n\r\n",
        "POST /connect HTTP/1.1\r\nContent-Length: 1\r\nContent-Length: 2\r\n\r\n",
        "POST /connect HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n",
    };
    for (const QByteArray& raw : cases) {
        const HttpRequestParser::Result result = HttpRequestParser::parse(raw);
        EXPECT_EQ(result.status, Status::Invalid) << raw.constData();
        EXPECT_EQ(result.errorStatus, 400) << raw.constData();
    }
}

TEST(HttpRequestParserTest, OversizedBodyIsRejectedBeforeItArrives)
{
    const QByteArray raw = "POST /connect HTTP/1.1\r\nContent-Length: "
        + QByteArray::number(HttpRequestParser::kMaxBodyBytes + 1) + "\r\n\r\n";
    const HttpRequestParser::Result result = HttpRequestParser::parse(raw);
    EXPECT_EQ(result.status, Status::Invalid);
    EXPECT_EQ(result.errorStatus, 413);
}

TEST(HttpRequestParserTest, OversizedHeaderIsRejected)
{
    const QByteArray raw = "GET /status HTTP/1.1\r\nX-Fill: " + QByteArray(HttpRequestParser::kMaxHeaderBytes, 'a');
    const HttpRequestParser::Result result = HttpRequestParser::parse(raw);
    EXPECT_EQ(result.status, Status::Invalid);
    EXPECT_EQ(result.errorStatus, 400);
}

TEST(HttpResponseTest, SerializesWithLengthAndClose)
{
    HttpResponse response = HttpResponse::json(200, QJsonObject {{QStringLiteral("status"), QStringLiteral("ok")}});
    response.setHeader("Access-Control-Allow-Origin", "*");
    const QByteArray wire = response.serialize();

    EXPECT_TRUE(wire.startsWith("HTTP/1.1 200 OK\r\n"));
    EXPECT_TRUE(wire.contains("Content-Type: application/json\r\n"));
    EXPECT_TRUE(wire.contains("Access-Control-Allow-Origin: *\r\n"));
    EXPECT_TRUE(wire.contains("Content-Length: " + QByteArray::number(response.body.size()) + "\r\n"));
    EXPECT_TRUE(wire.contains("Connection: close\r\n\r\n"));
    EXPECT_TRUE(wire.endsWith(response.body));
}

TEST(HttpResponseTest, SetHeaderReplacesCaseInsensitively)
{
    HttpResponse response;
    response.setHeader("Content-Type", "text/plain");
    response.setHeader("content-type", "application/json");
    EXPECT_EQ(response.headers.size(), 1);
    EXPECT_EQ(response.header("CONTENT-TYPE"), QByteArray("application/json"));
}

TEST(HttpResponseTest, ErrorBodyCarriesSuccessFalse)
{
    const HttpResponse response = HttpResponse::error(403, QStringLiteral("Invalid authentication token"));
    EXPECT_EQ(response.statusCode, 403);
    const QJsonObject body = QJsonDocument::fromJson(response.body).object();
    EXPECT_FALSE(body.value(QStringLiteral("success")).toBool(true));
    EXPECT_EQ(body.value(QStringLiteral("message")).toString(), QStringLiteral("Invalid authentication token"));
    EXPECT_TRUE(response.serialize().startsWith("HTTP/1.1 403 Forbidden\r\n"));
}
