#include <QByteArray>
#include <QHostAddress>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>
#include <QTcpSocket>
#include <QTemporaryDir>

#include <memory>
#include <optional>

#include <gtest/gtest.h>

import relaygate.backend.connectionorchestrator;
import relaygate.backend.controlapigateway;
import relaygate.backend.secretstore;
import relaygate.backend.tlsidentitymanager;
import relaygate.backend.tunnelsessioncontroller;
import relaygate.tests.faketunnel;

namespace {
const QString kToken = QStringLiteral("0123456789abcdef0123456789abcdef");

HttpRequest makeRequest(const QByteArray& method, const QString& path, const QByteArray& body = {})
{
    HttpRequest request;
    request.method = method;
    request.path = path;
    request.version = "HTTP/1.1";
    request.body = body;
    return request;
}

QJsonObject bodyOf(const HttpResponse& response)
{
    return QJsonDocument::fromJson(response.body).object();
}

class ControlApiGatewayTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        m_store = std::make_unique<SecretStore>(m_dir.filePath(QStringLiteral("secrets.json")));
        m_identity = std::make_unique<TlsIdentityManager>(m_store.get());
        m_platform = new FakeTunnelPlatform;
        m_relay = new FakeRelayEngine;
        m_controller = std::make_unique<TunnelSessionController>(m_platform, m_relay);
        m_orchestrator = std::make_unique<ConnectionOrchestrator>(m_controller.get());
        m_gateway = std::make_unique<ControlApiGateway>(m_orchestrator.get(), m_identity.get());
    }

    void TearDown() override
    {
        m_gateway.reset();
        m_orchestrator.reset();
        m_controller.reset();
        m_identity.reset();
        m_store.reset();
    }

    HttpResponse send(const HttpRequest& request)
    {
        std::optional<HttpResponse> response;
        m_gateway->dispatch(request, [&response](HttpResponse value) { response = std::move(value); });
        EXPECT_TRUE(waitFor([&response]() { return response.has_value(); }));
        return response.value_or(HttpResponse {});
    }

    QTemporaryDir m_dir;
    std::unique_ptr<SecretStore> m_store;
    std::unique_ptr<TlsIdentityManager> m_identity;
    FakeTunnelPlatform* m_platform = nullptr;
    FakeRelayEngine* m_relay = nullptr;
    std::unique_ptr<TunnelSessionController> m_controller;
    std::unique_ptr<ConnectionOrchestrator> m_orchestrator;
    std::unique_ptr<ControlApiGateway> m_gateway;
};
}

TEST_F(ControlApiGatewayTest, HealthOnBothPaths)
{
    for (const QString& path : {QStringLiteral("/"), QStringLiteral("/health")}) {
        const HttpResponse response = send(makeRequest("GET", path));
        EXPECT_EQ(response.statusCode, 200);
        EXPECT_EQ(response.header("Content-Type"), QByteArray("application/json"));
        EXPECT_EQ(response.header("Access-Control-Allow-Origin"), QByteArray("*"));
        const QJsonObject body = bodyOf(response);
        EXPECT_EQ(body.value(QStringLiteral("status")).toString(), QStringLiteral("ok"));
        EXPECT_EQ(body.value(QStringLiteral("service")).toString(), QStringLiteral("relaygate-control"));
    }
}

TEST_F(ControlApiGatewayTest, UnknownPathIsNotFound)
{
    const HttpResponse response = send(makeRequest("GET", QStringLiteral("/nope")));
    EXPECT_EQ(response.statusCode, 404);
    EXPECT_EQ(response.header("Access-Control-Allow-Origin"), QByteArray("*"));
    const QJsonObject body = bodyOf(response);
    EXPECT_FALSE(body.value(QStringLiteral("success")).toBool(true));
    EXPECT_EQ(body.value(QStringLiteral("message")).toString(), QStringLiteral("Not found: /nope"));
}

TEST_F(ControlApiGatewayTest, WrongMethodOnKnownPathIsNotFound)
{
    HttpResponse response = send(makeRequest("GET", QStringLiteral("/connect")));
    EXPECT_EQ(response.statusCode, 404);
    EXPECT_FALSE(response.hasHeader("Allow"));
    const QJsonObject body = bodyOf(response);
    EXPECT_FALSE(body.value(QStringLiteral("success")).toBool(true));
    EXPECT_EQ(body.value(QStringLiteral("message")).toString(), QStringLiteral("Not found: /connect"));

    response = send(makeRequest("POST", QStringLiteral("/status")));
    EXPECT_EQ(response.statusCode, 404);
    EXPECT_EQ(m_platform->establishCalls.load(), 0);
}

TEST_F(ControlApiGatewayTest, PreflightAnswersWithCorsHeaders)
{
    const HttpResponse response = send(makeRequest("OPTIONS", QStringLiteral("/connect")));
    EXPECT_EQ(response.statusCode, 200);
    EXPECT_TRUE(response.body.isEmpty());
    EXPECT_EQ(response.header("Access-Control-Allow-Origin"), QByteArray("*"));
    EXPECT_EQ(response.header("Access-Control-Allow-Methods"), QByteArray("GET, POST, OPTIONS"));
    EXPECT_EQ(response.header("Access-Control-Allow-Headers"), QByteArray("Content-Type, Authorization"));
    EXPECT_EQ(response.header("Access-Control-Max-Age"), QByteArray("86400"));
    EXPECT_EQ(m_platform->establishCalls.load(), 0);
}

TEST_F(ControlApiGatewayTest, ConnectValidatesBody)
{
    HttpResponse response = send(makeRequest("POST", QStringLiteral("/connect")));
    EXPECT_EQ(response.statusCode, 400);
    EXPECT_EQ(bodyOf(response).value(QStringLiteral("message")).toString(), QStringLiteral("Request body is required"));

    response = send(makeRequest("POST", QStringLiteral("/connect"), "{not json"));
    EXPECT_EQ(response.statusCode, 400);
    EXPECT_TRUE(bodyOf(response).value(QStringLiteral("message")).toString().startsWith(QStringLiteral("Invalid request: ")));

    response = send(makeRequest("POST", QStringLiteral("/connect"), "[1, 2]"));
    EXPECT_EQ(response.statusCode, 400);
    EXPECT_EQ(bodyOf(response).value(QStringLiteral("message")).toString(),
              QStringLiteral("Invalid request: body must be a JSON object"));

    response = send(makeRequest("POST", QStringLiteral("/connect"), R"({"host": "10.0.0.5", "port": 70000})"));
    EXPECT_EQ(response.statusCode, 400);
    EXPECT_EQ(bodyOf(response).value(QStringLiteral("message")).toString(),
              QStringLiteral("Invalid request: Missing or invalid \"port\" field (must be 1-65535)"));

    EXPECT_EQ(m_platform->establishCalls.load(), 0);
}

TEST_F(ControlApiGatewayTest, ConnectStatusDisconnectFlow)
{
    HttpResponse response = send(makeRequest("POST", QStringLiteral("/connect"),
                                             R"({"host": "192.168.1.100", "port": 9852})"));
    EXPECT_EQ(response.statusCode, 200);
    QJsonObject body = bodyOf(response);
    EXPECT_TRUE(body.value(QStringLiteral("success")).toBool());
    EXPECT_EQ(body.value(QStringLiteral("message")).toString(), QStringLiteral("Connected"));
    const auto options = m_relay->lastOptions();
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options->proxyHost, QStringLiteral("192.168.1.100"));
    EXPECT_EQ(options->proxyPort, 9852);

    response = send(makeRequest("GET", QStringLiteral("/status")));
    EXPECT_EQ(response.statusCode, 200);
    body = bodyOf(response);
    EXPECT_TRUE(body.value(QStringLiteral("connected")).toBool());
    EXPECT_EQ(body.value(QStringLiteral("state")).toString(), QStringLiteral("connected"));
    EXPECT_EQ(body.value(QStringLiteral("host")).toString(), QStringLiteral("192.168.1.100"));
    EXPECT_EQ(body.value(QStringLiteral("port")).toInt(), 9852);

    response = send(makeRequest("POST", QStringLiteral("/connect"), R"({"host": "10.9.9.9", "port": 1080})"));
    EXPECT_EQ(response.statusCode, 400);
    EXPECT_EQ(bodyOf(response).value(QStringLiteral("message")).toString(),
              QStringLiteral("Already connected to 192.168.1.100:9852. Disconnect first."));

    response = send(makeRequest("POST", QStringLiteral("/disconnect")));
    EXPECT_EQ(response.statusCode, 200);
    EXPECT_EQ(bodyOf(response).value(QStringLiteral("message")).toString(), QStringLiteral("Disconnected"));

    response = send(makeRequest("GET", QStringLiteral("/status")));
    body = bodyOf(response);
    EXPECT_FALSE(body.value(QStringLiteral("connected")).toBool(true));
    EXPECT_FALSE(body.contains(QStringLiteral("host")));
}

TEST_F(ControlApiGatewayTest, FailedConnectMapsToBadRequest)
{
    m_platform->failEstablish = true;
    const HttpResponse response = send(makeRequest("POST", QStringLiteral("/connect"),
                                                   R"({"host": "10.0.0.5", "port": 1080})"));
    EXPECT_EQ(response.statusCode, 400);
    EXPECT_EQ(bodyOf(response).value(QStringLiteral("message")).toString(), QStringLiteral("Connection failed"));
}

TEST_F(ControlApiGatewayTest, SwaggerServesHtml)
{
    const HttpResponse response = send(makeRequest("GET", QStringLiteral("/swagger")));
    EXPECT_EQ(response.statusCode, 200);
    EXPECT_TRUE(response.header("Content-Type").startsWith("text/html"));
    EXPECT_TRUE(response.body.contains("\"openapi\""));
    EXPECT_TRUE(response.body.contains("swagger-ui"));
}

TEST_F(ControlApiGatewayTest, BearerTokenIsEnforced)
{
    ASSERT_TRUE(m_gateway->start(0, false, kToken));
    EXPECT_TRUE(m_gateway->isAuthEnabled());

    HttpResponse response = send(makeRequest("GET", QStringLiteral("/status")));
    EXPECT_EQ(response.statusCode, 401);
    EXPECT_EQ(response.header("Access-Control-Allow-Origin"), QByteArray("*"));
    EXPECT_EQ(response.header("Content-Type"), QByteArray("application/json"));
    EXPECT_EQ(bodyOf(response).value(QStringLiteral("message")).toString(),
              QStringLiteral("Missing or invalid Authorization header. Expected: Bearer <token>"));

    HttpRequest request = makeRequest("GET", QStringLiteral("/status"));
    request.headers.insert("authorization", "Basic abc");
    EXPECT_EQ(send(request).statusCode, 401);

    request.headers.insert("authorization", "Bearer wrong");
    response = send(request);
    EXPECT_EQ(response.statusCode, 403);
    EXPECT_EQ(response.header("Access-Control-Allow-Origin"), QByteArray("*"));
    EXPECT_EQ(bodyOf(response).value(QStringLiteral("message")).toString(), QStringLiteral("Invalid authentication token"));

    request.headers.insert("authorization", QByteArray("Bearer ") + kToken.toUtf8());
    EXPECT_EQ(send(request).statusCode, 200);

    // Unknown paths are not exempt.
    EXPECT_EQ(send(makeRequest("GET", QStringLiteral("/nope"))).statusCode, 401);
}

TEST_F(ControlApiGatewayTest, PublicRoutesSkipAuthentication)
{
    ASSERT_TRUE(m_gateway->start(0, false, kToken));
    EXPECT_EQ(send(makeRequest("GET", QStringLiteral("/"))).statusCode, 200);
    EXPECT_EQ(send(makeRequest("GET", QStringLiteral("/health"))).statusCode, 200);
    EXPECT_EQ(send(makeRequest("GET", QStringLiteral("/swagger"))).statusCode, 200);
    EXPECT_EQ(send(makeRequest("OPTIONS", QStringLiteral("/disconnect"))).statusCode, 200);
}

TEST_F(ControlApiGatewayTest, StartAndStopAreIdempotent)
{
    QList<bool> changes;
    QObject::connect(m_gateway.get(), &ControlApiGateway::runningChanged, [&changes](bool running) {
        changes.append(running);
    });

    EXPECT_FALSE(m_gateway->isRunning());
    EXPECT_TRUE(m_gateway->address().isEmpty());
    m_gateway->stop();

    ASSERT_TRUE(m_gateway->start(0, false, {}));
    const quint16 port = m_gateway->port();
    EXPECT_NE(port, 0);
    EXPECT_FALSE(m_gateway->isHttps());
    EXPECT_FALSE(m_gateway->isAuthEnabled());
    EXPECT_EQ(m_gateway->address(), QStringLiteral("http://0.0.0.0:%1").arg(port));

    EXPECT_TRUE(m_gateway->start(0, false, kToken));
    EXPECT_EQ(m_gateway->port(), port);
    EXPECT_FALSE(m_gateway->isAuthEnabled());

    m_gateway->stop();
    m_gateway->stop();
    EXPECT_FALSE(m_gateway->isRunning());
    EXPECT_EQ(m_gateway->port(), 0);
    EXPECT_EQ(changes, (QList<bool> {true, false}));
}

TEST_F(ControlApiGatewayTest, HttpsWithoutMaterialFailsToStart)
{
    QString error;
    EXPECT_FALSE(m_gateway->start(0, true, {}, &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_FALSE(m_gateway->isRunning());
}

TEST_F(ControlApiGatewayTest, ServesRequestsOverTcp)
{
    ASSERT_TRUE(m_gateway->start(0, false, {}));

    QTcpSocket socket;
    QByteArray reply;
    QObject::connect(&socket, &QTcpSocket::readyRead, [&socket, &reply]() { reply += socket.readAll(); });
    socket.connectToHost(QHostAddress::LocalHost, m_gateway->port());
    ASSERT_TRUE(waitFor([&socket]() { return socket.state() == QAbstractSocket::ConnectedState; }));

    socket.write("GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n");
    ASSERT_TRUE(waitFor([&socket]() { return socket.state() == QAbstractSocket::UnconnectedState; }));
    reply += socket.readAll();

    EXPECT_TRUE(reply.startsWith("HTTP/1.1 200 OK\r\n")) << reply.toStdString();
    EXPECT_TRUE(reply.contains("Connection: close\r\n"));
    const qsizetype split = reply.indexOf("\r\n\r\n");
    ASSERT_GT(split, 0);
    const QJsonObject body = QJsonDocument::fromJson(reply.mid(split + 4)).object();
    EXPECT_EQ(body.value(QStringLiteral("status")).toString(), QStringLiteral("ok"));
}

TEST_F(ControlApiGatewayTest, MalformedRequestOverTcpIsRejected)
{
    ASSERT_TRUE(m_gateway->start(0, false, {}));

    QTcpSocket socket;
    QByteArray reply;
    QObject::connect(&socket, &QTcpSocket::readyRead, [&socket, &reply]() { reply += socket.readAll(); });
    socket.connectToHost(QHostAddress::LocalHost, m_gateway->port());
    ASSERT_TRUE(waitFor([&socket]() { return socket.state() == QAbstractSocket::ConnectedState; }));

    socket.write("NONSENSE\r\n\r\n");
    ASSERT_TRUE(waitFor([&socket]() { return socket.state() == QAbstractSocket::UnconnectedState; }));
    reply += socket.readAll();
    EXPECT_TRUE(reply.startsWith("HTTP/1.1 400 ")) << reply.toStdString();
}
