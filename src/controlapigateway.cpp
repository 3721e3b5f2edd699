module;
#include <QElapsedTimer>
#include <QHostAddress>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QPointer>
#include <QSslConfiguration>
#include <QSslServer>
#include <QSslSocket>
#include <QTimer>

#include <memory>
#include <optional>
#include <utility>

module relaygate.backend.controlapigateway;

import relaygate.backend.apidocumentation;
import relaygate.backend.connectionorchestrator;
import relaygate.backend.httpmessage;
import relaygate.backend.logging;
import relaygate.backend.tlsidentitymanager;

namespace {
constexpr auto kBearerPrefix = "Bearer ";

void setError(QString* errorMessage, const QString& text)
{
    if (errorMessage) {
        *errorMessage = text;
    }
}

bool constantTimeEquals(const QByteArray& left, const QByteArray& right)
{
    if (left.size() != right.size()) {
        return false;
    }
    unsigned char diff = 0;
    for (qsizetype i = 0; i < left.size(); ++i) {
        diff |= static_cast<unsigned char>(left.at(i) ^ right.at(i));
    }
    return diff == 0;
}

const RouteInfo* findRoute(const QList<RouteInfo>& routes, const QString& path)
{
    for (const RouteInfo& route : routes) {
        if (route.path == path) {
            return &route;
        }
    }
    return nullptr;
}
}

ControlApiGateway::ControlApiGateway(ConnectionOrchestrator* orchestrator,
                                     TlsIdentityManager* identity,
                                     QObject* parent)
    : QObject(parent)
    , m_orchestrator(orchestrator)
    , m_identity(identity)
{
    const QList<Middleware> chain {
        loggingMiddleware(),
        authMiddleware(),
        corsMiddleware(),
        contentTypeMiddleware()
    };

    Handler handler = [this](const HttpRequest& request, Responder respond) {
        route(request, std::move(respond));
    };
    for (auto it = chain.crbegin(); it != chain.crend(); ++it) {
        handler = (*it)(std::move(handler));
    }
    m_pipeline = std::move(handler);
}

ControlApiGateway::~ControlApiGateway()
{
    stop();
}

bool ControlApiGateway::start(quint16 port, bool https, const QString& authToken, QString* errorMessage)
{
    if (isRunning()) {
        qCDebug(lcGateway) << "Server already running on port" << m_port;
        return true;
    }

    std::unique_ptr<QTcpServer> server;
    if (https) {
        if (!m_identity) {
            setError(errorMessage, QStringLiteral("HTTPS requires a TLS identity"));
            return false;
        }
        QString tlsError;
        const std::optional<QSslConfiguration> configuration = m_identity->sslConfiguration(&tlsError);
        if (!configuration.has_value()) {
            setError(errorMessage, QStringLiteral("TLS material is not available: %1").arg(tlsError));
            return false;
        }
        auto sslServer = std::make_unique<QSslServer>();
        sslServer->setSslConfiguration(configuration.value());
        connect(sslServer.get(), &QSslServer::errorOccurred, this,
                [](QSslSocket* socket, QAbstractSocket::SocketError) {
            qCDebug(lcGateway).noquote() << "TLS client error from" << socket->peerAddress().toString()
                                         << ":" << socket->errorString();
        });
        server = std::move(sslServer);
    } else {
        server = std::make_unique<QTcpServer>();
    }

    connect(server.get(), &QTcpServer::pendingConnectionAvailable, this, [this]() {
        handlePendingConnections();
    });

    if (!server->listen(QHostAddress::AnyIPv4, port)) {
        setError(errorMessage, QStringLiteral("Failed to listen on port %1: %2").arg(port).arg(server->errorString()));
        qCWarning(lcGateway).noquote() << "Failed to listen on port" << port << ":" << server->errorString();
        return false;
    }

    m_server = std::move(server);
    m_https = https;
    m_authToken = authToken;
    m_port = m_server->serverPort();

    qCInfo(lcGateway).noquote() << "Server started on" << address()
                                << (m_authToken.isEmpty() ? "" : "(auth enabled)");
    emit runningChanged(true);
    return true;
}

void ControlApiGateway::stop()
{
    if (!m_server) {
        return;
    }

    m_server->close();
    const QList<QTcpSocket*> sockets = m_clients.keys();
    m_clients.clear();
    for (QTcpSocket* socket : sockets) {
        socket->disconnect(this);
        socket->abort();
        socket->deleteLater();
    }
    m_server.reset();
    m_https = false;
    m_authToken.clear();
    m_port = 0;

    qCInfo(lcGateway) << "Server stopped";
    emit runningChanged(false);
}

bool ControlApiGateway::isRunning() const
{
    return m_server && m_server->isListening();
}

bool ControlApiGateway::isHttps() const
{
    return m_https;
}

bool ControlApiGateway::isAuthEnabled() const
{
    return isRunning() && !m_authToken.isEmpty();
}

quint16 ControlApiGateway::port() const
{
    return m_port;
}

QString ControlApiGateway::address() const
{
    if (!isRunning()) {
        return {};
    }
    return QStringLiteral("%1://0.0.0.0:%2").arg(m_https ? QStringLiteral("https") : QStringLiteral("http")).arg(m_port);
}

const QList<RouteInfo>& ControlApiGateway::routes()
{
    static const QList<RouteInfo> table {
        {"GET", QStringLiteral("/"), QStringLiteral("Health"), QStringLiteral("healthCheckRoot"),
         QStringLiteral("Health check"), QStringLiteral("Alias for /health."),
         false, {}, QStringLiteral("HealthResponse")},
        {"GET", QStringLiteral("/health"), QStringLiteral("Health"), QStringLiteral("healthCheck"),
         QStringLiteral("Health check"), QStringLiteral("Verifies that the control server is running."),
         false, {}, QStringLiteral("HealthResponse")},
        {"POST", QStringLiteral("/connect"), QStringLiteral("Tunnel Control"), QStringLiteral("connect"),
         QStringLiteral("Connect the tunnel"),
         QStringLiteral("Connects the tunnel to a SOCKS5 proxy. Connecting again to the same endpoint succeeds."),
         true, QStringLiteral("ConnectRequest"), QStringLiteral("ApiResponse")},
        {"POST", QStringLiteral("/disconnect"), QStringLiteral("Tunnel Control"), QStringLiteral("disconnect"),
         QStringLiteral("Disconnect the tunnel"),
         QStringLiteral("Disconnects the tunnel. Disconnecting while disconnected succeeds."),
         true, {}, QStringLiteral("ApiResponse")},
        {"GET", QStringLiteral("/status"), QStringLiteral("Tunnel Control"), QStringLiteral("getStatus"),
         QStringLiteral("Get tunnel status"), QStringLiteral("Returns the current connection state."),
         true, {}, QStringLiteral("StatusResponse")},
        {"GET", QStringLiteral("/swagger"), QStringLiteral("Documentation"), QStringLiteral("swagger"),
         QStringLiteral("Swagger UI"), QStringLiteral("Interactive API documentation."),
         false, {}, {}}
    };
    return table;
}

void ControlApiGateway::dispatch(const HttpRequest& request, Responder respond)
{
    m_pipeline(request, std::move(respond));
}

void ControlApiGateway::handlePendingConnections()
{
    while (m_server && m_server->hasPendingConnections()) {
        QTcpSocket* socket = m_server->nextPendingConnection();
        if (socket == nullptr) {
            continue;
        }
        socket->setParent(this);
        m_clients.insert(socket, Client {});

        connect(socket, &QTcpSocket::readyRead, this, [this, socket]() {
            handleReadyRead(socket);
        });
        connect(socket, &QTcpSocket::disconnected, this, [this, socket]() {
            m_clients.remove(socket);
            socket->deleteLater();
        });

        QPointer<QTcpSocket> guard(socket);
        QTimer::singleShot(kRequestReadTimeoutMs, this, [this, guard]() {
            if (!guard) {
                return;
            }
            const auto it = m_clients.constFind(guard.data());
            if (it != m_clients.constEnd() && !it->dispatched) {
                qCDebug(lcGateway) << "Closing idle connection";
                guard->abort();
            }
        });

        // Bytes may already be buffered when the TLS handshake completed.
        if (socket->bytesAvailable() > 0) {
            handleReadyRead(socket);
        }
    }
}

void ControlApiGateway::handleReadyRead(QTcpSocket* socket)
{
    auto it = m_clients.find(socket);
    if (it == m_clients.end()) {
        return;
    }
    if (it->dispatched) {
        socket->readAll();
        return;
    }

    it->buffer.append(socket->readAll());
    const HttpRequestParser::Result parsed = HttpRequestParser::parse(it->buffer);
    if (parsed.status == HttpRequestParser::Status::Incomplete) {
        return;
    }

    it->dispatched = true;
    it->buffer.clear();

    if (parsed.status == HttpRequestParser::Status::Invalid) {
        qCDebug(lcGateway).noquote() << "Rejected request:" << parsed.errorMessage;
        HttpResponse response = HttpResponse::error(parsed.errorStatus, parsed.errorMessage);
        response.setHeader("Access-Control-Allow-Origin", "*");
        writeResponse(socket, response);
        return;
    }

    QPointer<QTcpSocket> guard(socket);
    QPointer<ControlApiGateway> self(this);
    dispatch(parsed.request, [self, guard](HttpResponse response) {
        if (!self || !guard) {
            return;
        }
        self->writeResponse(guard.data(), response);
    });
}

void ControlApiGateway::writeResponse(QTcpSocket* socket, const HttpResponse& response)
{
    if (socket->state() != QAbstractSocket::ConnectedState) {
        return;
    }
    socket->write(response.serialize());
    socket->flush();
    socket->disconnectFromHost();
}

ControlApiGateway::Middleware ControlApiGateway::loggingMiddleware() const
{
    return [](Handler next) -> Handler {
        return [next](const HttpRequest& request, Responder respond) {
            auto timer = std::make_shared<QElapsedTimer>();
            timer->start();
            const QString method = QString::fromLatin1(request.method);
            const QString path = request.path;
            next(request, [method, path, timer, respond](HttpResponse response) {
                qCInfo(lcGateway).noquote() << method << path << "->" << response.statusCode
                                            << QStringLiteral("(%1ms)").arg(timer->elapsed());
                respond(std::move(response));
            });
        };
    };
}

ControlApiGateway::Middleware ControlApiGateway::authMiddleware() const
{
    return [this](Handler next) -> Handler {
        return [this, next](const HttpRequest& request, Responder respond) {
            if (request.method == "OPTIONS" || m_authToken.isEmpty()) {
                next(request, std::move(respond));
                return;
            }
            const RouteInfo* route = findRoute(routes(), request.path);
            if (route && !route->requiresAuth) {
                next(request, std::move(respond));
                return;
            }

            const QByteArray authorization = request.header("Authorization");
            if (!authorization.startsWith(kBearerPrefix)) {
                HttpResponse response = HttpResponse::error(401, QStringLiteral("Missing or invalid Authorization header. "
                                                                                "Expected: Bearer <token>"));
                response.setHeader("Access-Control-Allow-Origin", "*");
                respond(std::move(response));
                return;
            }
            const QByteArray provided = authorization.mid(qstrlen(kBearerPrefix));
            if (!constantTimeEquals(provided, m_authToken.toUtf8())) {
                HttpResponse response = HttpResponse::error(403, QStringLiteral("Invalid authentication token"));
                response.setHeader("Access-Control-Allow-Origin", "*");
                respond(std::move(response));
                return;
            }
            next(request, std::move(respond));
        };
    };
}

ControlApiGateway::Middleware ControlApiGateway::corsMiddleware() const
{
    return [](Handler next) -> Handler {
        return [next](const HttpRequest& request, Responder respond) {
            if (request.method == "OPTIONS") {
                HttpResponse preflight;
                preflight.statusCode = 200;
                preflight.setHeader("Access-Control-Allow-Origin", "*");
                preflight.setHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
                preflight.setHeader("Access-Control-Allow-Headers", "Content-Type, Authorization");
                preflight.setHeader("Access-Control-Max-Age", "86400");
                respond(std::move(preflight));
                return;
            }
            next(request, [respond](HttpResponse response) {
                response.setHeader("Access-Control-Allow-Origin", "*");
                respond(std::move(response));
            });
        };
    };
}

ControlApiGateway::Middleware ControlApiGateway::contentTypeMiddleware() const
{
    return [](Handler next) -> Handler {
        return [next](const HttpRequest& request, Responder respond) {
            next(request, [respond](HttpResponse response) {
                if (!response.hasHeader("Content-Type")) {
                    response.setHeader("Content-Type", "application/json");
                }
                respond(std::move(response));
            });
        };
    };
}

void ControlApiGateway::route(const HttpRequest& request, Responder respond)
{
    for (const RouteInfo& route : routes()) {
        if (route.path != request.path || route.method != request.method) {
            continue;
        }

        if (route.operationId == QLatin1String("connect")) {
            handleConnect(request, std::move(respond));
        } else if (route.operationId == QLatin1String("disconnect")) {
            handleDisconnect(request, std::move(respond));
        } else if (route.operationId == QLatin1String("getStatus")) {
            handleStatus(request, std::move(respond));
        } else if (route.operationId == QLatin1String("swagger")) {
            handleSwagger(request, std::move(respond));
        } else {
            handleHealth(request, std::move(respond));
        }
        return;
    }

    // Anything without a matching method and path, including a known path with another method.
    respond(HttpResponse::error(404, QStringLiteral("Not found: %1").arg(request.path)));
}

void ControlApiGateway::handleHealth(const HttpRequest&, Responder respond)
{
    respond(HttpResponse::json(200, QJsonObject {
        {QStringLiteral("status"), QStringLiteral("ok")},
        {QStringLiteral("service"), QString::fromLatin1(ApiDocumentation::kServiceName)}
    }));
}

void ControlApiGateway::handleConnect(const HttpRequest& request, Responder respond)
{
    if (request.body.trimmed().isEmpty()) {
        respond(HttpResponse::error(400, QStringLiteral("Request body is required")));
        return;
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(request.body, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        respond(HttpResponse::error(400, QStringLiteral("Invalid request: %1").arg(parseError.errorString())));
        return;
    }
    if (!document.isObject()) {
        respond(HttpResponse::error(400, QStringLiteral("Invalid request: body must be a JSON object")));
        return;
    }

    QString error;
    const std::optional<ConnectRequest> connectRequest = ConnectRequest::fromJson(document.object(), &error);
    if (!connectRequest.has_value()) {
        respond(HttpResponse::error(400, QStringLiteral("Invalid request: %1").arg(error)));
        return;
    }

    m_orchestrator->requestConnect(connectRequest.value(), [respond](const OperationResult& result) {
        respond(HttpResponse::json(result.success ? 200 : 400, result.toJson()));
    });
}

void ControlApiGateway::handleDisconnect(const HttpRequest&, Responder respond)
{
    m_orchestrator->requestDisconnect([respond](const OperationResult& result) {
        respond(HttpResponse::json(result.success ? 200 : 400, result.toJson()));
    });
}

void ControlApiGateway::handleStatus(const HttpRequest&, Responder respond)
{
    respond(HttpResponse::json(200, m_orchestrator->status().toJson()));
}

void ControlApiGateway::handleSwagger(const HttpRequest&, Responder respond)
{
    respond(HttpResponse::html(200, ApiDocumentation::swaggerHtml(routes(), m_port ? m_port : 18080)));
}
