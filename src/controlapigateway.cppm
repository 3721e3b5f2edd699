/*!
 * @file        controlapigateway.cppm
 * @brief       HTTP/HTTPS control API of RelayGate.
 *
 * @details
 * Listens on all IPv4 interfaces and exposes health, connect, disconnect,
 * status and documentation endpoints. Every request passes through a fixed
 * middleware chain (logging, bearer auth, CORS, default content type) before
 * reaching the route table. Handlers complete asynchronously, so a slow
 * connect never blocks other clients.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QHash>
#include <QList>
#include <QObject>
#include <QString>
#include <QTcpServer>
#include <QTcpSocket>

#include <functional>
#include <memory>

#ifndef Q_MOC_RUN
export module relaygate.backend.controlapigateway;
export import relaygate.backend.apidocumentation;
export import relaygate.backend.httpmessage;
import relaygate.backend.connectionorchestrator;
import relaygate.backend.tlsidentitymanager;
#endif

#ifdef Q_MOC_RUN
#define RELAYGATE_MODULE_EXPORT
class ConnectionOrchestrator;
class TlsIdentityManager;
struct HttpRequest;
struct HttpResponse;
struct RouteInfo;
#else
#define RELAYGATE_MODULE_EXPORT export
#endif

/**
 * @class ControlApiGateway
 * @brief Request pipeline and socket server of the control API.
 */
RELAYGATE_MODULE_EXPORT class ControlApiGateway : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool running READ isRunning NOTIFY runningChanged)

public:
    //! Completes a request; may be invoked later from the event loop.
    using Responder = std::function<void(HttpResponse)>;
    using Handler = std::function<void(const HttpRequest&, Responder)>;
    using Middleware = std::function<Handler(Handler)>;

    static constexpr int kRequestReadTimeoutMs = 30000;

    /**
     * @brief Create a stopped gateway.
     * @param orchestrator Connect/disconnect workflow. Not owned.
     * @param identity TLS identity for HTTPS; may be null when HTTPS is never used.
     * @param parent Optional QObject parent.
     */
    ControlApiGateway(ConnectionOrchestrator* orchestrator,
                      TlsIdentityManager* identity,
                      QObject* parent = nullptr);
    ~ControlApiGateway() override;

    /**
     * @brief Start listening on all interfaces.
     * @param port Port number; 0 picks a free port.
     * @param https Serve TLS with the identity manager's material.
     * @param authToken Expected bearer token; empty disables authentication.
     * @param errorMessage Optional output error.
     * @return True when listening (or already running).
     */
    bool start(quint16 port, bool https, const QString& authToken, QString* errorMessage = nullptr);

    /**
     * @brief Close the listener and drop open connections. No-op when stopped.
     */
    void stop();

    bool isRunning() const;
    bool isHttps() const;
    bool isAuthEnabled() const;
    quint16 port() const;

    /**
     * @brief Listener URL such as `https://0.0.0.0:18080`.
     * @return URL, or empty string when stopped.
     */
    QString address() const;

    /**
     * @brief Route table used for routing, auth exemptions and documentation.
     */
    static const QList<RouteInfo>& routes();

    /**
     * @brief Run a parsed request through the middleware chain.
     * @param request Parsed request.
     * @param respond Completion callback.
     */
    void dispatch(const HttpRequest& request, Responder respond);

signals:
    void runningChanged(bool running);

private:
    struct Client {
        QByteArray buffer;
        bool dispatched = false;
    };

    void handlePendingConnections();
    void handleReadyRead(QTcpSocket* socket);
    void writeResponse(QTcpSocket* socket, const HttpResponse& response);

    Middleware loggingMiddleware() const;
    Middleware authMiddleware() const;
    Middleware corsMiddleware() const;
    Middleware contentTypeMiddleware() const;
    void route(const HttpRequest& request, Responder respond);

    void handleHealth(const HttpRequest& request, Responder respond);
    void handleConnect(const HttpRequest& request, Responder respond);
    void handleDisconnect(const HttpRequest& request, Responder respond);
    void handleStatus(const HttpRequest& request, Responder respond);
    void handleSwagger(const HttpRequest& request, Responder respond);

    ConnectionOrchestrator* m_orchestrator = nullptr;
    TlsIdentityManager* m_identity = nullptr;
    std::unique_ptr<QTcpServer> m_server;
    QHash<QTcpSocket*, Client> m_clients;
    Handler m_pipeline;
    QString m_authToken;
    bool m_https = false;
    quint16 m_port = 0;
};

#include "controlapigateway.moc"
