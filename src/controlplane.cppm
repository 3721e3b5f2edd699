/*!
 * @file        controlplane.cppm
 * @brief       Composition root wiring RelayGate components together.
 *
 * @details
 * Opens the data directory, loads settings and secrets, builds the identity
 * manager, tunnel session controller, orchestrator and control API gateway,
 * and applies the server settings when starting or restarting the listener.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QObject>
#include <QString>
#include <QtTypes>

#include <functional>
#include <optional>

#ifndef Q_MOC_RUN
export module relaygate.backend.controlplane;
import relaygate.backend.connectionorchestrator;
import relaygate.backend.controlapigateway;
import relaygate.backend.secretstore;
import relaygate.backend.serversettings;
import relaygate.backend.tlsidentitymanager;
import relaygate.backend.tunnelplatform;
import relaygate.backend.tunnelsessioncontroller;
#endif

#ifdef Q_MOC_RUN
#define RELAYGATE_MODULE_EXPORT
class ConnectionOrchestrator;
class ControlApiGateway;
class SecretStore;
class SettingsService;
class TlsIdentityManager;
class TunnelPlatform;
class RelayEngine;
class TunnelSessionController;
#else
#define RELAYGATE_MODULE_EXPORT export
#endif

/**
 * @struct ControlPlaneOptions
 * @brief Session overrides from the command line. Never written back.
 */
RELAYGATE_MODULE_EXPORT struct ControlPlaneOptions {
    QString dataDirectory;             //!< Empty means AppDataLocation.
    std::optional<quint16> port;       //!< Overrides `server/port`.
    std::optional<bool> httpsEnabled;  //!< Overrides `server/httpsEnabled`.
    bool autoStartDisabled = false;    //!< Skip auto start regardless of settings.
    QString relayExecutable;           //!< Overrides `relay/executablePath`.
    QString interfaceName;             //!< Overrides `relay/interfaceName`.
};

/**
 * @class ControlPlane
 * @brief Owns every long-lived component of the daemon.
 */
RELAYGATE_MODULE_EXPORT class ControlPlane : public QObject
{
    Q_OBJECT

public:
    //! Completion of an asynchronous server start.
    using StartCallback = std::function<void(bool ok, const QString& error)>;

    /**
     * @brief Build all components.
     * @param options Command-line overrides.
     * @param platform Virtual interface platform; null selects the Linux TUN platform. Ownership is taken.
     * @param relay Relay engine; null selects the hev-socks5-tunnel process. Ownership is taken.
     * @param parent Optional QObject parent.
     */
    explicit ControlPlane(const ControlPlaneOptions& options,
                          TunnelPlatform* platform = nullptr,
                          RelayEngine* relay = nullptr,
                          QObject* parent = nullptr);
    ~ControlPlane() override;

    /**
     * @brief Start the server when auto start applies.
     */
    void initialize();

    /**
     * @brief Start the control API with the current settings.
     *
     * @details
     * With HTTPS enabled the TLS identity is ensured on the thread pool first,
     * so certificate generation never runs on a request path.
     */
    void startServer(StartCallback callback = {});
    void stopServer();
    void restartServer(StartCallback callback = {});

    QString dataDirectory() const;
    SettingsService* settings();
    TlsIdentityManager* identity();
    TunnelSessionController* controller();
    ConnectionOrchestrator* orchestrator();
    ControlApiGateway* gateway();

signals:
    void serverStartFailed(const QString& error);

private:
    static QString resolveDataDirectory(const QString& requested);
    TunnelPlatform* createPlatform() const;
    RelayEngine* createRelay() const;

    void listen(quint16 port, bool https, bool authEnabled, const StartCallback& callback);
    void finishStart(bool ok, const QString& error, const StartCallback& callback);

    // Declaration order is construction order; later members reference earlier ones.
    ControlPlaneOptions m_options;
    QString m_dataDirectory;
    SecretStore m_secrets;
    SettingsService m_settings;
    TlsIdentityManager m_identity;
    TunnelSessionController m_controller;
    ConnectionOrchestrator m_orchestrator;
    ControlApiGateway m_gateway;
    quint64 m_startGeneration = 0;
};

#include "controlplane.moc"
