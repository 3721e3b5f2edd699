/*!
 * @file        tunnelplatform.cppm
 * @brief       Typed collaborator interfaces for the tunnel session.
 *
 * @details
 * Declares the immutable tunnel configuration, the virtual-interface handle
 * and the two platform collaborators driven by the session controller: the
 * virtual-interface platform (establish/release, revocation notice) and the
 * packet relay engine (start/stop/stats, crash notice). Concrete Linux
 * implementations live in their own modules; tests provide fakes.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QObject>
#include <QString>
#include <QStringList>
#include <QtTypes>

#include <optional>

#ifndef Q_MOC_RUN
export module relaygate.backend.tunnelplatform;
export import relaygate.backend.routeplanner;
#endif

#ifdef Q_MOC_RUN
#define RELAYGATE_MODULE_EXPORT
struct RoutePlan;
#else
#define RELAYGATE_MODULE_EXPORT export
#endif

/**
 * @struct TunnelConfiguration
 * @brief Parameters of one connect attempt.
 */
RELAYGATE_MODULE_EXPORT struct TunnelConfiguration {
    QString proxyHost;               //!< SOCKS5 server host.
    quint16 proxyPort = 0;           //!< SOCKS5 server port, 1..65535.
    QString username;                //!< Optional SOCKS5 username.
    QString password;                //!< Optional SOCKS5 password.
    QStringList allowedApplications; //!< Empty means unrestricted.
    bool blockQuic = true;           //!< Near-zero UDP idle timeout in the relay.

    /**
     * @brief Validate host and port.
     * @param errorMessage Optional output error.
     * @return True when usable.
     */
    bool validate(QString* errorMessage = nullptr) const;

    /**
     * @brief `host:port` label for logs and messages.
     * @return Endpoint text.
     */
    QString endpoint() const;
};

/**
 * @struct TunnelPreferences
 * @brief Persisted user preferences merged into every tunnel configuration.
 */
RELAYGATE_MODULE_EXPORT struct TunnelPreferences {
    bool appFilterEnabled = false;   //!< Restrict the tunnel to allowedApplications.
    QStringList allowedApplications; //!< Allow-list used when the filter is enabled.
    bool blockQuic = true;           //!< Block QUIC through the relay UDP timeout.

    /**
     * @brief Merge preferences into a configuration.
     * @param configuration Endpoint and credentials.
     * @return Configuration with filter and QUIC flag applied.
     */
    TunnelConfiguration applyTo(TunnelConfiguration configuration) const;
};

/**
 * @struct InterfaceHandle
 * @brief Platform resource representing an established virtual interface.
 */
RELAYGATE_MODULE_EXPORT struct InterfaceHandle {
    QString name;    //!< Interface name (for example `relaygate0`).
    int mtu = 1500;  //!< Configured MTU.

    /**
     * @brief Whether the handle refers to an interface.
     * @return True when named.
     */
    bool isValid() const;
};

/**
 * @struct RelayStartOptions
 * @brief Relay engine parameters derived from a tunnel configuration.
 */
RELAYGATE_MODULE_EXPORT struct RelayStartOptions {
    QString proxyHost;       //!< SOCKS5 server host.
    quint16 proxyPort = 0;   //!< SOCKS5 server port.
    QString username;        //!< Optional username.
    QString password;        //!< Optional password.
    int mtu = 1500;          //!< Tunnel MTU.
    int udpTimeoutMs = 60000; //!< UDP session idle timeout.
};

/**
 * @struct RelayStats
 * @brief Traffic counters reported by the relay engine.
 */
RELAYGATE_MODULE_EXPORT struct RelayStats {
    quint64 uploadBytes = 0;   //!< Bytes sent into the tunnel.
    quint64 downloadBytes = 0; //!< Bytes received from the tunnel.
    int activeConnections = 0; //!< Open relayed sessions, 0 when unknown.
};

/**
 * @class TunnelPlatform
 * @brief Creates and releases the virtual interface.
 */
RELAYGATE_MODULE_EXPORT class TunnelPlatform : public QObject
{
    Q_OBJECT

public:
    using QObject::QObject;
    ~TunnelPlatform() override = default;

    /**
     * @brief Create and configure the interface from a route plan.
     * @param plan Routes, address, DNS, MTU and application filter.
     * @param errorMessage Optional output error.
     * @return Handle, or empty optional on failure.
     */
    virtual std::optional<InterfaceHandle> establish(const RoutePlan& plan, QString* errorMessage = nullptr) = 0;

    /**
     * @brief Tear down an interface created by establish().
     * @param handle Handle to release.
     */
    virtual void release(const InterfaceHandle& handle) = 0;

signals:
    //! Emitted when the platform withdraws the interface or permission.
    void revoked();
};

/**
 * @class RelayEngine
 * @brief Moves packets between the interface and the SOCKS5 proxy.
 */
RELAYGATE_MODULE_EXPORT class RelayEngine : public QObject
{
    Q_OBJECT

public:
    using QObject::QObject;
    ~RelayEngine() override = default;

    /**
     * @brief Start relaying on an established interface.
     * @param handle Interface handle.
     * @param options Proxy endpoint, credentials, MTU and UDP timeout.
     * @param errorMessage Optional output error.
     * @return True once the relay is running.
     */
    virtual bool start(const InterfaceHandle& handle, const RelayStartOptions& options, QString* errorMessage = nullptr) = 0;

    /**
     * @brief Stop relaying; best effort and idempotent.
     */
    virtual void stop() = 0;

    /**
     * @brief Whether the relay is running.
     * @return True while running.
     */
    virtual bool isRunning() const = 0;

    /**
     * @brief Current traffic counters.
     * @return Counters, zero when not running.
     */
    virtual RelayStats stats() const = 0;

signals:
    //! Emitted when the relay stops without a stop() request.
    void unexpectedExit(const QString& reason);
};

#include "tunnelplatform.moc"
