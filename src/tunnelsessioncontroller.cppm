/*!
 * @file        tunnelsessioncontroller.cppm
 * @brief       Tunnel session lifecycle state machine.
 *
 * @details
 * Drives the virtual-interface platform and the relay engine through one
 * tunnel session and publishes the resulting `ConnectionState`. Platform and
 * relay calls run on a dedicated worker thread; their results return to the
 * controller's thread, the only place where the state changes. Permission
 * revocation and unexpected relay exits are folded into the same state feed.
 *
 * Transitions:
 * - Disconnected/Error -> Connecting -> Connected | Error
 * - Connected -> Disconnecting -> Disconnected
 * - Connected -> Error (relay exited unexpectedly)
 * - any -> Disconnected (permission revoked)
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QObject>
#include <QString>
#include <QThread>
#include <QTimer>
#include <QtTypes>

#include <functional>
#include <memory>
#include <optional>

#ifndef Q_MOC_RUN
export module relaygate.backend.tunnelsessioncontroller;
export import relaygate.backend.connectionstate;
export import relaygate.backend.tunnelplatform;
#endif

#ifdef Q_MOC_RUN
#define RELAYGATE_MODULE_EXPORT
class TunnelPlatform;
class RelayEngine;
struct TunnelConfiguration;
struct InterfaceHandle;
struct RelayStats;
#else
#define RELAYGATE_MODULE_EXPORT export
#endif

/**
 * @class TunnelSessionController
 * @brief Owns the published connection state and the platform collaborators.
 */
RELAYGATE_MODULE_EXPORT class TunnelSessionController : public QObject
{
    Q_OBJECT

public:
    //! UDP idle timeout passed to the relay normally.
    static constexpr int kDefaultUdpTimeoutMs = 60000;

    //! UDP idle timeout while QUIC blocking is on; every UDP flow expires, not only HTTP/3.
    static constexpr int kQuicBlockingUdpTimeoutMs = 1;

    //! Default tunnel MTU.
    static constexpr int kDefaultMtu = 1500;

    /**
     * @brief Construct controller and start its worker thread.
     * @param platform Virtual-interface platform; parentless, reparented to the worker context.
     * @param relay Relay engine; parentless, reparented to the worker context.
     * @param parent Optional QObject parent.
     */
    TunnelSessionController(TunnelPlatform* platform, RelayEngine* relay, QObject* parent = nullptr);

    /**
     * @brief Tear down any active session and stop the worker thread.
     */
    ~TunnelSessionController() override;

    /**
     * @brief Current connection state.
     * @return State value.
     */
    ConnectionState state() const;

    /**
     * @brief Configuration of the current or last attempted session.
     * @return Configuration, or empty optional before the first connect.
     */
    std::optional<TunnelConfiguration> activeConfiguration() const;

    /**
     * @brief Last polled relay counters.
     * @return Counters, zero while not connected.
     */
    RelayStats stats() const;

    /**
     * @brief Identifier excluded from the tunnel when no allow-list is set.
     * @param identifier Application identifier.
     */
    void setSelfIdentifier(const QString& identifier);

    /**
     * @brief MTU used for new sessions.
     * @param mtu Interface MTU.
     */
    void setMtu(int mtu);

    /**
     * @brief Interval of relay counter polling while connected.
     * @param intervalMs Milliseconds.
     */
    void setStatsInterval(int intervalMs);

    /**
     * @brief Begin a session.
     * @param configuration Proxy endpoint, credentials and filters.
     * @param errorMessage Optional output error when rejected.
     * @return True when Connecting was entered; the outcome arrives via stateChanged().
     *
     * Rejected unless the state is Disconnected or Error.
     */
    bool connectTunnel(const TunnelConfiguration& configuration, QString* errorMessage = nullptr);

    /**
     * @brief End the session: stop the relay, release the interface.
     *
     * Best effort. Enters Disconnecting and then Disconnected; a no-op when
     * already Disconnected or Disconnecting.
     */
    void disconnectTunnel();

    /**
     * @brief Force Disconnected after the platform withdrew the interface.
     *
     * Skips Disconnecting. Resources are released in the background.
     */
    void handlePermissionRevoked();

    /**
     * @brief UDP idle timeout for a QUIC-blocking choice.
     * @param blockQuic Whether QUIC blocking is on.
     * @return Timeout in milliseconds.
     */
    static int udpTimeoutFor(bool blockQuic);

signals:
    //! Published state feed; emitted once per transition.
    void stateChanged(ConnectionState state);
    //! Emitted after each stats poll.
    void statsChanged();
    //! Emitted when a session fails or the relay dies.
    void errorOccurred(const QString& message);

private:
    /**
     * @brief Apply a transition and publish it.
     * @param state New state.
     */
    void setState(ConnectionState state);

    /**
     * @brief Handle the worker's connect result.
     * @param session Session counter captured at dispatch.
     * @param handle Established interface, empty on failure.
     * @param error Failure text.
     */
    void finishConnect(quint64 session, const std::optional<InterfaceHandle>& handle, const QString& error);

    /**
     * @brief Handle the worker's disconnect completion.
     * @param session Session counter captured at dispatch.
     */
    void finishDisconnect(quint64 session);

    //! Interface established by the worker; touched only on the worker thread.
    struct WorkerState {
        std::optional<InterfaceHandle> handle;
    };

    /**
     * @brief Stop the relay and release the worker's interface on the worker thread.
     * @param onDone Optional completion, called on the controller thread.
     */
    void teardown(std::function<void()> onDone = {});

    static void releaseSession(TunnelPlatform* platform, RelayEngine* relay, WorkerState& worker);

    //! Relay exited without being asked to.
    void handleRelayExit(const QString& reason);

    //! Dispatch one stats poll to the worker.
    void pollStats();

    TunnelPlatform* m_platform = nullptr;            //!< Child of m_workerContext.
    RelayEngine* m_relay = nullptr;                  //!< Child of m_workerContext.
    QThread m_thread;                                //!< Worker thread.
    QObject* m_workerContext = nullptr;              //!< Worker-thread context; deleted when the thread finishes.
    std::shared_ptr<WorkerState> m_worker;           //!< Worker-side session resources.
    QTimer m_statsTimer;                             //!< Stats poll timer (controller thread).

    ConnectionState m_state = ConnectionState::Disconnected; //!< Published state.
    quint64 m_session = 0;                           //!< Bumped on every connect/disconnect/revoke.
    std::optional<TunnelConfiguration> m_configuration; //!< Current or last configuration.
    std::optional<InterfaceHandle> m_handle;         //!< Interface of the connected session.
    RelayStats m_stats;                              //!< Last polled counters.
    QString m_selfIdentifier;                        //!< Excluded application identifier.
    int m_mtu = kDefaultMtu;                         //!< MTU for new sessions.
};

#include "tunnelsessioncontroller.moc"
