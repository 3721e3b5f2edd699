/*!
 * @file        connectionorchestrator.cppm
 * @brief       Idempotent connect/disconnect workflow for the control API.
 *
 * @details
 * Reconciles external connect/disconnect commands with the tunnel state feed.
 * A single-flight guard rejects overlapping commands; each accepted command
 * subscribes to the session controller's state changes and waits, bounded by
 * a timeout, for a terminal state. Status reads never block.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QJsonObject>
#include <QList>
#include <QObject>
#include <QString>
#include <QtTypes>

#include <functional>
#include <optional>

#ifndef Q_MOC_RUN
export module relaygate.backend.connectionorchestrator;
export import relaygate.backend.connectionstate;
import relaygate.backend.tunnelplatform;
import relaygate.backend.tunnelsessioncontroller;
#endif

#ifdef Q_MOC_RUN
#define RELAYGATE_MODULE_EXPORT
class TunnelSessionController;
struct TunnelPreferences;
#else
#define RELAYGATE_MODULE_EXPORT export
#endif

/**
 * @struct ConnectRequest
 * @brief Validated body of a connect command.
 */
RELAYGATE_MODULE_EXPORT struct ConnectRequest {
    QString host;      //!< Proxy host, non-empty.
    quint16 port = 0;  //!< Proxy port, 1..65535.
    QString username;  //!< Optional SOCKS5 username.
    QString password;  //!< Optional SOCKS5 password.

    /**
     * @brief Parse and validate a JSON body.
     * @param json Decoded request object.
     * @param errorMessage Optional output validation error.
     * @return Request, or empty optional when invalid.
     */
    static std::optional<ConnectRequest> fromJson(const QJsonObject& json, QString* errorMessage = nullptr);
};

/**
 * @struct OperationResult
 * @brief Outcome of a connect or disconnect command.
 */
RELAYGATE_MODULE_EXPORT struct OperationResult {
    //! How the command ended.
    enum class Outcome {
        Completed, //!< Reached the requested state, or already there.
        Rejected,  //!< Refused without touching the tunnel (busy, conflicting target).
        Failed,    //!< Tunnel reported Error.
        TimedOut   //!< No terminal state within the bounded wait.
    };

    Outcome outcome = Outcome::Completed; //!< Command outcome.
    bool success = false;                 //!< Client-facing success flag.
    QString message;                      //!< Client-facing message.

    /**
     * @brief JSON projection `{success, message}`.
     * @return Response body.
     */
    QJsonObject toJson() const;
};

/**
 * @struct ConnectionStatus
 * @brief Read-only projection of the tunnel state.
 */
RELAYGATE_MODULE_EXPORT struct ConnectionStatus {
    bool connected = false;                          //!< State is Connected.
    ConnectionState state = ConnectionState::Disconnected; //!< Current state.
    std::optional<QString> host;                     //!< Connected host, only while connected.
    std::optional<quint16> port;                     //!< Connected port, only while connected.

    /**
     * @brief JSON projection `{connected, state, host?, port?}`.
     * @return Response body.
     */
    QJsonObject toJson() const;
};

/**
 * @class ConnectionOrchestrator
 * @brief Serializes connect/disconnect commands against the session controller.
 */
RELAYGATE_MODULE_EXPORT class ConnectionOrchestrator : public QObject
{
    Q_OBJECT

public:
    //! Completion callback, invoked on the orchestrator's thread.
    using ResultCallback = std::function<void(const OperationResult&)>;

    //! Default bound on waiting for Connected or Error.
    static constexpr int kDefaultConnectTimeoutMs = 30000;

    //! Default bound on waiting for Disconnected or Error.
    static constexpr int kDefaultDisconnectTimeoutMs = 10000;

    /**
     * @brief Construct orchestrator.
     * @param controller Session controller; must outlive the orchestrator.
     * @param parent Optional QObject parent.
     */
    explicit ConnectionOrchestrator(TunnelSessionController* controller, QObject* parent = nullptr);

    /**
     * @brief Bound on the connect wait.
     * @param timeoutMs Milliseconds.
     */
    void setConnectTimeout(int timeoutMs);

    /**
     * @brief Bound on the disconnect wait.
     * @param timeoutMs Milliseconds.
     */
    void setDisconnectTimeout(int timeoutMs);

    /**
     * @brief Preferences merged into each connect.
     * @param preferences Application filter and QUIC flag.
     */
    void setTunnelPreferences(const TunnelPreferences& preferences);

    /**
     * @brief Connect to a proxy, idempotently.
     * @param request Validated request.
     * @param callback Completion callback.
     *
     * Same target while Connected succeeds without side effects; another
     * target while Connected, or any transitional state, is rejected.
     */
    void requestConnect(const ConnectRequest& request, ResultCallback callback);

    /**
     * @brief Disconnect, idempotently.
     * @param callback Completion callback.
     *
     * Always reports success unless another command is in flight. Disconnected
     * and Error complete immediately without touching the tunnel.
     */
    void requestDisconnect(ResultCallback callback);

    /**
     * @brief Current status projection; no side effects.
     * @return Status.
     */
    ConnectionStatus status() const;

    /**
     * @brief Whether a command holds the single-flight guard.
     * @return True while busy.
     */
    bool isBusy() const;

signals:
    //! Emitted when the single-flight guard is taken or released.
    void busyChanged(bool busy);

private:
    //! Remembered target of the last successful connect.
    struct Target {
        QString host;
        quint16 port = 0;
    };

    /**
     * @brief Wait until the controller reaches one of @p expected.
     * @param expected Terminal states.
     * @param timeoutMs Bound.
     * @param done Called once with the observed state and whether the wait timed out.
     */
    void waitForState(const QList<ConnectionState>& expected,
                      int timeoutMs,
                      std::function<void(ConnectionState, bool)> done);

    void setBusy(bool busy);

    TunnelSessionController* m_controller = nullptr; //!< Not owned.
    TunnelPreferences m_preferences;                 //!< Merged into each connect.
    std::optional<Target> m_target;                  //!< Remembered connected target.
    bool m_busy = false;                             //!< Single-flight guard.
    int m_connectTimeoutMs = kDefaultConnectTimeoutMs;       //!< Connect wait bound.
    int m_disconnectTimeoutMs = kDefaultDisconnectTimeoutMs; //!< Disconnect wait bound.
};

#include "connectionorchestrator.moc"
