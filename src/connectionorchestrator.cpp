module;
#include <QJsonObject>
#include <QJsonValue>
#include <QLoggingCategory>
#include <QPointer>
#include <QTimer>

#include <cmath>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

module relaygate.backend.connectionorchestrator;

import relaygate.backend.connectionstate;
import relaygate.backend.logging;
import relaygate.backend.tunnelplatform;
import relaygate.backend.tunnelsessioncontroller;

namespace {
void setError(QString* errorMessage, const QString& error)
{
    if (errorMessage) {
        *errorMessage = error;
    }
}

OperationResult makeResult(OperationResult::Outcome outcome, bool success, const QString& message)
{
    OperationResult result;
    result.outcome = outcome;
    result.success = success;
    result.message = message;
    return result;
}
}

std::optional<ConnectRequest> ConnectRequest::fromJson(const QJsonObject& json, QString* errorMessage)
{
    const QJsonValue host = json.value(QStringLiteral("host"));
    if (!host.isString() || host.toString().isEmpty()) {
        setError(errorMessage, QStringLiteral("Missing or invalid \"host\" field"));
        return std::nullopt;
    }

    const QJsonValue port = json.value(QStringLiteral("port"));
    const double portValue = port.toDouble();
    if (!port.isDouble() || std::floor(portValue) != portValue || portValue < 1 || portValue > 65535) {
        setError(errorMessage, QStringLiteral("Missing or invalid \"port\" field (must be 1-65535)"));
        return std::nullopt;
    }

    ConnectRequest request;
    request.host = host.toString();
    request.port = static_cast<quint16>(portValue);
    request.username = json.value(QStringLiteral("username")).toString();
    request.password = json.value(QStringLiteral("password")).toString();
    return request;
}

QJsonObject OperationResult::toJson() const
{
    return QJsonObject {
        {QStringLiteral("success"), success},
        {QStringLiteral("message"), message}
    };
}

QJsonObject ConnectionStatus::toJson() const
{
    QJsonObject json {
        {QStringLiteral("connected"), connected},
        {QStringLiteral("state"), connectionStateName(state)}
    };
    if (host.has_value()) {
        json.insert(QStringLiteral("host"), host.value());
    }
    if (port.has_value()) {
        json.insert(QStringLiteral("port"), static_cast<int>(port.value()));
    }
    return json;
}

ConnectionOrchestrator::ConnectionOrchestrator(TunnelSessionController* controller, QObject* parent)
    : QObject(parent)
    , m_controller(controller)
{
    // The remembered target follows the session, including one that outlived a timed-out wait.
    connect(m_controller, &TunnelSessionController::stateChanged, this, [this](ConnectionState state) {
        if (state == ConnectionState::Connected) {
            const std::optional<TunnelConfiguration> configuration = m_controller->activeConfiguration();
            if (configuration.has_value()) {
                m_target = Target {configuration->proxyHost, configuration->proxyPort};
            }
        } else if (state == ConnectionState::Disconnected || state == ConnectionState::Error) {
            m_target.reset();
        }
    });
}

void ConnectionOrchestrator::setConnectTimeout(int timeoutMs)
{
    if (timeoutMs > 0) {
        m_connectTimeoutMs = timeoutMs;
    }
}

void ConnectionOrchestrator::setDisconnectTimeout(int timeoutMs)
{
    if (timeoutMs > 0) {
        m_disconnectTimeoutMs = timeoutMs;
    }
}

void ConnectionOrchestrator::setTunnelPreferences(const TunnelPreferences& preferences)
{
    m_preferences = preferences;
}

void ConnectionOrchestrator::requestConnect(const ConnectRequest& request, ResultCallback callback)
{
    using Outcome = OperationResult::Outcome;

    if (m_busy) {
        callback(makeResult(Outcome::Rejected, false, QStringLiteral("Operation already in progress")));
        return;
    }

    const ConnectionState state = m_controller->state();
    if (state == ConnectionState::Connected) {
        if (m_target.has_value() && m_target->host == request.host && m_target->port == request.port) {
            callback(makeResult(Outcome::Completed, true, QStringLiteral("Already connected")));
            return;
        }
        const QString current = m_target.has_value()
            ? QStringLiteral("%1:%2").arg(m_target->host).arg(m_target->port)
            : QStringLiteral("unknown");
        callback(makeResult(Outcome::Rejected, false,
                            QStringLiteral("Already connected to %1. Disconnect first.").arg(current)));
        return;
    }
    if (state == ConnectionState::Connecting) {
        callback(makeResult(Outcome::Rejected, false, QStringLiteral("Connection already in progress")));
        return;
    }
    if (state == ConnectionState::Disconnecting) {
        callback(makeResult(Outcome::Rejected, false, QStringLiteral("Disconnect in progress")));
        return;
    }

    TunnelConfiguration configuration;
    configuration.proxyHost = request.host;
    configuration.proxyPort = request.port;
    configuration.username = request.username;
    configuration.password = request.password;
    configuration = m_preferences.applyTo(configuration);

    m_target.reset();
    setBusy(true);
    QString error;
    if (!m_controller->connectTunnel(configuration, &error)) {
        setBusy(false);
        callback(makeResult(Outcome::Failed, false, QStringLiteral("Connection error: %1").arg(error)));
        return;
    }

    const Target target {request.host, request.port};
    QPointer<ConnectionOrchestrator> guard(this);
    waitForState({ConnectionState::Connected, ConnectionState::Error}, m_connectTimeoutMs,
                 [guard, target, callback](ConnectionState observed, bool timedOut) {
        if (!guard) {
            return;
        }

        OperationResult result;
        if (observed == ConnectionState::Connected) {
            guard->m_target = target;
            result = makeResult(Outcome::Completed, true, QStringLiteral("Connected"));
        } else if (timedOut) {
            result = makeResult(Outcome::TimedOut, false, QStringLiteral("Connection timed out"));
        } else {
            result = makeResult(Outcome::Failed, false, QStringLiteral("Connection failed"));
        }
        qCInfo(lcOrchestrator).noquote() << "Connect to" << QStringLiteral("%1:%2").arg(target.host).arg(target.port)
                                         << "->" << result.message;
        guard->setBusy(false);
        callback(result);
    });
}

void ConnectionOrchestrator::requestDisconnect(ResultCallback callback)
{
    using Outcome = OperationResult::Outcome;

    if (m_busy) {
        callback(makeResult(Outcome::Rejected, false, QStringLiteral("Operation already in progress")));
        return;
    }

    const ConnectionState state = m_controller->state();
    if (state == ConnectionState::Disconnected) {
        m_target.reset();
        callback(makeResult(Outcome::Completed, true, QStringLiteral("Already disconnected")));
        return;
    }
    if (state == ConnectionState::Error) {
        m_target.reset();
        callback(makeResult(Outcome::Completed, true, QStringLiteral("Disconnected (was in error state)")));
        return;
    }

    setBusy(true);
    m_controller->disconnectTunnel();

    QPointer<ConnectionOrchestrator> guard(this);
    waitForState({ConnectionState::Disconnected, ConnectionState::Error}, m_disconnectTimeoutMs,
                 [guard, callback](ConnectionState observed, bool timedOut) {
        if (!guard) {
            return;
        }

        guard->m_target.reset();
        OperationResult result;
        if (observed == ConnectionState::Disconnected) {
            result = makeResult(Outcome::Completed, true, QStringLiteral("Disconnected"));
        } else {
            result = makeResult(timedOut ? Outcome::TimedOut : Outcome::Completed, true,
                                QStringLiteral("Disconnected (with error state)"));
        }
        qCInfo(lcOrchestrator).noquote() << "Disconnect ->" << result.message
                                         << (timedOut ? "(timed out)" : "");
        guard->setBusy(false);
        callback(result);
    });
}

ConnectionStatus ConnectionOrchestrator::status() const
{
    ConnectionStatus status;
    status.state = m_controller->state();
    status.connected = status.state == ConnectionState::Connected;
    if (status.connected && m_target.has_value()) {
        status.host = m_target->host;
        status.port = m_target->port;
    }
    return status;
}

bool ConnectionOrchestrator::isBusy() const
{
    return m_busy;
}

void ConnectionOrchestrator::waitForState(const QList<ConnectionState>& expected,
                                          int timeoutMs,
                                          std::function<void(ConnectionState, bool)> done)
{
    const ConnectionState current = m_controller->state();
    if (expected.contains(current)) {
        done(current, false);
        return;
    }

    // Deleting the waiter drops both the subscription and the timer.
    auto* waiter = new QObject(this);
    auto* timer = new QTimer(waiter);
    timer->setSingleShot(true);

    auto finished = std::make_shared<bool>(false);
    auto finish = [waiter, finished, done](ConnectionState state, bool timedOut) {
        if (*finished) {
            return;
        }
        *finished = true;
        waiter->deleteLater();
        done(state, timedOut);
    };

    connect(m_controller, &TunnelSessionController::stateChanged, waiter, [expected, finish](ConnectionState state) {
        if (expected.contains(state)) {
            finish(state, false);
        }
    });
    connect(timer, &QTimer::timeout, waiter, [this, finish]() {
        finish(m_controller->state(), true);
    });
    timer->start(timeoutMs);
}

void ConnectionOrchestrator::setBusy(bool busy)
{
    if (m_busy == busy) {
        return;
    }
    m_busy = busy;
    emit busyChanged(busy);
}
