module;
#include <QLoggingCategory>
#include <QMetaObject>
#include <QPointer>
#include <QThread>

#include <functional>
#include <memory>
#include <optional>

module relaygate.backend.tunnelsessioncontroller;

import relaygate.backend.connectionstate;
import relaygate.backend.logging;
import relaygate.backend.routeplanner;
import relaygate.backend.tunnelplatform;

namespace {
constexpr int kStatsIntervalMs = 1000;
}

TunnelSessionController::TunnelSessionController(TunnelPlatform* platform, RelayEngine* relay, QObject* parent)
    : QObject(parent)
    , m_platform(platform)
    , m_relay(relay)
    , m_workerContext(new QObject)
    , m_worker(std::make_shared<WorkerState>())
{
    m_thread.setObjectName(QStringLiteral("TunnelSessionWorker"));
    m_platform->setParent(m_workerContext);
    m_relay->setParent(m_workerContext);
    m_workerContext->moveToThread(&m_thread);
    connect(&m_thread, &QThread::finished, m_workerContext, &QObject::deleteLater);

    connect(m_platform, &TunnelPlatform::revoked, this, &TunnelSessionController::handlePermissionRevoked);
    connect(m_relay, &RelayEngine::unexpectedExit, this, &TunnelSessionController::handleRelayExit);

    m_statsTimer.setInterval(kStatsIntervalMs);
    connect(&m_statsTimer, &QTimer::timeout, this, &TunnelSessionController::pollStats);

    m_thread.start();
}

TunnelSessionController::~TunnelSessionController()
{
    m_statsTimer.stop();
    ++m_session;

    // Runs after any queued connect, so an interface it established is released here.
    TunnelPlatform* platform = m_platform;
    RelayEngine* relay = m_relay;
    const std::shared_ptr<WorkerState> worker = m_worker;
    QMetaObject::invokeMethod(m_workerContext, [platform, relay, worker]() {
        releaseSession(platform, relay, *worker);
    }, Qt::BlockingQueuedConnection);

    m_thread.quit();
    m_thread.wait();
}

void TunnelSessionController::releaseSession(TunnelPlatform* platform, RelayEngine* relay, WorkerState& worker)
{
    relay->stop();
    if (worker.handle.has_value()) {
        platform->release(worker.handle.value());
        worker.handle.reset();
    }
}

ConnectionState TunnelSessionController::state() const
{
    return m_state;
}

std::optional<TunnelConfiguration> TunnelSessionController::activeConfiguration() const
{
    return m_configuration;
}

RelayStats TunnelSessionController::stats() const
{
    return m_stats;
}

void TunnelSessionController::setSelfIdentifier(const QString& identifier)
{
    m_selfIdentifier = identifier;
}

void TunnelSessionController::setMtu(int mtu)
{
    if (mtu > 0) {
        m_mtu = mtu;
    }
}

void TunnelSessionController::setStatsInterval(int intervalMs)
{
    if (intervalMs > 0) {
        m_statsTimer.setInterval(intervalMs);
    }
}

int TunnelSessionController::udpTimeoutFor(bool blockQuic)
{
    return blockQuic ? kQuicBlockingUdpTimeoutMs : kDefaultUdpTimeoutMs;
}

bool TunnelSessionController::connectTunnel(const TunnelConfiguration& configuration, QString* errorMessage)
{
    if (m_state != ConnectionState::Disconnected && m_state != ConnectionState::Error) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Tunnel is %1.").arg(connectionStateName(m_state));
        }
        return false;
    }
    if (!configuration.validate(errorMessage)) {
        return false;
    }

    const quint64 session = ++m_session;
    m_configuration = configuration;
    m_stats = RelayStats();
    setState(ConnectionState::Connecting);

    const RoutePlan plan = RoutePlanner::plan(configuration.proxyHost,
                                              configuration.allowedApplications,
                                              m_selfIdentifier,
                                              m_mtu);

    RelayStartOptions options;
    options.proxyHost = configuration.proxyHost;
    options.proxyPort = configuration.proxyPort;
    options.username = configuration.username;
    options.password = configuration.password;
    options.mtu = m_mtu;
    options.udpTimeoutMs = udpTimeoutFor(configuration.blockQuic);
    if (configuration.blockQuic) {
        qCInfo(lcTunnel) << "QUIC blocking on: relay UDP idle timeout set to" << options.udpTimeoutMs << "ms";
    }

    qCInfo(lcTunnel).noquote() << "Connecting to" << configuration.endpoint();

    TunnelPlatform* platform = m_platform;
    RelayEngine* relay = m_relay;
    const std::shared_ptr<WorkerState> worker = m_worker;
    QPointer<TunnelSessionController> guard(this);
    QMetaObject::invokeMethod(m_workerContext, [guard, platform, relay, worker, plan, options, session]() {
        QString error;
        std::optional<InterfaceHandle> handle = platform->establish(plan, &error);
        if (handle.has_value() && !relay->start(handle.value(), options, &error)) {
            platform->release(handle.value());
            handle.reset();
        }
        if (!handle.has_value() && error.isEmpty()) {
            error = QStringLiteral("Tunnel start failed.");
        }
        worker->handle = handle;
        if (!guard) {
            return;
        }

        QMetaObject::invokeMethod(guard.data(), [guard, session, handle, error]() {
            if (guard) {
                guard->finishConnect(session, handle, error);
            }
        }, Qt::QueuedConnection);
    }, Qt::QueuedConnection);

    return true;
}

void TunnelSessionController::disconnectTunnel()
{
    if (m_state == ConnectionState::Disconnected || m_state == ConnectionState::Disconnecting) {
        return;
    }

    const quint64 session = ++m_session;
    m_statsTimer.stop();
    setState(ConnectionState::Disconnecting);
    qCInfo(lcTunnel) << "Disconnecting";

    QPointer<TunnelSessionController> guard(this);
    m_handle.reset();
    teardown([guard, session]() {
        if (guard) {
            guard->finishDisconnect(session);
        }
    });
}

void TunnelSessionController::handlePermissionRevoked()
{
    ++m_session;
    m_statsTimer.stop();
    qCWarning(lcTunnel) << "Tunnel permission revoked";

    m_handle.reset();
    teardown();
    m_stats = RelayStats();
    setState(ConnectionState::Disconnected);
}

void TunnelSessionController::setState(ConnectionState state)
{
    if (m_state == state) {
        return;
    }

    qCDebug(lcTunnel) << "State" << connectionStateName(m_state) << "->" << connectionStateName(state);
    m_state = state;
    emit stateChanged(state);
}

void TunnelSessionController::finishConnect(quint64 session, const std::optional<InterfaceHandle>& handle, const QString& error)
{
    if (session != m_session) {
        // Superseded while starting; the superseding teardown releases the interface.
        qCDebug(lcTunnel) << "Discarding superseded connect result";
        return;
    }

    if (!handle.has_value()) {
        qCWarning(lcTunnel).noquote() << "Connect failed:" << error;
        setState(ConnectionState::Error);
        emit errorOccurred(error);
        return;
    }

    m_handle = handle;
    setState(ConnectionState::Connected);
    qCInfo(lcTunnel) << "Connected through" << handle->name;
    m_statsTimer.start();
}

void TunnelSessionController::finishDisconnect(quint64 session)
{
    if (session != m_session) {
        return;
    }
    m_stats = RelayStats();
    setState(ConnectionState::Disconnected);
    qCInfo(lcTunnel) << "Disconnected";
}

void TunnelSessionController::teardown(std::function<void()> onDone)
{
    TunnelPlatform* platform = m_platform;
    RelayEngine* relay = m_relay;
    const std::shared_ptr<WorkerState> worker = m_worker;
    QPointer<TunnelSessionController> guard(this);
    QMetaObject::invokeMethod(m_workerContext, [guard, platform, relay, worker, onDone]() {
        releaseSession(platform, relay, *worker);
        if (onDone && guard) {
            QMetaObject::invokeMethod(guard.data(), onDone, Qt::QueuedConnection);
        }
    }, Qt::QueuedConnection);
}

void TunnelSessionController::handleRelayExit(const QString& reason)
{
    if (m_state != ConnectionState::Connected) {
        return;
    }

    ++m_session;
    m_statsTimer.stop();
    qCWarning(lcTunnel).noquote() << "Relay stopped unexpectedly:" << reason;
    m_handle.reset();
    teardown();
    setState(ConnectionState::Error);
    emit errorOccurred(reason);
}

void TunnelSessionController::pollStats()
{
    if (m_state != ConnectionState::Connected) {
        return;
    }

    RelayEngine* relay = m_relay;
    const quint64 session = m_session;
    QPointer<TunnelSessionController> guard(this);
    QMetaObject::invokeMethod(m_workerContext, [guard, relay, session]() {
        const RelayStats stats = relay->stats();
        if (!guard) {
            return;
        }
        QMetaObject::invokeMethod(guard.data(), [guard, session, stats]() {
            if (!guard || guard->m_session != session) {
                return;
            }
            guard->m_stats = stats;
            emit guard->statsChanged();
        }, Qt::QueuedConnection);
    }, Qt::QueuedConnection);
}
