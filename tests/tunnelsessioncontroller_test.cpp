#include <QList>
#include <QString>
#include <QStringList>

#include <atomic>
#include <memory>

#include <gtest/gtest.h>

import relaygate.backend.tunnelsessioncontroller;
import relaygate.tests.faketunnel;

namespace {
TunnelConfiguration configurationFor(const QString& host, quint16 port)
{
    TunnelConfiguration configuration;
    configuration.proxyHost = host;
    configuration.proxyPort = port;
    return configuration;
}

class TunnelSessionControllerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_platform = new FakeTunnelPlatform;
        m_relay = new FakeRelayEngine;
        m_controller = std::make_unique<TunnelSessionController>(m_platform, m_relay);
        QObject::connect(m_controller.get(), &TunnelSessionController::stateChanged,
                         [this](ConnectionState state) { m_states.append(state); });
    }

    void TearDown() override
    {
        m_controller.reset();
    }

    bool waitForState(ConnectionState state)
    {
        return waitFor([this, state]() { return m_controller->state() == state; });
    }

    void connectAndWait()
    {
        ASSERT_TRUE(m_controller->connectTunnel(configurationFor(QStringLiteral("192.168.1.100"), 1080)));
        ASSERT_TRUE(waitForState(ConnectionState::Connected));
        m_states.clear();
    }

    FakeTunnelPlatform* m_platform = nullptr;
    FakeRelayEngine* m_relay = nullptr;
    std::unique_ptr<TunnelSessionController> m_controller;
    QList<ConnectionState> m_states;
};
}

TEST_F(TunnelSessionControllerTest, StartsDisconnected)
{
    EXPECT_EQ(m_controller->state(), ConnectionState::Disconnected);
    EXPECT_FALSE(m_controller->activeConfiguration().has_value());
}

TEST_F(TunnelSessionControllerTest, ConnectPublishesConnectingThenConnected)
{
    ASSERT_TRUE(m_controller->connectTunnel(configurationFor(QStringLiteral("192.168.1.100"), 1080)));
    EXPECT_EQ(m_controller->state(), ConnectionState::Connecting);
    ASSERT_TRUE(waitForState(ConnectionState::Connected));

    EXPECT_EQ(m_states, (QList<ConnectionState> {ConnectionState::Connecting, ConnectionState::Connected}));
    EXPECT_EQ(m_platform->establishCalls.load(), 1);
    EXPECT_EQ(m_relay->startCalls.load(), 1);
    EXPECT_TRUE(m_relay->running.load());
    ASSERT_TRUE(m_controller->activeConfiguration().has_value());
    EXPECT_EQ(m_controller->activeConfiguration()->endpoint(), QStringLiteral("192.168.1.100:1080"));
}

TEST_F(TunnelSessionControllerTest, RoutePlanExcludesProxyAndRelayGetsOptions)
{
    TunnelConfiguration configuration = configurationFor(QStringLiteral("10.0.0.5"), 9852);
    configuration.username = QStringLiteral("user");
    configuration.password = QStringLiteral("pass");
    ASSERT_TRUE(m_controller->connectTunnel(configuration));
    ASSERT_TRUE(waitForState(ConnectionState::Connected));

    const auto plan = m_platform->lastPlan();
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->routes.size(), 32);
    EXPECT_EQ(plan->dnsServer, QStringLiteral("198.18.0.2"));
    EXPECT_EQ(plan->mtu, TunnelSessionController::kDefaultMtu);

    const auto options = m_relay->lastOptions();
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options->proxyHost, QStringLiteral("10.0.0.5"));
    EXPECT_EQ(options->proxyPort, 9852);
    EXPECT_EQ(options->username, QStringLiteral("user"));
    EXPECT_EQ(options->password, QStringLiteral("pass"));
    EXPECT_EQ(options->udpTimeoutMs, TunnelSessionController::kQuicBlockingUdpTimeoutMs);
}

TEST_F(TunnelSessionControllerTest, QuicBlockingOffKeepsDefaultUdpTimeout)
{
    TunnelConfiguration configuration = configurationFor(QStringLiteral("10.0.0.5"), 1080);
    configuration.blockQuic = false;
    ASSERT_TRUE(m_controller->connectTunnel(configuration));
    ASSERT_TRUE(waitForState(ConnectionState::Connected));
    EXPECT_EQ(m_relay->lastOptions()->udpTimeoutMs, TunnelSessionController::kDefaultUdpTimeoutMs);
}

TEST_F(TunnelSessionControllerTest, InvalidConfigurationIsRejected)
{
    QString error;
    EXPECT_FALSE(m_controller->connectTunnel(configurationFor(QString(), 1080), &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_FALSE(m_controller->connectTunnel(configurationFor(QStringLiteral("10.0.0.5"), 0), &error));
    EXPECT_EQ(m_controller->state(), ConnectionState::Disconnected);
    EXPECT_TRUE(m_states.isEmpty());
}

TEST_F(TunnelSessionControllerTest, ConnectIsRejectedWhileConnected)
{
    connectAndWait();
    QString error;
    EXPECT_FALSE(m_controller->connectTunnel(configurationFor(QStringLiteral("10.0.0.9"), 1080), &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_EQ(m_controller->state(), ConnectionState::Connected);
}

TEST_F(TunnelSessionControllerTest, EstablishFailureEndsInError)
{
    m_platform->failEstablish = true;
    QStringList errors;
    QObject::connect(m_controller.get(), &TunnelSessionController::errorOccurred,
                     [&errors](const QString& message) { errors.append(message); });

    ASSERT_TRUE(m_controller->connectTunnel(configurationFor(QStringLiteral("10.0.0.5"), 1080)));
    ASSERT_TRUE(waitForState(ConnectionState::Error));
    EXPECT_EQ(m_relay->startCalls.load(), 0);
    EXPECT_EQ(errors, QStringList {QStringLiteral("interface permission denied")});
}

TEST_F(TunnelSessionControllerTest, RelayStartFailureReleasesInterface)
{
    m_relay->failStart = true;
    ASSERT_TRUE(m_controller->connectTunnel(configurationFor(QStringLiteral("10.0.0.5"), 1080)));
    ASSERT_TRUE(waitForState(ConnectionState::Error));
    EXPECT_EQ(m_platform->releaseCalls.load(), 1);
    EXPECT_FALSE(m_platform->active.load());
}

TEST_F(TunnelSessionControllerTest, ErrorStateAllowsNewConnect)
{
    m_platform->failEstablish = true;
    ASSERT_TRUE(m_controller->connectTunnel(configurationFor(QStringLiteral("10.0.0.5"), 1080)));
    ASSERT_TRUE(waitForState(ConnectionState::Error));

    m_platform->failEstablish = false;
    ASSERT_TRUE(m_controller->connectTunnel(configurationFor(QStringLiteral("10.0.0.5"), 1080)));
    EXPECT_TRUE(waitForState(ConnectionState::Connected));
}

TEST_F(TunnelSessionControllerTest, DisconnectPassesThroughDisconnecting)
{
    connectAndWait();
    m_controller->disconnectTunnel();
    EXPECT_EQ(m_controller->state(), ConnectionState::Disconnecting);
    ASSERT_TRUE(waitForState(ConnectionState::Disconnected));

    EXPECT_EQ(m_states, (QList<ConnectionState> {ConnectionState::Disconnecting, ConnectionState::Disconnected}));
    EXPECT_FALSE(m_relay->running.load());
    EXPECT_EQ(m_platform->releaseCalls.load(), 1);
}

TEST_F(TunnelSessionControllerTest, DisconnectWhenDisconnectedIsNoOp)
{
    m_controller->disconnectTunnel();
    EXPECT_EQ(m_controller->state(), ConnectionState::Disconnected);
    EXPECT_TRUE(m_states.isEmpty());
}

TEST_F(TunnelSessionControllerTest, DisconnectDuringConnectReleasesLateInterface)
{
    m_platform->establishDelayMs = 200;
    ASSERT_TRUE(m_controller->connectTunnel(configurationFor(QStringLiteral("10.0.0.5"), 1080)));
    m_controller->disconnectTunnel();
    ASSERT_TRUE(waitForState(ConnectionState::Disconnected));

    EXPECT_TRUE(waitFor([this]() { return m_platform->releaseCalls.load() == 1 && !m_relay->running.load(); }));
    EXPECT_FALSE(m_states.contains(ConnectionState::Connected));
    EXPECT_EQ(m_controller->state(), ConnectionState::Disconnected);
}

TEST_F(TunnelSessionControllerTest, DestroyDuringConnectReleasesInterface)
{
    auto released = std::make_shared<std::atomic<int>>(0);
    m_platform->onRelease = [released]() { ++*released; };
    m_platform->establishDelayMs = 200;
    ASSERT_TRUE(m_controller->connectTunnel(configurationFor(QStringLiteral("10.0.0.5"), 1080)));
    ASSERT_TRUE(waitFor([this]() { return m_platform->establishCalls.load() == 1; }));

    m_controller.reset();
    EXPECT_EQ(released->load(), 1);
}

TEST_F(TunnelSessionControllerTest, DestroyWhileConnectedReleasesInterface)
{
    auto released = std::make_shared<std::atomic<int>>(0);
    m_platform->onRelease = [released]() { ++*released; };
    connectAndWait();

    m_controller.reset();
    EXPECT_EQ(released->load(), 1);
}

TEST_F(TunnelSessionControllerTest, RevocationForcesDisconnectedDirectly)
{
    connectAndWait();
    emit m_platform->revoked();

    EXPECT_EQ(m_controller->state(), ConnectionState::Disconnected);
    EXPECT_EQ(m_states, QList<ConnectionState> {ConnectionState::Disconnected});
    EXPECT_TRUE(waitFor([this]() { return m_platform->releaseCalls.load() == 1; }));
}

TEST_F(TunnelSessionControllerTest, UnexpectedRelayExitEndsInError)
{
    connectAndWait();
    QStringList errors;
    QObject::connect(m_controller.get(), &TunnelSessionController::errorOccurred,
                     [&errors](const QString& message) { errors.append(message); });
    emit m_relay->unexpectedExit(QStringLiteral("relay crashed"));

    EXPECT_EQ(m_controller->state(), ConnectionState::Error);
    EXPECT_EQ(errors, QStringList {QStringLiteral("relay crashed")});
    EXPECT_TRUE(waitFor([this]() { return m_platform->releaseCalls.load() == 1; }));
}

TEST_F(TunnelSessionControllerTest, StatsArePolledWhileConnected)
{
    m_controller->setStatsInterval(20);
    connectAndWait();
    m_relay->uploadBytes = 1234;
    m_relay->downloadBytes = 5678;

    ASSERT_TRUE(waitFor([this]() { return m_controller->stats().uploadBytes == 1234; }));
    EXPECT_EQ(m_controller->stats().downloadBytes, 5678u);

    m_controller->disconnectTunnel();
    ASSERT_TRUE(waitForState(ConnectionState::Disconnected));
    EXPECT_EQ(m_controller->stats().uploadBytes, 0u);
}
