#include <QDir>
#include <QRegularExpression>
#include <QSettings>
#include <QTemporaryDir>

#include <memory>

#include <gtest/gtest.h>

import relaygate.backend.secretstore;
import relaygate.backend.serversettings;

namespace {
class SettingsServiceTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        m_secrets = std::make_unique<SecretStore>(path(QStringLiteral("secrets.json")));
        m_service = std::make_unique<SettingsService>(path(QStringLiteral("settings.ini")), m_secrets.get());
    }

    QString path(const QString& name) const
    {
        return QDir(m_dir.path()).filePath(name);
    }

    QTemporaryDir m_dir;
    std::unique_ptr<SecretStore> m_secrets;
    std::unique_ptr<SettingsService> m_service;
};
}

TEST_F(SettingsServiceTest, DefaultsMatchFirstRun)
{
    const ServerRuntimeSettings settings = m_service->serverSettings();
    EXPECT_TRUE(settings.autoStart);
    EXPECT_EQ(settings.port, 18080);
    EXPECT_FALSE(settings.httpsEnabled);
    EXPECT_FALSE(settings.authEnabled);
    EXPECT_TRUE(m_service->authToken().isEmpty());

    const TunnelPreferences tunnel = m_service->tunnelPreferences();
    EXPECT_FALSE(tunnel.appFilterEnabled);
    EXPECT_TRUE(tunnel.blockQuic);
}

TEST_F(SettingsServiceTest, PortOutsideRangeIsRejected)
{
    QString error;
    EXPECT_FALSE(m_service->setPort(0, &error));
    EXPECT_EQ(error, QStringLiteral("Port must be between 1 and 65535"));
    EXPECT_FALSE(m_service->setPort(65536));
    EXPECT_EQ(m_service->serverSettings().port, 18080);

    EXPECT_TRUE(m_service->setPort(9090));
    EXPECT_EQ(m_service->serverSettings().port, 9090);
}

TEST_F(SettingsServiceTest, AuthRequiresHttps)
{
    QString error;
    EXPECT_FALSE(m_service->setAuthEnabled(true, &error));
    EXPECT_EQ(error, QStringLiteral("Authentication requires HTTPS to be enabled first"));
    EXPECT_FALSE(m_service->serverSettings().authEnabled);
}

TEST_F(SettingsServiceTest, EnablingAuthGeneratesToken)
{
    m_service->setHttpsEnabled(true);
    ASSERT_TRUE(m_service->setAuthEnabled(true));

    const QString token = m_service->authToken();
    EXPECT_TRUE(QRegularExpression(QStringLiteral("^[0-9a-f]{32}$")).match(token).hasMatch()) << token.toStdString();

    // A stored token is kept on later toggles.
    ASSERT_TRUE(m_service->setAuthEnabled(false));
    ASSERT_TRUE(m_service->setAuthEnabled(true));
    EXPECT_EQ(m_service->authToken(), token);
}

TEST_F(SettingsServiceTest, DisablingHttpsDisablesAuth)
{
    m_service->setHttpsEnabled(true);
    ASSERT_TRUE(m_service->setAuthEnabled(true));
    m_service->setHttpsEnabled(false);

    const ServerRuntimeSettings settings = m_service->serverSettings();
    EXPECT_FALSE(settings.httpsEnabled);
    EXPECT_FALSE(settings.authEnabled);
}

TEST_F(SettingsServiceTest, GeneratedTokensDiffer)
{
    const QString first = m_service->generateNewAuthToken();
    const QString second = m_service->generateNewAuthToken();
    EXPECT_EQ(first.size(), 32);
    EXPECT_NE(first, second);
    EXPECT_EQ(m_service->authToken(), second);
}

TEST_F(SettingsServiceTest, SettingsPersistAcrossInstances)
{
    m_service->setAutoStart(false);
    ASSERT_TRUE(m_service->setPort(8443));
    m_service->setHttpsEnabled(true);
    ASSERT_TRUE(m_service->setAuthEnabled(true));
    TunnelPreferences preferences;
    preferences.appFilterEnabled = true;
    preferences.allowedApplications = {QStringLiteral("firefox")};
    preferences.blockQuic = false;
    m_service->setTunnelPreferences(preferences);
    const QString token = m_service->authToken();

    SecretStore secrets(path(QStringLiteral("secrets.json")));
    SettingsService reloaded(path(QStringLiteral("settings.ini")), &secrets);

    const ServerRuntimeSettings expected {false, 8443, true, true};
    EXPECT_EQ(reloaded.serverSettings(), expected);
    EXPECT_EQ(reloaded.authToken(), token);
    EXPECT_TRUE(reloaded.tunnelPreferences().appFilterEnabled);
    EXPECT_EQ(reloaded.tunnelPreferences().allowedApplications, QStringList {QStringLiteral("firefox")});
    EXPECT_FALSE(reloaded.tunnelPreferences().blockQuic);
}

TEST_F(SettingsServiceTest, TokenIsNotWrittenToSettingsFile)
{
    m_service->setHttpsEnabled(true);
    ASSERT_TRUE(m_service->setAuthEnabled(true));
    const QString token = m_service->authToken();

    QSettings raw(path(QStringLiteral("settings.ini")), QSettings::IniFormat);
    for (const QString& key : raw.allKeys()) {
        EXPECT_NE(raw.value(key).toString(), token) << key.toStdString();
    }
}

TEST_F(SettingsServiceTest, InconsistentStoredAuthIsDropped)
{
    {
        QSettings raw(path(QStringLiteral("settings.ini")), QSettings::IniFormat);
        raw.setValue(QStringLiteral("server/httpsEnabled"), false);
        raw.setValue(QStringLiteral("server/authEnabled"), true);
        raw.setValue(QStringLiteral("server/port"), 70000);
    }
    m_service->load();
    EXPECT_FALSE(m_service->serverSettings().authEnabled);
    EXPECT_EQ(m_service->serverSettings().port, 18080);
}

TEST_F(SettingsServiceTest, ResetRestoresDefaultsAndForgetsToken)
{
    m_service->setHttpsEnabled(true);
    ASSERT_TRUE(m_service->setAuthEnabled(true));
    ASSERT_TRUE(m_service->setPort(1234));

    m_service->reset();
    EXPECT_EQ(m_service->serverSettings(), ServerRuntimeSettings {});
    EXPECT_TRUE(m_service->authToken().isEmpty());
}

TEST_F(SettingsServiceTest, SetAuthTokenRequiresHexFormat)
{
    QString error;
    EXPECT_FALSE(m_service->setAuthToken(QStringLiteral("not-a-token"), &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_FALSE(m_service->setAuthToken(QStringLiteral("0123456789abcdef0123456789abcde"), &error));
    EXPECT_FALSE(m_service->setAuthToken(QStringLiteral("0123456789abcdef0123456789abcdeg"), &error));
    EXPECT_TRUE(m_service->authToken().isEmpty());

    ASSERT_TRUE(m_service->setAuthToken(QStringLiteral("0123456789ABCDEF0123456789ABCDEF"), &error));
    EXPECT_EQ(m_service->authToken(), QStringLiteral("0123456789abcdef0123456789abcdef"));

    EXPECT_FALSE(m_service->setAuthToken(QStringLiteral("abc"), &error));
    EXPECT_EQ(m_service->authToken(), QStringLiteral("0123456789abcdef0123456789abcdef"));
}
