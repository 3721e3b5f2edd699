module;
#include <QByteArray>
#include <QLoggingCategory>
#include <QRandomGenerator>
#include <QRegularExpression>
#include <QSettings>
#include <QStringList>

#include <array>

module relaygate.backend.serversettings;

import relaygate.backend.logging;
import relaygate.backend.secretstore;
import relaygate.backend.tunnelplatform;

namespace {
constexpr auto kTokenKey = "api/token";

void setError(QString* errorMessage, const QString& text)
{
    if (errorMessage) {
        *errorMessage = text;
    }
}
}

SettingsService::SettingsService(const QString& settingsPath, SecretStore* secrets)
    : m_settingsPath(settingsPath)
    , m_secrets(secrets)
{
    load();
}

void SettingsService::load()
{
    QSettings settings(m_settingsPath, QSettings::IniFormat);
    const ServerRuntimeSettings defaults;

    m_server.autoStart = settings.value(QStringLiteral("server/autoStart"), defaults.autoStart).toBool();
    const int port = settings.value(QStringLiteral("server/port"), defaults.port).toInt();
    if (port >= 1 && port <= 65535) {
        m_server.port = static_cast<quint16>(port);
    } else {
        qCWarning(lcSettings) << "Ignoring stored port" << port;
        m_server.port = defaults.port;
    }
    m_server.httpsEnabled = settings.value(QStringLiteral("server/httpsEnabled"), defaults.httpsEnabled).toBool();
    m_server.authEnabled = settings.value(QStringLiteral("server/authEnabled"), defaults.authEnabled).toBool();
    if (m_server.authEnabled && !m_server.httpsEnabled) {
        qCWarning(lcSettings) << "Stored settings enable auth without HTTPS; auth disabled";
        m_server.authEnabled = false;
    }

    const TunnelPreferences tunnelDefaults;
    m_tunnel.appFilterEnabled =
        settings.value(QStringLiteral("tunnel/appFilterEnabled"), tunnelDefaults.appFilterEnabled).toBool();
    m_tunnel.allowedApplications = settings.value(QStringLiteral("tunnel/allowedApps")).toStringList();
    m_tunnel.blockQuic = settings.value(QStringLiteral("tunnel/blockQuic"), tunnelDefaults.blockQuic).toBool();

    m_relay.executablePath = settings.value(QStringLiteral("relay/executablePath")).toString().trimmed();
    m_relay.interfaceName = settings.value(QStringLiteral("relay/interfaceName")).toString().trimmed();
}

void SettingsService::save() const
{
    QSettings settings(m_settingsPath, QSettings::IniFormat);
    settings.setValue(QStringLiteral("server/autoStart"), m_server.autoStart);
    settings.setValue(QStringLiteral("server/port"), m_server.port);
    settings.setValue(QStringLiteral("server/httpsEnabled"), m_server.httpsEnabled);
    settings.setValue(QStringLiteral("server/authEnabled"), m_server.authEnabled);
    settings.setValue(QStringLiteral("tunnel/appFilterEnabled"), m_tunnel.appFilterEnabled);
    settings.setValue(QStringLiteral("tunnel/allowedApps"), m_tunnel.allowedApplications);
    settings.setValue(QStringLiteral("tunnel/blockQuic"), m_tunnel.blockQuic);
    settings.setValue(QStringLiteral("relay/executablePath"), m_relay.executablePath);
    settings.setValue(QStringLiteral("relay/interfaceName"), m_relay.interfaceName);
    settings.sync();
    if (settings.status() != QSettings::NoError) {
        qCWarning(lcSettings).noquote() << "Failed to write settings to" << m_settingsPath;
    }
}

ServerRuntimeSettings SettingsService::serverSettings() const
{
    return m_server;
}

void SettingsService::setAutoStart(bool enabled)
{
    m_server.autoStart = enabled;
    save();
}

bool SettingsService::setPort(int port, QString* errorMessage)
{
    if (port < 1 || port > 65535) {
        setError(errorMessage, QStringLiteral("Port must be between 1 and 65535"));
        return false;
    }
    m_server.port = static_cast<quint16>(port);
    save();
    return true;
}

void SettingsService::setHttpsEnabled(bool enabled)
{
    m_server.httpsEnabled = enabled;
    if (!enabled && m_server.authEnabled) {
        qCInfo(lcSettings) << "HTTPS disabled; disabling authentication";
        m_server.authEnabled = false;
    }
    save();
}

bool SettingsService::setAuthEnabled(bool enabled, QString* errorMessage)
{
    if (enabled && !m_server.httpsEnabled) {
        setError(errorMessage, QStringLiteral("Authentication requires HTTPS to be enabled first"));
        return false;
    }
    if (enabled && authToken().isEmpty() && generateNewAuthToken(errorMessage).isEmpty()) {
        return false;
    }
    m_server.authEnabled = enabled;
    save();
    return true;
}

QString SettingsService::authToken() const
{
    return m_secrets ? m_secrets->value(QString::fromLatin1(kTokenKey)) : QString();
}

bool SettingsService::setAuthToken(const QString& token, QString* errorMessage)
{
    if (!m_secrets) {
        setError(errorMessage, QStringLiteral("Secret store is unavailable"));
        return false;
    }
    const QString normalized = token.trimmed().toLower();
    static const QRegularExpression tokenPattern(QStringLiteral("^[0-9a-f]{%1}$").arg(kTokenBytes * 2));
    if (!tokenPattern.match(normalized).hasMatch()) {
        setError(errorMessage, QStringLiteral("Token must be %1 hexadecimal characters").arg(kTokenBytes * 2));
        return false;
    }
    return m_secrets->setValue(QString::fromLatin1(kTokenKey), normalized, errorMessage);
}

QString SettingsService::generateNewAuthToken(QString* errorMessage)
{
    const QString token = randomToken();
    if (!setAuthToken(token, errorMessage)) {
        return {};
    }
    qCInfo(lcSettings) << "Generated a new API token";
    return token;
}

bool SettingsService::clearAuthToken(QString* errorMessage)
{
    if (!m_secrets) {
        setError(errorMessage, QStringLiteral("Secret store is unavailable"));
        return false;
    }
    return m_secrets->remove({QString::fromLatin1(kTokenKey)}, errorMessage);
}

void SettingsService::reset()
{
    m_server = ServerRuntimeSettings {};
    m_tunnel = TunnelPreferences {};
    m_relay = RelaySettings {};
    QString error;
    if (!clearAuthToken(&error)) {
        qCWarning(lcSettings).noquote() << "Failed to clear API token:" << error;
    }
    save();
}

TunnelPreferences SettingsService::tunnelPreferences() const
{
    return m_tunnel;
}

void SettingsService::setTunnelPreferences(const TunnelPreferences& preferences)
{
    m_tunnel = preferences;
    save();
}

RelaySettings SettingsService::relaySettings() const
{
    return m_relay;
}

void SettingsService::setRelaySettings(const RelaySettings& settings)
{
    m_relay.executablePath = settings.executablePath.trimmed();
    m_relay.interfaceName = settings.interfaceName.trimmed();
    save();
}

QString SettingsService::settingsPath() const
{
    return m_settingsPath;
}

QString SettingsService::randomToken()
{
    std::array<quint32, kTokenBytes / sizeof(quint32)> words {};
    QRandomGenerator::system()->fillRange(words.data(), static_cast<qsizetype>(words.size()));
    const QByteArray bytes(reinterpret_cast<const char*>(words.data()), kTokenBytes);
    return QString::fromLatin1(bytes.toHex());
}
