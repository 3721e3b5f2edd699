module;
#include <QCoreApplication>
#include <QDir>
#include <QLoggingCategory>
#include <QPointer>
#include <QStandardPaths>

#include <utility>

module relaygate.backend.controlplane;

import relaygate.backend.connectionorchestrator;
import relaygate.backend.controlapigateway;
import relaygate.backend.linuxtunplatform;
import relaygate.backend.logging;
import relaygate.backend.relayprocessmanager;
import relaygate.backend.secretstore;
import relaygate.backend.serversettings;
import relaygate.backend.tlsidentitymanager;
import relaygate.backend.tunnelplatform;
import relaygate.backend.tunnelsessioncontroller;

namespace {
constexpr auto kSettingsFileName = "settings.ini";
constexpr auto kSecretsFileName = "secrets.json";
constexpr auto kRuntimeDirectoryName = "run";
}

ControlPlane::ControlPlane(const ControlPlaneOptions& options,
                           TunnelPlatform* platform,
                           RelayEngine* relay,
                           QObject* parent)
    : QObject(parent)
    , m_options(options)
    , m_dataDirectory(resolveDataDirectory(options.dataDirectory))
    , m_secrets(QDir(m_dataDirectory).filePath(QString::fromLatin1(kSecretsFileName)))
    , m_settings(QDir(m_dataDirectory).filePath(QString::fromLatin1(kSettingsFileName)), &m_secrets)
    , m_identity(&m_secrets)
    , m_controller(platform ? platform : createPlatform(), relay ? relay : createRelay())
    , m_orchestrator(&m_controller)
    , m_gateway(&m_orchestrator, &m_identity)
{
    m_controller.setSelfIdentifier(QCoreApplication::applicationFilePath());
    m_orchestrator.setTunnelPreferences(m_settings.tunnelPreferences());

    qCInfo(lcApp).noquote() << "Data directory:" << m_dataDirectory;
}

ControlPlane::~ControlPlane()
{
    m_gateway.stop();
}

QString ControlPlane::resolveDataDirectory(const QString& requested)
{
    QString directory = requested.trimmed();
    if (directory.isEmpty()) {
        directory = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    }
    directory = QDir(directory).absolutePath();
    if (!QDir().mkpath(directory)) {
        qCWarning(lcApp).noquote() << "Cannot create data directory" << directory;
    }
    return directory;
}

TunnelPlatform* ControlPlane::createPlatform() const
{
    auto* platform = new LinuxTunPlatform();
    const QString interfaceName = m_options.interfaceName.isEmpty() ? m_settings.relaySettings().interfaceName
                                                                     : m_options.interfaceName;
    if (!interfaceName.isEmpty()) {
        platform->setInterfaceName(interfaceName);
    }
    return platform;
}

RelayEngine* ControlPlane::createRelay() const
{
    auto* process = new RelayProcessManager();
    process->setExecutablePath(m_options.relayExecutable.isEmpty() ? m_settings.relaySettings().executablePath
                                                                   : m_options.relayExecutable);
    process->setRuntimeDirectory(QDir(m_dataDirectory).filePath(QString::fromLatin1(kRuntimeDirectoryName)));
    return process;
}

void ControlPlane::initialize()
{
    const bool autoStart = m_settings.serverSettings().autoStart && !m_options.autoStartDisabled;
    if (!autoStart) {
        qCInfo(lcApp) << "Auto start disabled; control server not started";
        return;
    }
    startServer();
}

void ControlPlane::startServer(StartCallback callback)
{
    ServerRuntimeSettings server = m_settings.serverSettings();
    if (m_options.port.has_value()) {
        server.port = m_options.port.value();
    }
    if (m_options.httpsEnabled.has_value()) {
        server.httpsEnabled = m_options.httpsEnabled.value();
    }
    if (!server.httpsEnabled) {
        server.authEnabled = false;
    }

    const quint64 generation = ++m_startGeneration;
    if (!server.httpsEnabled) {
        listen(server.port, false, false, callback);
        return;
    }

    QPointer<ControlPlane> guard(this);
    m_identity.ensureAsync([guard, generation, server, callback](bool ok, const QString& error) {
        if (!guard) {
            return;
        }
        if (generation != guard->m_startGeneration) {
            qCDebug(lcApp) << "Discarding superseded server start";
            return;
        }
        if (!ok) {
            guard->finishStart(false, QStringLiteral("TLS identity unavailable: %1").arg(error), callback);
            return;
        }
        guard->listen(server.port, true, server.authEnabled, callback);
    });
}

void ControlPlane::stopServer()
{
    ++m_startGeneration;
    m_gateway.stop();
}

void ControlPlane::restartServer(StartCallback callback)
{
    stopServer();
    m_orchestrator.setTunnelPreferences(m_settings.tunnelPreferences());
    startServer(std::move(callback));
}

QString ControlPlane::dataDirectory() const
{
    return m_dataDirectory;
}

SettingsService* ControlPlane::settings()
{
    return &m_settings;
}

TlsIdentityManager* ControlPlane::identity()
{
    return &m_identity;
}

TunnelSessionController* ControlPlane::controller()
{
    return &m_controller;
}

ConnectionOrchestrator* ControlPlane::orchestrator()
{
    return &m_orchestrator;
}

ControlApiGateway* ControlPlane::gateway()
{
    return &m_gateway;
}

void ControlPlane::listen(quint16 port, bool https, bool authEnabled, const StartCallback& callback)
{
    QString token;
    if (authEnabled) {
        token = m_settings.authToken();
        if (token.isEmpty()) {
            QString error;
            token = m_settings.generateNewAuthToken(&error);
            if (token.isEmpty()) {
                finishStart(false, QStringLiteral("Cannot create API token: %1").arg(error), callback);
                return;
            }
        }
    }

    QString error;
    const bool ok = m_gateway.start(port, https, token, &error);
    finishStart(ok, error, callback);
}

void ControlPlane::finishStart(bool ok, const QString& error, const StartCallback& callback)
{
    if (!ok) {
        qCWarning(lcApp).noquote() << "Control server failed to start:" << error;
        emit serverStartFailed(error);
    } else if (m_gateway.isHttps()) {
        qCInfo(lcApp).noquote() << "TLS fingerprint:" << m_identity.fingerprint();
    }
    if (callback) {
        callback(ok, error);
    }
}
