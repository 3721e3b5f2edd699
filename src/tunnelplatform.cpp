module;
#include <QString>
#include <QStringList>

module relaygate.backend.tunnelplatform;

bool TunnelConfiguration::validate(QString* errorMessage) const
{
    QString error;
    if (proxyHost.trimmed().isEmpty()) {
        error = QStringLiteral("Proxy host is required.");
    } else if (proxyPort == 0) {
        error = QStringLiteral("Proxy port must be between 1 and 65535.");
    }

    if (!error.isEmpty()) {
        if (errorMessage) {
            *errorMessage = error;
        }
        return false;
    }
    return true;
}

QString TunnelConfiguration::endpoint() const
{
    return QStringLiteral("%1:%2").arg(proxyHost).arg(proxyPort);
}

TunnelConfiguration TunnelPreferences::applyTo(TunnelConfiguration configuration) const
{
    configuration.allowedApplications = appFilterEnabled ? allowedApplications : QStringList();
    configuration.blockQuic = blockQuic;
    return configuration;
}

bool InterfaceHandle::isValid() const
{
    return !name.isEmpty();
}
