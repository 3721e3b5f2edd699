module;
#include <QByteArray>
#include <QString>
#include <QStringList>

module relaygate.backend.relayconfigbuilder;

import relaygate.backend.tunnelplatform;

namespace {
QString entry(const QString& key, const QString& value)
{
    return QStringLiteral("  %1: %2").arg(key, value);
}

QString entry(const QString& key, int value)
{
    return entry(key, QString::number(value));
}
}

QByteArray RelayConfigBuilder::build(const InterfaceHandle& handle,
                                     const RelayStartOptions& options,
                                     const BuildOptions& buildOptions)
{
    QStringList lines;

    lines << QStringLiteral("tunnel:");
    lines << entry(QStringLiteral("name"), quoted(handle.name));
    lines << entry(QStringLiteral("mtu"), options.mtu);

    lines << QStringLiteral("socks5:");
    lines << entry(QStringLiteral("address"), quoted(options.proxyHost));
    lines << entry(QStringLiteral("port"), options.proxyPort);
    lines << entry(QStringLiteral("udp"), quoted(QStringLiteral("udp")));
    if (!options.username.isEmpty()) {
        lines << entry(QStringLiteral("username"), quoted(options.username));
        lines << entry(QStringLiteral("password"), quoted(options.password));
    }

    if (buildOptions.enableMapDns) {
        lines << QStringLiteral("mapdns:");
        lines << entry(QStringLiteral("address"), buildOptions.mapDnsAddress);
        lines << entry(QStringLiteral("port"), buildOptions.mapDnsPort);
        lines << entry(QStringLiteral("network"), buildOptions.mapDnsNetwork);
        lines << entry(QStringLiteral("netmask"), buildOptions.mapDnsNetmask);
        lines << entry(QStringLiteral("cache-size"), buildOptions.mapDnsCacheSize);
    }

    lines << QStringLiteral("misc:");
    lines << entry(QStringLiteral("connect-timeout"), buildOptions.connectTimeoutMs);
    lines << entry(QStringLiteral("tcp-read-write-timeout"), buildOptions.tcpReadWriteTimeoutMs);
    lines << entry(QStringLiteral("udp-read-write-timeout"), options.udpTimeoutMs);
    lines << entry(QStringLiteral("log-file"), QStringLiteral("stderr"));
    lines << entry(QStringLiteral("log-level"), buildOptions.logLevel);

    return (lines.join(QLatin1Char('\n')) + QLatin1Char('\n')).toUtf8();
}

QString RelayConfigBuilder::quoted(const QString& value)
{
    QString escaped = value;
    escaped.replace(QLatin1Char('\''), QStringLiteral("''"));
    return QLatin1Char('\'') + escaped + QLatin1Char('\'');
}
