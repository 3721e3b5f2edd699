module;
#include <QLoggingCategory>
#include <QStringList>

#include <optional>

module relaygate.backend.routeplanner;

import relaygate.backend.logging;

namespace {
quint32 maskFor(int prefixLength)
{
    return prefixLength <= 0 ? 0u : (~0u << (32 - prefixLength));
}

void subdivide(const Ipv4Prefix& block, quint32 excluded, QList<Ipv4Prefix>& out)
{
    if (!block.contains(excluded)) {
        out.append(block);
        return;
    }
    if (block.prefixLength == 32) {
        return;
    }

    const int childLength = block.prefixLength + 1;
    const quint32 half = 1u << (32 - childLength);
    subdivide(Ipv4Prefix {block.address, childLength}, excluded, out);
    subdivide(Ipv4Prefix {block.address | half, childLength}, excluded, out);
}
}

bool Ipv4Prefix::contains(quint32 host) const
{
    const quint32 mask = maskFor(prefixLength);
    return (host & mask) == (address & mask);
}

quint64 Ipv4Prefix::size() const
{
    return quint64 {1} << (32 - prefixLength);
}

std::optional<quint32> RoutePlanner::parseIpv4(const QString& text)
{
    const QStringList parts = text.split(QLatin1Char('.'));
    if (parts.size() != 4) {
        return std::nullopt;
    }

    quint32 result = 0;
    for (const QString& part : parts) {
        if (part.isEmpty() || part.size() > 3) {
            return std::nullopt;
        }
        int octet = 0;
        for (const QChar ch : part) {
            if (ch < QLatin1Char('0') || ch > QLatin1Char('9')) {
                return std::nullopt;
            }
            octet = octet * 10 + (ch.unicode() - u'0');
        }
        if (octet > 255) {
            return std::nullopt;
        }
        result = (result << 8) | static_cast<quint32>(octet);
    }
    return result;
}

QString RoutePlanner::formatAddress(quint32 address)
{
    return QStringLiteral("%1.%2.%3.%4")
        .arg((address >> 24) & 0xFF)
        .arg((address >> 16) & 0xFF)
        .arg((address >> 8) & 0xFF)
        .arg(address & 0xFF);
}

QString RoutePlanner::formatPrefix(const Ipv4Prefix& prefix)
{
    return QStringLiteral("%1/%2").arg(formatAddress(prefix.address)).arg(prefix.prefixLength);
}

QList<Ipv4Prefix> RoutePlanner::excludeAddress(quint32 excluded)
{
    QList<Ipv4Prefix> routes;
    routes.reserve(32);
    subdivide(Ipv4Prefix {0, 0}, excluded, routes);
    return routes;
}

QList<Ipv4Prefix> RoutePlanner::routesExcluding(const QString& proxyHost)
{
    const auto proxyAddress = parseIpv4(proxyHost.trimmed());
    if (!proxyAddress.has_value()) {
        qCWarning(lcRouting) << "Proxy host is not an IPv4 literal, using default route:" << proxyHost;
        return {Ipv4Prefix {0, 0}};
    }

    const QList<Ipv4Prefix> routes = excludeAddress(proxyAddress.value());
    qCDebug(lcRouting) << "Computed" << routes.size() << "routes excluding proxy" << proxyHost;
    return routes;
}

RoutePlan RoutePlanner::plan(const QString& proxyHost,
                             const QStringList& allowedApplications,
                             const QString& selfIdentifier,
                             int mtu)
{
    RoutePlan plan;
    plan.routes = routesExcluding(proxyHost);
    plan.mtu = mtu;

    if (!allowedApplications.isEmpty()) {
        plan.filter.mode = ApplicationFilter::Mode::AllowList;
        plan.filter.applications = allowedApplications;
    } else {
        plan.filter.mode = ApplicationFilter::Mode::ExcludeSelf;
        if (!selfIdentifier.isEmpty()) {
            plan.filter.applications = {selfIdentifier};
        }
    }
    return plan;
}
