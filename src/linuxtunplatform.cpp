module;
#include <QFileInfo>
#include <QLoggingCategory>
#include <QProcess>
#include <QStringList>

#include <optional>

module relaygate.backend.linuxtunplatform;

import relaygate.backend.logging;
import relaygate.backend.routeplanner;
import relaygate.backend.tunnelplatform;

namespace {
constexpr int kCommandTimeoutMs = 10000;
constexpr int kWatchIntervalMs = 2000;

bool runProcess(
    const QString& program,
    const QStringList& args,
    int timeoutMs,
    QString* stderrText)
{
    QProcess process;
    process.start(program, args);
    if (!process.waitForStarted(5000)) {
        if (stderrText != nullptr) {
            *stderrText = QStringLiteral("Failed to start process: %1").arg(program);
        }
        return false;
    }

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished(1000);
        if (stderrText != nullptr) {
            *stderrText = QStringLiteral("Process timed out: %1").arg(program);
        }
        return false;
    }

    if (stderrText != nullptr) {
        *stderrText = QString::fromUtf8(process.readAllStandardError()).trimmed();
    }
    return process.exitStatus() == QProcess::NormalExit && process.exitCode() == 0;
}

// A /0 route would collide with the existing default route; two /1 halves cover the same space.
QList<Ipv4Prefix> installableRoutes(const QList<Ipv4Prefix>& routes)
{
    QList<Ipv4Prefix> result;
    for (const Ipv4Prefix& prefix : routes) {
        if (prefix.prefixLength == 0) {
            result.append(Ipv4Prefix {0x00000000u, 1});
            result.append(Ipv4Prefix {0x80000000u, 1});
        } else {
            result.append(prefix);
        }
    }
    return result;
}
}

LinuxTunPlatform::LinuxTunPlatform(QObject* parent)
    : TunnelPlatform(parent)
    , m_interfaceName(QStringLiteral("relaygate0"))
    , m_watchTimer(this)
{
    m_watchTimer.setInterval(kWatchIntervalMs);
    connect(&m_watchTimer, &QTimer::timeout, this, &LinuxTunPlatform::checkInterface);
}

void LinuxTunPlatform::setInterfaceName(const QString& name)
{
    if (!name.trimmed().isEmpty()) {
        m_interfaceName = name.trimmed();
    }
}

QString LinuxTunPlatform::interfaceName() const
{
    return m_interfaceName;
}

std::optional<InterfaceHandle> LinuxTunPlatform::establish(const RoutePlan& plan, QString* errorMessage)
{
    const QString name = m_interfaceName;
    if (interfaceExists(name)) {
        qCWarning(lcRelay) << "Removing stale interface" << name;
        QString staleError;
        if (!runIp({QStringLiteral("link"), QStringLiteral("delete"), QStringLiteral("dev"), name}, &staleError)) {
            qCWarning(lcRelay) << "Could not remove stale interface:" << staleError;
        }
    }

    QString error;
    auto fail = [&](const QString& step) -> std::optional<InterfaceHandle> {
        if (interfaceExists(name)
            && !runIp({QStringLiteral("link"), QStringLiteral("delete"), QStringLiteral("dev"), name})) {
            qCWarning(lcRelay) << "Rollback could not delete" << name;
        }
        const QString message = error.isEmpty()
            ? QStringLiteral("%1 failed.").arg(step)
            : QStringLiteral("%1 failed: %2").arg(step, error);
        qCWarning(lcRelay).noquote() << message;
        if (errorMessage) {
            *errorMessage = message;
        }
        return std::nullopt;
    };

    if (!runIp({QStringLiteral("tuntap"), QStringLiteral("add"), QStringLiteral("dev"), name,
                QStringLiteral("mode"), QStringLiteral("tun")}, &error)) {
        return fail(QStringLiteral("Creating TUN device"));
    }

    const QString address = QStringLiteral("%1/%2").arg(plan.interfaceAddress).arg(plan.interfacePrefixLength);
    if (!runIp({QStringLiteral("addr"), QStringLiteral("add"), address, QStringLiteral("dev"), name}, &error)) {
        return fail(QStringLiteral("Assigning interface address"));
    }
    if (!runIp({QStringLiteral("link"), QStringLiteral("set"), QStringLiteral("dev"), name,
                QStringLiteral("mtu"), QString::number(plan.mtu), QStringLiteral("up")}, &error)) {
        return fail(QStringLiteral("Bringing interface up"));
    }

    const QList<Ipv4Prefix> routes = installableRoutes(plan.routes);
    for (const Ipv4Prefix& prefix : routes) {
        if (!runIp({QStringLiteral("route"), QStringLiteral("replace"), RoutePlanner::formatPrefix(prefix),
                    QStringLiteral("dev"), name}, &error)) {
            return fail(QStringLiteral("Installing route %1").arg(RoutePlanner::formatPrefix(prefix)));
        }
    }

    QString dnsError;
    if (!runProcess(QStringLiteral("resolvectl"), {QStringLiteral("dns"), name, plan.dnsServer}, kCommandTimeoutMs, &dnsError)
        || !runProcess(QStringLiteral("resolvectl"), {QStringLiteral("domain"), name, QStringLiteral("~.")}, kCommandTimeoutMs, &dnsError)) {
        qCWarning(lcRelay) << "Could not set tunnel DNS through resolvectl:" << dnsError;
    }

    if (plan.filter.mode == ApplicationFilter::Mode::AllowList) {
        qCWarning(lcRelay) << "Per-application routing is not available on Linux; ignoring allow-list of"
                           << plan.filter.applications.size() << "entries";
    }

    m_activeInterface = name;
    m_watchTimer.start();
    qCInfo(lcRelay) << "Interface" << name << "established with" << routes.size() << "routes";

    InterfaceHandle handle;
    handle.name = name;
    handle.mtu = plan.mtu;
    return handle;
}

void LinuxTunPlatform::release(const InterfaceHandle& handle)
{
    m_watchTimer.stop();
    if (handle.name == m_activeInterface) {
        m_activeInterface.clear();
    }
    if (!interfaceExists(handle.name)) {
        return;
    }

    QString error;
    if (!runProcess(QStringLiteral("resolvectl"), {QStringLiteral("revert"), handle.name}, kCommandTimeoutMs, &error)) {
        qCDebug(lcRelay) << "resolvectl revert failed:" << error;
    }
    if (!runIp({QStringLiteral("link"), QStringLiteral("delete"), QStringLiteral("dev"), handle.name}, &error)) {
        qCWarning(lcRelay) << "Failed to delete interface" << handle.name << error;
        return;
    }
    qCInfo(lcRelay) << "Interface" << handle.name << "released";
}

void LinuxTunPlatform::checkInterface()
{
    if (m_activeInterface.isEmpty() || interfaceExists(m_activeInterface)) {
        return;
    }

    qCWarning(lcRelay) << "Interface" << m_activeInterface << "disappeared";
    m_watchTimer.stop();
    m_activeInterface.clear();
    emit revoked();
}

bool LinuxTunPlatform::runIp(const QStringList& args, QString* errorMessage) const
{
    qCDebug(lcRelay).noquote() << "ip" << args.join(QLatin1Char(' '));
    return runProcess(QStringLiteral("ip"), args, kCommandTimeoutMs, errorMessage);
}

bool LinuxTunPlatform::interfaceExists(const QString& name)
{
    return QFileInfo::exists(QStringLiteral("/sys/class/net/%1").arg(name));
}
