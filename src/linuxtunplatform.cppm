/*!
 * @file        linuxtunplatform.cppm
 * @brief       Linux virtual-interface platform built on ip(8).
 *
 * @details
 * Creates a persistent TUN device for the relay engine, assigns the tunnel
 * address and MTU, installs the route plan as device routes and points the
 * interface DNS at the fake-IP resolver through systemd-resolved. A watch
 * timer reports the interface disappearing underneath an active session.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>

#include <optional>

#ifndef Q_MOC_RUN
export module relaygate.backend.linuxtunplatform;
import relaygate.backend.tunnelplatform;
#endif

#ifdef Q_MOC_RUN
#define RELAYGATE_MODULE_EXPORT
class TunnelPlatform;
struct InterfaceHandle;
struct RoutePlan;
#else
#define RELAYGATE_MODULE_EXPORT export
#endif

/**
 * @class LinuxTunPlatform
 * @brief Manages the TUN device and its routes with ip(8) and resolvectl.
 */
RELAYGATE_MODULE_EXPORT class LinuxTunPlatform : public TunnelPlatform
{
    Q_OBJECT

public:
    /**
     * @brief Construct platform.
     * @param parent Optional QObject parent.
     */
    explicit LinuxTunPlatform(QObject* parent = nullptr);

    /**
     * @brief Name of the TUN device to create.
     * @param name Interface name, at most 15 characters.
     */
    void setInterfaceName(const QString& name);

    /**
     * @brief Configured TUN device name.
     * @return Interface name.
     */
    QString interfaceName() const;

    std::optional<InterfaceHandle> establish(const RoutePlan& plan, QString* errorMessage = nullptr) override;
    void release(const InterfaceHandle& handle) override;

private slots:
    //! Check that the established interface still exists.
    void checkInterface();

private:
    /**
     * @brief Run an ip(8) command.
     * @param args Arguments after `ip`.
     * @param errorMessage Optional output error (stderr text).
     * @return True on exit code 0.
     */
    bool runIp(const QStringList& args, QString* errorMessage = nullptr) const;

    /**
     * @brief Whether an interface with @p name exists.
     * @param name Interface name.
     * @return True when present in sysfs.
     */
    static bool interfaceExists(const QString& name);

    QString m_interfaceName;   //!< TUN device name.
    QString m_activeInterface; //!< Interface currently established, empty when none.
    QTimer m_watchTimer;       //!< Periodic existence check.
};

#include "linuxtunplatform.moc"
