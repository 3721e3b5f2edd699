/*!
 * @file        routeplanner.cppm
 * @brief       Tunnel route plan computation.
 *
 * @details
 * Computes the IPv4 prefixes installed on the tunnel interface so that the
 * whole address space is captured except the upstream proxy address, which
 * must stay reachable through the physical uplink to avoid a routing loop.
 * The plan also carries the interface address, MTU, fake-IP DNS server and
 * the application filter.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QList>
#include <QString>
#include <QStringList>
#include <QtTypes>

#include <optional>

export module relaygate.backend.routeplanner;

/**
 * @struct Ipv4Prefix
 * @brief IPv4 network in CIDR form, address held in host byte order.
 */
export struct Ipv4Prefix {
    quint32 address = 0;  //!< Network address.
    int prefixLength = 0; //!< 0..32.

    /**
     * @brief Check whether @p host lies in this block.
     * @param host Address in host byte order.
     * @return True when covered.
     */
    bool contains(quint32 host) const;

    /**
     * @brief Number of addresses in the block.
     * @return 2^(32 - prefixLength).
     */
    quint64 size() const;

    bool operator==(const Ipv4Prefix& other) const = default;
};

/**
 * @struct ApplicationFilter
 * @brief Which applications are routed through the tunnel.
 */
export struct ApplicationFilter {
    enum class Mode {
        ExcludeSelf, //!< Everything except the controlling application.
        AllowList    //!< Only the listed applications.
    };

    Mode mode = Mode::ExcludeSelf; //!< Filter mode.
    QStringList applications;      //!< Allowed applications, or the excluded self identifier.
};

/**
 * @struct RoutePlan
 * @brief Everything needed to configure the virtual interface.
 */
export struct RoutePlan {
    QList<Ipv4Prefix> routes;                                //!< Prefixes routed into the tunnel.
    QString interfaceAddress = QStringLiteral("198.18.0.1"); //!< Local tunnel address.
    int interfacePrefixLength = 24;                          //!< Local tunnel netmask length.
    QString dnsServer = QStringLiteral("198.18.0.2");        //!< Fake-IP resolver served by the relay.
    int mtu = 1500;                                          //!< Interface MTU.
    ApplicationFilter filter;                                //!< Application filter.
};

/**
 * @class RoutePlanner
 * @brief Address-space decomposition and plan assembly.
 */
export class RoutePlanner
{
public:
    /**
     * @brief Parse a strict dotted-quad IPv4 literal.
     * @param text Four decimal octets 0..255 separated by dots.
     * @return Address in host byte order, or empty optional.
     */
    static std::optional<quint32> parseIpv4(const QString& text);

    /**
     * @brief Format an address as dotted quad.
     * @param address Address in host byte order.
     * @return Text such as `10.0.0.1`.
     */
    static QString formatAddress(quint32 address);

    /**
     * @brief Format a prefix as CIDR.
     * @param prefix Prefix.
     * @return Text such as `10.0.0.0/8`.
     */
    static QString formatPrefix(const Ipv4Prefix& prefix);

    /**
     * @brief Minimal prefix set covering 0.0.0.0/0 except one address.
     * @param excluded Address to leave out.
     * @return 32 prefixes in ascending address order.
     */
    static QList<Ipv4Prefix> excludeAddress(quint32 excluded);

    /**
     * @brief Routes for a proxy host.
     * @param proxyHost Proxy address; a hostname yields the default route only.
     * @return Route list.
     */
    static QList<Ipv4Prefix> routesExcluding(const QString& proxyHost);

    /**
     * @brief Build the complete plan for a tunnel session.
     * @param proxyHost Upstream proxy host.
     * @param allowedApplications Allow-list; empty routes everything but @p selfIdentifier.
     * @param selfIdentifier Identifier of the controlling application.
     * @param mtu Interface MTU.
     * @return Plan.
     */
    static RoutePlan plan(const QString& proxyHost,
                          const QStringList& allowedApplications,
                          const QString& selfIdentifier,
                          int mtu = 1500);
};
