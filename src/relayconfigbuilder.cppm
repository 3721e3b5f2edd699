/*!
 * @file        relayconfigbuilder.cppm
 * @brief       Runtime hev-socks5-tunnel configuration generator.
 *
 * @details
 * Transforms an interface handle and relay start options into the YAML
 * document read by the hev-socks5-tunnel executable: tunnel device, SOCKS5
 * upstream with optional credentials, fake-IP DNS mapping and the timeout
 * block that also carries the coarse QUIC-blocking switch.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QString>

#ifndef Q_MOC_RUN
export module relaygate.backend.relayconfigbuilder;
import relaygate.backend.tunnelplatform;
#endif

/**
 * @class RelayConfigBuilder
 * @brief Builds runtime configuration documents for the relay engine.
 */
export class RelayConfigBuilder
{
public:
    /**
     * @struct BuildOptions
     * @brief Settings that do not come from the tunnel configuration.
     */
    struct BuildOptions {
        QString logLevel = QStringLiteral("warn");            //!< Relay log level.
        bool enableMapDns = true;                             //!< Serve fake-IP DNS.
        QString mapDnsAddress = QStringLiteral("198.18.0.2"); //!< Fake-IP resolver address.
        int mapDnsPort = 53;                                  //!< Fake-IP resolver port.
        QString mapDnsNetwork = QStringLiteral("240.0.0.0");  //!< Synthetic address pool.
        QString mapDnsNetmask = QStringLiteral("240.0.0.0");  //!< Pool netmask.
        int mapDnsCacheSize = 10000;                          //!< Cached name mappings.
        int connectTimeoutMs = 10000;                         //!< Upstream connect timeout.
        int tcpReadWriteTimeoutMs = 300000;                   //!< TCP idle timeout.
    };

    /**
     * @brief Build full relay YAML.
     * @param handle Established interface.
     * @param options Proxy endpoint, credentials, MTU and UDP timeout.
     * @param buildOptions Remaining switches.
     * @return UTF-8 YAML document.
     */
    static QByteArray build(const InterfaceHandle& handle,
                            const RelayStartOptions& options,
                            const BuildOptions& buildOptions);

private:
    /**
     * @brief Quote a scalar for YAML single-quoted style.
     * @param value Raw text.
     * @return Quoted text.
     */
    static QString quoted(const QString& value);
};
