/*!
 * @file        logging.cppm
 * @brief       Logging categories for RelayGate backend modules.
 *
 * @details
 * Every backend component logs through its own Qt logging category so output
 * can be filtered per area (for example `relaygate.gateway.debug=true`).
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QLoggingCategory>

export module relaygate.backend.logging;

export const QLoggingCategory& lcIdentity();     //!< TLS identity generation and storage.
export const QLoggingCategory& lcRouting();      //!< Route plan computation.
export const QLoggingCategory& lcTunnel();       //!< Tunnel session lifecycle.
export const QLoggingCategory& lcRelay();        //!< Relay engine process and TUN platform.
export const QLoggingCategory& lcOrchestrator(); //!< Connect/disconnect workflow.
export const QLoggingCategory& lcGateway();      //!< Control API server.
export const QLoggingCategory& lcSettings();     //!< Persisted settings and secrets.
export const QLoggingCategory& lcApp();          //!< Composition root and entry point.
