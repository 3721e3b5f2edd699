/*!
 * @file        connectionstate.cppm
 * @brief       Connection state enum exports for RelayGate.
 *
 * @details
 * Provides the canonical tunnel connection-state enum shared by the session
 * controller, the orchestrator and the control API. This module also exposes
 * Qt meta-object helpers so enum values travel through queued signals, and the
 * lowercase wire names used in API payloads.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QObject>
#include <QString>

#ifndef Q_MOC_RUN
export module relaygate.backend.connectionstate;
#endif

namespace App {
Q_NAMESPACE

/**
 * @enum ConnectionState
 * @brief Lifecycle state of the tunnel session.
 *
 * @details
 * Exactly one value is current at any time. Only the tunnel session
 * controller mutates it; every other component observes it.
 */
enum class ConnectionState
{
    Disconnected,  //!< No tunnel is active.
    Connecting,    //!< Interface and relay start are in progress.
    Connected,     //!< Relay is running and routes are installed.
    Disconnecting, //!< Teardown was requested and is in progress.
    Error          //!< Last start attempt failed or the relay died.
};

Q_ENUM_NS(ConnectionState)

} // namespace App

#ifndef Q_MOC_RUN

//! Convenience alias exported from the internal App namespace.
export using ConnectionState = App::ConnectionState;

/**
 * @brief Return Qt meta-object for the `App` namespace.
 * @return Namespace meta-object containing exported enums.
 */
export const QMetaObject& connectionStateMetaObject()
{
    return App::staticMetaObject;
}

/**
 * @brief Lowercase wire name of a state (`connected`, `error`, ...).
 * @param state State value.
 * @return Name used in JSON payloads and logs.
 */
export QString connectionStateName(ConnectionState state)
{
    switch (state) {
    case ConnectionState::Disconnected:
        return QStringLiteral("disconnected");
    case ConnectionState::Connecting:
        return QStringLiteral("connecting");
    case ConnectionState::Connected:
        return QStringLiteral("connected");
    case ConnectionState::Disconnecting:
        return QStringLiteral("disconnecting");
    case ConnectionState::Error:
        return QStringLiteral("error");
    }
    return QStringLiteral("disconnected");
}
#endif

#include "connectionstate.moc"
