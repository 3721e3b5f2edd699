/*!
 * @file        serversettings.cppm
 * @brief       Persisted runtime settings of the control server.
 *
 * @details
 * Stores the listener options (auto start, port, HTTPS, bearer auth), the
 * tunnel preferences and the relay executable options in an INI file. The API
 * token lives in the secret store, never in the INI file.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QString>
#include <QtTypes>

export module relaygate.backend.serversettings;
export import relaygate.backend.tunnelplatform;
import relaygate.backend.secretstore;

/**
 * @struct ServerRuntimeSettings
 * @brief Listener options of the control API.
 *
 * @details
 * Invariant: `authEnabled` implies `httpsEnabled`.
 */
export struct ServerRuntimeSettings {
    bool autoStart = true;       //!< Start the server at launch.
    quint16 port = 18080;        //!< Listening port.
    bool httpsEnabled = false;   //!< Serve TLS with the local identity.
    bool authEnabled = false;    //!< Require `Authorization: Bearer <token>`.

    bool operator==(const ServerRuntimeSettings&) const = default;
};

/**
 * @struct RelaySettings
 * @brief Options of the external relay engine.
 */
export struct RelaySettings {
    QString executablePath; //!< Empty means lookup on PATH.
    QString interfaceName;  //!< Empty means the platform default.
};

/**
 * @class SettingsService
 * @brief Validating front-end over `QSettings` and the secret store.
 */
export class SettingsService
{
public:
    static constexpr int kTokenBytes = 16;

    /**
     * @brief Create a service and load the stored values.
     * @param settingsPath INI file path.
     * @param secrets Secret store holding the API token. Not owned.
     */
    SettingsService(const QString& settingsPath, SecretStore* secrets);

    void load();
    void save() const;

    ServerRuntimeSettings serverSettings() const;

    void setAutoStart(bool enabled);

    /**
     * @brief Change the listening port.
     * @param port Port number.
     * @param errorMessage Optional output error.
     * @return False when @p port is outside 1..65535.
     */
    bool setPort(int port, QString* errorMessage = nullptr);

    /**
     * @brief Toggle HTTPS. Disabling it also disables authentication.
     */
    void setHttpsEnabled(bool enabled);

    /**
     * @brief Toggle bearer-token authentication.
     * @param enabled New value.
     * @param errorMessage Optional output error.
     * @return False when enabling without HTTPS or when the token cannot be stored.
     *
     * @details
     * Enabling generates a token when none is stored yet.
     */
    bool setAuthEnabled(bool enabled, QString* errorMessage = nullptr);

    QString authToken() const;
    bool setAuthToken(const QString& token, QString* errorMessage = nullptr);

    /**
     * @brief Replace the API token with a fresh random one.
     * @return The new token, or empty string when it could not be stored.
     */
    QString generateNewAuthToken(QString* errorMessage = nullptr);
    bool clearAuthToken(QString* errorMessage = nullptr);

    /**
     * @brief Restore defaults and forget the token.
     */
    void reset();

    TunnelPreferences tunnelPreferences() const;
    void setTunnelPreferences(const TunnelPreferences& preferences);

    RelaySettings relaySettings() const;
    void setRelaySettings(const RelaySettings& settings);

    QString settingsPath() const;

    /**
     * @brief 32 lowercase hex characters from the system CSPRNG.
     */
    static QString randomToken();

private:
    QString m_settingsPath;
    SecretStore* m_secrets = nullptr;
    ServerRuntimeSettings m_server;
    TunnelPreferences m_tunnel;
    RelaySettings m_relay;
};
