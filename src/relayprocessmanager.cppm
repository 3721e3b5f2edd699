/*!
 * @file        relayprocessmanager.cppm
 * @brief       hev-socks5-tunnel process lifecycle and traffic counters.
 *
 * @details
 * Implements the relay engine interface on Linux by launching the
 * hev-socks5-tunnel executable through `QProcess` with a generated YAML
 * configuration. Output lines are forwarded to the relay logging category,
 * unexpected exits are reported, and traffic counters are read from the
 * tunnel interface statistics in sysfs.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QObject>
#include <QProcess>
#include <QString>

#ifndef Q_MOC_RUN
export module relaygate.backend.relayprocessmanager;
import relaygate.backend.tunnelplatform;
#endif

#ifdef Q_MOC_RUN
#define RELAYGATE_MODULE_EXPORT
class RelayEngine;
struct InterfaceHandle;
struct RelayStartOptions;
struct RelayStats;
#else
#define RELAYGATE_MODULE_EXPORT export
#endif

/**
 * @class RelayProcessManager
 * @brief Runs hev-socks5-tunnel as a child process.
 */
RELAYGATE_MODULE_EXPORT class RelayProcessManager : public RelayEngine
{
    Q_OBJECT

public:
    /**
     * @brief Construct process manager.
     * @param parent Optional QObject parent.
     */
    explicit RelayProcessManager(QObject* parent = nullptr);

    /**
     * @brief Set relay executable path; empty means search `PATH`.
     * @param path Executable path.
     */
    void setExecutablePath(const QString& path);

    /**
     * @brief Resolved relay executable path.
     * @return Configured path, or the first match on `PATH`.
     */
    QString executablePath() const;

    /**
     * @brief Directory receiving the generated configuration file.
     * @param path Writable directory.
     */
    void setRuntimeDirectory(const QString& path);

    /**
     * @brief Root of the per-interface statistics tree.
     * @param path Defaults to `/sys/class/net`.
     */
    void setStatisticsRoot(const QString& path);

    /**
     * @brief Relay log level written to the configuration.
     * @param level hev-socks5-tunnel level name (`debug`, `info`, `warn`, `error`).
     */
    void setLogLevel(const QString& level);

    /**
     * @brief Path of the generated configuration file.
     * @return File path.
     */
    QString configPath() const;

    bool start(const InterfaceHandle& handle, const RelayStartOptions& options, QString* errorMessage = nullptr) override;
    void stop() override;
    bool isRunning() const override;
    RelayStats stats() const override;

private slots:
    //! Handle stdout bytes from process.
    void onReadyReadStandardOutput();
    //! Handle stderr bytes from process.
    void onReadyReadStandardError();
    //! Handle QProcess finished signal.
    void onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus);

private:
    /**
     * @brief Write the YAML configuration with owner-only permissions.
     * @param content YAML bytes.
     * @param errorMessage Optional output error.
     * @return True when written.
     */
    bool writeConfig(const QByteArray& content, QString* errorMessage);

    /**
     * @brief Split chunk into full lines and log them.
     * @param buffer Persistent line buffer.
     * @param chunk Newly received bytes.
     */
    void parseAndLogLines(QByteArray& buffer, const QByteArray& chunk);

    /**
     * @brief Read one interface counter.
     * @param counter File name under `statistics/`.
     * @return Counter value, 0 when unavailable.
     */
    quint64 readCounter(const QString& counter) const;

    QProcess m_process;          //!< Managed relay child process.
    QString m_executablePath;    //!< Configured executable path.
    QString m_runtimeDirectory;  //!< Directory for the generated configuration.
    QString m_statisticsRoot;    //!< Interface statistics root.
    QString m_logLevel;          //!< Relay log level.
    QString m_interfaceName;     //!< Interface used by the running relay.
    QByteArray m_stdoutBuffer;   //!< Buffered stdout bytes for line splitting.
    QByteArray m_stderrBuffer;   //!< Buffered stderr bytes for line splitting.
    QString m_lastErrorLine;     //!< Last stderr line, reported on unexpected exit.
    bool m_stopRequested = false; //!< Exit was requested through stop().
    bool m_starting = false;      //!< Inside start(); exits are reported as start errors.
};

#include "relayprocessmanager.moc"
