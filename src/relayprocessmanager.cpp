module;
#include <QDir>
#include <QFile>
#include <QFileDevice>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QProcess>
#include <QSaveFile>
#include <QStandardPaths>

module relaygate.backend.relayprocessmanager;

import relaygate.backend.logging;
import relaygate.backend.relayconfigbuilder;
import relaygate.backend.tunnelplatform;

namespace {
constexpr int kStartTimeoutMs = 5000;
constexpr int kStartupGraceMs = 300;
constexpr int kStopTimeoutMs = 3000;
constexpr int kKillTimeoutMs = 2000;

const QString kExecutableName = QStringLiteral("hev-socks5-tunnel");
const QString kConfigFileName = QStringLiteral("relay.yml");

void setError(QString* errorMessage, const QString& error)
{
    if (errorMessage) {
        *errorMessage = error;
    }
}
}

RelayProcessManager::RelayProcessManager(QObject* parent)
    : RelayEngine(parent)
    , m_process(this)
    , m_runtimeDirectory(QDir::tempPath())
    , m_statisticsRoot(QStringLiteral("/sys/class/net"))
    , m_logLevel(QStringLiteral("warn"))
{
    connect(&m_process, &QProcess::readyReadStandardOutput, this, &RelayProcessManager::onReadyReadStandardOutput);
    connect(&m_process, &QProcess::readyReadStandardError, this, &RelayProcessManager::onReadyReadStandardError);
    connect(&m_process, &QProcess::finished, this, &RelayProcessManager::onProcessFinished);
}

void RelayProcessManager::setExecutablePath(const QString& path)
{
    m_executablePath = path.trimmed();
}

QString RelayProcessManager::executablePath() const
{
    if (!m_executablePath.isEmpty()) {
        return m_executablePath;
    }
    return QStandardPaths::findExecutable(kExecutableName);
}

void RelayProcessManager::setRuntimeDirectory(const QString& path)
{
    m_runtimeDirectory = path;
}

void RelayProcessManager::setStatisticsRoot(const QString& path)
{
    m_statisticsRoot = path;
}

void RelayProcessManager::setLogLevel(const QString& level)
{
    m_logLevel = level;
}

QString RelayProcessManager::configPath() const
{
    return QDir(m_runtimeDirectory).filePath(kConfigFileName);
}

bool RelayProcessManager::start(const InterfaceHandle& handle, const RelayStartOptions& options, QString* errorMessage)
{
    if (isRunning()) {
        setError(errorMessage, QStringLiteral("Relay is already running."));
        return false;
    }

    const QString executable = executablePath();
    if (executable.isEmpty()) {
        setError(errorMessage, QStringLiteral("%1 executable was not found.").arg(kExecutableName));
        return false;
    }
    const QFileInfo executableInfo(executable);
    if (!executableInfo.exists() || !executableInfo.isExecutable()) {
        setError(errorMessage, QStringLiteral("Relay executable not found: %1").arg(executable));
        return false;
    }

    RelayConfigBuilder::BuildOptions buildOptions;
    buildOptions.logLevel = m_logLevel;
    if (!writeConfig(RelayConfigBuilder::build(handle, options, buildOptions), errorMessage)) {
        return false;
    }

    m_stdoutBuffer.clear();
    m_stderrBuffer.clear();
    m_lastErrorLine.clear();
    m_stopRequested = false;
    m_starting = true;
    m_interfaceName = handle.name;

    m_process.setProgram(executable);
    m_process.setArguments({configPath()});
    m_process.setWorkingDirectory(m_runtimeDirectory);
    m_process.start();

    if (!m_process.waitForStarted(kStartTimeoutMs)) {
        setError(errorMessage, QStringLiteral("Failed to start relay: %1").arg(m_process.errorString()));
        m_starting = false;
        m_stopRequested = true;
        m_process.kill();
        return false;
    }

    // An invalid configuration makes the relay exit right away.
    const bool exitedEarly = m_process.waitForFinished(kStartupGraceMs);
    m_starting = false;
    if (exitedEarly) {
        parseAndLogLines(m_stderrBuffer, m_process.readAllStandardError());
        const QString reason = m_lastErrorLine.isEmpty()
            ? QStringLiteral("exit code %1").arg(m_process.exitCode())
            : m_lastErrorLine;
        setError(errorMessage, QStringLiteral("Relay exited during startup: %1").arg(reason));
        return false;
    }

    qCInfo(lcRelay) << "Relay started on" << handle.name << "pid" << m_process.processId()
                    << "udp timeout" << options.udpTimeoutMs << "ms";
    return true;
}

void RelayProcessManager::stop()
{
    m_stopRequested = true;
    if (!isRunning()) {
        return;
    }

    m_process.terminate();
    if (!m_process.waitForFinished(kStopTimeoutMs)) {
        qCWarning(lcRelay) << "Relay did not terminate in time, killing";
        m_process.kill();
        m_process.waitForFinished(kKillTimeoutMs);
    }
}

bool RelayProcessManager::isRunning() const
{
    return m_process.state() != QProcess::NotRunning;
}

RelayStats RelayProcessManager::stats() const
{
    RelayStats stats;
    if (!isRunning() || m_interfaceName.isEmpty()) {
        return stats;
    }

    // Packets the kernel routes into the TUN device are transmitted on it.
    stats.uploadBytes = readCounter(QStringLiteral("tx_bytes"));
    stats.downloadBytes = readCounter(QStringLiteral("rx_bytes"));
    return stats;
}

void RelayProcessManager::onReadyReadStandardOutput()
{
    parseAndLogLines(m_stdoutBuffer, m_process.readAllStandardOutput());
}

void RelayProcessManager::onReadyReadStandardError()
{
    parseAndLogLines(m_stderrBuffer, m_process.readAllStandardError());
}

void RelayProcessManager::onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    parseAndLogLines(m_stdoutBuffer, QByteArray("\n"));
    parseAndLogLines(m_stderrBuffer, QByteArray("\n"));

    if (m_starting) {
        return;
    }
    if (m_stopRequested) {
        qCInfo(lcRelay) << "Relay stopped";
        return;
    }

    const QString reason = exitStatus == QProcess::CrashExit
        ? QStringLiteral("Relay crashed")
        : QStringLiteral("Relay exited with code %1").arg(exitCode);
    qCWarning(lcRelay).noquote() << reason << m_lastErrorLine;
    m_stopRequested = true;
    emit unexpectedExit(reason);
}

bool RelayProcessManager::writeConfig(const QByteArray& content, QString* errorMessage)
{
    if (!QDir().mkpath(m_runtimeDirectory)) {
        setError(errorMessage, QStringLiteral("Failed to create directory: %1").arg(m_runtimeDirectory));
        return false;
    }

    QSaveFile file(configPath());
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        setError(errorMessage, QStringLiteral("Failed to open config file: %1").arg(configPath()));
        return false;
    }
    file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    file.write(content);

    if (!file.commit()) {
        setError(errorMessage, QStringLiteral("Failed to write config file to disk."));
        return false;
    }
    QFile::setPermissions(configPath(), QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    return true;
}

void RelayProcessManager::parseAndLogLines(QByteArray& buffer, const QByteArray& chunk)
{
    if (!chunk.isEmpty()) {
        buffer.append(chunk);
    }

    qsizetype newLineIndex = buffer.indexOf('\n');
    while (newLineIndex >= 0) {
        const QByteArray lineBytes = buffer.left(newLineIndex).trimmed();
        buffer.remove(0, newLineIndex + 1);

        if (!lineBytes.isEmpty()) {
            const QString line = QString::fromUtf8(lineBytes);
            if (&buffer == &m_stderrBuffer) {
                m_lastErrorLine = line;
            }
            qCDebug(lcRelay).noquote() << line;
        }

        newLineIndex = buffer.indexOf('\n');
    }
}

quint64 RelayProcessManager::readCounter(const QString& counter) const
{
    QFile file(QDir(m_statisticsRoot).filePath(QStringLiteral("%1/statistics/%2").arg(m_interfaceName, counter)));
    if (!file.open(QIODevice::ReadOnly)) {
        return 0;
    }
    bool ok = false;
    const quint64 value = file.readAll().trimmed().toULongLong(&ok);
    return ok ? value : 0;
}
