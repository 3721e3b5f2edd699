#include <QCoreApplication>
#include <QLoggingCategory>
#include <QSocketNotifier>
#include <QTextStream>
#include <QtCore/qglobal.h>

#include <csignal>
#include <memory>
#include <sys/socket.h>
#include <unistd.h>

import relaygate.backend.controlplane;
import relaygate.backend.logging;

namespace {

int g_signalFds[2] = {-1, -1};

extern "C" void handleTerminationSignal(int)
{
    const char byte = 1;
    [[maybe_unused]] const ssize_t written = ::write(g_signalFds[0], &byte, sizeof(byte));
}

bool installTerminationHandlers()
{
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, g_signalFds) != 0) {
        return false;
    }
    struct sigaction action {};
    action.sa_handler = handleTerminationSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    return ::sigaction(SIGINT, &action, nullptr) == 0 && ::sigaction(SIGTERM, &action, nullptr) == 0;
}

void printUsage()
{
    QTextStream(stdout)
        << "Usage: RelayGate [options]\n"
        << "  --data-dir <path>    Settings, secrets and runtime files\n"
        << "  --port <n>           Control API port for this session\n"
        << "  --https              Serve the control API over TLS for this session\n"
        << "  --no-auto-start      Do not start the control API\n"
        << "  --relay <path>       hev-socks5-tunnel executable\n"
        << "  --interface <name>   TUN interface name\n"
        << "  --verbose            Enable debug logging\n";
}

} // namespace

auto main(int argc, char *argv[]) -> int
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("RelayGate"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("relaygate.local"));
    QCoreApplication::setApplicationName(QStringLiteral("RelayGate"));
#ifdef APP_VERSION
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));
#else
    QCoreApplication::setApplicationVersion(QStringLiteral("0.0.0"));
#endif

    qSetMessagePattern(QStringLiteral(
        "%{time yyyy-MM-dd hh:mm:ss.zzz} "
        "%{if-debug}D%{endif}%{if-info}I%{endif}%{if-warning}W%{endif}%{if-critical}C%{endif}%{if-fatal}F%{endif} "
        "%{category}: %{message}"));

    ControlPlaneOptions options;
    bool verbose = false;

    const QStringList args = app.arguments();
    for (int i = 1; i < args.size(); ++i) {
        const QString arg = args.at(i);
        if (arg == QStringLiteral("--data-dir") && i + 1 < args.size()) {
            options.dataDirectory = args.at(i + 1).trimmed();
            ++i;
            continue;
        }
        if (arg == QStringLiteral("--port") && i + 1 < args.size()) {
            bool ok = false;
            const int parsed = args.at(i + 1).toInt(&ok);
            if (!ok || parsed < 1 || parsed > 65535) {
                QTextStream(stderr) << "Invalid port: " << args.at(i + 1) << "\n";
                return 2;
            }
            options.port = static_cast<quint16>(parsed);
            ++i;
            continue;
        }
        if (arg == QStringLiteral("--https")) {
            options.httpsEnabled = true;
            continue;
        }
        if (arg == QStringLiteral("--no-auto-start")) {
            options.autoStartDisabled = true;
            continue;
        }
        if (arg == QStringLiteral("--relay") && i + 1 < args.size()) {
            options.relayExecutable = args.at(i + 1).trimmed();
            ++i;
            continue;
        }
        if (arg == QStringLiteral("--interface") && i + 1 < args.size()) {
            options.interfaceName = args.at(i + 1).trimmed();
            ++i;
            continue;
        }
        if (arg == QStringLiteral("--verbose")) {
            verbose = true;
            continue;
        }
        if (arg == QStringLiteral("--help") || arg == QStringLiteral("-h")) {
            printUsage();
            return 0;
        }
        QTextStream(stderr) << "Unknown argument: " << arg << "\n";
        printUsage();
        return 2;
    }

    if (verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("relaygate.*.debug=true"));
    }

    std::unique_ptr<QSocketNotifier> signalNotifier;
    if (installTerminationHandlers()) {
        signalNotifier = std::make_unique<QSocketNotifier>(g_signalFds[1], QSocketNotifier::Read);
        QObject::connect(signalNotifier.get(), &QSocketNotifier::activated, &app, [notifier = signalNotifier.get()]() {
            notifier->setEnabled(false);
            char byte = 0;
            [[maybe_unused]] const ssize_t received = ::read(g_signalFds[1], &byte, sizeof(byte));
            qCInfo(lcApp) << "Termination requested";
            QCoreApplication::quit();
        });
    } else {
        qCWarning(lcApp) << "Failed to install termination handlers";
    }

    ControlPlane controlPlane(options);
    controlPlane.initialize();

    qCInfo(lcApp).noquote() << QCoreApplication::applicationName() << QCoreApplication::applicationVersion()
                            << "running";
    return app.exec();
}
