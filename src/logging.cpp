module;
#include <QLoggingCategory>

module relaygate.backend.logging;

Q_LOGGING_CATEGORY(lcIdentity, "relaygate.identity")
Q_LOGGING_CATEGORY(lcRouting, "relaygate.routing")
Q_LOGGING_CATEGORY(lcTunnel, "relaygate.tunnel")
Q_LOGGING_CATEGORY(lcRelay, "relaygate.relay")
Q_LOGGING_CATEGORY(lcOrchestrator, "relaygate.orchestrator")
Q_LOGGING_CATEGORY(lcGateway, "relaygate.gateway")
Q_LOGGING_CATEGORY(lcSettings, "relaygate.settings")
Q_LOGGING_CATEGORY(lcApp, "relaygate.app")
