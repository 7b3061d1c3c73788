#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>

#include "config/command_line.h"
#include "config/config_store.h"
#include "core/log_manager.h"
#include "pipeline/filter_chain.h"
#include "pipeline/filters/auth_filter.h"
#include "pipeline/filters/debug_filter.h"
#include "pipeline/filters/echo_filter.h"
#include "server/line_server.h"

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("authline"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    // --- 1. Command line ---
    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Line-protocol echo server with per-connection handshake authentication"));
    parser.addHelpOption();
    parser.addVersionOption();

    addCommandLineOptions(parser);
    parser.process(app);

    // --- 2. Config ---
    ConfigStore configStore;
    if (auto applied = applyCommandLine(parser, configStore); !applied) {
        qCritical().noquote() << "authline:" << applied.error().message;
        return 1;
    }

    const ServerConfig config = configStore.serverConfig();

    // --- 3. Log ---
    LogManager& log = LogManager::instance();
    log.setMinimumLevel(LogManager::parseLevel(config.logging.level));
    log.setConsoleEcho(config.logging.console);
    if (!config.logging.dir.isEmpty())
        log.initialize(config.logging.dir);
    LOG_INFO(QStringLiteral("authline v%1 starting").arg(app.applicationVersion()));

    // --- 4. Filter chain: transport -> debug -> auth -> echo ---
    FilterChain chain;
    chain.addFilter(std::make_unique<DebugFilter>(config.logging.debugFilter));
    chain.addFilter(std::make_unique<AuthFilter>());
    chain.addFilter(std::make_unique<EchoFilter>());

    // --- 5. Server ---
    LineServer server;
    server.setFilterChain(&chain);
    if (!server.start(config)) {
        LOG_ERROR(QStringLiteral("authline: server failed to start"));
        return 1;
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &server, &LineServer::stop);

    return app.exec();
}
