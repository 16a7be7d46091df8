#include <QCoreApplication>
#include <QDir>
#include <QHostAddress>
#include <QHttpServer>
#include <QTcpServer>
#include <QTextStream>
#include <QThread>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <functional>

#include "config/server_args.h"
#include "config/server_config.h"
#include "http/api_router.h"
#include "http/remote_backend_directory.h"
#include "server_manager.h"
#include "toolhub/gateway/stdio_gateway.h"
#include "utils/server_logger.h"

using namespace toolhub_server;

namespace {

constexpr const char* kVersion = "1.0.0";

void printHelp() {
    QTextStream err(stderr);
    err << "Usage: toolhub_server [options]\n"
        << "Options:\n"
        << "  --stdio                  Serve JSON-RPC on stdin/stdout\n"
        << "  --data-root=<path>       Data root directory (default: ~/.toolhub)\n"
        << "  --port=<port>            HTTP port (default: 8080)\n"
        << "  --host=<addr>            Listen address (default: 127.0.0.1)\n"
        << "  --log-level=<level>      debug|info|warn|error (default: info)\n"
        << "  --control-url=<url>      With --stdio, read running backends from this daemon\n"
        << "  -h, --help               Show this help\n"
        << "  -v, --version            Show version\n";
    err.flush();
}

bool ensureDirectories(const QString& dataRoot) {
    static const char* kDirs[] = {"backends", "logs"};
    for (const char* sub : kDirs) {
        if (!QDir(dataRoot + "/" + sub).mkpath(".")) {
            std::fprintf(stderr, "Failed to create: %s/%s\n", qUtf8Printable(dataRoot), sub);
            return false;
        }
    }
    return true;
}

void requestQuitSignalHandler(int) {
    QMetaObject::invokeMethod(
        qApp,
        []() { QCoreApplication::quit(); },
        Qt::QueuedConnection);
}

bool startHttp(QHttpServer& httpServer, QTcpServer& tcpServer, const ServerConfig& config) {
    if (!tcpServer.listen(QHostAddress(config.host), static_cast<quint16>(config.port))) {
        qCritical("Failed to listen on %s:%d", qUtf8Printable(config.host), config.port);
        return false;
    }
    if (!httpServer.bind(&tcpServer)) {
        qCritical("Failed to bind HTTP server");
        return false;
    }
    qInfo("HTTP server listening on %s:%d", qUtf8Printable(config.host),
          static_cast<int>(tcpServer.serverPort()));
    return true;
}

/// Run the gateway on a worker thread and quit the application at end of input.
int runGateway(QCoreApplication& app, toolhub::ToolAggregator* aggregator,
               const std::function<void()>& beforeExit) {
    toolhub::StdioGateway gateway(aggregator, "toolhub", kVersion);
    int gatewayCode = 0;
    QThread* thread = QThread::create([&gateway, &gatewayCode]() {
        gatewayCode = gateway.runStdio();
    });
    thread->setObjectName("stdio-gateway");
    QObject::connect(thread, &QThread::finished, &app, &QCoreApplication::quit);
    thread->start();

    const int appCode = app.exec();
    if (beforeExit) {
        beforeExit();
    }

    if (!thread->wait(1000)) {
        // blocked reading stdin after a signal; nothing left to flush
        qInfo("Gateway still waiting on stdin, exiting");
        ServerLogger::shutdown();
        std::_Exit(appCode);
    }
    delete thread;
    return appCode != 0 ? appCode : gatewayCode;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    const ServerArgs args = ServerArgs::parse(app.arguments());
    if (args.help) {
        printHelp();
        return 0;
    }
    if (args.version) {
        std::fprintf(stderr, "toolhub_server %s\n", kVersion);
        return 0;
    }
    if (!args.error.isEmpty()) {
        std::fprintf(stderr, "Error: %s\n", qUtf8Printable(args.error));
        return 2;
    }

    const QString dataRoot = QDir(args.dataRoot.isEmpty() ? ServerArgs::defaultDataRoot()
                                                          : args.dataRoot)
                                 .absolutePath();
    if (!ensureDirectories(dataRoot)) {
        return 1;
    }

    QString cfgErr;
    ServerConfig config = ServerConfig::loadFromFile(dataRoot + "/config.json", cfgErr);
    if (!cfgErr.isEmpty()) {
        std::fprintf(stderr, "Error: %s\n", qUtf8Printable(cfgErr));
        return 2;
    }
    config.applyArgs(args);

    ServerLogger::Config logConfig;
    logConfig.logLevel = config.logLevel;
    logConfig.logDir = dataRoot + "/logs";
    logConfig.maxFileBytes = config.logMaxBytes;
    logConfig.maxFiles = config.logMaxFiles;
    QString logErr;
    if (!ServerLogger::init(logConfig, logErr)) {
        std::fprintf(stderr, "Error: %s\n", qUtf8Printable(logErr));
        return 1;
    }

    std::signal(SIGINT, requestQuitSignalHandler);
#ifdef SIGTERM
    std::signal(SIGTERM, requestQuitSignalHandler);
#endif

    // gateway against a separate daemon: no registry, no HTTP server
    if (args.stdio && !config.controlUrl.isEmpty()) {
        toolhub::BackendCatalog catalog = toolhub::BackendCatalog::builtin();
        if (!config.catalogFile.isEmpty()) {
            QString catErr;
            catalog = toolhub::BackendCatalog::loadFromFile(config.catalogFile, catErr);
            if (!catErr.isEmpty()) {
                qCritical("%s", qUtf8Printable(catErr));
                return 1;
            }
        }

        RemoteBackendDirectory directory(QUrl(config.controlUrl), catalog);

        toolhub::EphemeralRelay::Options relayOptions;
        relayOptions.startTimeoutMs = config.startTimeoutMs;
        relayOptions.discoveryTimeoutMs = config.discoveryTimeoutMs;
        relayOptions.callTimeoutMs = config.callTimeoutMs;
        toolhub::EphemeralRelay relay(&directory, relayOptions);

        toolhub::ToolAggregator::Options aggregatorOptions;
        aggregatorOptions.cacheTtlMs = config.toolCacheTtlMs;
        aggregatorOptions.discoveryAttempts = config.discoveryAttempts;
        toolhub::ToolAggregator aggregator(&directory, &relay, aggregatorOptions);

        qInfo("Gateway using control API at %s", qUtf8Printable(config.controlUrl));
        const int code = runGateway(app, &aggregator, nullptr);
        ServerLogger::shutdown();
        return code;
    }

    ServerManager manager(dataRoot, config);
    QString initErr;
    if (!manager.initialize(initErr)) {
        qCritical("Init error: %s", qUtf8Printable(initErr));
        ServerLogger::shutdown();
        return 1;
    }

    QHttpServer httpServer;
    QTcpServer tcpServer;
    ApiRouter router(&manager);
    router.registerRoutes(httpServer);

    if (args.stdio) {
        // the control API is optional alongside the gateway; another instance may own the port
        if (!startHttp(httpServer, tcpServer, config)) {
            qWarning("Continuing without the control API");
        }
        const int code = runGateway(app, manager.aggregator(), [&manager]() { manager.shutdown(); });
        ServerLogger::shutdown();
        return code;
    }

    if (!startHttp(httpServer, tcpServer, config)) {
        ServerLogger::shutdown();
        return 1;
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() {
        manager.shutdown();
    });

    const int code = app.exec();
    ServerLogger::shutdown();
    return code;
}
