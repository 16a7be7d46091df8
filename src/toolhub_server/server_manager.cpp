#include "server_manager.h"

#include <QCoreApplication>
#include <QDir>

namespace toolhub_server {

QJsonObject ServerManager::SystemHealth::toJson() const {
    QJsonObject breakdown;
    for (auto it = statusBreakdown.constBegin(); it != statusBreakdown.constEnd(); ++it) {
        breakdown[it.key()] = it.value();
    }

    QJsonObject obj;
    obj["status"] = status;
    obj["score"] = score;
    obj["total_servers"] = totalServers;
    obj["running_servers"] = runningServers;
    obj["error_servers"] = errorServers;
    obj["status_breakdown"] = breakdown;
    obj["timestamp"] = timestamp.toString(Qt::ISODate);
    return obj;
}

ServerManager::ServerManager(const QString& dataRoot, const ServerConfig& config, QObject* parent)
    : QObject(parent)
    , m_dataRoot(dataRoot)
    , m_config(config) {
}

ServerManager::~ServerManager() {
    shutdown();
}

ClientConfigTarget ServerManager::clientTarget(const ServerConfig& config) {
    ClientConfigTarget target;
    target.path = config.resolvedClientConfigPath();
    target.entryName = config.clientEntryName;
    target.selfPath = QCoreApplication::applicationFilePath();
    return target;
}

bool ServerManager::initialize(QString& error) {
    QDir root(m_dataRoot);
    if (!root.exists()) {
        error = "data root does not exist: " + m_dataRoot;
        return false;
    }

    if (m_config.catalogFile.isEmpty()) {
        m_catalog = toolhub::BackendCatalog::builtin();
    } else {
        m_catalog = toolhub::BackendCatalog::loadFromFile(m_config.catalogFile, error);
        if (!error.isEmpty()) {
            return false;
        }
    }
    qInfo("Catalog: %d backends", m_catalog.size());

    m_runner = std::make_unique<ProcessCommandRunner>();

    LifecycleManager::Options lifecycleOptions;
    lifecycleOptions.dataRoot = m_dataRoot;
    lifecycleOptions.logMaxBytes = m_config.logMaxBytes;
    lifecycleOptions.logMaxFiles = m_config.logMaxFiles;
    lifecycleOptions.startTimeoutMs = m_config.startTimeoutMs;
    lifecycleOptions.clientTarget = clientTarget(m_config);
    m_lifecycle = std::make_unique<LifecycleManager>(m_catalog, lifecycleOptions, m_runner.get());

    if (!m_lifecycle->loadState(error)) {
        return false;
    }

    toolhub::EphemeralRelay::Options relayOptions;
    relayOptions.startTimeoutMs = m_config.startTimeoutMs;
    relayOptions.discoveryTimeoutMs = m_config.discoveryTimeoutMs;
    relayOptions.callTimeoutMs = m_config.callTimeoutMs;
    m_relay = std::make_unique<toolhub::EphemeralRelay>(m_lifecycle.get(), relayOptions);

    toolhub::ToolAggregator::Options aggregatorOptions;
    aggregatorOptions.cacheTtlMs = m_config.toolCacheTtlMs;
    aggregatorOptions.discoveryAttempts = m_config.discoveryAttempts;
    m_aggregator = std::make_unique<toolhub::ToolAggregator>(m_lifecycle.get(), m_relay.get(),
                                                             aggregatorOptions);
    m_aggregator->setErrorHistory(m_lifecycle->errorHistory());

    // a restarted or stopped backend must be rediscovered
    connect(m_lifecycle.get(), &LifecycleManager::backendStarted, this,
            [this](const QString& id) { m_aggregator->invalidate(id); });
    connect(m_lifecycle.get(), &LifecycleManager::backendStopped, this,
            [this](const QString& id) { m_aggregator->invalidate(id); });

    error.clear();
    return true;
}

void ServerManager::shutdown() {
    if (m_shutdown || !m_lifecycle) {
        return;
    }
    m_shutdown = true;
    m_lifecycle->waitForInstalls();
    m_lifecycle->stopAll();
}

ServerManager::SystemHealth ServerManager::systemHealth() const {
    SystemHealth h;
    h.timestamp = QDateTime::currentDateTimeUtc();
    if (!m_lifecycle) {
        h.status = "healthy";
        return h;
    }

    for (const BackendView& v : m_lifecycle->list()) {
        const QString status = backendStateName(v.state);
        h.statusBreakdown[status]++;
        h.totalServers++;
        if (v.state == BackendState::Running) {
            h.runningServers++;
        } else if (v.state == BackendState::Failed) {
            h.errorServers++;
        }
    }

    if (h.totalServers > 0) {
        h.score = h.runningServers * 100 / h.totalServers;
    }

    h.status = "healthy";
    if (h.errorServers > 0) {
        h.status = "degraded";
    }
    if (h.runningServers == 0 && h.totalServers > 0) {
        h.status = "unhealthy";
    }
    return h;
}

} // namespace toolhub_server
