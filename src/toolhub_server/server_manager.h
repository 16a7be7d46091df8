#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QMap>
#include <QObject>
#include <QString>

#include <memory>

#include "config/server_config.h"
#include "manager/command_runner.h"
#include "manager/lifecycle_manager.h"
#include "toolhub/aggregator/tool_aggregator.h"
#include "toolhub/backend/backend_catalog.h"
#include "toolhub/relay/ephemeral_relay.h"

namespace toolhub_server {

/**
 * Owns every long-lived component of the daemon
 *
 * Construction order is catalog, command runner, lifecycle manager, relay,
 * aggregator. The relay and the aggregator read the running set from the
 * lifecycle manager.
 */
class ServerManager : public QObject {
    Q_OBJECT
public:
    struct SystemHealth {
        QString status;             // healthy | degraded | unhealthy
        int score = 100;
        int totalServers = 0;
        int runningServers = 0;
        int errorServers = 0;
        QMap<QString, int> statusBreakdown;
        QDateTime timestamp;

        QJsonObject toJson() const;
    };

    ServerManager(const QString& dataRoot,
                  const ServerConfig& config,
                  QObject* parent = nullptr);
    ~ServerManager() override;

    /// Load the catalog and the saved registry. Must be called once before use.
    bool initialize(QString& error);
    void shutdown();

    LifecycleManager* lifecycle() { return m_lifecycle.get(); }
    toolhub::ToolAggregator* aggregator() { return m_aggregator.get(); }
    const toolhub::BackendCatalog& catalog() const { return m_catalog; }

    SystemHealth systemHealth() const;

    QString dataRoot() const { return m_dataRoot; }
    const ServerConfig& config() const { return m_config; }

    /// Client registration derived from the config; selfPath is this executable.
    static ClientConfigTarget clientTarget(const ServerConfig& config);

private:
    QString m_dataRoot;
    ServerConfig m_config;
    toolhub::BackendCatalog m_catalog;

    std::unique_ptr<ProcessCommandRunner> m_runner;
    std::unique_ptr<LifecycleManager> m_lifecycle;
    std::unique_ptr<toolhub::EphemeralRelay> m_relay;
    std::unique_ptr<toolhub::ToolAggregator> m_aggregator;
    bool m_shutdown = false;
};

} // namespace toolhub_server
