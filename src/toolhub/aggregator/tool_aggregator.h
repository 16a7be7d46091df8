#pragma once

#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QMap>
#include <QMutex>
#include <QString>

#include "tool_descriptor.h"
#include "toolhub/backend/backend_directory.h"
#include "toolhub/relay/tool_source.h"
#include "toolhub/toolhub_export.h"

namespace toolhub {

class ErrorHistory;

/**
 * One discovery finding, reset on every aggregation pass
 */
struct TOOLHUB_API ToolDiagnostic {
    QString serverId;
    QString type;
    QString description;
    QDateTime timestamp;
    QString severity;   // error | warning | info
    QString resolution;

    QJsonObject toJson() const;
};

/**
 * Merges the tools of every running backend into one list
 *
 * Backends are discovered concurrently, one worker thread each, and the results
 * are appended in directory order so that name routing stays deterministic.
 * A backend that fails discovery contributes nothing and leaves a diagnostic.
 */
class TOOLHUB_API ToolAggregator {
public:
    struct Options {
        int cacheTtlMs = 5 * 60 * 1000;
        int discoveryAttempts = 2;
        int retryBackoffMs = 1000;
    };

    ToolAggregator(const IBackendDirectory* directory, IToolSource* source);
    ToolAggregator(const IBackendDirectory* directory, IToolSource* source, const Options& options);

    ToolAggregator(const ToolAggregator&) = delete;
    ToolAggregator& operator=(const ToolAggregator&) = delete;

    /// Optional sink for tool_discovery_error records.
    void setErrorHistory(ErrorHistory* history) { m_errorHistory = history; }

    QList<ToolDescriptor> collectTools();

    /// Diagnostics of the most recent collectTools() pass.
    QList<ToolDiagnostic> diagnostics() const;
    QJsonArray diagnosticsJson() const;

    /// First tool named @p name in aggregation order.
    bool routeTool(const QString& name, ToolDescriptor& owner);

    bool callTool(const ToolDescriptor& owner,
                  const QJsonValue& arguments,
                  ToolCallResult& out,
                  QString& error);

    void invalidate(const QString& backendId = QString());

    const Options& options() const { return m_options; }

    static QString defaultCategory(const QString& backendId);

    /// Install path present and launch program resolvable.
    static bool preflight(const RunningBackend& backend, QString& error);

private:
    struct CacheEntry {
        QList<ToolDescriptor> tools;
        qint64 storedAtMs = 0;
    };

    bool cachedTools(const QString& backendId, QList<ToolDescriptor>& out);
    void storeTools(const QString& backendId, const QList<ToolDescriptor>& tools);
    void dropStaleCache(const QList<RunningBackend>& running);

    QList<ToolDescriptor> discoverBackend(const RunningBackend& backend);
    bool discoverWithRetry(const QString& backendId, QJsonArray& tools, QString& error);

    void addDiagnostic(const QString& serverId,
                       const QString& type,
                       const QString& description,
                       const QString& severity,
                       const QString& resolution = QString());

    const IBackendDirectory* m_directory = nullptr;
    IToolSource* m_source = nullptr;
    Options m_options;
    ErrorHistory* m_errorHistory = nullptr;

    mutable QMutex m_mutex;
    QMap<QString, CacheEntry> m_cache;
    QList<ToolDiagnostic> m_diagnostics;
};

} // namespace toolhub
