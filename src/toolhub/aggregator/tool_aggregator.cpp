#include "tool_aggregator.h"

#include <QDir>
#include <QFileInfo>
#include <QHash>
#include <QMutexLocker>
#include <QSet>
#include <QStandardPaths>
#include <QThread>

#include <memory>
#include <vector>

#include "toolhub/backend/backend_launch.h"
#include "toolhub/backend/env_file.h"
#include "toolhub/diagnostics/error_history.h"

namespace toolhub {

QJsonObject ToolDiagnostic::toJson() const {
    QJsonObject obj{
        {"server_id", serverId},
        {"type", type},
        {"description", description},
        {"timestamp", timestamp.toUTC().toString(Qt::ISODate)},
        {"severity", severity},
    };
    if (!resolution.isEmpty()) {
        obj["resolution"] = resolution;
    }
    return obj;
}

ToolAggregator::ToolAggregator(const IBackendDirectory* directory, IToolSource* source)
    : m_directory(directory)
    , m_source(source) {
}

ToolAggregator::ToolAggregator(const IBackendDirectory* directory,
                               IToolSource* source,
                               const Options& options)
    : m_directory(directory)
    , m_source(source)
    , m_options(options) {
}

QString ToolAggregator::defaultCategory(const QString& backendId) {
    static const QHash<QString, QString> kCategories{
        {"gohighlevel", "gohighlevel"},
        {"meta-ads", "meta-ads"},
        {"google-ads", "google-ads"},
        {"github", "development"},
        {"docker", "development"},
        {"puppeteer", "web_browser"},
        {"slack", "communication"},
        {"gmail", "email"},
        {"brave-search", "search"},
        {"notion", "productivity"},
        {"figma", "design"},
        {"google-maps", "maps"},
        {"stripe", "payments"},
    };
    return kCategories.value(backendId, backendId);
}

bool ToolAggregator::preflight(const RunningBackend& backend, QString& error) {
    if (backend.installPath.isEmpty() || !QDir(backend.installPath).exists()) {
        error = "install directory does not exist: " + backend.installPath;
        return false;
    }

    const LaunchSpec spec = buildLaunchSpec(backend.definition, backend.installPath, backend.env);
    QString resolved;
    if (QDir::isAbsolutePath(spec.program)) {
        resolved = QFileInfo(spec.program).isExecutable() ? spec.program : QString();
    } else if (spec.program.contains('/')) {
        const QString local = QDir(backend.installPath).filePath(spec.program);
        resolved = QFileInfo(local).isExecutable() ? local : QString();
    } else {
        resolved = QStandardPaths::findExecutable(spec.program);
    }

    if (resolved.isEmpty()) {
        error = QString("launch program '%1' not found").arg(spec.program);
        return false;
    }
    return true;
}

QList<ToolDescriptor> ToolAggregator::collectTools() {
    {
        QMutexLocker locker(&m_mutex);
        m_diagnostics.clear();
    }

    if (!m_directory || !m_source) {
        return {};
    }

    const QList<RunningBackend> running = m_directory->runningBackends();
    dropStaleCache(running);
    if (running.isEmpty()) {
        return {};
    }

    std::vector<QList<ToolDescriptor>> results(static_cast<size_t>(running.size()));
    std::vector<std::unique_ptr<QThread>> workers;
    workers.reserve(static_cast<size_t>(running.size()));

    for (int i = 0; i < running.size(); ++i) {
        const RunningBackend backend = running.at(i);
        QList<ToolDescriptor>* slot = &results[static_cast<size_t>(i)];
        std::unique_ptr<QThread> worker(QThread::create([this, backend, slot]() {
            *slot = discoverBackend(backend);
        }));
        worker->setObjectName("discover-" + backend.definition.id);
        worker->start();
        workers.push_back(std::move(worker));
    }

    for (auto& worker : workers) {
        worker->wait();
    }

    QList<ToolDescriptor> merged;
    for (const auto& tools : results) {
        merged.append(tools);
    }
    qDebug("Aggregator: %lld tools from %lld running backends",
           static_cast<long long>(merged.size()), static_cast<long long>(running.size()));
    return merged;
}

QList<ToolDescriptor> ToolAggregator::discoverBackend(const RunningBackend& backend) {
    const QString id = backend.definition.id;

    QList<ToolDescriptor> cached;
    if (cachedTools(id, cached)) {
        return cached;
    }

    QString error;
    if (!preflight(backend, error)) {
        addDiagnostic(id, "preflight_failed", error, "error",
                      "Reinstall the backend or check that its runtime is on PATH");
        return {};
    }

    if (!backend.definition.requiredEnv.isEmpty()
        && !QFileInfo::exists(EnvFile::pathFor(backend.installPath))) {
        addDiagnostic(id, "missing_env_file",
                      "No .env file found; the backend may be missing configuration",
                      "warning", "Configure the backend credentials and reinstall");
    }

    QJsonArray raw;
    if (!discoverWithRetry(id, raw, error)) {
        addDiagnostic(id, "tool_discovery_failed",
                      "Failed to discover tools: " + error, "error",
                      "Check backend logs, verify credentials and ensure dependencies are installed");
        if (m_errorHistory) {
            ErrorReporter reporter(id, "tool discovery");
            m_errorHistory->add(id, reporter.toolDiscoveryError(error));
        }
        return {};
    }

    const qint64 now = QDateTime::currentSecsSinceEpoch();
    const QString category = defaultCategory(id);
    QList<ToolDescriptor> tools;
    for (const QJsonValue& value : raw) {
        if (!value.isObject()) {
            continue;
        }
        ToolDescriptor tool = ToolDescriptor::fromBackendJson(
            value.toObject(), id, backend.definition.name, category, now);
        if (tool.name.isEmpty()) {
            continue;
        }
        tools.append(tool);
    }

    storeTools(id, tools);
    return tools;
}

bool ToolAggregator::discoverWithRetry(const QString& backendId, QJsonArray& tools, QString& error) {
    const int attempts = qMax(1, m_options.discoveryAttempts);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        QString attemptError;
        if (m_source->discover(backendId, tools, attemptError)) {
            if (attempt > 1) {
                addDiagnostic(backendId, "retry_success",
                              QString("Tool discovery succeeded on attempt %1").arg(attempt),
                              "info");
            }
            error.clear();
            return true;
        }

        error = attemptError;
        if (attempt < attempts) {
            const int backoff = m_options.retryBackoffMs * attempt;
            addDiagnostic(backendId, "retry_attempt",
                          QString("Retry %1/%2 after %3 ms: %4")
                              .arg(attempt)
                              .arg(attempts)
                              .arg(backoff)
                              .arg(attemptError),
                          "warning");
            if (backoff > 0) {
                QThread::msleep(static_cast<unsigned long>(backoff));
            }
        }
    }
    error = QString("failed after %1 attempts: %2").arg(attempts).arg(error);
    return false;
}

bool ToolAggregator::cachedTools(const QString& backendId, QList<ToolDescriptor>& out) {
    QMutexLocker locker(&m_mutex);
    auto it = m_cache.constFind(backendId);
    if (it == m_cache.constEnd()) {
        return false;
    }
    const qint64 age = QDateTime::currentMSecsSinceEpoch() - it->storedAtMs;
    if (age >= m_options.cacheTtlMs) {
        m_cache.remove(backendId);
        return false;
    }
    out = it->tools;
    return true;
}

void ToolAggregator::storeTools(const QString& backendId, const QList<ToolDescriptor>& tools) {
    if (m_options.cacheTtlMs <= 0) {
        return;
    }
    QMutexLocker locker(&m_mutex);
    m_cache.insert(backendId, CacheEntry{tools, QDateTime::currentMSecsSinceEpoch()});
}

void ToolAggregator::dropStaleCache(const QList<RunningBackend>& running) {
    QSet<QString> live;
    for (const RunningBackend& backend : running) {
        live.insert(backend.definition.id);
    }

    QMutexLocker locker(&m_mutex);
    for (auto it = m_cache.begin(); it != m_cache.end();) {
        if (!live.contains(it.key())) {
            it = m_cache.erase(it);
        } else {
            ++it;
        }
    }
}

void ToolAggregator::invalidate(const QString& backendId) {
    QMutexLocker locker(&m_mutex);
    if (backendId.isEmpty()) {
        m_cache.clear();
    } else {
        m_cache.remove(backendId);
    }
}

void ToolAggregator::addDiagnostic(const QString& serverId,
                                   const QString& type,
                                   const QString& description,
                                   const QString& severity,
                                   const QString& resolution) {
    ToolDiagnostic diag;
    diag.serverId = serverId;
    diag.type = type;
    diag.description = description;
    diag.timestamp = QDateTime::currentDateTimeUtc();
    diag.severity = severity;
    diag.resolution = resolution;

    if (severity == "error") {
        qWarning("Aggregator: %s %s: %s", qUtf8Printable(serverId), qUtf8Printable(type),
                 qUtf8Printable(description));
    }

    QMutexLocker locker(&m_mutex);
    m_diagnostics.append(diag);
}

QList<ToolDiagnostic> ToolAggregator::diagnostics() const {
    QMutexLocker locker(&m_mutex);
    return m_diagnostics;
}

QJsonArray ToolAggregator::diagnosticsJson() const {
    QJsonArray arr;
    for (const ToolDiagnostic& diag : diagnostics()) {
        arr.append(diag.toJson());
    }
    return arr;
}

bool ToolAggregator::routeTool(const QString& name, ToolDescriptor& owner) {
    const QList<ToolDescriptor> tools = collectTools();
    for (const ToolDescriptor& tool : tools) {
        if (tool.name == name) {
            owner = tool;
            return true;
        }
    }
    return false;
}

bool ToolAggregator::callTool(const ToolDescriptor& owner,
                              const QJsonValue& arguments,
                              ToolCallResult& out,
                              QString& error) {
    if (!m_source) {
        error = "no tool source";
        return false;
    }
    return m_source->call(owner.serverId, owner.name, arguments, out, error);
}

} // namespace toolhub
