#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QProcess>
#include <QString>
#include <QStringList>

#include <memory>

#include "toolhub/backend/backend_definition.h"

namespace toolhub_server {

class BackendLogWriter;

enum class BackendState {
    NotInstalled,
    Installing,
    Installed,
    Running,
    Stopped,
    Failed
};

QString backendStateName(BackendState state);
bool parseBackendState(const QString& name, BackendState& out);

/**
 * Mutable registry entry for one installed backend
 * The process handle is owned by the entry while the backend runs and is never
 * persisted.
 */
struct BackendInstallation {
    QString id;
    QString installPath;
    BackendState state = BackendState::NotInstalled;
    toolhub::EnvMap env;
    QStringList logs;

    QDateTime installedAt;
    QDateTime updatedAt;
    QDateTime startedAt;

    QProcess* process = nullptr;
    qint64 pid = 0;
    std::unique_ptr<BackendLogWriter> logWriter;

    BackendInstallation();
    ~BackendInstallation();

    void appendLog(const QString& line);
    void touch() { updatedAt = QDateTime::currentDateTimeUtc(); }

    /// Persistable view: no handle, no env values.
    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject& obj, BackendInstallation& out, QString& error);

    static constexpr int kMaxLogLines = 200;
};

/**
 * Read-only view of a catalog entry merged with its installation, if any
 */
struct BackendView {
    toolhub::BackendDefinition definition;
    BackendState state = BackendState::NotInstalled;
    QString installPath;
    QStringList logs;
    QStringList envKeys;
    qint64 pid = 0;
    QDateTime installedAt;
    QDateTime startedAt;

    /// Control API shape; env values are never included.
    QJsonObject toJson() const;
};

} // namespace toolhub_server
