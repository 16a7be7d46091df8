#include "backend_installation.h"

#include <QJsonArray>

#include "manager/backend_log_writer.h"

namespace toolhub_server {

QString backendStateName(BackendState state) {
    switch (state) {
    case BackendState::NotInstalled:
        return "not_installed";
    case BackendState::Installing:
        return "installing";
    case BackendState::Installed:
        return "installed";
    case BackendState::Running:
        return "running";
    case BackendState::Stopped:
        return "stopped";
    case BackendState::Failed:
        return "failed";
    }
    return "not_installed";
}

bool parseBackendState(const QString& name, BackendState& out) {
    static const BackendState kAll[] = {
        BackendState::NotInstalled, BackendState::Installing, BackendState::Installed,
        BackendState::Running,      BackendState::Stopped,    BackendState::Failed,
    };
    for (BackendState state : kAll) {
        if (backendStateName(state) == name) {
            out = state;
            return true;
        }
    }
    return false;
}

BackendInstallation::BackendInstallation() = default;
BackendInstallation::~BackendInstallation() = default;

void BackendInstallation::appendLog(const QString& line) {
    logs.append(QString("[%1] %2")
                    .arg(QDateTime::currentDateTimeUtc().toString(Qt::ISODate), line));
    while (logs.size() > kMaxLogLines) {
        logs.removeFirst();
    }
    touch();
}

QJsonObject BackendInstallation::toJson() const {
    QJsonObject obj;
    obj["id"] = id;
    obj["install_path"] = installPath;
    obj["status"] = backendStateName(state);
    obj["logs"] = QJsonArray::fromStringList(logs);
    if (installedAt.isValid()) {
        obj["installed_at"] = installedAt.toString(Qt::ISODate);
    }
    if (updatedAt.isValid()) {
        obj["updated_at"] = updatedAt.toString(Qt::ISODate);
    }
    if (startedAt.isValid()) {
        obj["started_at"] = startedAt.toString(Qt::ISODate);
    }
    return obj;
}

bool BackendInstallation::fromJson(const QJsonObject& obj, BackendInstallation& out, QString& error) {
    out.id = obj.value("id").toString();
    out.installPath = obj.value("install_path").toString();
    if (out.id.isEmpty() || out.installPath.isEmpty()) {
        error = "snapshot entry requires id and install_path";
        return false;
    }

    const QString status = obj.value("status").toString("installed");
    if (!parseBackendState(status, out.state)) {
        error = "unknown status in snapshot: " + status;
        return false;
    }

    out.logs.clear();
    for (const QJsonValue& v : obj.value("logs").toArray()) {
        out.logs.append(v.toString());
    }
    while (out.logs.size() > kMaxLogLines) {
        out.logs.removeFirst();
    }

    out.installedAt = QDateTime::fromString(obj.value("installed_at").toString(), Qt::ISODate);
    out.updatedAt = QDateTime::fromString(obj.value("updated_at").toString(), Qt::ISODate);
    out.startedAt = QDateTime::fromString(obj.value("started_at").toString(), Qt::ISODate);
    return true;
}

QJsonObject BackendView::toJson() const {
    QJsonObject obj;
    obj["id"] = definition.id;
    obj["name"] = definition.name;
    obj["description"] = definition.description;
    obj["repo_url"] = definition.repoUrl;
    obj["install_path"] = installPath;
    obj["command"] = definition.command;
    obj["args"] = QJsonArray::fromStringList(definition.args);
    obj["port"] = definition.port;
    obj["status"] = backendStateName(state);
    obj["logs"] = QJsonArray::fromStringList(logs);
    obj["server_type"] = toolhub::runtimeKindName(definition.runtime);
    obj["category"] = definition.category;
    obj["tools_count"] = definition.toolsCount;
    obj["sub_path"] = definition.subPath;
    obj["required_env"] = QJsonArray::fromStringList(definition.requiredEnv);
    obj["env_keys"] = QJsonArray::fromStringList(envKeys);
    if (state == BackendState::Running && pid > 0) {
        obj["pid"] = pid;
    }
    if (installedAt.isValid()) {
        obj["installed_at"] = installedAt.toString(Qt::ISODate);
    }
    if (startedAt.isValid() && state == BackendState::Running) {
        obj["started_at"] = startedAt.toString(Qt::ISODate);
    }
    return obj;
}

} // namespace toolhub_server
