#pragma once

#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QStringList>

#include "toolhub/toolhub_export.h"

namespace toolhub {

using EnvMap = QMap<QString, QString>;

enum class RuntimeKind {
    NodeJs,
    Python
};

TOOLHUB_API QString runtimeKindName(RuntimeKind kind);
TOOLHUB_API bool parseRuntimeKind(const QString& name, RuntimeKind& out);

/**
 * Immutable catalog row describing one installable backend
 */
struct TOOLHUB_API BackendDefinition {
    QString id;
    QString name;
    QString description;
    QString repoUrl;
    QString subPath;
    RuntimeKind runtime = RuntimeKind::NodeJs;
    QString command;
    QStringList args;
    EnvMap env;
    int port = 0;
    QString category;
    int toolsCount = 0;
    QStringList requiredEnv;
    EnvMap defaultConfig;

    bool isValid() const { return !id.isEmpty() && !command.isEmpty(); }

    /// Accepts the keys written by toJson(); unknown keys are ignored so that
    /// control API entries can be read back.
    static BackendDefinition fromJson(const QJsonObject& obj, QString& error);
    QJsonObject toJson() const;
};

TOOLHUB_API QJsonObject envMapToJson(const EnvMap& env);
TOOLHUB_API EnvMap envMapFromJson(const QJsonObject& obj);

} // namespace toolhub
