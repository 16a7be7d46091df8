#include "backend_definition.h"

#include <QJsonArray>
#include <QVariant>

namespace toolhub {

namespace {

QStringList toStringList(const QJsonValue& value) {
    QStringList out;
    for (const QJsonValue& v : value.toArray()) {
        out.append(v.toString());
    }
    return out;
}

} // namespace

QString runtimeKindName(RuntimeKind kind) {
    switch (kind) {
    case RuntimeKind::NodeJs:
        return "nodejs";
    case RuntimeKind::Python:
        return "python";
    }
    return "nodejs";
}

bool parseRuntimeKind(const QString& name, RuntimeKind& out) {
    if (name == "nodejs") {
        out = RuntimeKind::NodeJs;
        return true;
    }
    if (name == "python") {
        out = RuntimeKind::Python;
        return true;
    }
    return false;
}

QJsonObject envMapToJson(const EnvMap& env) {
    QJsonObject obj;
    for (auto it = env.constBegin(); it != env.constEnd(); ++it) {
        obj[it.key()] = it.value();
    }
    return obj;
}

EnvMap envMapFromJson(const QJsonObject& obj) {
    EnvMap env;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        env.insert(it.key(), it.value().toVariant().toString());
    }
    return env;
}

BackendDefinition BackendDefinition::fromJson(const QJsonObject& obj, QString& error) {
    BackendDefinition def;

    if (!obj.value("id").isString() || obj.value("id").toString().isEmpty()) {
        error = "backend definition requires a non-empty 'id'";
        return def;
    }
    def.id = obj.value("id").toString();

    if (!obj.value("command").isString() || obj.value("command").toString().isEmpty()) {
        error = "backend '" + def.id + "' requires a non-empty 'command'";
        return def;
    }
    def.command = obj.value("command").toString();

    const QString runtime = obj.value("server_type").toString("nodejs");
    if (!parseRuntimeKind(runtime, def.runtime)) {
        error = "backend '" + def.id + "' has unknown server_type: " + runtime;
        return def;
    }

    if (obj.contains("args") && !obj.value("args").isArray()) {
        error = "backend '" + def.id + "' field 'args' must be an array";
        return def;
    }

    def.name = obj.value("name").toString(def.id);
    def.description = obj.value("description").toString();
    def.repoUrl = obj.value("repo_url").toString();
    def.subPath = obj.value("sub_path").toString();
    def.args = toStringList(obj.value("args"));
    def.env = envMapFromJson(obj.value("env").toObject());
    def.port = obj.value("port").toInt(0);
    def.category = obj.value("category").toString();
    def.toolsCount = obj.value("tools_count").toInt(0);
    def.requiredEnv = toStringList(obj.value("required_env"));
    def.defaultConfig = envMapFromJson(obj.value("default_config").toObject());

    error.clear();
    return def;
}

QJsonObject BackendDefinition::toJson() const {
    QJsonObject obj;
    obj["id"] = id;
    obj["name"] = name;
    obj["description"] = description;
    obj["repo_url"] = repoUrl;
    obj["sub_path"] = subPath;
    obj["server_type"] = runtimeKindName(runtime);
    obj["command"] = command;
    obj["args"] = QJsonArray::fromStringList(args);
    obj["env"] = envMapToJson(env);
    obj["port"] = port;
    obj["category"] = category;
    obj["tools_count"] = toolsCount;
    obj["required_env"] = QJsonArray::fromStringList(requiredEnv);
    if (!defaultConfig.isEmpty()) {
        obj["default_config"] = envMapToJson(defaultConfig);
    }
    return obj;
}

} // namespace toolhub
