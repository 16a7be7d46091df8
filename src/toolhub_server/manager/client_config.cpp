#include "client_config.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>

namespace toolhub_server {

bool ClientConfig::load(const QString& path, QJsonObject& root, QString& error) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        error = "cannot open client config: " + path;
        return false;
    }

    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError) {
        error = "client config parse error: " + parseErr.errorString();
        return false;
    }
    if (!doc.isObject()) {
        error = "client config must contain a JSON object";
        return false;
    }
    root = doc.object();
    return true;
}

bool ClientConfig::save(const QString& path, const QJsonObject& root, QString& error) {
    const QString dir = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(dir)) {
        error = "cannot create directory: " + dir;
        return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        error = "cannot write client config: " + path;
        return false;
    }
    const QByteArray data = QJsonDocument(root).toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size() || !file.commit()) {
        error = "failed to save client config: " + file.errorString();
        return false;
    }
    return true;
}

bool ClientConfig::isUsableEntry(const QJsonObject& entry) {
    return !entry.value("command").toString().isEmpty()
           && entry.value("args").isArray()
           && !entry.value("args").toArray().isEmpty();
}

int ClientConfig::cleanup(QJsonObject& root) {
    QJsonObject servers = root.value(kServersKey).toObject();
    int dropped = 0;
    for (auto it = servers.begin(); it != servers.end();) {
        if (!isUsableEntry(it.value().toObject())) {
            qInfo("Client config: dropping unusable entry '%s'", qUtf8Printable(it.key()));
            it = servers.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    root[kServersKey] = servers;
    return dropped;
}

bool ClientConfig::findEntry(const QJsonObject& root, const QString& name, QJsonObject& entry) {
    const QJsonObject servers = root.value(kServersKey).toObject();
    if (!servers.contains(name)) {
        return false;
    }
    entry = servers.value(name).toObject();
    return true;
}

bool ClientConfig::upsertEntry(const QString& path,
                               const QString& name,
                               const QString& command,
                               const QStringList& args,
                               QString& error) {
    QJsonObject root;
    if (QFileInfo::exists(path) && !load(path, root, error)) {
        return false;
    }

    cleanup(root);
    QJsonObject servers = root.value(kServersKey).toObject();
    servers[name] = QJsonObject{
        {"command", command},
        {"args", QJsonArray::fromStringList(args)},
    };
    root[kServersKey] = servers;
    return save(path, root, error);
}

bool ClientConfig::patchCommand(const QString& path,
                                const QString& name,
                                const QString& command,
                                QString& error) {
    QJsonObject root;
    if (!load(path, root, error)) {
        return false;
    }

    QJsonObject servers = root.value(kServersKey).toObject();
    if (!servers.contains(name)) {
        error = QString("entry '%1' not found in client config").arg(name);
        return false;
    }
    QJsonObject entry = servers.value(name).toObject();
    entry["command"] = command;
    servers[name] = entry;
    root[kServersKey] = servers;
    return save(path, root, error);
}

} // namespace toolhub_server
