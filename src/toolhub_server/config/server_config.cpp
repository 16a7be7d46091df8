#include "server_config.h"

#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSet>
#include <QStandardPaths>

namespace toolhub_server {

namespace {

bool isValidLogLevel(const QString& level) {
    return level == "debug" || level == "info" || level == "warn" || level == "error";
}

bool readInt(const QJsonObject& obj, const QString& key, qint64 minValue, qint64 maxValue,
             qint64& out, QString& error) {
    if (!obj.contains(key)) {
        return true;
    }
    const QJsonValue v = obj.value(key);
    if (!v.isDouble() || v.toDouble() != static_cast<double>(v.toInteger())) {
        error = QString("config field '%1' must be an integer").arg(key);
        return false;
    }
    const qint64 value = v.toInteger();
    if (value < minValue || value > maxValue) {
        error = QString("config field '%1' out of range").arg(key);
        return false;
    }
    out = value;
    return true;
}

bool readString(const QJsonObject& obj, const QString& key, bool allowEmpty,
                QString& out, QString& error) {
    if (!obj.contains(key)) {
        return true;
    }
    if (!obj.value(key).isString()) {
        error = QString("config field '%1' must be a string").arg(key);
        return false;
    }
    const QString value = obj.value(key).toString();
    if (!allowEmpty && value.isEmpty()) {
        error = QString("config field '%1' cannot be empty").arg(key);
        return false;
    }
    out = value;
    return true;
}

} // namespace

QString ServerConfig::defaultClientConfigPath() {
    return QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)
           + "/Claude/claude_desktop_config.json";
}

QString ServerConfig::resolvedClientConfigPath() const {
    return clientConfigPath.isEmpty() ? defaultClientConfigPath() : clientConfigPath;
}

ServerConfig ServerConfig::loadFromFile(const QString& filePath, QString& error) {
    ServerConfig cfg;

    if (!QFileInfo::exists(filePath)) {
        error.clear();
        return cfg;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        error = "cannot open config file: " + filePath;
        return cfg;
    }

    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError) {
        error = "config.json parse error: " + parseErr.errorString();
        return cfg;
    }
    if (!doc.isObject()) {
        error = "config.json must contain a JSON object";
        return cfg;
    }

    const QJsonObject obj = doc.object();
    static const QSet<QString> known = {
        "port", "host", "logLevel", "logMaxBytes", "logMaxFiles",
        "catalogFile", "clientConfigPath", "clientEntryName", "controlUrl",
        "discoveryTimeoutMs", "callTimeoutMs", "startTimeoutMs",
        "toolCacheTtlMs", "discoveryAttempts",
    };
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!known.contains(it.key())) {
            error = "unknown field in config.json: " + it.key();
            return cfg;
        }
    }

    qint64 port = cfg.port;
    qint64 logMaxBytes = cfg.logMaxBytes;
    qint64 logMaxFiles = cfg.logMaxFiles;
    qint64 discoveryTimeout = cfg.discoveryTimeoutMs;
    qint64 callTimeout = cfg.callTimeoutMs;
    qint64 startTimeout = cfg.startTimeoutMs;
    qint64 cacheTtl = cfg.toolCacheTtlMs;
    qint64 attempts = cfg.discoveryAttempts;
    constexpr qint64 kMaxMs = 24LL * 3600 * 1000;

    if (!readInt(obj, "port", 1, 65535, port, error)
        || !readString(obj, "host", false, cfg.host, error)
        || !readString(obj, "logLevel", false, cfg.logLevel, error)
        || !readInt(obj, "logMaxBytes", 1024, 1LL << 40, logMaxBytes, error)
        || !readInt(obj, "logMaxFiles", 1, 100, logMaxFiles, error)
        || !readString(obj, "catalogFile", true, cfg.catalogFile, error)
        || !readString(obj, "clientConfigPath", true, cfg.clientConfigPath, error)
        || !readString(obj, "clientEntryName", false, cfg.clientEntryName, error)
        || !readString(obj, "controlUrl", true, cfg.controlUrl, error)
        || !readInt(obj, "discoveryTimeoutMs", 100, kMaxMs, discoveryTimeout, error)
        || !readInt(obj, "callTimeoutMs", 100, kMaxMs, callTimeout, error)
        || !readInt(obj, "startTimeoutMs", 100, kMaxMs, startTimeout, error)
        || !readInt(obj, "toolCacheTtlMs", 0, kMaxMs, cacheTtl, error)
        || !readInt(obj, "discoveryAttempts", 1, 10, attempts, error)) {
        return cfg;
    }

    if (!isValidLogLevel(cfg.logLevel)) {
        error = "invalid config logLevel: " + cfg.logLevel;
        return cfg;
    }

    cfg.port = static_cast<int>(port);
    cfg.logMaxBytes = logMaxBytes;
    cfg.logMaxFiles = static_cast<int>(logMaxFiles);
    cfg.discoveryTimeoutMs = static_cast<int>(discoveryTimeout);
    cfg.callTimeoutMs = static_cast<int>(callTimeout);
    cfg.startTimeoutMs = static_cast<int>(startTimeout);
    cfg.toolCacheTtlMs = static_cast<int>(cacheTtl);
    cfg.discoveryAttempts = static_cast<int>(attempts);

    error.clear();
    return cfg;
}

void ServerConfig::applyArgs(const ServerArgs& args) {
    if (args.hasPort) {
        port = args.port;
    }
    if (args.hasHost) {
        host = args.host;
    }
    if (args.hasLogLevel) {
        logLevel = args.logLevel;
    }
    if (args.hasControlUrl) {
        controlUrl = args.controlUrl;
    }
}

} // namespace toolhub_server
