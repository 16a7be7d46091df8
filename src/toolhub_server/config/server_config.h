#pragma once

#include <QString>

#include "server_args.h"

namespace toolhub_server {

struct ServerConfig {
    int port = 8080;
    QString host = "127.0.0.1";
    QString logLevel = "info";
    qint64 logMaxBytes = 10 * 1024 * 1024;  // 10MB
    int logMaxFiles = 3;

    QString catalogFile;
    QString clientConfigPath;               // empty means the desktop client default
    QString clientEntryName = "toolhub";
    QString controlUrl;

    int discoveryTimeoutMs = 45000;
    int callTimeoutMs = 50000;
    int startTimeoutMs = 15000;
    int toolCacheTtlMs = 5 * 60 * 1000;
    int discoveryAttempts = 2;

    static ServerConfig loadFromFile(const QString& filePath, QString& error);
    void applyArgs(const ServerArgs& args);

    /// <GenericConfigLocation>/Claude/claude_desktop_config.json
    static QString defaultClientConfigPath();
    QString resolvedClientConfigPath() const;
};

} // namespace toolhub_server
