#pragma once

#include <QString>

namespace toolhub_server {

/**
 * Routes Qt message macros into spdlog
 * Console output goes to stderr only; stdout carries the JSON-RPC stream in
 * stdio mode.
 */
class ServerLogger {
public:
    struct Config {
        QString logLevel = "info";
        QString logDir;
        qint64 maxFileBytes = 10 * 1024 * 1024;
        int maxFiles = 3;
    };

    static bool init(const Config& config, QString& error);
    static void shutdown();

    static constexpr const char* kLogFileName = "toolhub.log";

private:
    ServerLogger() = delete;
};

} // namespace toolhub_server
