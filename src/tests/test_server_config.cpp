#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include "toolhub_server/config/server_args.h"
#include "toolhub_server/config/server_config.h"

using namespace toolhub_server;

namespace {

bool writeFile(const QString& path, const QByteArray& content) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(content) == content.size();
}

QString loadError(const QJsonObject& obj) {
    QTemporaryDir dir;
    if (!dir.isValid()) {
        return "tempdir";
    }
    const QString filePath = dir.path() + "/config.json";
    if (!writeFile(filePath, QJsonDocument(obj).toJson(QJsonDocument::Compact))) {
        return "write";
    }
    QString error;
    (void)ServerConfig::loadFromFile(filePath, error);
    return error;
}

} // namespace

TEST(ServerConfigTest, MissingFileUsesDefaults) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    QString error;
    const auto cfg = ServerConfig::loadFromFile(dir.path() + "/config.json", error);
    EXPECT_TRUE(error.isEmpty());
    EXPECT_EQ(cfg.port, 8080);
    EXPECT_EQ(cfg.host, "127.0.0.1");
    EXPECT_EQ(cfg.logLevel, "info");
    EXPECT_EQ(cfg.discoveryTimeoutMs, 45000);
    EXPECT_EQ(cfg.callTimeoutMs, 50000);
    EXPECT_EQ(cfg.toolCacheTtlMs, 300000);
    EXPECT_EQ(cfg.clientEntryName, "toolhub");
    EXPECT_TRUE(cfg.catalogFile.isEmpty());
}

TEST(ServerConfigTest, InvalidJsonReturnsError) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const QString filePath = dir.path() + "/config.json";
    ASSERT_TRUE(writeFile(filePath, "{bad json"));

    QString error;
    (void)ServerConfig::loadFromFile(filePath, error);
    EXPECT_FALSE(error.isEmpty());
}

TEST(ServerConfigTest, ReadsAllFields) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const QString filePath = dir.path() + "/config.json";
    const QJsonObject obj{
        {"port", 9100},
        {"catalogFile", "/etc/toolhub/catalog.json"},
        {"clientConfigPath", "/tmp/client.json"},
        {"clientEntryName", "hub"},
        {"discoveryTimeoutMs", 2000},
        {"callTimeoutMs", 3000},
        {"toolCacheTtlMs", 0},
        {"discoveryAttempts", 3},
    };
    ASSERT_TRUE(writeFile(filePath, QJsonDocument(obj).toJson()));

    QString error;
    const ServerConfig cfg = ServerConfig::loadFromFile(filePath, error);
    ASSERT_TRUE(error.isEmpty()) << error.toStdString();
    EXPECT_EQ(cfg.port, 9100);
    EXPECT_EQ(cfg.catalogFile, "/etc/toolhub/catalog.json");
    EXPECT_EQ(cfg.resolvedClientConfigPath(), "/tmp/client.json");
    EXPECT_EQ(cfg.clientEntryName, "hub");
    EXPECT_EQ(cfg.discoveryTimeoutMs, 2000);
    EXPECT_EQ(cfg.callTimeoutMs, 3000);
    EXPECT_EQ(cfg.toolCacheTtlMs, 0);
    EXPECT_EQ(cfg.discoveryAttempts, 3);
}

TEST(ServerConfigTest, RejectsBadFields) {
    EXPECT_FALSE(loadError(QJsonObject{{"nope", 1}}).isEmpty());
    EXPECT_FALSE(loadError(QJsonObject{{"port", "8080"}}).isEmpty());
    EXPECT_FALSE(loadError(QJsonObject{{"port", 0}}).isEmpty());
    EXPECT_FALSE(loadError(QJsonObject{{"discoveryAttempts", 0}}).isEmpty());
    EXPECT_FALSE(loadError(QJsonObject{{"logLevel", "trace"}}).isEmpty());
    EXPECT_FALSE(loadError(QJsonObject{{"clientEntryName", ""}}).isEmpty());
    EXPECT_FALSE(loadError(QJsonObject{{"callTimeoutMs", 1.5}}).isEmpty());
}

TEST(ServerConfigTest, EmptyClientPathFallsBackToDefault) {
    ServerConfig cfg;
    EXPECT_EQ(cfg.resolvedClientConfigPath(), ServerConfig::defaultClientConfigPath());
    EXPECT_TRUE(cfg.resolvedClientConfigPath().endsWith("/Claude/claude_desktop_config.json"));
}

TEST(ServerConfigTest, ApplyArgsOverridesOnlyExplicitFlags) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const QString filePath = dir.path() + "/config.json";
    const QJsonObject obj{{"port", 9001}, {"host", "0.0.0.0"}, {"logLevel", "warn"}};
    ASSERT_TRUE(writeFile(filePath, QJsonDocument(obj).toJson(QJsonDocument::Compact)));

    QString error;
    ServerConfig cfg = ServerConfig::loadFromFile(filePath, error);
    ASSERT_TRUE(error.isEmpty());

    cfg.applyArgs(ServerArgs::parse({"toolhub_server", "--data-root=/data"}));
    EXPECT_EQ(cfg.port, 9001);
    EXPECT_EQ(cfg.host, "0.0.0.0");
    EXPECT_EQ(cfg.logLevel, "warn");

    cfg.applyArgs(ServerArgs::parse({"toolhub_server", "--port=9100", "--log-level=debug",
                                     "--control-url=http://localhost:9"}));
    EXPECT_EQ(cfg.port, 9100);
    EXPECT_EQ(cfg.host, "0.0.0.0");
    EXPECT_EQ(cfg.logLevel, "debug");
    EXPECT_EQ(cfg.controlUrl, "http://localhost:9");
}
