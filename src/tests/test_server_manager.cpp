#include <gtest/gtest.h>

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include "toolhub_server/server_manager.h"

using namespace toolhub_server;

namespace {

bool writeCatalog(const QString& path, const QJsonArray& entries) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    const QByteArray data = QJsonDocument(entries).toJson();
    return file.write(data) == data.size();
}

QJsonObject entry(const QString& id) {
    return QJsonObject{{"id", id}, {"command", QCoreApplication::applicationFilePath()}};
}

} // namespace

TEST(ServerManagerTest, MissingDataRootFails) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());

    ServerManager manager(tmp.path() + "/absent", ServerConfig());
    QString error;
    EXPECT_FALSE(manager.initialize(error));
    EXPECT_TRUE(error.contains("data root does not exist"));
}

TEST(ServerManagerTest, BrokenCatalogFileFails) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());

    ServerConfig cfg;
    cfg.catalogFile = tmp.path() + "/missing.json";
    ServerManager manager(tmp.path(), cfg);
    QString error;
    EXPECT_FALSE(manager.initialize(error));
    EXPECT_FALSE(error.isEmpty());
}

TEST(ServerManagerTest, BuiltinCatalogIsUsedByDefault) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());

    ServerConfig cfg;
    cfg.clientConfigPath = tmp.path() + "/client.json";
    ServerManager manager(tmp.path(), cfg);
    QString error;
    ASSERT_TRUE(manager.initialize(error)) << error.toStdString();

    EXPECT_TRUE(manager.catalog().contains("gohighlevel"));
    ASSERT_NE(manager.lifecycle(), nullptr);
    ASSERT_NE(manager.aggregator(), nullptr);
    EXPECT_EQ(manager.lifecycle()->list().size(), manager.catalog().size());
}

TEST(ServerManagerTest, HealthOfIdleFleet) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    ASSERT_TRUE(writeCatalog(tmp.path() + "/catalog.json", QJsonArray{entry("a"), entry("b")}));

    ServerConfig cfg;
    cfg.catalogFile = tmp.path() + "/catalog.json";
    cfg.clientConfigPath = tmp.path() + "/client.json";
    ServerManager manager(tmp.path(), cfg);
    QString error;
    ASSERT_TRUE(manager.initialize(error)) << error.toStdString();

    const QJsonObject health = manager.systemHealth().toJson();
    EXPECT_EQ(health.value("status").toString(), "unhealthy");
    EXPECT_EQ(health.value("score").toInt(), 0);
    EXPECT_EQ(health.value("total_servers").toInt(), 2);
    EXPECT_EQ(health.value("running_servers").toInt(), 0);
    EXPECT_EQ(health.value("status_breakdown").toObject().value("not_installed").toInt(), 2);
    EXPECT_FALSE(health.value("timestamp").toString().isEmpty());
}

TEST(ServerManagerTest, EmptyCatalogIsHealthy) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    ASSERT_TRUE(writeCatalog(tmp.path() + "/catalog.json", QJsonArray()));

    ServerConfig cfg;
    cfg.catalogFile = tmp.path() + "/catalog.json";
    cfg.clientConfigPath = tmp.path() + "/client.json";
    ServerManager manager(tmp.path(), cfg);
    QString error;
    ASSERT_TRUE(manager.initialize(error)) << error.toStdString();

    const ServerManager::SystemHealth health = manager.systemHealth();
    EXPECT_EQ(health.status, "healthy");
    EXPECT_EQ(health.score, 100);
    EXPECT_EQ(health.totalServers, 0);
}

TEST(ServerManagerTest, ClientTargetPointsAtThisExecutable) {
    ServerConfig cfg;
    cfg.clientConfigPath = "/tmp/toolhub-client.json";
    cfg.clientEntryName = "hub";

    const ClientConfigTarget target = ServerManager::clientTarget(cfg);
    EXPECT_EQ(target.path, "/tmp/toolhub-client.json");
    EXPECT_EQ(target.entryName, "hub");
    EXPECT_EQ(target.selfPath, QCoreApplication::applicationFilePath());
    EXPECT_EQ(target.args, QStringList{"--stdio"});
}
