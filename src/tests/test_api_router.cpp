#include <gtest/gtest.h>

#include <QCoreApplication>
#include <QDir>
#include <QEventLoop>
#include <QFile>
#include <QFileInfo>
#include <QHttpServer>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTcpServer>
#include <QTemporaryDir>
#include <QTimer>
#include <QUrl>

#include <memory>

#include "toolhub_server/http/api_router.h"
#include "toolhub_server/server_manager.h"

using namespace toolhub_server;

namespace {

QString exeSuffix() {
#ifdef Q_OS_WIN
    return ".exe";
#else
    return QString();
#endif
}

QString testBinaryPath(const QString& baseName) {
    return QCoreApplication::applicationDirPath() + "/" + baseName + exeSuffix();
}

bool writeJson(const QString& path, const QJsonDocument& doc) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    const QByteArray data = doc.toJson();
    return file.write(data) == data.size();
}

bool sendRequest(const QString& method, const QUrl& url, const QByteArray& body, int& statusCode,
                 QByteArray& responseBody, QString& error) {
    QNetworkAccessManager manager;
    QNetworkRequest req(url);
    req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");

    QNetworkReply* reply = nullptr;
    if (method == "GET") {
        reply = manager.get(req);
    } else if (method == "POST") {
        reply = manager.post(req, body);
    } else if (method == "DELETE") {
        reply = manager.sendCustomRequest(req, "DELETE", body);
    } else {
        error = "unsupported method";
        return false;
    }

    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    // start and validation can spawn processes, so allow more than a plain GET
    timeout.start(10000);
    loop.exec();
    if (!timeout.isActive()) {
        reply->abort();
        error = "request timeout";
        reply->deleteLater();
        return false;
    }
    timeout.stop();

    statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    responseBody = reply->readAll();
    if (reply->error() != QNetworkReply::NoError && statusCode == 0) {
        error = reply->errorString();
        reply->deleteLater();
        return false;
    }

    reply->deleteLater();
    error.clear();
    return true;
}

QJsonObject parseJsonObject(const QByteArray& data) {
    return QJsonDocument::fromJson(data).object();
}

class ApiRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(m_tmp.isValid());
        m_root = m_tmp.path();
        ASSERT_TRUE(QDir().mkpath(m_root + "/backends"));
        ASSERT_TRUE(QDir().mkpath(m_root + "/logs"));

        const QString stub = testBinaryPath("test_backend_stub");
        ASSERT_TRUE(QFileInfo::exists(stub));

        const QJsonArray catalog{
            QJsonObject{{"id", "alpha"},
                        {"name", "Alpha"},
                        {"command", stub},
                        {"repo_url", "https://example.invalid/alpha.git"},
                        {"category", "development"},
                        {"tools_count", 4},
                        {"port", 8100},
                        {"required_env", QJsonArray{"ALPHA_KEY"}}},
            QJsonObject{{"id", "beta"},
                        {"name", "Beta"},
                        {"command", stub},
                        {"category", "crm"},
                        {"tools_count", 7},
                        {"default_config", QJsonObject{{"BETA_KEY", "preset"}}},
                        {"required_env", QJsonArray{"BETA_KEY"}}},
        };
        ASSERT_TRUE(writeJson(m_root + "/catalog.json", QJsonDocument(catalog)));

        m_config.catalogFile = m_root + "/catalog.json";
        m_config.clientConfigPath = m_root + "/client/claude_desktop_config.json";
        m_config.discoveryTimeoutMs = 5000;
    }

    void TearDown() override {
        m_httpServer.reset();
        if (m_manager) {
            m_manager->shutdown();
        }
    }

    /// Make "alpha" look installed on disk so that detection picks it up.
    void seedAlphaInstall(const QString& key) {
        const QString dir = m_root + "/backends/alpha";
        ASSERT_TRUE(QDir().mkpath(dir + "/node_modules"));
        QFile pkg(dir + "/package.json");
        ASSERT_TRUE(pkg.open(QIODevice::WriteOnly));
        pkg.close();
        QFile env(dir + "/.env");
        ASSERT_TRUE(env.open(QIODevice::WriteOnly));
        env.write("ALPHA_KEY=" + key.toUtf8() + "\n");
        env.close();
    }

    void startServer() {
        m_manager = std::make_unique<ServerManager>(m_root, m_config);
        QString error;
        ASSERT_TRUE(m_manager->initialize(error)) << error.toStdString();

        m_httpServer = std::make_unique<QHttpServer>();
        m_router = std::make_unique<ApiRouter>(m_manager.get());
        m_router->registerRoutes(*m_httpServer);

        auto* tcpServer = new QTcpServer(m_httpServer.get());
        if (!tcpServer->listen(QHostAddress::AnyIPv4, 0)) {
            GTEST_SKIP() << "Cannot listen on a local port";
        }
        if (!m_httpServer->bind(tcpServer)) {
            GTEST_SKIP() << "Cannot bind HTTP server";
        }
        m_port = tcpServer->serverPort();
    }

    QUrl url(const QString& path) const {
        return QUrl(QString("http://127.0.0.1:%1%2").arg(m_port).arg(path));
    }

    QJsonObject call(const QString& method, const QString& path, int expectedStatus,
                     const QByteArray& body = QByteArray()) {
        int status = 0;
        QByteArray response;
        QString error;
        EXPECT_TRUE(sendRequest(method, url(path), body, status, response, error))
            << error.toStdString();
        EXPECT_EQ(status, expectedStatus) << method.toStdString() << " " << path.toStdString()
                                          << ": " << response.toStdString();
        return parseJsonObject(response);
    }

    QTemporaryDir m_tmp;
    QString m_root;
    ServerConfig m_config;
    std::unique_ptr<ServerManager> m_manager;
    std::unique_ptr<QHttpServer> m_httpServer;
    std::unique_ptr<ApiRouter> m_router;
    quint16 m_port = 0;
};

} // namespace

TEST_F(ApiRouterTest, HealthAndServerList) {
    startServer();
    EXPECT_EQ(call("GET", "/health", 200).value("status").toString(), "ok");

    const QJsonArray servers = call("GET", "/api/servers", 200).value("servers").toArray();
    ASSERT_EQ(servers.size(), 2);
    const QJsonObject alpha = servers.at(0).toObject();
    EXPECT_EQ(alpha.value("id").toString(), "alpha");
    EXPECT_EQ(alpha.value("status").toString(), "not_installed");
    EXPECT_EQ(alpha.value("tools_count").toInt(), 4);
    EXPECT_FALSE(alpha.contains("pid"));
}

TEST_F(ApiRouterTest, Categories) {
    startServer();
    const QJsonArray categories = call("GET", "/api/categories", 200).value("categories").toArray();
    ASSERT_EQ(categories.size(), 2);
    QStringList ids;
    for (const QJsonValue& v : categories) {
        ids.append(v.toObject().value("id").toString());
        if (v.toObject().value("id").toString() == "crm") {
            EXPECT_EQ(v.toObject().value("tools_count").toInt(), 7);
            EXPECT_EQ(v.toObject().value("server_count").toInt(), 1);
        }
    }
    EXPECT_TRUE(ids.contains("development"));
    EXPECT_TRUE(ids.contains("crm"));
}

TEST_F(ApiRouterTest, CategoriesOutsideTheTableAreListedById) {
    const QJsonArray catalog{
        QJsonObject{{"id", "finder"}, {"command", "finder"}, {"category", "search"},
                    {"tools_count", 2}},
        QJsonObject{{"id", "loose"}, {"command", "loose"}, {"tools_count", 1}},
        QJsonObject{{"id", "crm-one"}, {"command", "crm"}, {"category", "crm"}},
    };
    ASSERT_TRUE(writeJson(m_root + "/catalog.json", QJsonDocument(catalog)));
    startServer();

    const QJsonArray categories = call("GET", "/api/categories", 200).value("categories").toArray();
    ASSERT_EQ(categories.size(), 3);
    EXPECT_EQ(categories.at(0).toObject().value("id").toString(), "crm");

    const QJsonObject search = categories.at(1).toObject();
    EXPECT_EQ(search.value("id").toString(), "search");
    EXPECT_EQ(search.value("name").toString(), "search");
    EXPECT_EQ(search.value("server_count").toInt(), 1);
    EXPECT_EQ(search.value("tools_count").toInt(), 2);

    EXPECT_EQ(categories.at(2).toObject().value("id").toString(), "uncategorized");
}

TEST_F(ApiRouterTest, InstallRequestValidation) {
    startServer();
    call("POST", "/api/servers/install", 400, "{not json");
    call("POST", "/api/servers/install", 400, R"({"config":{}})");
    call("POST", "/api/servers/install", 404, R"({"server_id":"missing"})");
    call("POST", "/api/servers/install", 400, R"({"server_id":"alpha","config":[]})");
    call("POST", "/api/servers/install", 400,
         R"({"server_id":"alpha","config":{"ALPHA_KEY":5}})");

    const QJsonObject missing =
        call("POST", "/api/servers/install", 400, R"({"server_id":"alpha","config":{}})");
    EXPECT_EQ(missing.value("error").toString(), "ALPHA_KEY is required for Alpha");
}

TEST_F(ApiRouterTest, Credentials) {
    startServer();
    const QJsonObject alpha = call("GET", "/api/servers/alpha/credentials", 200);
    EXPECT_EQ(alpha.value("server_id").toString(), "alpha");
    EXPECT_TRUE(alpha.value("requires_credentials").toBool());
    EXPECT_EQ(alpha.value("required_credentials").toArray().first().toString(), "ALPHA_KEY");
    call("GET", "/api/servers/nope/credentials", 404);
}

TEST_F(ApiRouterTest, StartStopLifecycle) {
    seedAlphaInstall("k");
    startServer();

    EXPECT_EQ(call("GET", "/api/servers/alpha/status", 200).value("status").toString(),
              "installed");
    call("POST", "/api/servers/nope/start", 404);
    call("POST", "/api/servers/beta/start", 500);

    EXPECT_EQ(call("POST", "/api/servers/alpha/start", 200).value("message").toString(),
              "Server started");
    // the missing client config was created by auto-fix on the way
    EXPECT_TRUE(QFileInfo::exists(m_config.clientConfigPath));

    const QJsonObject status = call("GET", "/api/servers/alpha/status", 200);
    EXPECT_EQ(status.value("status").toString(), "running");
    EXPECT_EQ(status.value("port").toInt(), 8100);

    call("POST", "/api/servers/alpha/start", 409);
    call("POST", "/api/servers/install", 409,
         R"({"server_id":"alpha","config":{"ALPHA_KEY":"x"}})");

    const QJsonObject health = call("GET", "/api/system/health", 200).value("health").toObject();
    EXPECT_EQ(health.value("running_servers").toInt(), 1);
    EXPECT_EQ(health.value("total_servers").toInt(), 2);
    EXPECT_EQ(health.value("score").toInt(), 50);
    EXPECT_EQ(health.value("status").toString(), "healthy");

    EXPECT_EQ(call("POST", "/api/servers/alpha/stop", 200).value("message").toString(),
              "Server stopped");
    EXPECT_EQ(call("GET", "/api/servers/alpha/status", 200).value("status").toString(),
              "stopped");

    const QJsonArray logs = call("GET", "/api/servers/alpha/logs?limit=1", 200)
                                .value("logs").toArray();
    ASSERT_EQ(logs.size(), 1);
    EXPECT_EQ(logs.first().toString(), "Stopped");

    call("POST", "/api/servers/beta/stop", 200);
    call("POST", "/api/servers/nope/stop", 404);
}

TEST_F(ApiRouterTest, StartupFailureIsRecorded) {
    seedAlphaInstall("");
    startServer();

    call("POST", "/api/servers/alpha/start", 500);

    const QJsonObject errors = call("GET", "/api/errors/servers/alpha", 200);
    EXPECT_EQ(errors.value("server_id").toString(), "alpha");
    EXPECT_EQ(errors.value("count").toInt(), 1);
    EXPECT_EQ(errors.value("errors").toArray().first().toObject().value("type").toString(),
              "startup_error");

    const QJsonObject all = call("GET", "/api/errors/servers", 200);
    EXPECT_EQ(all.value("total_count").toInt(), 1);
    EXPECT_TRUE(all.value("errors").toObject().contains("alpha"));

    const QJsonObject details = call("GET", "/api/servers/alpha/details", 200);
    EXPECT_EQ(details.value("error_count").toInt(), 1);
    EXPECT_FALSE(details.value("validation").toObject().value("is_valid").toBool());

    EXPECT_EQ(call("DELETE", "/api/errors/servers/alpha", 200).value("message").toString(),
              "Errors cleared successfully");
    EXPECT_EQ(call("GET", "/api/errors/servers/alpha", 200).value("count").toInt(), 0);
}

TEST_F(ApiRouterTest, Validation) {
    seedAlphaInstall("k");
    startServer();

    const QJsonObject all = call("GET", "/api/validation/servers", 200);
    EXPECT_EQ(all.value("summary").toObject().value("total").toInt(), 1);
    ASSERT_EQ(all.value("results").toArray().size(), 1);

    const QJsonObject one = call("GET", "/api/validation/servers/alpha", 200);
    EXPECT_EQ(one.value("server_id").toString(), "alpha");
    EXPECT_FALSE(one.value("is_valid").toBool());

    call("GET", "/api/validation/servers/beta", 404);
    call("GET", "/api/validation/servers/nope", 404);
    call("POST", "/api/validation/servers/beta/autofix", 404);

    const QJsonObject fixed = call("POST", "/api/validation/servers/alpha/autofix", 200);
    EXPECT_TRUE(fixed.value("success").toBool());
    EXPECT_TRUE(fixed.value("validation").toObject().value("is_valid").toBool());
}

TEST_F(ApiRouterTest, DiagnosticsAndDetailsForUninstalled) {
    startServer();
    EXPECT_TRUE(call("GET", "/api/diagnostics/tools", 200).value("diagnostics").isArray());

    const QJsonObject details = call("GET", "/api/servers/beta/details", 200);
    EXPECT_TRUE(details.value("validation").isNull());
    EXPECT_EQ(details.value("server").toObject().value("status").toString(), "not_installed");
    call("GET", "/api/servers/nope/details", 404);
}
