#pragma once

#include <QHttpServer>
#include <QObject>

namespace toolhub_server {

class ServerManager;

class ApiRouter : public QObject {
    Q_OBJECT
public:
    explicit ApiRouter(ServerManager* manager,
                       QObject* parent = nullptr);
    ~ApiRouter() override;

    void registerRoutes(QHttpServer& server);

private:
    QHttpServerResponse handleHealth(const QHttpServerRequest& req);
    QHttpServerResponse handleServerList(const QHttpServerRequest& req);
    QHttpServerResponse handleCategories(const QHttpServerRequest& req);
    QHttpServerResponse handleInstall(const QHttpServerRequest& req);
    QHttpServerResponse handleStart(const QString& id, const QHttpServerRequest& req);
    QHttpServerResponse handleStop(const QString& id, const QHttpServerRequest& req);
    QHttpServerResponse handleStatus(const QString& id, const QHttpServerRequest& req);
    QHttpServerResponse handleLogs(const QString& id, const QHttpServerRequest& req);
    QHttpServerResponse handleCredentials(const QString& id, const QHttpServerRequest& req);
    QHttpServerResponse handleDetails(const QString& id, const QHttpServerRequest& req);

    QHttpServerResponse handleValidateAll(const QHttpServerRequest& req);
    QHttpServerResponse handleValidateOne(const QString& id, const QHttpServerRequest& req);
    QHttpServerResponse handleAutoFix(const QString& id, const QHttpServerRequest& req);

    QHttpServerResponse handleToolDiagnostics(const QHttpServerRequest& req);
    QHttpServerResponse handleSystemHealth(const QHttpServerRequest& req);

    QHttpServerResponse handleAllErrors(const QHttpServerRequest& req);
    QHttpServerResponse handleServerErrors(const QString& id, const QHttpServerRequest& req);
    QHttpServerResponse handleClearErrors(const QString& id, const QHttpServerRequest& req);

    ServerManager* m_manager = nullptr;
};

} // namespace toolhub_server
