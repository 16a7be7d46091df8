#pragma once

#include <QJsonObject>
#include <QString>
#include <QUrl>

#include "toolhub/backend/backend_catalog.h"
#include "toolhub/backend/backend_directory.h"

namespace toolhub_server {

/**
 * Running set taken from a separate daemon's control API
 *
 * Each query issues GET /api/servers and keeps the entries whose status is
 * running. Definitions come from the local catalog; env values never cross the
 * wire and are read from the install directory's .env instead. Safe to call
 * from any thread that can run a QEventLoop.
 */
class RemoteBackendDirectory : public toolhub::IBackendDirectory {
public:
    RemoteBackendDirectory(const QUrl& controlUrl,
                           const toolhub::BackendCatalog& catalog,
                           int timeoutMs = kDefaultTimeoutMs);

    QList<toolhub::RunningBackend> runningBackends() const override;
    bool findRunning(const QString& backendId, toolhub::RunningBackend& out) const override;

    /// Turn a /api/servers body into running backends, ordered by id.
    QList<toolhub::RunningBackend> parseServerList(const QJsonObject& body) const;

    static constexpr int kDefaultTimeoutMs = 5000;

private:
    bool fetchServerList(QJsonObject& body, QString& error) const;

    QUrl m_controlUrl;
    toolhub::BackendCatalog m_catalog;
    int m_timeoutMs;
};

} // namespace toolhub_server
