#include "remote_backend_directory.h"

#include <QEventLoop>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

#include <algorithm>

#include "toolhub/backend/env_file.h"

using toolhub::RunningBackend;

namespace toolhub_server {

RemoteBackendDirectory::RemoteBackendDirectory(const QUrl& controlUrl,
                                               const toolhub::BackendCatalog& catalog,
                                               int timeoutMs)
    : m_controlUrl(controlUrl)
    , m_catalog(catalog)
    , m_timeoutMs(timeoutMs) {
}

bool RemoteBackendDirectory::fetchServerList(QJsonObject& body, QString& error) const {
    QUrl url = m_controlUrl;
    QString path = url.path();
    if (path.endsWith('/')) {
        path.chop(1);
    }
    url.setPath(path + "/api/servers");

    QNetworkAccessManager manager;
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    QNetworkReply* reply = manager.get(request);

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timer.start(m_timeoutMs);
    loop.exec();

    bool ok = false;
    if (!timer.isActive()) {
        reply->abort();
        error = "control API request timed out: " + url.toString();
    } else if (reply->error() != QNetworkReply::NoError) {
        timer.stop();
        error = QString("control API request failed: %1").arg(reply->errorString());
    } else {
        timer.stop();
        QJsonParseError parseErr;
        const QJsonDocument doc = QJsonDocument::fromJson(reply->readAll(), &parseErr);
        if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
            error = "control API returned invalid JSON";
        } else {
            body = doc.object();
            ok = true;
        }
    }

    reply->deleteLater();
    return ok;
}

QList<RunningBackend> RemoteBackendDirectory::parseServerList(const QJsonObject& body) const {
    QList<RunningBackend> out;
    for (const QJsonValue& value : body.value("servers").toArray()) {
        const QJsonObject entry = value.toObject();
        if (entry.value("status").toString() != "running") {
            continue;
        }

        const QString id = entry.value("id").toString();
        const auto def = m_catalog.find(id);
        if (!def) {
            qWarning("Control API reports unknown backend %s", qUtf8Printable(id));
            continue;
        }

        RunningBackend backend;
        backend.definition = *def;
        backend.installPath = entry.value("install_path").toString();

        const QString envPath = toolhub::EnvFile::pathFor(backend.installPath);
        if (QFileInfo::exists(envPath)) {
            QString error;
            if (!toolhub::EnvFile::read(envPath, backend.env, error)) {
                qWarning("%s", qUtf8Printable(error));
            }
        }
        out.append(backend);
    }

    std::sort(out.begin(), out.end(), [](const RunningBackend& a, const RunningBackend& b) {
        return a.definition.id < b.definition.id;
    });
    return out;
}

QList<RunningBackend> RemoteBackendDirectory::runningBackends() const {
    QJsonObject body;
    QString error;
    if (!fetchServerList(body, error)) {
        qWarning("%s", qUtf8Printable(error));
        return {};
    }
    return parseServerList(body);
}

bool RemoteBackendDirectory::findRunning(const QString& backendId, RunningBackend& out) const {
    for (const RunningBackend& backend : runningBackends()) {
        if (backend.definition.id == backendId) {
            out = backend;
            return true;
        }
    }
    return false;
}

} // namespace toolhub_server
