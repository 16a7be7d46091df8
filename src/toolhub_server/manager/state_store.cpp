#include "state_store.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>

namespace toolhub_server {

StateStore::StateStore(const QString& filePath)
    : m_filePath(filePath) {
}

bool StateStore::exists() const {
    return QFileInfo::exists(m_filePath);
}

bool StateStore::load(QJsonObject& snapshot, QString& error) const {
    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        error = "cannot open state file: " + m_filePath;
        return false;
    }

    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError) {
        error = "state file parse error: " + parseErr.errorString();
        return false;
    }
    if (!doc.isObject()) {
        error = "state file must contain a JSON object";
        return false;
    }
    snapshot = doc.object();
    return true;
}

bool StateStore::save(const QJsonObject& snapshot, QString& error) const {
    if (!QDir().mkpath(QFileInfo(m_filePath).absolutePath())) {
        error = "cannot create directory for " + m_filePath;
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        error = "cannot write state file: " + m_filePath;
        return false;
    }
    const QByteArray data = QJsonDocument(snapshot).toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size() || !file.commit()) {
        error = "failed to save state file: " + file.errorString();
        return false;
    }
    return true;
}

} // namespace toolhub_server
