#pragma once

#include <QHttpServerResponse>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUrlQuery>

namespace toolhub_server {

inline QHttpServerResponse jsonResponse(
    const QJsonObject& obj,
    QHttpServerResponse::StatusCode code = QHttpServerResponse::StatusCode::Ok) {
    return QHttpServerResponse(
        "application/json",
        QJsonDocument(obj).toJson(QJsonDocument::Compact),
        code);
}

inline QHttpServerResponse errorResponse(QHttpServerResponse::StatusCode code,
                                         const QString& message) {
    return jsonResponse(QJsonObject{{"error", message}}, code);
}

inline QHttpServerResponse messageResponse(const QString& message) {
    return jsonResponse(QJsonObject{{"message", message}});
}

/// Integer query item, or @p fallback when absent or not a number.
inline int queryInt(const QUrlQuery& query, const QString& key, int fallback) {
    bool ok = false;
    const int value = query.queryItemValue(key).toInt(&ok);
    return ok ? value : fallback;
}

} // namespace toolhub_server
