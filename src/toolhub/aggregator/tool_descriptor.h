#pragma once

#include <QJsonObject>
#include <QString>

#include "toolhub/toolhub_export.h"

namespace toolhub {

/**
 * One tool as seen by the downstream client
 * The raw object reported by the backend is kept so that full mode can return it
 * untouched.
 */
struct TOOLHUB_API ToolDescriptor {
    QString name;
    QString description;
    QJsonObject inputSchema;
    QString category;
    QString serverId;
    QString serverName;
    qint64 discoveredAt = 0;
    QJsonObject raw;

    /// Build from a backend's tools/list entry and tag it with its owner.
    static ToolDescriptor fromBackendJson(const QJsonObject& obj,
                                          const QString& serverId,
                                          const QString& serverName,
                                          const QString& defaultCategory,
                                          qint64 discoveredAt);

    /// Raw object plus category and owner tags.
    QJsonObject toJson() const;
};

} // namespace toolhub
