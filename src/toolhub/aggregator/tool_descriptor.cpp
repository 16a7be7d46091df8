#include "tool_descriptor.h"

namespace toolhub {

ToolDescriptor ToolDescriptor::fromBackendJson(const QJsonObject& obj,
                                               const QString& serverId,
                                               const QString& serverName,
                                               const QString& defaultCategory,
                                               qint64 discoveredAt) {
    ToolDescriptor tool;
    tool.raw = obj;
    tool.name = obj.value("name").toString();
    tool.description = obj.value("description").toString();
    tool.inputSchema = obj.value("inputSchema").toObject();
    tool.category = obj.value("category").toString();
    if (tool.category.isEmpty()) {
        tool.category = defaultCategory;
    }
    tool.serverId = serverId;
    tool.serverName = serverName;
    tool.discoveredAt = discoveredAt;
    return tool;
}

QJsonObject ToolDescriptor::toJson() const {
    QJsonObject obj = raw;
    obj["name"] = name;
    if (!description.isEmpty() || obj.contains("description")) {
        obj["description"] = description;
    }
    if (!category.isEmpty()) {
        obj["category"] = category;
    }
    obj["_server_id"] = serverId;
    obj["_server_name"] = serverName;
    obj["_discovered_at"] = discoveredAt;
    return obj;
}

} // namespace toolhub
