#include "tool_query.h"

#include <QMap>

#include <algorithm>
#include <limits>

namespace toolhub {

QString shapeModeName(ShapeMode mode) {
    switch (mode) {
    case ShapeMode::Full:
        return "full";
    case ShapeMode::Simplified:
        return "simplified";
    case ShapeMode::UltraMinimal:
        return "ultra_minimal";
    }
    return "simplified";
}

ShapeMode shapeModeFor(bool simplified, bool ultraMinimal) {
    if (ultraMinimal) {
        return ShapeMode::UltraMinimal;
    }
    return simplified ? ShapeMode::Simplified : ShapeMode::Full;
}

QList<ToolDescriptor> filterTools(const QList<ToolDescriptor>& tools,
                                  const QString& category,
                                  const QString& namePattern) {
    if (category.isEmpty() && namePattern.isEmpty()) {
        return tools;
    }

    QList<ToolDescriptor> out;
    for (const ToolDescriptor& tool : tools) {
        if (!category.isEmpty() && tool.category != category) {
            continue;
        }
        if (!namePattern.isEmpty() && !tool.name.contains(namePattern, Qt::CaseInsensitive)) {
            continue;
        }
        out.append(tool);
    }
    return out;
}

int contextTierCap(int totalFiltered) {
    if (totalFiltered > 200) {
        return 20;
    }
    if (totalFiltered > 100) {
        return 30;
    }
    if (totalFiltered > 50) {
        return 40;
    }
    return 50;
}

int adjustLimitForContext(int requested, int totalFiltered) {
    return std::min(std::max(requested, 0), contextTierCap(totalFiltered));
}

QList<ToolDescriptor> paginateTools(const QList<ToolDescriptor>& tools, int limit, int offset) {
    limit = std::max(limit, 0);
    offset = std::max(offset, 0);
    const int size = static_cast<int>(tools.size());
    if (offset >= size || limit == 0) {
        return {};
    }
    return tools.mid(offset, std::min(limit, size - offset));
}

QJsonObject simplifySchema(const QJsonObject& schema) {
    QJsonObject properties;
    const QJsonObject source = schema.value("properties").toObject();
    for (auto it = source.constBegin(); it != source.constEnd(); ++it) {
        const QJsonObject prop = it.value().toObject();
        QJsonObject slim;
        if (prop.contains("type")) {
            slim["type"] = prop.value("type");
        }
        if (prop.contains("description")) {
            slim["description"] = prop.value("description");
        }
        properties[it.key()] = slim;
    }
    return QJsonObject{{"type", "object"}, {"properties", properties}};
}

QJsonObject shapeTool(const ToolDescriptor& tool, ShapeMode mode) {
    if (mode == ShapeMode::Full) {
        return tool.toJson();
    }

    QJsonObject obj;
    obj["name"] = tool.name;
    obj["description"] = tool.description;
    obj["category"] = tool.category;
    obj["_server_id"] = tool.serverId;
    if (mode == ShapeMode::Simplified) {
        obj["inputSchema"] = simplifySchema(tool.inputSchema);
    }
    return obj;
}

QJsonArray shapeTools(const QList<ToolDescriptor>& tools, ShapeMode mode) {
    QJsonArray arr;
    for (const ToolDescriptor& tool : tools) {
        arr.append(shapeTool(tool, mode));
    }
    return arr;
}

namespace {

// JSON numbers may be fractional or beyond int; clamp before truncating.
int clampedCount(const QJsonValue& v) {
    const double d = std::clamp(v.toDouble(), 0.0,
                                static_cast<double>(std::numeric_limits<int>::max()));
    return static_cast<int>(d);
}

} // namespace

ToolListQuery ToolListQuery::fromParams(const QJsonObject& params) {
    ToolListQuery q;
    if (params.value("limit").isDouble()) {
        q.limit = clampedCount(params.value("limit"));
    }
    if (params.value("offset").isDouble()) {
        q.offset = clampedCount(params.value("offset"));
    }
    q.category = params.value("category").toString();
    q.namePattern = params.value("name_pattern").toString();
    if (params.value("simplified").isBool()) {
        q.simplified = params.value("simplified").toBool();
    }
    if (params.value("ultra_minimal").isBool()) {
        q.ultraMinimal = params.value("ultra_minimal").toBool();
    }
    return q;
}

ToolPage queryTools(const QList<ToolDescriptor>& tools, const ToolListQuery& query) {
    const QList<ToolDescriptor> filtered = filterTools(tools, query.category, query.namePattern);
    const int total = static_cast<int>(filtered.size());
    const int requested = std::max(query.limit, 0);
    const int offset = std::max(query.offset, 0);
    const int adjusted = adjustLimitForContext(requested, total);

    const QList<ToolDescriptor> page = paginateTools(filtered, adjusted, offset);

    ToolPage out;
    out.tools = shapeTools(page, shapeModeFor(query.simplified, query.ultraMinimal));
    out.meta = QJsonObject{
        {"total_count", total},
        {"returned_count", static_cast<int>(page.size())},
        {"requested_limit", requested},
        {"adjusted_limit", adjusted},
        {"offset", offset},
        {"simplified", query.simplified},
        {"ultra_minimal", query.ultraMinimal},
        {"has_more", offset < total - adjusted},
        {"context_optimized", adjusted != requested},
    };
    return out;
}

QList<CategoryCount> countCategories(const QList<ToolDescriptor>& tools) {
    QMap<QString, int> counts;
    for (const ToolDescriptor& tool : tools) {
        const QString name = tool.category.isEmpty() ? QStringLiteral("uncategorized")
                                                     : tool.category;
        counts[name] += 1;
    }

    QList<CategoryCount> out;
    for (auto it = counts.constBegin(); it != counts.constEnd(); ++it) {
        out.append(CategoryCount{it.key(), it.value()});
    }
    return out;
}

} // namespace toolhub
