#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QString>

#include "tool_descriptor.h"
#include "toolhub/toolhub_export.h"

namespace toolhub {

/**
 * Context budgeting over the aggregated tool list
 *
 * Everything here is a pure function over value lists so the budget rules can be
 * exercised without any backend.
 */

enum class ShapeMode {
    Full,
    Simplified,
    UltraMinimal
};

TOOLHUB_API QString shapeModeName(ShapeMode mode);

/// ultra_minimal wins over simplified.
TOOLHUB_API ShapeMode shapeModeFor(bool simplified, bool ultraMinimal);

/// Exact category match AND case-insensitive substring on the name.
TOOLHUB_API QList<ToolDescriptor> filterTools(const QList<ToolDescriptor>& tools,
                                              const QString& category = QString(),
                                              const QString& namePattern = QString());

TOOLHUB_API int contextTierCap(int totalFiltered);
TOOLHUB_API int adjustLimitForContext(int requested, int totalFiltered);

TOOLHUB_API QList<ToolDescriptor> paginateTools(const QList<ToolDescriptor>& tools,
                                                int limit,
                                                int offset);

TOOLHUB_API QJsonObject simplifySchema(const QJsonObject& schema);
TOOLHUB_API QJsonObject shapeTool(const ToolDescriptor& tool, ShapeMode mode);
TOOLHUB_API QJsonArray shapeTools(const QList<ToolDescriptor>& tools, ShapeMode mode);

struct TOOLHUB_API ToolListQuery {
    static constexpr int kDefaultLimit = 25;

    int limit = kDefaultLimit;
    int offset = 0;
    QString category;
    QString namePattern;
    bool simplified = true;
    bool ultraMinimal = false;

    static ToolListQuery fromParams(const QJsonObject& params);
};

struct TOOLHUB_API ToolPage {
    QJsonArray tools;
    QJsonObject meta;
};

/// Filter, budget, paginate and shape in one pass; meta describes what was done.
TOOLHUB_API ToolPage queryTools(const QList<ToolDescriptor>& tools, const ToolListQuery& query);

struct CategoryCount {
    QString name;
    int count = 0;
};

/// Tools per category sorted by name; empty categories count as "uncategorized".
TOOLHUB_API QList<CategoryCount> countCategories(const QList<ToolDescriptor>& tools);

} // namespace toolhub
