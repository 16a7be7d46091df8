#pragma once

#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

#include "backend_definition.h"
#include "toolhub/toolhub_export.h"

namespace toolhub {

/**
 * Immutable table of known backends
 * Built once at startup and handed to the components that need it; there is no
 * global instance. Order of definitions is preserved.
 */
class TOOLHUB_API BackendCatalog {
public:
    BackendCatalog() = default;
    explicit BackendCatalog(const QList<BackendDefinition>& definitions);

    static BackendCatalog builtin();

    /// Reads a JSON array of definitions. Returns an empty catalog and sets
    /// @p error on failure.
    static BackendCatalog loadFromFile(const QString& filePath, QString& error);

    bool contains(const QString& id) const;
    std::optional<BackendDefinition> find(const QString& id) const;
    const QList<BackendDefinition>& all() const { return m_definitions; }
    QStringList ids() const;
    int size() const { return static_cast<int>(m_definitions.size()); }
    bool isEmpty() const { return m_definitions.isEmpty(); }

private:
    QList<BackendDefinition> m_definitions;
};

} // namespace toolhub
