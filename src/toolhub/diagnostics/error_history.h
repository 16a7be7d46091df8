#pragma once

#include <QList>
#include <QMap>
#include <QMutex>
#include <QString>

#include "enhanced_error.h"
#include "toolhub/toolhub_export.h"

namespace toolhub {

/**
 * Per-backend ring buffer of the most recent failures
 * Thread-safe; installs record from worker threads.
 */
class TOOLHUB_API ErrorHistory {
public:
    explicit ErrorHistory(int capacity = kDefaultCapacity);

    void add(const QString& backendId, const EnhancedError& error);
    QList<EnhancedError> errors(const QString& backendId) const;
    QMap<QString, QList<EnhancedError>> all() const;
    void clear(const QString& backendId);
    int capacity() const { return m_capacity; }

    static constexpr int kDefaultCapacity = 10;

private:
    int m_capacity;
    mutable QMutex m_mutex;
    QMap<QString, QList<EnhancedError>> m_errors;
};

} // namespace toolhub
