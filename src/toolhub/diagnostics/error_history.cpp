#include "error_history.h"

#include <QMutexLocker>

namespace toolhub {

ErrorHistory::ErrorHistory(int capacity)
    : m_capacity(capacity > 0 ? capacity : kDefaultCapacity) {
}

void ErrorHistory::add(const QString& backendId, const EnhancedError& error) {
    QMutexLocker locker(&m_mutex);
    QList<EnhancedError>& list = m_errors[backendId];
    list.append(error);
    while (list.size() > m_capacity) {
        list.removeFirst();
    }
}

QList<EnhancedError> ErrorHistory::errors(const QString& backendId) const {
    QMutexLocker locker(&m_mutex);
    return m_errors.value(backendId);
}

QMap<QString, QList<EnhancedError>> ErrorHistory::all() const {
    QMutexLocker locker(&m_mutex);
    return m_errors;
}

void ErrorHistory::clear(const QString& backendId) {
    QMutexLocker locker(&m_mutex);
    m_errors.remove(backendId);
}

} // namespace toolhub
