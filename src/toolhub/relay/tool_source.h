#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

namespace toolhub {

/**
 * Outcome of one tools/call against a backend
 * backendError is non-empty when the backend answered with a JSON-RPC error.
 */
struct ToolCallResult {
    QJsonValue result;
    QJsonObject backendError;

    bool isBackendError() const { return !backendError.isEmpty(); }
};

/**
 * Narrow seam between the aggregator and whatever talks to backends
 */
class IToolSource {
public:
    virtual ~IToolSource() = default;

    /**
     * List the tools of a running backend
     * @return false on spawn failure, timeout or an unusable answer
     */
    virtual bool discover(const QString& backendId, QJsonArray& tools, QString& error) = 0;

    virtual bool call(const QString& backendId,
                      const QString& toolName,
                      const QJsonValue& arguments,
                      ToolCallResult& out,
                      QString& error) = 0;
};

} // namespace toolhub
