#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include "toolhub/toolhub_export.h"

namespace toolhub {

namespace rpc {

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

constexpr const char* kVersion = "2.0";
constexpr const char* kProtocolVersion = "2024-11-05";

} // namespace rpc

/**
 * JSON-RPC 2.0 message, used for both directions.
 * An absent id is kept as QJsonValue::Undefined so that a literal null id
 * still counts as present.
 */
struct TOOLHUB_API RpcMessage {
    QJsonValue id = QJsonValue(QJsonValue::Undefined);
    QString method;
    QJsonValue params = QJsonValue(QJsonValue::Undefined);
    QJsonValue result = QJsonValue(QJsonValue::Undefined);
    QJsonValue error = QJsonValue(QJsonValue::Undefined);

    bool hasId() const { return !id.isUndefined(); }
    bool isRequest() const { return !method.isEmpty() && hasId(); }
    bool isNotification() const { return !method.isEmpty() && !hasId(); }
    bool isResponse() const { return method.isEmpty() && (!result.isUndefined() || !error.isUndefined()); }

    QJsonObject paramsObject() const { return params.toObject(); }
};

} // namespace toolhub
