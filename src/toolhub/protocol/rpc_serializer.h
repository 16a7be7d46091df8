#pragma once

#include <QByteArray>
#include <QJsonObject>

#include "rpc_types.h"
#include "toolhub/toolhub_export.h"

namespace toolhub {

/**
 * Parse one JSON-RPC message.
 * @param line   raw bytes of one message, trailing newline allowed
 * @param out    parsed message
 * @param error  parser diagnostic on failure
 * @return false if the bytes are not a JSON object
 */
TOOLHUB_API bool parseRpcMessage(const QByteArray& line, RpcMessage& out, QString& error);

TOOLHUB_API bool rpcMessageFromJson(const QJsonObject& obj, RpcMessage& out);

TOOLHUB_API QJsonObject rpcMessageToJson(const RpcMessage& msg);

/**
 * Compact JSON followed by a single '\n'.
 */
TOOLHUB_API QByteArray serializeRpcMessage(const RpcMessage& msg);

TOOLHUB_API RpcMessage makeRpcRequest(const QJsonValue& id,
                                      const QString& method,
                                      const QJsonValue& params = QJsonValue(QJsonValue::Undefined));

TOOLHUB_API RpcMessage makeRpcNotification(const QString& method,
                                           const QJsonValue& params = QJsonValue(QJsonValue::Undefined));

TOOLHUB_API RpcMessage makeRpcResult(const QJsonValue& id, const QJsonValue& result);

TOOLHUB_API RpcMessage makeRpcError(const QJsonValue& id,
                                    int code,
                                    const QString& message,
                                    const QJsonValue& data = QJsonValue(QJsonValue::Undefined));

} // namespace toolhub
