#include "rpc_serializer.h"

#include <QJsonDocument>
#include <QJsonParseError>

namespace toolhub {

bool parseRpcMessage(const QByteArray& line, RpcMessage& out, QString& error)
{
    QJsonParseError err{};
    const QJsonDocument doc = QJsonDocument::fromJson(line, &err);

    if (err.error != QJsonParseError::NoError) {
        error = err.errorString();
        return false;
    }
    if (!doc.isObject()) {
        error = "message must be a JSON object";
        return false;
    }

    out = RpcMessage();
    rpcMessageFromJson(doc.object(), out);
    error.clear();
    return true;
}

bool rpcMessageFromJson(const QJsonObject& obj, RpcMessage& out)
{
    if (obj.contains("id")) {
        out.id = obj.value("id");
    }
    out.method = obj.value("method").toString();
    if (obj.contains("params")) {
        out.params = obj.value("params");
    }
    if (obj.contains("result")) {
        out.result = obj.value("result");
    }
    if (obj.contains("error")) {
        out.error = obj.value("error");
    }
    return !out.method.isEmpty() || out.isResponse();
}

QJsonObject rpcMessageToJson(const RpcMessage& msg)
{
    QJsonObject obj;
    obj["jsonrpc"] = rpc::kVersion;
    if (msg.hasId()) {
        obj["id"] = msg.id;
    }
    if (!msg.method.isEmpty()) {
        obj["method"] = msg.method;
    }
    if (!msg.params.isUndefined()) {
        obj["params"] = msg.params;
    }
    // a response carries exactly one of result/error
    if (!msg.error.isUndefined()) {
        obj["error"] = msg.error;
    } else if (!msg.result.isUndefined()) {
        obj["result"] = msg.result;
    }
    return obj;
}

QByteArray serializeRpcMessage(const RpcMessage& msg)
{
    QByteArray data = QJsonDocument(rpcMessageToJson(msg)).toJson(QJsonDocument::Compact);
    data.append('\n');
    return data;
}

RpcMessage makeRpcRequest(const QJsonValue& id, const QString& method, const QJsonValue& params)
{
    RpcMessage msg;
    msg.id = id;
    msg.method = method;
    msg.params = params;
    return msg;
}

RpcMessage makeRpcNotification(const QString& method, const QJsonValue& params)
{
    RpcMessage msg;
    msg.method = method;
    msg.params = params;
    return msg;
}

RpcMessage makeRpcResult(const QJsonValue& id, const QJsonValue& result)
{
    RpcMessage msg;
    msg.id = id.isUndefined() ? QJsonValue(QJsonValue::Null) : id;
    msg.result = result;
    return msg;
}

RpcMessage makeRpcError(const QJsonValue& id, int code, const QString& message, const QJsonValue& data)
{
    QJsonObject err{{"code", code}, {"message", message}};
    if (!data.isUndefined()) {
        err["data"] = data;
    }

    RpcMessage msg;
    msg.id = id.isUndefined() ? QJsonValue(QJsonValue::Null) : id;
    msg.error = err;
    return msg;
}

} // namespace toolhub
