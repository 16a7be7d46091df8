#include "stdio_gateway.h"

#include <QFile>
#include <QJsonArray>
#include <QMutexLocker>
#include <QTextStream>

#include "toolhub/aggregator/tool_aggregator.h"
#include "toolhub/aggregator/tool_query.h"
#include "toolhub/protocol/rpc_serializer.h"

#ifdef Q_OS_WIN
#include <windows.h>
#endif

namespace toolhub {

StdioGateway::StdioGateway(ToolAggregator* aggregator,
                           const QString& serverName,
                           const QString& serverVersion)
    : m_aggregator(aggregator)
    , m_serverName(serverName)
    , m_serverVersion(serverVersion) {
}

bool StdioGateway::handleLine(const QByteArray& line, QByteArray& response) {
    if (line.trimmed().isEmpty()) {
        return false;
    }

    RpcMessage request;
    QString parseErr;
    if (!parseRpcMessage(line, request, parseErr)) {
        qWarning("Gateway: parse error: %s", qUtf8Printable(parseErr));
        response = serializeRpcMessage(
            makeRpcError(QJsonValue::Null, rpc::kParseError, "Parse error: " + parseErr));
        return true;
    }

    if (request.method.startsWith("notifications/") || !request.hasId()) {
        qDebug("Gateway: notification %s", qUtf8Printable(request.method));
        return false;
    }

    response = serializeRpcMessage(dispatch(request));
    return true;
}

RpcMessage StdioGateway::dispatch(const RpcMessage& request) {
    const QString& method = request.method;
    const QJsonObject params = request.paramsObject();

    if (method.isEmpty()) {
        return makeRpcError(request.id, rpc::kInvalidRequest, "Invalid request: missing method");
    }
    if (method == "initialize") {
        return makeRpcResult(request.id, handleInitialize());
    }
    if (method == "tools/list") {
        return makeRpcResult(request.id, handleToolsList(params));
    }
    if (method == "tools/categories") {
        return makeRpcResult(request.id, handleCategories());
    }
    if (method == "tools/call") {
        return handleToolsCall(request.id, params);
    }
    if (method == "resources/list") {
        return makeRpcResult(request.id, QJsonObject{{"resources", QJsonArray{}}});
    }
    if (method == "prompts/list") {
        return makeRpcResult(request.id, QJsonObject{{"prompts", QJsonArray{}}});
    }

    qDebug("Gateway: unknown method %s", qUtf8Printable(method));
    return makeRpcError(request.id, rpc::kMethodNotFound, "Unknown method: " + method);
}

QJsonObject StdioGateway::handleInitialize() const {
    return QJsonObject{
        {"protocolVersion", rpc::kProtocolVersion},
        {"capabilities", QJsonObject{{"tools", QJsonObject{}}}},
        {"serverInfo", QJsonObject{{"name", m_serverName}, {"version", m_serverVersion}}},
    };
}

QJsonObject StdioGateway::handleToolsList(const QJsonObject& params) {
    const ToolListQuery query = ToolListQuery::fromParams(params);
    QList<ToolDescriptor> tools;
    QJsonArray diagnostics;
    if (m_aggregator) {
        tools = m_aggregator->collectTools();
        diagnostics = m_aggregator->diagnosticsJson();
    }

    const ToolPage page = queryTools(tools, query);
    qInfo("Gateway: tools/list returned %d of %d tools",
          page.meta.value("returned_count").toInt(), page.meta.value("total_count").toInt());
    return QJsonObject{
        {"tools", page.tools},
        {"diagnostics", diagnostics},
        {"_meta", page.meta},
    };
}

QJsonObject StdioGateway::handleCategories() {
    QList<ToolDescriptor> tools;
    if (m_aggregator) {
        tools = m_aggregator->collectTools();
    }

    QJsonArray categories;
    for (const CategoryCount& c : countCategories(tools)) {
        categories.append(QJsonObject{{"name", c.name}, {"count", c.count}});
    }
    return QJsonObject{
        {"categories", categories},
        {"total_tools", static_cast<int>(tools.size())},
    };
}

RpcMessage StdioGateway::handleToolsCall(const QJsonValue& id, const QJsonObject& params) {
    const QString name = params.value("name").toString();
    if (name.isEmpty()) {
        return makeRpcError(id, rpc::kInvalidParams, "Missing tool name");
    }

    ToolDescriptor owner;
    if (!m_aggregator || !m_aggregator->routeTool(name, owner)) {
        return makeRpcError(id, rpc::kInvalidParams, "Tool not found: " + name);
    }

    ToolCallResult result;
    QString error;
    if (!m_aggregator->callTool(owner, params.value("arguments"), result, error)) {
        // OS detail stays in the log
        qWarning("Gateway: tools/call %s on %s failed: %s", qUtf8Printable(name),
                 qUtf8Printable(owner.serverId), qUtf8Printable(error));
        return makeRpcError(id, rpc::kInternalError, "Tool call failed");
    }

    if (result.isBackendError()) {
        const int code = result.backendError.value("code").toInt(rpc::kInternalError);
        const QString message = result.backendError.value("message").toString("Tool call failed");
        return makeRpcError(id, code, message, result.backendError.value("data"));
    }

    return makeRpcResult(id, result.result.isUndefined() ? QJsonValue(QJsonObject{})
                                                         : result.result);
}

void StdioGateway::writeLine(QIODevice& out, const QByteArray& data) {
    QMutexLocker locker(&m_outputMutex);
    out.write(data);
    if (auto* file = qobject_cast<QFile*>(&out)) {
        file->flush();
    }
}

int StdioGateway::run(QIODevice& in, QIODevice& out) {
    QTextStream stream(&in);
    stream.setEncoding(QStringConverter::Utf8);

    qint64 handled = 0;
    while (!stream.atEnd()) {
        const QString line = stream.readLine();
        if (line.trimmed().isEmpty()) {
            continue;
        }

        QByteArray response;
        if (handleLine(line.toUtf8(), response)) {
            writeLine(out, response);
        }
        ++handled;
    }

    qInfo("Gateway: input closed after %lld messages", static_cast<long long>(handled));
    return 0;
}

int StdioGateway::runStdio() {
#ifdef Q_OS_WIN
    SetConsoleOutputCP(CP_UTF8);
    SetConsoleCP(CP_UTF8);
#endif
    QFile input;
    QFile output;
    if (!input.open(stdin, QIODevice::ReadOnly)) {
        qCritical("Gateway: cannot open stdin");
        return 1;
    }
    if (!output.open(stdout, QIODevice::WriteOnly)) {
        qCritical("Gateway: cannot open stdout");
        return 1;
    }
    return run(input, output);
}

} // namespace toolhub
