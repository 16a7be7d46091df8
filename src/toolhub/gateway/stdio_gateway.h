#pragma once

#include <QByteArray>
#include <QIODevice>
#include <QMutex>
#include <QString>

#include "toolhub/protocol/rpc_types.h"
#include "toolhub/toolhub_export.h"

namespace toolhub {

class ToolAggregator;

/**
 * Downstream JSON-RPC endpoint
 *
 * Reads one request per line, dispatches it and writes exactly one response line.
 * Notifications and id-less messages get no answer. The loop is sequential, so
 * responses leave in request order.
 */
class TOOLHUB_API StdioGateway {
public:
    explicit StdioGateway(ToolAggregator* aggregator,
                          const QString& serverName = "toolhub",
                          const QString& serverVersion = "1.0.0");

    StdioGateway(const StdioGateway&) = delete;
    StdioGateway& operator=(const StdioGateway&) = delete;

    /**
     * Handle one input line
     * @param response  serialized answer including the trailing newline
     * @return true if @p response must be written
     */
    bool handleLine(const QByteArray& line, QByteArray& response);

    RpcMessage dispatch(const RpcMessage& request);

    /// Serve until @p in reaches end of stream. Returns the process exit code.
    int run(QIODevice& in, QIODevice& out);

    /// run() on the process's stdin and stdout.
    int runStdio();

    /// Serialized write shared by every producer of output lines.
    void writeLine(QIODevice& out, const QByteArray& data);

private:
    QJsonObject handleInitialize() const;
    QJsonObject handleToolsList(const QJsonObject& params);
    QJsonObject handleCategories();
    RpcMessage handleToolsCall(const QJsonValue& id, const QJsonObject& params);

    ToolAggregator* m_aggregator = nullptr;
    QString m_serverName;
    QString m_serverVersion;
    QMutex m_outputMutex;
};

} // namespace toolhub
