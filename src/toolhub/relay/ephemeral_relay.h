#pragma once

#include <QByteArray>
#include <QString>

#include "tool_source.h"
#include "toolhub/backend/backend_directory.h"
#include "toolhub/protocol/json_framer.h"
#include "toolhub/protocol/rpc_types.h"
#include "toolhub/toolhub_export.h"

namespace toolhub {

/**
 * Spawn-per-request relay
 * Every discover/call starts a fresh instance of the backend's launch command,
 * feeds it the full handshake plus the request on stdin, closes stdin and reads
 * merged output until the id=2 answer shows up or the deadline passes.
 */
class TOOLHUB_API EphemeralRelay : public IToolSource {
public:
    struct Options {
        int startTimeoutMs = 15000;
        int discoveryTimeoutMs = 45000;
        int callTimeoutMs = 50000;
        QString clientName = "toolhub";
        QString clientVersion = "1.0.0";
    };

    explicit EphemeralRelay(const IBackendDirectory* directory);
    EphemeralRelay(const IBackendDirectory* directory, const Options& options);

    EphemeralRelay(const EphemeralRelay&) = delete;
    EphemeralRelay& operator=(const EphemeralRelay&) = delete;

    bool discover(const QString& backendId, QJsonArray& tools, QString& error) override;
    bool call(const QString& backendId,
              const QString& toolName,
              const QJsonValue& arguments,
              ToolCallResult& out,
              QString& error) override;

    /**
     * Run one handshake + request against a fresh backend process
     * @param request   request to send; its id is replaced with kRequestId
     * @param response  the backend's answer to kRequestId
     * @return false on spawn failure, timeout, early exit or output overflow
     */
    bool exchange(const RunningBackend& backend,
                  const RpcMessage& request,
                  int timeoutMs,
                  RpcMessage& response,
                  QString& error) const;

    const Options& options() const { return m_options; }

    static QByteArray buildHandshake(const QString& clientName,
                                     const QString& clientVersion,
                                     const RpcMessage& request);

    /// Consume framed objects until a response with @p id appears.
    static bool extractResponse(JsonFramer& framer, int id, RpcMessage& out);

    static constexpr int kInitializeId = 1;
    static constexpr int kRequestId = 2;
    static constexpr qint64 kMaxOutputBytes = 16 * 1024 * 1024; // 16MB

private:
    const IBackendDirectory* m_directory = nullptr;
    Options m_options;
};

} // namespace toolhub
