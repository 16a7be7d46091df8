#include "ephemeral_relay.h"

#include <QElapsedTimer>
#include <QJsonDocument>
#include <QProcess>
#include <QVariant>

#include "toolhub/backend/backend_launch.h"
#include "toolhub/protocol/rpc_serializer.h"

namespace toolhub {

EphemeralRelay::EphemeralRelay(const IBackendDirectory* directory)
    : m_directory(directory) {
}

EphemeralRelay::EphemeralRelay(const IBackendDirectory* directory, const Options& options)
    : m_directory(directory)
    , m_options(options) {
}

QByteArray EphemeralRelay::buildHandshake(const QString& clientName,
                                          const QString& clientVersion,
                                          const RpcMessage& request) {
    const QJsonObject initParams{
        {"protocolVersion", rpc::kProtocolVersion},
        {"capabilities", QJsonObject{}},
        {"clientInfo", QJsonObject{{"name", clientName}, {"version", clientVersion}}},
    };

    RpcMessage real = request;
    real.id = kRequestId;

    QByteArray out;
    out.append(serializeRpcMessage(makeRpcRequest(kInitializeId, "initialize", initParams)));
    out.append(serializeRpcMessage(makeRpcNotification("notifications/initialized")));
    out.append(serializeRpcMessage(real));
    return out;
}

bool EphemeralRelay::extractResponse(JsonFramer& framer, int id, RpcMessage& out) {
    QByteArray object;
    while (framer.tryReadObject(object)) {
        RpcMessage msg;
        QString parseErr;
        if (!parseRpcMessage(object, msg, parseErr)) {
            continue;
        }
        if (!msg.isResponse() || !msg.id.isDouble() || msg.id.toInt() != id) {
            continue;
        }
        out = msg;
        return true;
    }
    return false;
}

bool EphemeralRelay::exchange(const RunningBackend& backend,
                              const RpcMessage& request,
                              int timeoutMs,
                              RpcMessage& response,
                              QString& error) const {
    const LaunchSpec spec = buildLaunchSpec(backend.definition, backend.installPath, backend.env);

    QProcess proc;
    spec.applyTo(proc);
    proc.setProcessChannelMode(QProcess::MergedChannels);
    proc.start();
    if (!proc.waitForStarted(m_options.startTimeoutMs)) {
        error = QString("failed to start '%1': %2").arg(spec.commandLine(), proc.errorString());
        proc.kill();
        proc.waitForFinished(1000);
        return false;
    }

    const QByteArray input = buildHandshake(m_options.clientName, m_options.clientVersion, request);
    if (proc.write(input) != input.size()) {
        error = "failed to write handshake: " + proc.errorString();
        proc.kill();
        proc.waitForFinished(1000);
        return false;
    }
    proc.closeWriteChannel();

    JsonFramer framer;
    QElapsedTimer timer;
    timer.start();
    qint64 received = 0;
    bool found = false;

    while (!found) {
        const QByteArray chunk = proc.readAll();
        if (!chunk.isEmpty()) {
            received += chunk.size();
            if (received > kMaxOutputBytes) {
                error = "backend output exceeded limit";
                break;
            }
            framer.append(chunk);
            found = extractResponse(framer, kRequestId, response);
            if (found) {
                break;
            }
        }

        if (proc.state() == QProcess::NotRunning) {
            framer.append(proc.readAll());
            found = extractResponse(framer, kRequestId, response);
            if (!found) {
                error = QString("backend exited with code %1 without a response")
                            .arg(proc.exitCode());
            }
            break;
        }

        const qint64 remaining = timeoutMs - timer.elapsed();
        if (remaining <= 0) {
            error = QString("timed out after %1 ms").arg(timeoutMs);
            break;
        }
        proc.waitForReadyRead(static_cast<int>(qMin<qint64>(remaining, 100)));
    }

    if (proc.state() != QProcess::NotRunning) {
        proc.kill();
        proc.waitForFinished(1000);
    }

    if (found) {
        error.clear();
    }
    return found;
}

bool EphemeralRelay::discover(const QString& backendId, QJsonArray& tools, QString& error) {
    RunningBackend backend;
    if (!m_directory || !m_directory->findRunning(backendId, backend)) {
        error = "backend not running: " + backendId;
        return false;
    }

    RpcMessage response;
    if (!exchange(backend, makeRpcRequest(kRequestId, "tools/list", QJsonObject{}),
                  m_options.discoveryTimeoutMs, response, error)) {
        qWarning("Relay: tools/list on %s failed: %s",
                 qUtf8Printable(backendId), qUtf8Printable(error));
        return false;
    }

    if (!response.error.isUndefined()) {
        error = "backend returned error: "
                + response.error.toObject().value("message").toString("unknown");
        return false;
    }

    const QJsonValue toolsValue = response.result.toObject().value("tools");
    if (!toolsValue.isArray()) {
        error = "malformed tools/list result: missing 'tools' array";
        return false;
    }

    tools = toolsValue.toArray();
    qDebug("Relay: %s reported %lld tools", qUtf8Printable(backendId),
           static_cast<long long>(tools.size()));
    error.clear();
    return true;
}

bool EphemeralRelay::call(const QString& backendId,
                          const QString& toolName,
                          const QJsonValue& arguments,
                          ToolCallResult& out,
                          QString& error) {
    RunningBackend backend;
    if (!m_directory || !m_directory->findRunning(backendId, backend)) {
        error = "backend not running: " + backendId;
        return false;
    }

    const QJsonObject params{
        {"name", toolName},
        {"arguments", arguments.isUndefined() || arguments.isNull() ? QJsonValue(QJsonObject{})
                                                                     : arguments},
    };

    RpcMessage response;
    if (!exchange(backend, makeRpcRequest(kRequestId, "tools/call", params),
                  m_options.callTimeoutMs, response, error)) {
        qWarning("Relay: tools/call %s on %s failed: %s", qUtf8Printable(toolName),
                 qUtf8Printable(backendId), qUtf8Printable(error));
        return false;
    }

    out = ToolCallResult();
    if (!response.error.isUndefined()) {
        out.backendError = response.error.isObject()
                               ? response.error.toObject()
                               : QJsonObject{{"message", response.error.toVariant().toString()}};
    } else {
        out.result = response.result;
    }
    error.clear();
    return true;
}

} // namespace toolhub
