// Fake MCP backend for relay and lifecycle tests.
// Behaviour is selected through the environment so that the relay's normal
// launch path (definition env + .env + overrides) drives it:
//   TOOLHUB_STUB_MODE    ok | error | hang | multiline | noise | exit
//   TOOLHUB_STUB_TOOLS   number of tools reported by tools/list (default 3)
//   TOOLHUB_STUB_PREFIX  tool name prefix (default "stub")

#include <QCoreApplication>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QThread>

#include <cstdio>

namespace {

QByteArray env(const char* name, const QByteArray& fallback) {
    const QByteArray value = qgetenv(name);
    return value.isEmpty() ? fallback : value;
}

void writeMessage(QFile& out, const QJsonObject& msg, bool indented) {
    QByteArray data = QJsonDocument(msg).toJson(indented ? QJsonDocument::Indented
                                                         : QJsonDocument::Compact);
    if (!data.endsWith('\n')) {
        data.append('\n');
    }
    out.write(data);
    out.flush();
}

QJsonArray makeTools(int count, const QString& prefix) {
    QJsonArray tools;
    for (int i = 0; i < count; ++i) {
        const QJsonObject schema{
            {"type", "object"},
            {"properties", QJsonObject{{"text", QJsonObject{{"type", "string"},
                                                            {"description", "input text"},
                                                            {"default", "x"}}}}},
            {"required", QJsonArray{"text"}},
        };
        tools.append(QJsonObject{
            {"name", QString("%1_tool_%2").arg(prefix).arg(i)},
            {"description", QString("Stub tool %1").arg(i)},
            {"inputSchema", schema},
        });
    }
    return tools;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    const QByteArray mode = env("TOOLHUB_STUB_MODE", "ok");
    const int toolCount = env("TOOLHUB_STUB_TOOLS", "3").toInt();
    const QString prefix = QString::fromUtf8(env("TOOLHUB_STUB_PREFIX", "stub"));

    if (mode == "exit") {
        return 3;
    }

    QFile in;
    QFile out;
    if (!in.open(stdin, QIODevice::ReadOnly) || !out.open(stdout, QIODevice::WriteOnly)) {
        return 2;
    }

    const bool indented = mode == "multiline";
    if (mode == "noise") {
        out.write("Starting stub server...\nListening on stdio\n");
        out.flush();
    }

    while (true) {
        const QByteArray line = in.readLine();
        if (line.isEmpty()) {
            break;
        }

        const QJsonObject request = QJsonDocument::fromJson(line).object();
        const QString method = request.value("method").toString();
        if (!request.contains("id")) {
            continue;
        }
        if (mode == "hang" && method != "initialize") {
            QThread::sleep(30);
            return 0;
        }

        QJsonObject response{{"jsonrpc", "2.0"}, {"id", request.value("id")}};
        if (method == "initialize") {
            response["result"] = QJsonObject{
                {"protocolVersion", "2024-11-05"},
                {"capabilities", QJsonObject{{"tools", QJsonObject{}}}},
                {"serverInfo", QJsonObject{{"name", "stub"}, {"version", "0.0.1"}}},
            };
        } else if (method == "tools/list") {
            response["result"] = QJsonObject{{"tools", makeTools(toolCount, prefix)}};
        } else if (method == "tools/call") {
            const QJsonObject params = request.value("params").toObject();
            if (mode == "error") {
                response["error"] = QJsonObject{{"code", -32001},
                                                {"message", "stub failure"},
                                                {"data", QJsonObject{{"tool", params.value("name")}}}};
            } else {
                const QString text = QString("%1:%2").arg(
                    params.value("name").toString(),
                    QString::fromUtf8(QJsonDocument(params.value("arguments").toObject())
                                          .toJson(QJsonDocument::Compact)));
                response["result"] = QJsonObject{
                    {"content", QJsonArray{QJsonObject{{"type", "text"}, {"text", text}}}}};
            }
        } else {
            response["error"] = QJsonObject{{"code", -32601}, {"message", "Method not found"}};
        }

        if (mode == "noise") {
            out.write("log: handling " + method.toUtf8() + "\n");
        }
        writeMessage(out, response, indented);
    }
    return 0;
}
