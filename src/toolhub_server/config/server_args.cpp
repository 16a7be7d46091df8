#include "server_args.h"

#include <QDir>
#include <QUrl>

namespace toolhub_server {

namespace {

bool isKnownLogLevel(const QString& level) {
    static const QStringList kLevels{"debug", "info", "warn", "error"};
    return kLevels.contains(level);
}

bool isHttpUrl(const QString& raw) {
    const QUrl url(raw, QUrl::StrictMode);
    return url.isValid() && !url.host().isEmpty()
           && (url.scheme() == "http" || url.scheme() == "https");
}

// Applies one --key=value option. Returns false with error set when the value is rejected.
bool applyValueOption(ServerArgs& out, const QString& key, const QString& value, QString& error) {
    if (key == "data-root") {
        if (value.isEmpty()) {
            error = "--data-root needs a directory";
            return false;
        }
        out.dataRoot = value;
    } else if (key == "port") {
        bool ok = false;
        const int port = value.toInt(&ok);
        if (!ok || port < 1 || port > 65535) {
            error = "invalid port: " + value;
            return false;
        }
        out.port = port;
        out.hasPort = true;
    } else if (key == "host") {
        if (value.isEmpty()) {
            error = "--host needs an address";
            return false;
        }
        out.host = value;
        out.hasHost = true;
    } else if (key == "log-level") {
        if (!isKnownLogLevel(value)) {
            error = "invalid log level: " + value;
            return false;
        }
        out.logLevel = value;
        out.hasLogLevel = true;
    } else if (key == "control-url") {
        if (!isHttpUrl(value)) {
            error = "invalid control url: " + value;
            return false;
        }
        out.controlUrl = value;
        out.hasControlUrl = true;
    } else {
        error = QString("unknown option: --%1=%2").arg(key, value);
        return false;
    }
    return true;
}

} // namespace

QString ServerArgs::defaultDataRoot() {
    return QDir::homePath() + "/.toolhub";
}

ServerArgs ServerArgs::parse(const QStringList& args) {
    ServerArgs result;

    // args[0] is the program
    for (const QString& arg : args.mid(1)) {
        if (arg == "-h" || arg == "--help") {
            result.help = true;
        } else if (arg == "-v" || arg == "--version") {
            result.version = true;
        } else if (arg == "--stdio") {
            result.stdio = true;
        } else if (arg.startsWith("--") && arg.contains('=')) {
            const int eq = arg.indexOf('=');
            if (!applyValueOption(result, arg.mid(2, eq - 2), arg.mid(eq + 1), result.error)) {
                return result;
            }
        } else {
            result.error = "unknown option: " + arg;
            return result;
        }
    }

    if (result.dataRoot.isEmpty()) {
        result.dataRoot = defaultDataRoot();
    }
    return result;
}

} // namespace toolhub_server
