#pragma once

#include <QString>
#include <QStringList>

namespace toolhub_server {

struct ServerArgs {
    QString dataRoot;           // empty means ~/.toolhub
    int port = 8080;
    QString host = "127.0.0.1";
    QString logLevel = "info";
    QString controlUrl;

    bool hasPort = false;
    bool hasHost = false;
    bool hasLogLevel = false;
    bool hasControlUrl = false;

    bool stdio = false;
    bool help = false;
    bool version = false;
    QString error;

    static ServerArgs parse(const QStringList& args);

    static QString defaultDataRoot();
};

} // namespace toolhub_server
