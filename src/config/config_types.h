#pragma once
#include <QString>

struct ListenOptions {
    QString host = QStringLiteral("0.0.0.0");
    int port = 7777;
    int maxLineLength = 4096;
    int maxPacketLines = 256;
};

struct LoggingOptions {
    QString dir;                       // empty = no log file
    QString level = QStringLiteral("info");
    bool console = true;
    bool debugFilter = false;          // trace every packet through DebugFilter
};

struct ServerConfig {
    ListenOptions listen;
    LoggingOptions logging;

    bool isValid() const {
        return !listen.host.isEmpty()
            && listen.port >= 0 && listen.port <= 65535
            && listen.maxLineLength > 0 && listen.maxPacketLines > 1;
    }
};
