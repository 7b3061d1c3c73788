#include "command_line.h"
#include "config_store.h"
#include <QFileInfo>
#include <QVariantMap>

void addCommandLineOptions(QCommandLineParser& parser) {
    parser.addOption(QCommandLineOption(QStringList{QStringLiteral("c"), QStringLiteral("config")},
                                        QStringLiteral("JSON configuration file."),
                                        QStringLiteral("path")));
    parser.addOption(QCommandLineOption(QStringLiteral("host"),
                                        QStringLiteral("Listen address."),
                                        QStringLiteral("address")));
    parser.addOption(QCommandLineOption(QStringList{QStringLiteral("p"), QStringLiteral("port")},
                                        QStringLiteral("Listen port (0 picks a free port)."),
                                        QStringLiteral("port")));
    parser.addOption(QCommandLineOption(QStringLiteral("log-dir"),
                                        QStringLiteral("Directory for authline.log."),
                                        QStringLiteral("dir")));
    parser.addOption(QCommandLineOption(QStringList{QStringLiteral("d"), QStringLiteral("debug")},
                                        QStringLiteral("Debug logging and packet tracing.")));
}

VoidResult applyCommandLine(const QCommandLineParser& parser, ConfigStore& store) {
    if (parser.isSet(QStringLiteral("config"))) {
        const QString path = parser.value(QStringLiteral("config"));
        if (!store.load(path)) {
            if (QFileInfo::exists(path)) {
                return std::unexpected(DomainFailure::invalidInput(
                    QStringLiteral("bad_config"),
                    QStringLiteral("cannot read config %1").arg(path)));
            }
            // first run: write the defaults out
            store.save();
        }
    }

    const bool hostSet = parser.isSet(QStringLiteral("host"));
    const bool portSet = parser.isSet(QStringLiteral("port"));
    if (hostSet || portSet) {
        QVariantMap listen;
        if (hostSet)
            listen[QStringLiteral("host")] = parser.value(QStringLiteral("host"));
        if (portSet) {
            bool ok = false;
            const int port = parser.value(QStringLiteral("port")).toInt(&ok);
            if (!ok) {
                return std::unexpected(DomainFailure::invalidInput(
                    QStringLiteral("bad_port"),
                    QStringLiteral("invalid port '%1'").arg(parser.value(QStringLiteral("port")))));
            }
            listen[QStringLiteral("port")] = port;
        }
        store.setListenOptions(listen);
    }

    const bool logDirSet = parser.isSet(QStringLiteral("log-dir"));
    const bool debugSet = parser.isSet(QStringLiteral("debug"));
    if (logDirSet || debugSet) {
        QVariantMap logging;
        if (logDirSet)
            logging[QStringLiteral("dir")] = parser.value(QStringLiteral("log-dir"));
        if (debugSet) {
            logging[QStringLiteral("level")] = QStringLiteral("debug");
            logging[QStringLiteral("debug_filter")] = true;
        }
        store.setLoggingOptions(logging);
    }
    return {};
}
