#include "config_store.h"
#include "core/log_manager.h"
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>

namespace {

QJsonValue jsonValueEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (obj.contains(snake))
        return obj.value(snake);
    return obj.value(QString::fromUtf8(camelKey));
}

QString jsonStringEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey,
                         const QString& fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isString() ? value.toString() : fallback;
}

int jsonIntEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, int fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toInt(fallback);
}

bool jsonBoolEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, bool fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toBool(fallback);
}

bool mapContainsEither(const QVariantMap& map, const char* snakeKey, const char* camelKey)
{
    return map.contains(QString::fromUtf8(snakeKey)) || map.contains(QString::fromUtf8(camelKey));
}

QVariant mapValueEither(const QVariantMap& map, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (map.contains(snake))
        return map.value(snake);
    return map.value(QString::fromUtf8(camelKey));
}

int clampInt(int value, int minValue, int maxValue)
{
    return qBound(minValue, value, maxValue);
}

constexpr int kMinLineLength = 16;
constexpr int kMaxLineLength = 1048576;
constexpr int kMinPacketLines = 2;
constexpr int kMaxPacketLines = 65536;

}

ConfigStore::ConfigStore(QObject* parent)
    : QObject(parent)
{
}

bool ConfigStore::load(const QString& path) {
    m_filePath = path;
    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly))
        return false;

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARNING(QStringLiteral("ConfigStore: %1 is not a JSON object (%2)")
                        .arg(m_filePath, parseError.errorString()));
        return false;
    }

    QJsonObject root = doc.object();
    const ServerConfig defaults;

    // server
    QJsonObject s = root["server"].toObject();
    m_config.listen.host = jsonStringEither(s, "host", "host", defaults.listen.host);
    m_config.listen.port = clampInt(jsonIntEither(s, "port", "port", defaults.listen.port), 0, 65535);
    m_config.listen.maxLineLength = clampInt(
        jsonIntEither(s, "max_line_length", "maxLineLength", defaults.listen.maxLineLength),
        kMinLineLength, kMaxLineLength);
    m_config.listen.maxPacketLines = clampInt(
        jsonIntEither(s, "max_packet_lines", "maxPacketLines", defaults.listen.maxPacketLines),
        kMinPacketLines, kMaxPacketLines);

    // logging
    QJsonObject l = root["logging"].toObject();
    m_config.logging.dir = jsonStringEither(l, "dir", "dir", defaults.logging.dir);
    m_config.logging.level = LogManager::levelName(LogManager::parseLevel(
        jsonStringEither(l, "level", "level", defaults.logging.level)));
    m_config.logging.console = jsonBoolEither(l, "console", "console", defaults.logging.console);
    m_config.logging.debugFilter = jsonBoolEither(l, "debug_filter", "debugFilter",
                                                  defaults.logging.debugFilter);

    emit configChanged();
    return true;
}

bool ConfigStore::save() {
    if (m_filePath.isEmpty())
        return false;

    QJsonObject root;
    root["version"] = 1;

    QJsonObject s;
    s["host"] = m_config.listen.host;
    s["port"] = m_config.listen.port;
    s["max_line_length"] = m_config.listen.maxLineLength;
    s["max_packet_lines"] = m_config.listen.maxPacketLines;
    root["server"] = s;

    QJsonObject l;
    l["dir"] = m_config.logging.dir;
    l["level"] = m_config.logging.level;
    l["console"] = m_config.logging.console;
    l["debug_filter"] = m_config.logging.debugFilter;
    root["logging"] = l;

    QFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly))
        return false;
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    return true;
}

QVariantMap ConfigStore::listenOptions() const {
    QVariantMap map;
    map["host"] = m_config.listen.host;
    map["port"] = m_config.listen.port;
    map["max_line_length"] = m_config.listen.maxLineLength;
    map["maxLineLength"] = m_config.listen.maxLineLength;
    map["max_packet_lines"] = m_config.listen.maxPacketLines;
    map["maxPacketLines"] = m_config.listen.maxPacketLines;
    return map;
}

void ConfigStore::setListenOptions(const QVariantMap& opts) {
    if (opts.contains("host"))
        m_config.listen.host = opts.value("host").toString();
    if (opts.contains("port"))
        m_config.listen.port = clampInt(opts.value("port").toInt(), 0, 65535);
    if (mapContainsEither(opts, "max_line_length", "maxLineLength"))
        m_config.listen.maxLineLength = clampInt(mapValueEither(opts, "max_line_length", "maxLineLength").toInt(),
                                                 kMinLineLength, kMaxLineLength);
    if (mapContainsEither(opts, "max_packet_lines", "maxPacketLines"))
        m_config.listen.maxPacketLines = clampInt(mapValueEither(opts, "max_packet_lines", "maxPacketLines").toInt(),
                                                  kMinPacketLines, kMaxPacketLines);
    save();
    emit configChanged();
}

QVariantMap ConfigStore::loggingOptions() const {
    QVariantMap map;
    map["dir"] = m_config.logging.dir;
    map["level"] = m_config.logging.level;
    map["console"] = m_config.logging.console;
    map["debug_filter"] = m_config.logging.debugFilter;
    map["debugFilter"] = m_config.logging.debugFilter;
    return map;
}

void ConfigStore::setLoggingOptions(const QVariantMap& opts) {
    if (opts.contains("dir"))
        m_config.logging.dir = opts.value("dir").toString();
    if (opts.contains("level"))
        m_config.logging.level = LogManager::levelName(
            LogManager::parseLevel(opts.value("level").toString()));
    if (opts.contains("console"))
        m_config.logging.console = opts.value("console").toBool();
    if (mapContainsEither(opts, "debug_filter", "debugFilter"))
        m_config.logging.debugFilter = mapValueEither(opts, "debug_filter", "debugFilter").toBool();
    save();
    emit configChanged();
}
