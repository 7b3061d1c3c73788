#pragma once
#include "config_types.h"
#include <QObject>
#include <QVariantMap>

class ConfigStore : public QObject {
    Q_OBJECT

public:
    explicit ConfigStore(QObject* parent = nullptr);

    bool load(const QString& path);
    bool save();
    QString filePath() const { return m_filePath; }

    QVariantMap listenOptions() const;
    void setListenOptions(const QVariantMap& opts);

    QVariantMap loggingOptions() const;
    void setLoggingOptions(const QVariantMap& opts);

    ServerConfig serverConfig() const { return m_config; }

signals:
    void configChanged();

private:
    ServerConfig m_config;
    QString m_filePath;
};
