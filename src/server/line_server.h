#pragma once
#include "config/config_types.h"
#include "protocol/line_codec.h"
#include "protocol/types.h"
#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>
#include <QHash>

class FilterChain;

class LineServer : public QObject {
    Q_OBJECT
public:
    explicit LineServer(QObject* parent = nullptr);
    ~LineServer() override;

    bool start(const ServerConfig& config);
    void stop();
    bool isRunning() const;
    quint16 port() const;
    int clientCount() const { return static_cast<int>(m_sockets.size()); }

    void setFilterChain(FilterChain* chain);

    // Server push through the write side of the filter chain.
    VoidResult send(ConnectionId connection, const MultiLinePacket& packet);

signals:
    void statusChanged(bool running);
    void clientConnected(ConnectionId connection);
    void clientDisconnected(ConnectionId connection);

private slots:
    void onNewConnection();
    void onSocketReadyRead();
    void onSocketDisconnected();

private:
    void handlePacket(QTcpSocket* socket, const MultiLinePacket& packet);
    void rejectClient(QTcpSocket* socket, const DomainFailure& failure);
    void releaseConnection(QTcpSocket* socket);

    QTcpServer* m_server = nullptr;
    FilterChain* m_chain = nullptr;
    LineCodec m_codec;
    ConnectionId m_nextConnectionId = 1;
    QHash<QTcpSocket*, ConnectionId> m_connections;
    QHash<ConnectionId, QTcpSocket*> m_sockets;
    QHash<QTcpSocket*, QByteArray> m_pendingData;
};
