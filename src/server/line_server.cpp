#include "line_server.h"
#include "core/log_manager.h"
#include "pipeline/filter_chain.h"
#include <QHostAddress>

// ========================================================================
// Construction / destruction
// ========================================================================

LineServer::LineServer(QObject* parent)
    : QObject(parent)
{
}

LineServer::~LineServer()
{
    stop();
}

void LineServer::setFilterChain(FilterChain* chain)
{
    m_chain = chain;
}

// ========================================================================
// start / stop
// ========================================================================

bool LineServer::start(const ServerConfig& config)
{
    if (m_server) {
        stop();
    }

    if (!config.isValid()) {
        LOG_ERROR(QStringLiteral("LineServer: invalid listen configuration"));
        return false;
    }

    QHostAddress address;
    if (!address.setAddress(config.listen.host)) {
        LOG_ERROR(QStringLiteral("LineServer: cannot parse listen address '%1'")
                      .arg(config.listen.host));
        return false;
    }

    m_codec = LineCodec(config.listen.maxLineLength, config.listen.maxPacketLines);

    m_server = new QTcpServer(this);
    connect(m_server, &QTcpServer::newConnection,
            this, &LineServer::onNewConnection);

    const quint16 port = static_cast<quint16>(config.listen.port);
    if (!m_server->listen(address, port)) {
        LOG_ERROR(QStringLiteral("LineServer: failed to listen on %1:%2 - %3")
                      .arg(config.listen.host)
                      .arg(port)
                      .arg(m_server->errorString()));
        delete m_server;
        m_server = nullptr;
        return false;
    }

    LOG_INFO(QStringLiteral("LineServer: listening on %1:%2")
                 .arg(config.listen.host)
                 .arg(m_server->serverPort()));
    emit statusChanged(true);
    return true;
}

void LineServer::stop()
{
    if (!m_server) {
        return;
    }

    m_server->close();

    // disconnectFromHost() may emit disconnected() synchronously
    const QList<QTcpSocket*> sockets = m_connections.keys();
    for (QTcpSocket* socket : sockets) {
        socket->disconnectFromHost();
    }

    // Sockets still flushing are torn down here; they are children of
    // m_server and must be released before it is deleted
    const QList<QTcpSocket*> remaining = m_connections.keys();
    for (QTcpSocket* socket : remaining) {
        disconnect(socket, nullptr, this, nullptr);
        socket->abort();
        releaseConnection(socket);
    }

    delete m_server;
    m_server = nullptr;

    LOG_INFO(QStringLiteral("LineServer: stopped"));
    emit statusChanged(false);
}

bool LineServer::isRunning() const
{
    return m_server && m_server->isListening();
}

quint16 LineServer::port() const
{
    return m_server ? m_server->serverPort() : 0;
}

// ========================================================================
// Connection lifecycle
// ========================================================================

void LineServer::onNewConnection()
{
    while (m_server->hasPendingConnections()) {
        QTcpSocket* socket = m_server->nextPendingConnection();
        if (!socket) {
            continue;
        }

        const ConnectionId connection = m_nextConnectionId++;
        m_connections.insert(socket, connection);
        m_sockets.insert(connection, socket);

        connect(socket, &QTcpSocket::readyRead,
                this, &LineServer::onSocketReadyRead);
        connect(socket, &QTcpSocket::disconnected,
                this, &LineServer::onSocketDisconnected);

        LOG_DEBUG(QStringLiteral("LineServer: connection %1 from %2:%3")
                      .arg(connection)
                      .arg(socket->peerAddress().toString())
                      .arg(socket->peerPort()));
        emit clientConnected(connection);
    }
}

void LineServer::onSocketReadyRead()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket || !m_connections.contains(socket)) {
        return;
    }

    QByteArray& buffer = m_pendingData[socket];
    buffer += socket->readAll();

    // decode again after each batch so a framing error held back behind
    // complete packets is reported
    while (true) {
        auto packets = m_codec.decode(m_pendingData[socket]);
        if (!packets) {
            rejectClient(socket, packets.error());
            return;
        }
        if (packets->isEmpty())
            return;

        for (const MultiLinePacket& packet : *packets) {
            handlePacket(socket, packet);
            if (socket->state() != QAbstractSocket::ConnectedState
                || !m_connections.contains(socket)) {
                return;
            }
        }
    }
}

void LineServer::onSocketDisconnected()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) {
        return;
    }
    releaseConnection(socket);
}

void LineServer::releaseConnection(QTcpSocket* socket)
{
    m_pendingData.remove(socket);
    const auto it = m_connections.constFind(socket);
    if (it == m_connections.cend()) {
        return;
    }
    const ConnectionId connection = it.value();
    m_connections.remove(socket);
    m_sockets.remove(connection);

    if (m_chain) {
        m_chain->processClose(connection);
    }
    socket->deleteLater();

    LOG_DEBUG(QStringLiteral("LineServer: connection %1 closed").arg(connection));
    emit clientDisconnected(connection);
}

// ========================================================================
// Packet dispatch
// ========================================================================

void LineServer::handlePacket(QTcpSocket* socket, const MultiLinePacket& packet)
{
    if (!m_chain) {
        rejectClient(socket, DomainFailure::internal(QStringLiteral("filter chain not configured")));
        return;
    }

    const ConnectionId connection = m_connections.value(socket);
    auto outcome = m_chain->processRead(connection, packet);
    if (!outcome) {
        rejectClient(socket, outcome.error());
        return;
    }

    for (const MultiLinePacket& out : outcome->outbound) {
        socket->write(LineCodec::encode(out));
    }
    socket->flush();

    if (outcome->delivered) {
        LOG_DEBUG(QStringLiteral("LineServer: packet '%1' from connection %2 reached the end of the chain")
                      .arg(outcome->delivered->command())
                      .arg(connection));
    }
}

VoidResult LineServer::send(ConnectionId connection, const MultiLinePacket& packet)
{
    QTcpSocket* socket = m_sockets.value(connection, nullptr);
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("unknown_connection"),
            QStringLiteral("connection %1 is not open").arg(connection)));
    }
    if (!m_chain) {
        return std::unexpected(DomainFailure::internal(QStringLiteral("filter chain not configured")));
    }

    auto encoded = m_chain->processWrite(connection, packet);
    if (!encoded) return std::unexpected(encoded.error());

    socket->write(LineCodec::encode(*encoded));
    socket->flush();
    return {};
}

void LineServer::rejectClient(QTcpSocket* socket, const DomainFailure& failure)
{
    LOG_WARNING(QStringLiteral("LineServer: closing connection %1 - %2")
                    .arg(m_connections.value(socket))
                    .arg(failure.describe()));

    m_pendingData.remove(socket);
    disconnect(socket, &QTcpSocket::readyRead,
               this, &LineServer::onSocketReadyRead);
    if (socket->state() == QAbstractSocket::ConnectedState) {
        socket->write(LineCodec::encodeLines(failure.toLines()));
        socket->flush();
        socket->disconnectFromHost();
    }
}
