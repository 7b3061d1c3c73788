#include <QTest>
#include <QSignalSpy>
#include <QTcpSocket>
#include <QDeadlineTimer>
#include <QHostAddress>
#include <optional>
#include "config/config_types.h"
#include "pipeline/filter_chain.h"
#include "pipeline/filters/auth_filter.h"
#include "pipeline/filters/echo_filter.h"
#include "protocol/line_codec.h"
#include "server/line_server.h"

class TestLineServer : public QObject {
    Q_OBJECT

private:
    FilterChain m_chain;
    AuthFilter* m_auth = nullptr;
    LineServer* m_server = nullptr;

    // Client and server share this thread, so waiting must keep the event
    // loop spinning instead of blocking in waitForReadyRead().
    static std::optional<MultiLinePacket> readPacket(QTcpSocket& socket, QByteArray& buffer) {
        LineCodec codec;
        QDeadlineTimer deadline(5000);
        while (!deadline.hasExpired()) {
            buffer += socket.readAll();
            const qsizetype end = buffer.indexOf("\n\n");
            if (end >= 0) {
                QByteArray one = buffer.left(end + 2);
                buffer.remove(0, end + 2);
                auto packets = codec.decode(one);
                if (packets && !packets->isEmpty())
                    return packets->first();
                continue;
            }
            QTest::qWait(10);
        }
        return std::nullopt;
    }

    bool connectClient(QTcpSocket& socket) {
        socket.connectToHost(QHostAddress::LocalHost, m_server->port());
        QDeadlineTimer deadline(5000);
        while (socket.state() != QAbstractSocket::ConnectedState && !deadline.hasExpired())
            QTest::qWait(10);
        return socket.state() == QAbstractSocket::ConnectedState;
    }

    QString authenticate(QTcpSocket& socket, QByteArray& buffer) {
        socket.write("authentication-request\n\n");
        auto response = readPacket(socket, buffer);
        if (!response || response->command() != AuthFilter::kResponseCommand)
            return {};
        return response->lineAt(1).value_or(QString()).section(QLatin1Char(':'), 1).trimmed();
    }

private slots:
    void initTestCase() {
        auto auth = std::make_unique<AuthFilter>();
        m_auth = auth.get();
        m_chain.addFilter(std::move(auth));
        m_chain.addFilter(std::make_unique<EchoFilter>());

        m_server = new LineServer(this);
        m_server->setFilterChain(&m_chain);

        ServerConfig config;
        config.listen.host = QStringLiteral("127.0.0.1");
        config.listen.port = 0;
        config.listen.maxLineLength = 128;
        QVERIFY(m_server->start(config));
        QVERIFY(m_server->isRunning());
        QVERIFY(m_server->port() != 0);
    }

    void cleanupTestCase() {
        m_server->stop();
        QVERIFY(!m_server->isRunning());
    }

    void testHandshakeAndEcho() {
        QTcpSocket socket;
        QVERIFY(connectClient(socket));
        QByteArray buffer;

        const QString token = authenticate(socket, buffer);
        QVERIFY(!token.isEmpty());

        socket.write(QStringLiteral("say\nauth-id: %1\nhello\n\n").arg(token).toUtf8());
        auto echo = readPacket(socket, buffer);
        QVERIFY(echo.has_value());
        QCOMPARE(echo->lines(),
                 QStringList({"say", "auth-id: " + token, "hello"}));
    }

    void testUnauthenticatedClientIsDisconnected() {
        QTcpSocket socket;
        QVERIFY(connectClient(socket));
        QByteArray buffer;

        socket.write("say\nauth-id: 1\nhello\n\n");
        auto reply = readPacket(socket, buffer);
        QVERIFY(reply.has_value());
        QCOMPARE(reply->command(), QStringLiteral("error"));
        QVERIFY(reply->lineAt(1).value_or(QString()).startsWith(QStringLiteral("not_authenticated")));
        QTRY_COMPARE_WITH_TIMEOUT(socket.state(), QAbstractSocket::UnconnectedState, 5000);
    }

    void testMissingHeaderIsProtocolError() {
        QTcpSocket socket;
        QVERIFY(connectClient(socket));
        QByteArray buffer;
        QVERIFY(!authenticate(socket, buffer).isEmpty());

        socket.write("say\n\n");
        auto reply = readPacket(socket, buffer);
        QVERIFY(reply.has_value());
        QCOMPARE(reply->command(), QStringLiteral("error"));
        QVERIFY(reply->lineAt(1).value_or(QString()).startsWith(QStringLiteral("missing_auth_header")));
    }

    void testOverlongLineIsRejected() {
        QTcpSocket socket;
        QVERIFY(connectClient(socket));
        QByteArray buffer;

        socket.write(QByteArray(300, 'x') + "\n\n");
        auto reply = readPacket(socket, buffer);
        QVERIFY(reply.has_value());
        QVERIFY(reply->lineAt(1).value_or(QString()).startsWith(QStringLiteral("line_too_long")));
    }

    void testPacketsBeforeFramingErrorAreAnswered() {
        QTcpSocket socket;
        QVERIFY(connectClient(socket));
        socket.write("authentication-request\n\n" + QByteArray(200, 'x') + "\n\n");

        QByteArray buffer;
        auto response = readPacket(socket, buffer);
        QVERIFY(response.has_value());
        QCOMPARE(response->command(), AuthFilter::kResponseCommand);

        auto reply = readPacket(socket, buffer);
        QVERIFY(reply.has_value());
        QCOMPARE(reply->command(), QStringLiteral("error"));
        QVERIFY(reply->lineAt(1).value_or(QString()).startsWith(QStringLiteral("line_too_long")));
    }

    void testDisconnectDropsSession() {
        QSignalSpy connected(m_server, &LineServer::clientConnected);
        QSignalSpy disconnected(m_server, &LineServer::clientDisconnected);
        ConnectionId id = 0;

        {
            QTcpSocket socket;
            QVERIFY(connectClient(socket));
            QByteArray buffer;
            QVERIFY(!authenticate(socket, buffer).isEmpty());
            QCOMPARE(connected.count(), 1);
            id = connected.first().first().value<ConnectionId>();
            QVERIFY(m_auth->sessions().contains(id));
            QVERIFY(m_server->clientCount() >= 1);
            socket.disconnectFromHost();
        }

        auto closed = [&disconnected, id]() {
            for (const QList<QVariant>& args : disconnected) {
                if (args.first().value<ConnectionId>() == id)
                    return true;
            }
            return false;
        };
        QTRY_VERIFY_WITH_TIMEOUT(closed(), 5000);
        QVERIFY(!m_auth->sessions().contains(id));
    }

    void testServerPush() {
        QSignalSpy connected(m_server, &LineServer::clientConnected);
        QTcpSocket socket;
        QVERIFY(connectClient(socket));
        QTRY_COMPARE_WITH_TIMEOUT(connected.count(), 1, 5000);
        const ConnectionId id = connected.first().first().value<ConnectionId>();

        auto refused = m_server->send(id, MultiLinePacket::of({"notice"}));
        QVERIFY(!refused.has_value());
        QCOMPARE(refused.error().kind, ErrorKind::Authentication);

        QByteArray buffer;
        const QString token = authenticate(socket, buffer);
        QVERIFY(!token.isEmpty());

        QVERIFY(m_server->send(id, MultiLinePacket::of({"notice", "maintenance"})).has_value());
        auto pushed = readPacket(socket, buffer);
        QVERIFY(pushed.has_value());
        QCOMPARE(pushed->lines(),
                 QStringList({"notice", "auth-id: " + token, "maintenance"}));

        QVERIFY(!m_server->send(999999, MultiLinePacket::of({"notice"})).has_value());
    }
};

QTEST_MAIN(TestLineServer)
#include "tst_line_server.moc"
