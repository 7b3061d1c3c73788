#include <QTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QFile>
#include <QRegularExpression>
#include "core/log_manager.h"

class TestLogManager : public QObject {
    Q_OBJECT

private slots:
    void init() {
        LogManager::instance().setMinimumLevel(LogManager::Debug);
        LogManager::instance().clearLogs();
    }

    void testMinimumLevelDropsLowerMessages() {
        LogManager& log = LogManager::instance();
        log.setMinimumLevel(LogManager::Warning);
        QCOMPARE(log.minimumLevel(), LogManager::Warning);

        QSignalSpy spy(&log, &LogManager::logEntry);
        LOG_DEBUG(QStringLiteral("trace"));
        LOG_INFO(QStringLiteral("hidden"));
        LOG_WARNING(QStringLiteral("shown"));

        QCOMPARE(spy.count(), 1);
        auto recent = log.recentLogs();
        QCOMPARE(recent.size(), 1);
        QCOMPARE(recent.first().toMap().value("message").toString(), QStringLiteral("shown"));
        QCOMPARE(recent.first().toMap().value("level").toInt(), int(LogManager::Warning));
    }

    void testLogEntrySignal() {
        LogManager& log = LogManager::instance();
        QSignalSpy spy(&log, &LogManager::logEntry);
        LOG_ERROR(QStringLiteral("boom"));

        QCOMPARE(spy.count(), 1);
        const QList<QVariant> args = spy.takeFirst();
        QCOMPARE(args.at(0).toInt(), int(LogManager::Error));
        QCOMPARE(args.at(2).toString(), QStringLiteral("authline"));
        QCOMPARE(args.at(3).toString(), QStringLiteral("boom"));
    }

    void testFileOutputFormat() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        LogManager& log = LogManager::instance();
        log.initialize(dir.path());
        log.log(LogManager::Warning, QStringLiteral("server"), QStringLiteral("first"));
        log.log(LogManager::Error, QStringLiteral("server"), QStringLiteral("second"));

        QFile file(dir.path() + QStringLiteral("/authline.log"));
        QVERIFY(file.open(QIODevice::ReadOnly | QIODevice::Text));
        const QStringList lines = QString::fromUtf8(file.readAll()).split('\n', Qt::SkipEmptyParts);
        QCOMPARE(lines.size(), 2);

        static const QRegularExpression pattern(
            QStringLiteral(R"(^\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3}\] \[(\w+)\] \[server\] (\w+)$)"));
        auto first = pattern.match(lines.at(0));
        QVERIFY(first.hasMatch());
        QCOMPARE(first.captured(1), QStringLiteral("WARN"));
        QCOMPARE(first.captured(2), QStringLiteral("first"));
        auto second = pattern.match(lines.at(1));
        QVERIFY(second.hasMatch());
        QCOMPARE(second.captured(1), QStringLiteral("ERROR"));

        // reopening appends
        log.initialize(dir.path());
        log.log(LogManager::Info, QStringLiteral("server"), QStringLiteral("third"));
        file.close();
        QVERIFY(file.open(QIODevice::ReadOnly | QIODevice::Text));
        QCOMPARE(QString::fromUtf8(file.readAll()).split('\n', Qt::SkipEmptyParts).size(), 3);
    }

    void testRecentLogsAreBounded() {
        LogManager& log = LogManager::instance();
        for (int i = 0; i < 2100; ++i)
            LOG_DEBUG(QStringLiteral("entry %1").arg(i));

        auto all = log.recentLogs(5000);
        QCOMPARE(all.size(), 2000);
        QCOMPARE(all.first().toMap().value("message").toString(), QStringLiteral("entry 100"));
        QCOMPARE(all.last().toMap().value("message").toString(), QStringLiteral("entry 2099"));

        auto tail = log.recentLogs(3);
        QCOMPARE(tail.size(), 3);
        QCOMPARE(tail.first().toMap().value("message").toString(), QStringLiteral("entry 2097"));

        log.clearLogs();
        QVERIFY(log.recentLogs().isEmpty());
    }

    void testLevelNames() {
        QCOMPARE(LogManager::parseLevel(QStringLiteral(" WARN ")), LogManager::Warning);
        QCOMPARE(LogManager::parseLevel(QStringLiteral("error")), LogManager::Error);
        QCOMPARE(LogManager::parseLevel(QStringLiteral("loud"), LogManager::Debug), LogManager::Debug);
        QCOMPARE(LogManager::levelName(LogManager::Warning), QStringLiteral("warning"));
    }
};

QTEST_MAIN(TestLogManager)
#include "tst_log_manager.moc"
