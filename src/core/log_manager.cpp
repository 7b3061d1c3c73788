#include "log_manager.h"
#include <QDateTime>
#include <QDir>
#include <QMutexLocker>
#include <QTextStream>
#include <QDebug>

namespace {

const char* const kLevelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};

}

LogManager& LogManager::instance() {
    static LogManager s_instance;
    return s_instance;
}

LogManager::~LogManager()
{
    if (m_logFile.isOpen()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

void LogManager::initialize(const QString& logDir) {
    QMutexLocker locker(&m_mutex);
    if (m_logFile.isOpen())
        m_logFile.close();

    QDir().mkpath(logDir);
    QString logPath = logDir + "/authline.log";
    m_logFile.setFileName(logPath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "LogManager: failed to open log file:" << logPath;
        m_logFile.close();
    }
}

void LogManager::log(Level level, const QString& category, const QString& message) {
    if (level < Debug || level > Error) {
        level = Error;
    }

    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
    QString formatted = QString("[%1] [%2] [%3] %4")
        .arg(timestamp, kLevelNames[level], category, message);

    {
        QMutexLocker locker(&m_mutex);
        if (level < m_minimumLevel)
            return;

        // file output
        if (m_logFile.isOpen()) {
            QTextStream stream(&m_logFile);
            stream << formatted << "\n";
            stream.flush();
        }

        if (m_consoleEcho)
            qInfo().noquote() << formatted;

        QVariantMap entry;
        entry["level"] = static_cast<int>(level);
        entry["timestamp"] = timestamp;
        entry["category"] = category;
        entry["message"] = message;
        m_buffer.append(entry);
        while (m_buffer.size() > m_maxBuffer)
            m_buffer.removeFirst();
    }

    emit logEntry(static_cast<int>(level), timestamp, category, message);
}

void LogManager::setMinimumLevel(Level level) {
    QMutexLocker locker(&m_mutex);
    m_minimumLevel = level;
}

LogManager::Level LogManager::minimumLevel() const {
    QMutexLocker locker(&m_mutex);
    return m_minimumLevel;
}

void LogManager::setConsoleEcho(bool enabled) {
    QMutexLocker locker(&m_mutex);
    m_consoleEcho = enabled;
}

QVariantList LogManager::recentLogs(int count) const {
    QMutexLocker locker(&m_mutex);
    QVariantList result;
    int start = qMax(0, static_cast<int>(m_buffer.size()) - count);
    for (int i = start; i < m_buffer.size(); ++i)
        result.append(m_buffer[i]);
    return result;
}

void LogManager::clearLogs() {
    QMutexLocker locker(&m_mutex);
    m_buffer.clear();
}

LogManager::Level LogManager::parseLevel(const QString& name, Level fallback) {
    const QString n = name.trimmed().toLower();
    if (n == QStringLiteral("debug"))
        return Debug;
    if (n == QStringLiteral("info"))
        return Info;
    if (n == QStringLiteral("warn") || n == QStringLiteral("warning"))
        return Warning;
    if (n == QStringLiteral("error"))
        return Error;
    return fallback;
}

QString LogManager::levelName(Level level) {
    switch (level) {
    case Debug:   return QStringLiteral("debug");
    case Info:    return QStringLiteral("info");
    case Warning: return QStringLiteral("warning");
    case Error:   return QStringLiteral("error");
    }
    return QStringLiteral("info");
}
