#include "log_manager.h"
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QTextStream>
#include <QDebug>

namespace {

const char* const kLevelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};

QString timestampNow()
{
    return QDateTime::currentDateTime().toString(QStringLiteral("yyyy-MM-dd hh:mm:ss.zzz"));
}

}

LogManager& LogManager::instance() {
    static LogManager s_instance;
    return s_instance;
}

LogManager::~LogManager()
{
    closeFile();
}

bool LogManager::openFile(const QString& path) {
    QMutexLocker lock(&m_mutex);
    if (m_logFile.isOpen())
        m_logFile.close();

    QDir().mkpath(QFileInfo(path).absolutePath());
    m_logFile.setFileName(path);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "LogManager: failed to open log file:" << path;
        return false;
    }
    return true;
}

void LogManager::closeFile() {
    QMutexLocker lock(&m_mutex);
    if (m_logFile.isOpen()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

void LogManager::setMinimumLevel(Level level) {
    QMutexLocker lock(&m_mutex);
    m_minimumLevel = level;
}

LogManager::Level LogManager::minimumLevel() const {
    QMutexLocker lock(&m_mutex);
    return m_minimumLevel;
}

void LogManager::setEchoToStderr(bool echo) {
    QMutexLocker lock(&m_mutex);
    m_echo = echo;
}

void LogManager::setMaxBuffer(int entries) {
    QMutexLocker lock(&m_mutex);
    m_maxBuffer = qMax(1, entries);
    while (m_buffer.size() > m_maxBuffer)
        m_buffer.removeFirst();
}

void LogManager::log(Level level, const QString& category, const QString& message) {
    if (level < Debug || level > Error)
        level = Error;

    const QString timestamp = timestampNow();
    {
        QMutexLocker lock(&m_mutex);
        if (level < m_minimumLevel)
            return;

        const QString formatted = QStringLiteral("[%1] [%2] [%3] %4")
            .arg(timestamp, QString::fromLatin1(kLevelNames[level]), category, message);

        if (m_logFile.isOpen()) {
            QTextStream stream(&m_logFile);
            stream << formatted << "\n";
            stream.flush();
        }
        if (m_echo)
            qDebug().noquote() << formatted;

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

QVariantList LogManager::recentLogs(int count) const {
    QMutexLocker lock(&m_mutex);
    QVariantList result;
    const int start = qMax(0, static_cast<int>(m_buffer.size()) - count);
    for (int i = start; i < m_buffer.size(); ++i)
        result.append(m_buffer[i]);
    return result;
}

void LogManager::clearLogs() {
    QMutexLocker lock(&m_mutex);
    m_buffer.clear();
}

QString LogManager::formatMessage(Level level, const QString& category, const QString& message) {
    if (level < Debug || level > Error)
        level = Error;
    return QStringLiteral("[%1] [%2] [%3] %4")
        .arg(timestampNow(), QString::fromLatin1(kLevelNames[level]), category, message);
}
