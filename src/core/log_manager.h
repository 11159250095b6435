#pragma once
#include <QObject>
#include <QFile>
#include <QMutex>
#include <QVariantMap>
#include <QList>

class LogManager : public QObject {
    Q_OBJECT

public:
    static LogManager& instance();

    enum Level { Debug, Info, Warning, Error };
    Q_ENUM(Level)

    // Opens (append) a log file; logging to the ring buffer works without one.
    bool openFile(const QString& path);
    void closeFile();

    void setMinimumLevel(Level level);
    Level minimumLevel() const;

    void setEchoToStderr(bool echo);

    void log(Level level, const QString& category, const QString& message);

    QVariantList recentLogs(int count = 200) const;
    void clearLogs();
    void setMaxBuffer(int entries);

    static QString formatMessage(Level level, const QString& category, const QString& message);

signals:
    void logEntry(int level, const QString& timestamp,
                  const QString& category, const QString& message);

private:
    LogManager() = default;
    ~LogManager() override;

    mutable QMutex m_mutex;
    QFile m_logFile;
    QList<QVariantMap> m_buffer;
    int m_maxBuffer = 2000;
    Level m_minimumLevel = Info;
    bool m_echo = false;
};

#define LOG_DEBUG(category, msg) LogManager::instance().log(LogManager::Debug, category, msg)
#define LOG_INFO(category, msg) LogManager::instance().log(LogManager::Info, category, msg)
#define LOG_WARNING(category, msg) LogManager::instance().log(LogManager::Warning, category, msg)
#define LOG_ERROR(category, msg) LogManager::instance().log(LogManager::Error, category, msg)
