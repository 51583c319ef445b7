#ifndef LOGMANAGER_H
#define LOGMANAGER_H

#include <QObject>
#include <QString>
#include <QDateTime>
#include <QFile>
#include <QMutex>

class LogManager : public QObject
{
    Q_OBJECT

public:
    enum LogLevel { Debug, Info, Warning, Error, Success };
    Q_ENUM(LogLevel)

    static LogManager& instance();

    // Delete copy constructor and assignment operator
    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    static bool setLogFile(const QString &path);
    static void setMinimumLevel(LogLevel level);
    static void setConsoleOutput(bool enabled);
    static void installQtMessageHandler();

    // <dir>/<yyyy-MM-dd>_<name>.log, creating dir if needed
    static QString logFilePath(const QString &directory, const QString &name);

    static void log(const QString &message, LogLevel level = Info);

    static QString formatMessage(const QString &message, LogLevel level);
    static QString levelName(LogLevel level);

signals:
    void logRequested(const QString &message, LogManager::LogLevel level);

private:
    explicit LogManager(QObject *parent = nullptr);
    ~LogManager() override;

    bool setLogFileImpl(const QString &path);
    void logImpl(const QString &message, LogLevel level);

    QMutex mutex;
    QFile logFile;
    LogLevel minimumLevel = Info;
    bool consoleOutput = true;
};

#endif // LOGMANAGER_H
