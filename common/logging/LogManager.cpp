#include "LogManager.h"

#include <QDir>
#include <QFileInfo>
#include <QTextStream>
#include <cstdio>

LogManager::LogManager(QObject *parent)
    : QObject(parent)
{
}

LogManager::~LogManager()
{
    QMutexLocker locker(&mutex);
    if (logFile.isOpen()) {
        logFile.close();
    }
}

LogManager& LogManager::instance()
{
    static LogManager instance;
    return instance;
}

bool LogManager::setLogFile(const QString &path)
{
    return instance().setLogFileImpl(path);
}

bool LogManager::setLogFileImpl(const QString &path)
{
    QMutexLocker locker(&mutex);

    if (logFile.isOpen()) {
        logFile.close();
    }
    if (path.isEmpty()) {
        return true;
    }

    logFile.setFileName(path);
    if (!logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "Failed to open log file '%s': %s\n",
                     qPrintable(path), qPrintable(logFile.errorString()));
        return false;
    }
    return true;
}

void LogManager::setMinimumLevel(LogLevel level)
{
    QMutexLocker locker(&instance().mutex);
    instance().minimumLevel = level;
}

void LogManager::setConsoleOutput(bool enabled)
{
    QMutexLocker locker(&instance().mutex);
    instance().consoleOutput = enabled;
}

static void qtMessageHandler(QtMsgType type, const QMessageLogContext &, const QString &message)
{
    switch (type) {
        case QtDebugMsg:
            LogManager::log(message, LogManager::Debug);
            break;
        case QtInfoMsg:
            LogManager::log(message, LogManager::Info);
            break;
        case QtWarningMsg:
            LogManager::log(message, LogManager::Warning);
            break;
        case QtCriticalMsg:
        case QtFatalMsg:
            LogManager::log(message, LogManager::Error);
            break;
    }
}

void LogManager::installQtMessageHandler()
{
    qInstallMessageHandler(qtMessageHandler);
}

QString LogManager::logFilePath(const QString &directory, const QString &name)
{
    QDir dir(directory);
    if (!dir.exists()) {
        dir.mkpath(".");
    }
    QString date = QDate::currentDate().toString("yyyy-MM-dd");
    return dir.filePath(QString("%1_%2.log").arg(date, name));
}

void LogManager::log(const QString &message, LogLevel level)
{
    instance().logImpl(message, level);
}

void LogManager::logImpl(const QString &message, LogLevel level)
{
    {
        QMutexLocker locker(&mutex);
        if (level < minimumLevel && level != Success) {
            return;
        }

        QString line = formatMessage(message, level);
        if (consoleOutput) {
            std::fprintf(stderr, "%s\n", qPrintable(line));
            std::fflush(stderr);
        }
        if (logFile.isOpen()) {
            QTextStream stream(&logFile);
            stream << line << '\n';
            stream.flush();
        }
    }

    emit logRequested(message, level);
}

QString LogManager::levelName(LogLevel level)
{
    switch (level) {
        case Debug:
            return "DEBUG";
        case Info:
            return "INFO";
        case Warning:
            return "WARN";
        case Error:
            return "ERROR";
        case Success:
            return "OK";
    }
    return "INFO";
}

QString LogManager::formatMessage(const QString &message, LogLevel level)
{
    QString timestamp = QDateTime::currentDateTime().toString("[hh:mm:ss]");
    return QString("%1 [%2] %3").arg(timestamp, levelName(level), message);
}
