#ifndef OPERATORCONSOLE_H
#define OPERATORCONSOLE_H

#include <QObject>
#include <QByteArray>
#include <QString>
#include <QStringList>

class QSocketNotifier;
class ManagerConfig;
class ControlServer;
class ProcessSupervisor;

// Line-oriented operator commands read from stdin
class OperatorConsole : public QObject
{
    Q_OBJECT

public:
    OperatorConsole(const ManagerConfig &config, ProcessSupervisor &supervisor, ControlServer &server,
                    QObject *parent = nullptr);
    ~OperatorConsole() override;

    // Delete copy constructor and assignment operator
    OperatorConsole(const OperatorConsole&) = delete;
    OperatorConsole& operator=(const OperatorConsole&) = delete;

    void start();

    // Runs one command line and returns the text to print
    QString execute(const QString &line);

    static QString helpText();

signals:
    void quitRequested();

private:
    void handleInput();
    QString statusLine(const QString &botId) const;
    QString listBots() const;
    QString sendCustom(const QStringList &words);

    const ManagerConfig &config;
    ProcessSupervisor &supervisor;
    ControlServer &server;
    QSocketNotifier *notifier = nullptr;
    QByteArray pending;
};

#endif // OPERATORCONSOLE_H
