#ifndef PROCESSSUPERVISOR_H
#define PROCESSSUPERVISOR_H

#include <QObject>
#include <QString>
#include <QStringList>
#include "config/ManagerConfig.h"
#include "network/ControlError.h"
#include "supervisor/ProcessTable.h"

class ControlServer;

struct BotStatus {
    bool running = false;
    bool connected = false;
    qint64 pid = 0;
};

class ProcessSupervisor : public QObject
{
    Q_OBJECT

public:
    static constexpr int PollIntervalMs = 100;
    static constexpr int KillGraceMs = 2000;

    ProcessSupervisor(const ManagerConfig &config, ControlServer &server, ProcessTable &table,
                      QObject *parent = nullptr);

    // Delete copy constructor and assignment operator
    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    SupervisorResult start(const QString &botId);
    SupervisorResult stop(const QString &botId, int timeoutMs);
    SupervisorResult stop(const QString &botId) { return stop(botId, config.stopTimeoutMs); }
    BotStatus status(const QString &botId) const;

    QStringList trackedBots() const;
    void recoverOrphans();
    void shutdownAll(int timeoutMs);

signals:
    void botStarted(const QString &botId, qint64 pid);
    void botStopped(const QString &botId);

private:
    bool waitForExit(const ProcessRecord &record, int timeoutMs) const;

    const ManagerConfig &config;
    ControlServer &server;
    ProcessTable &table;
};

#endif // PROCESSSUPERVISOR_H
