#ifndef BOTRUNNER_H
#define BOTRUNNER_H

#include <QThread>
#include <QMutex>
#include <QStringList>
#include <atomic>
#include <memory>
#include "bot/BotCapability.h"
#include "bot/CommandQueue.h"
#include "network/WorkerClient.h"

class BotRunner : public QThread
{
    Q_OBJECT

public:
    static constexpr int TickIntervalMs = 500;

    BotRunner(std::unique_ptr<BotCapability> capability, const WorkerClientSettings &settings,
              QObject *parent = nullptr);
    ~BotRunner() override;

    void stop();
    bool isStopping() const { return stopping.load(); }

    // True when the loop ended because the manager sent stop
    bool stoppedByManager() const { return managerStop.load(); }

    WorkerClient& client() { return workerClient; }
    CommandQueue& commandQueue() { return commands; }
    QStringList commandNames() const;

signals:
    void commandReceived(const ControlMessage &message);

protected:
    void run() override;

private:
    bool dispatch(const ControlMessage &message);

    std::unique_ptr<BotCapability> bot;
    CommandQueue commands;
    WorkerClient workerClient;
    mutable QMutex commandsMutex;
    QStringList registeredCommands;
    std::atomic<bool> stopping{false};
    std::atomic<bool> managerStop{false};
};

#endif // BOTRUNNER_H
