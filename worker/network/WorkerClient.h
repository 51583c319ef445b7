#ifndef WORKERCLIENT_H
#define WORKERCLIENT_H

#include <QObject>
#include <QThread>
#include <QTimer>
#include <QMutex>
#include <atomic>
#include <memory>
#include "network/ControlChannel.h"
#include "network/ControlMessage.h"
#include "network/ControlError.h"
#include "bot/CommandQueue.h"

struct WorkerClientSettings {
    QString botId;
    QString host = "127.0.0.1";
    quint16 port = 5000;
    int retryIntervalMs = 5000;
    int ackTimeoutMs = ControlChannel::DefaultAckTimeoutMs;
    int dialTimeoutMs = 3000;
};

// Keeps a worker registered with the manager. Runs on its own thread and
// redials at a fixed interval whenever the connection is lost.
class WorkerClient : public QObject
{
    Q_OBJECT

public:
    enum class State { Disconnected, Connecting, Registered };
    Q_ENUM(State)

    WorkerClient(const WorkerClientSettings &settings, CommandQueue &commands);
    ~WorkerClient() override;

    // Delete copy constructor and assignment operator
    WorkerClient(const WorkerClient&) = delete;
    WorkerClient& operator=(const WorkerClient&) = delete;

    void start();
    void shutdown(int timeoutMs = 5000);

    State state() const { return currentState.load(); }
    bool isRegistered() const { return state() == State::Registered; }
    const QString& botId() const { return settings.botId; }

    ControlError sendToManager(const ControlMessage &message);

    static QString stateName(State state);

signals:
    void stateChanged(WorkerClient::State state);
    void registered();
    void disconnected();

private:
    void attemptConnection();
    void scheduleRetry();
    void drainChannel(quint64 generation);
    void handleChannelClosed(quint64 generation, const QString &reason);
    void dropChannel();
    void setState(State state);
    std::shared_ptr<ControlChannel> currentChannel() const;

    const WorkerClientSettings settings;
    CommandQueue &commands;

    QThread clientThread;
    QTimer *retryTimer;
    std::atomic<State> currentState{State::Disconnected};
    std::atomic<bool> stopping{false};

    mutable QMutex channelMutex;
    std::shared_ptr<ControlChannel> channel;
    quint64 channelGeneration = 0;
};

#endif // WORKERCLIENT_H
