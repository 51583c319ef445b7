#include "WorkerClient.h"
#include "logging/LogManager.h"

#include <QDeadlineTimer>

WorkerClient::WorkerClient(const WorkerClientSettings &settings, CommandQueue &commands)
    : QObject(nullptr)
    , settings(settings)
    , commands(commands)
    , retryTimer(new QTimer(this))
{
    retryTimer->setSingleShot(true);
    connect(retryTimer, &QTimer::timeout, this, &WorkerClient::attemptConnection);

    clientThread.setObjectName(QString("client:%1").arg(settings.botId));
    connect(&clientThread, &QThread::finished, retryTimer, &QTimer::stop, Qt::DirectConnection);
    moveToThread(&clientThread);
}

WorkerClient::~WorkerClient()
{
    shutdown();
    if (clientThread.isRunning()) {
        clientThread.wait();
    }
}

QString WorkerClient::stateName(State state)
{
    switch (state) {
        case State::Disconnected: return "Disconnected";
        case State::Connecting:   return "Connecting";
        case State::Registered:   return "Registered";
    }
    return "Unknown";
}

void WorkerClient::start()
{
    if (clientThread.isRunning()) {
        return;
    }

    stopping.store(false);
    clientThread.start();
    QMetaObject::invokeMethod(this, [this]() { attemptConnection(); }, Qt::QueuedConnection);
}

void WorkerClient::shutdown(int timeoutMs)
{
    if (stopping.exchange(true) && !clientThread.isRunning()) {
        return;
    }

    // Unblocks a registration waiting for its ack
    if (std::shared_ptr<ControlChannel> current = currentChannel()) {
        current->close();
    }

    clientThread.quit();
    if (!clientThread.wait(QDeadlineTimer(timeoutMs))) {
        LogManager::log(QString("Client thread for '%1' did not stop within %2 ms")
                            .arg(settings.botId).arg(timeoutMs),
                        LogManager::Warning);
        return;
    }

    dropChannel();
    setState(State::Disconnected);
}

void WorkerClient::attemptConnection()
{
    if (stopping.load()) {
        return;
    }

    setState(State::Connecting);
    LogManager::log(QString("Connecting to manager at %1:%2...").arg(settings.host).arg(settings.port),
                    LogManager::Info);

    auto newChannel = std::make_shared<ControlChannel>(settings.botId);
    quint64 generation = 0;
    {
        QMutexLocker locker(&channelMutex);
        channel = newChannel;
        generation = ++channelGeneration;
    }

    connect(newChannel.get(), &ControlChannel::messageReady, this, [this, generation]() {
        drainChannel(generation);
    });
    connect(newChannel.get(), &ControlChannel::closed, this, [this, generation](const QString &reason) {
        handleChannelClosed(generation, reason);
    });

    QString error;
    if (!newChannel->connectToPeer(settings.host, settings.port, settings.dialTimeoutMs, &error)) {
        LogManager::log(QString("Failed to connect to manager: %1").arg(error), LogManager::Warning);
        dropChannel();
        scheduleRetry();
        return;
    }

    if (stopping.load()) {
        return;
    }

    ControlError result = newChannel->send(ControlMessage::connected(settings.botId), settings.ackTimeoutMs);
    if (result != ControlError::None) {
        LogManager::log(QString("Registration with manager failed: %1").arg(controlErrorName(result)),
                        LogManager::Warning);
        dropChannel();
        scheduleRetry();
        return;
    }

    setState(State::Registered);
    LogManager::log(QString("Registered with manager as '%1'").arg(settings.botId), LogManager::Success);
    emit registered();

    drainChannel(generation);
}

void WorkerClient::scheduleRetry()
{
    if (stopping.load()) {
        return;
    }

    setState(State::Disconnected);
    LogManager::log(QString("Retrying connection in %1 ms").arg(settings.retryIntervalMs), LogManager::Info);
    retryTimer->start(settings.retryIntervalMs);
}

void WorkerClient::drainChannel(quint64 generation)
{
    std::shared_ptr<ControlChannel> current;
    {
        QMutexLocker locker(&channelMutex);
        if (generation != channelGeneration) {
            return;
        }
        current = channel;
    }
    if (!current) {
        return;
    }

    while (std::optional<ControlMessage> message = current->tryReceive()) {
        LogManager::log(QString("Received '%1' from manager").arg(ControlMessage::kindName(message->kind())),
                        LogManager::Debug);
        commands.push(*message);
    }
}

void WorkerClient::handleChannelClosed(quint64 generation, const QString &reason)
{
    {
        QMutexLocker locker(&channelMutex);
        if (generation != channelGeneration || !channel) {
            return;
        }
    }

    // A stop may have arrived right before the close
    drainChannel(generation);

    bool wasRegistered = isRegistered();
    LogManager::log(QString("Lost connection to manager: %1").arg(reason), LogManager::Warning);
    dropChannel();
    setState(State::Disconnected);
    if (wasRegistered) {
        emit disconnected();
    }
    scheduleRetry();
}

void WorkerClient::dropChannel()
{
    std::shared_ptr<ControlChannel> old;
    {
        QMutexLocker locker(&channelMutex);
        old.swap(channel);
    }
    if (old) {
        old->disconnect(this);
        old->close();
    }
}

std::shared_ptr<ControlChannel> WorkerClient::currentChannel() const
{
    QMutexLocker locker(&channelMutex);
    return channel;
}

void WorkerClient::setState(State state)
{
    State previous = currentState.exchange(state);
    if (previous != state) {
        LogManager::log(QString("Client state: %1 -> %2").arg(stateName(previous), stateName(state)),
                        LogManager::Debug);
        emit stateChanged(state);
    }
}

ControlError WorkerClient::sendToManager(const ControlMessage &message)
{
    if (!isRegistered()) {
        return ControlError::NotConnected;
    }

    std::shared_ptr<ControlChannel> current = currentChannel();
    if (!current) {
        return ControlError::NotConnected;
    }
    return current->send(message, settings.ackTimeoutMs);
}
