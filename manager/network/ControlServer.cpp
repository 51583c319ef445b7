#include "ControlServer.h"
#include "logging/LogManager.h"

#include <QHostAddress>

ControlListener::ControlListener(ConnectionRegistry &registry, QObject *parent)
    : QTcpServer(parent)
    , registry(registry)
    , nextConnectionId(1000)
{
}

ControlListener::~ControlListener()
{
    closeAll();
}

void ControlListener::incomingConnection(qintptr socketDescriptor)
{
    int connectionId = nextConnectionId++;
    auto channel = std::make_shared<ControlChannel>(QString("connection-%1").arg(connectionId));

    QString error;
    if (!channel->attach(socketDescriptor, &error)) {
        LogManager::log(QString("Failed to accept connection %1: %2").arg(connectionId).arg(error),
                        LogManager::Error);
        return;
    }

    ControlChannel *raw = channel.get();
    handlers.insert(raw, channel);

    connect(raw, &ControlChannel::messageReady, this, [this, raw]() { handleMessages(raw); });
    connect(raw, &ControlChannel::closed, this, [this, raw](const QString &reason) { handleClosed(raw, reason); });

    LogManager::log(QString("New client connected (Connection ID: %1, peer %2)")
                        .arg(connectionId).arg(raw->peerAddress()),
                    LogManager::Info);

    // Frames or a close may have landed before the signals were connected
    if (raw->pendingMessages() > 0) {
        handleMessages(raw);
    }
    if (!raw->isOpen()) {
        handleClosed(raw, "Closed during accept");
    }
}

void ControlListener::handleMessages(ControlChannel *channel)
{
    auto it = handlers.constFind(channel);
    if (it == handlers.constEnd()) {
        return;
    }
    std::shared_ptr<ControlChannel> handler = it.value();

    while (std::optional<ControlMessage> message = handler->tryReceive()) {
        switch (message->kind()) {
            case ControlMessage::Kind::Connected:
                registerBot(handler, message->botId());
                break;
            case ControlMessage::Kind::Custom: {
                QString botId = registry.botIdFor(channel);
                if (botId.isEmpty()) {
                    LogManager::log(QString("Ignoring message from unregistered connection '%1'")
                                        .arg(handler->name()),
                                    LogManager::Warning);
                    break;
                }
                emit messageReceived(botId, *message);
                break;
            }
            case ControlMessage::Kind::Stop:
            case ControlMessage::Kind::Ack:
                LogManager::log(QString("Unexpected '%1' from connection '%2'")
                                    .arg(ControlMessage::kindName(message->kind()), handler->name()),
                                LogManager::Warning);
                break;
        }
    }
}

void ControlListener::registerBot(const std::shared_ptr<ControlChannel> &channel, const QString &botId)
{
    if (botId.isEmpty()) {
        LogManager::log(QString("Connection '%1' sent an empty bot_id, closing").arg(channel->name()),
                        LogManager::Error);
        channel->close();
        return;
    }

    QString current = registry.botIdFor(channel.get());
    if (!current.isEmpty() && current != botId) {
        LogManager::log(QString("Connection already registered as '%1' tried to register as '%2', ignoring")
                            .arg(current, botId),
                        LogManager::Error);
        return;
    }

    ControlError result = registry.registerConnection(botId, channel);
    if (result == ControlError::RegistryConflict) {
        LogManager::log(QString("Registry conflict: bot '%1' is already connected, rejecting connection from %2")
                            .arg(botId, channel->peerAddress()),
                        LogManager::Error);
        channel->close();
        return;
    }

    if (current == botId) {
        return;
    }

    channel->setName(botId);
    LogManager::log(QString("Bot '%1' connected (%2)").arg(botId, channel->peerAddress()), LogManager::Success);
    emit botConnected(botId);
}

void ControlListener::handleClosed(ControlChannel *channel, const QString &reason)
{
    auto it = handlers.find(channel);
    if (it == handlers.end()) {
        return;
    }
    std::shared_ptr<ControlChannel> handler = it.value();
    handlers.erase(it);

    QString botId = registry.botIdFor(channel);
    if (!botId.isEmpty() && registry.removeConnection(botId, channel)) {
        LogManager::log(QString("Bot '%1' disconnected: %2").arg(botId, reason), LogManager::Warning);
        emit botDisconnected(botId);
    } else {
        LogManager::log(QString("Client disconnected (%1): %2").arg(channel->name(), reason), LogManager::Info);
    }
}

void ControlListener::closeAll()
{
    QHash<ControlChannel*, std::shared_ptr<ControlChannel>> closing;
    closing.swap(handlers);

    for (const auto &channel : std::as_const(closing)) {
        channel->disconnect(this);
        channel->close();
    }
    registry.takeAll();
}

ControlServer::ControlServer(QObject *parent)
    : QObject(parent)
{
    qRegisterMetaType<ControlMessage>();
    acceptThread.setObjectName("control-server");
}

ControlServer::~ControlServer()
{
    stop();
}

bool ControlServer::start(const QString &host, quint16 port, QString *errorString)
{
    if (listener) {
        LogManager::log("Control server already running", LogManager::Warning);
        return false;
    }

    QHostAddress address;
    if (!address.setAddress(host)) {
        if (host == "localhost") {
            address = QHostAddress::LocalHost;
        } else {
            if (errorString) {
                *errorString = QString("Invalid listen address '%1'").arg(host);
            }
            return false;
        }
    }

    listener = new ControlListener(connections);
    listener->moveToThread(&acceptThread);

    connect(listener, &ControlListener::botConnected, this, &ControlServer::botConnected, Qt::DirectConnection);
    connect(listener, &ControlListener::botDisconnected, this, &ControlServer::botDisconnected, Qt::DirectConnection);
    connect(listener, &ControlListener::messageReceived, this, &ControlServer::messageReceived, Qt::DirectConnection);

    acceptThread.start();

    bool listening = false;
    QString error;
    QMetaObject::invokeMethod(listener, [&]() {
        listening = listener->listen(address, port);
        if (listening) {
            boundPort = listener->serverPort();
        } else {
            error = listener->errorString();
        }
    }, Qt::BlockingQueuedConnection);

    if (!listening) {
        LogManager::log(QString("Failed to listen on %1:%2: %3").arg(host).arg(port).arg(error), LogManager::Error);
        if (errorString) {
            *errorString = error;
        }
        acceptThread.quit();
        acceptThread.wait();
        delete listener;
        listener = nullptr;
        return false;
    }

    LogManager::log(QString("Control server listening on %1:%2").arg(host).arg(boundPort), LogManager::Success);
    return true;
}

void ControlServer::stop()
{
    if (!listener) {
        return;
    }

    QMetaObject::invokeMethod(listener, [this]() {
        listener->close();
        listener->closeAll();
    }, Qt::BlockingQueuedConnection);

    acceptThread.quit();
    acceptThread.wait();
    delete listener;
    listener = nullptr;
    boundPort = 0;

    LogManager::log("Control server stopped", LogManager::Info);
}

bool ControlServer::isListening() const
{
    return listener != nullptr;
}

quint16 ControlServer::serverPort() const
{
    return boundPort;
}

ControlError ControlServer::sendTo(const QString &botId, const ControlMessage &message, int ackTimeoutMs)
{
    std::shared_ptr<ControlChannel> channel = connections.lookup(botId);
    if (!channel) {
        LogManager::log(QString("Cannot send '%1': bot '%2' not connected")
                            .arg(ControlMessage::kindName(message.kind()), botId),
                        LogManager::Warning);
        return ControlError::NotConnected;
    }

    ControlError result = channel->send(message, ackTimeoutMs);
    switch (result) {
        case ControlError::None:
            LogManager::log(QString("Sent '%1' to bot '%2'").arg(ControlMessage::kindName(message.kind()), botId),
                            LogManager::Info);
            break;
        case ControlError::ChannelClosed:
            LogManager::log(QString("Bot '%1' disconnected before '%2' was confirmed")
                                .arg(botId, ControlMessage::kindName(message.kind())),
                            LogManager::Warning);
            result = ControlError::NotConnected;
            break;
        default:
            LogManager::log(QString("Sending '%1' to bot '%2' failed: %3")
                                .arg(ControlMessage::kindName(message.kind()), botId, controlErrorName(result)),
                            LogManager::Warning);
            break;
    }
    return result;
}

bool ControlServer::isConnected(const QString &botId) const
{
    return connections.contains(botId);
}

QStringList ControlServer::connectedBots() const
{
    return connections.botIds();
}
