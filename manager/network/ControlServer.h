#ifndef CONTROLSERVER_H
#define CONTROLSERVER_H

#include <QObject>
#include <QTcpServer>
#include <QThread>
#include <QHash>
#include <memory>
#include "network/ControlChannel.h"
#include "network/ControlMessage.h"
#include "network/ControlError.h"
#include "network/ConnectionRegistry.h"

// Accept loop; lives on the server's accept thread
class ControlListener : public QTcpServer
{
    Q_OBJECT

public:
    explicit ControlListener(ConnectionRegistry &registry, QObject *parent = nullptr);
    ~ControlListener() override;

    void closeAll();

signals:
    void botConnected(const QString &botId);
    void botDisconnected(const QString &botId);
    void messageReceived(const QString &botId, const ControlMessage &message);

protected:
    void incomingConnection(qintptr socketDescriptor) override;

private:
    void handleMessages(ControlChannel *channel);
    void handleClosed(ControlChannel *channel, const QString &reason);
    void registerBot(const std::shared_ptr<ControlChannel> &channel, const QString &botId);

    ConnectionRegistry &registry;
    QHash<ControlChannel*, std::shared_ptr<ControlChannel>> handlers;
    int nextConnectionId;
};

class ControlServer : public QObject
{
    Q_OBJECT

public:
    explicit ControlServer(QObject *parent = nullptr);
    ~ControlServer() override;

    // Delete copy constructor and assignment operator
    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    bool start(const QString &host, quint16 port, QString *errorString = nullptr);
    void stop();
    bool isListening() const;
    quint16 serverPort() const;

    ControlError sendTo(const QString &botId, const ControlMessage &message,
                        int ackTimeoutMs = ControlChannel::DefaultAckTimeoutMs);
    bool isConnected(const QString &botId) const;
    QStringList connectedBots() const;

    const ConnectionRegistry& registry() const { return connections; }

signals:
    void botConnected(const QString &botId);
    void botDisconnected(const QString &botId);
    void messageReceived(const QString &botId, const ControlMessage &message);

private:
    ConnectionRegistry connections;
    QThread acceptThread;
    ControlListener *listener = nullptr;
    quint16 boundPort = 0;
};

#endif // CONTROLSERVER_H
