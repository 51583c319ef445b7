#ifndef CONNECTIONREGISTRY_H
#define CONNECTIONREGISTRY_H

#include <QString>
#include <QStringList>
#include <QHash>
#include <QMutex>
#include <QDateTime>
#include <memory>
#include "network/ControlChannel.h"
#include "network/ControlError.h"

struct ConnectionRecord {
    QString botId;
    std::shared_ptr<ControlChannel> channel;
    QDateTime registeredAt;

    QDateTime lastActivity() const { return channel ? channel->lastActivity() : registeredAt; }
};

// Identity -> live connection. One lock guards the map and is never held
// while a channel does socket work.
class ConnectionRegistry
{
public:
    ConnectionRegistry() = default;

    // Delete copy constructor and assignment operator
    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    // RegistryConflict when botId is held by another connection, or the
    // channel is already registered under a different id
    ControlError registerConnection(const QString &botId, const std::shared_ptr<ControlChannel> &channel);

    // Removes the entry only if it still points at channel
    bool removeConnection(const QString &botId, const ControlChannel *channel);

    std::shared_ptr<ControlChannel> lookup(const QString &botId) const;
    QString botIdFor(const ControlChannel *channel) const;
    bool contains(const QString &botId) const;
    QStringList botIds() const;
    QList<ConnectionRecord> records() const;
    int size() const;
    QList<std::shared_ptr<ControlChannel>> takeAll();

private:
    mutable QMutex mutex;
    QHash<QString, ConnectionRecord> connections;
};

#endif // CONNECTIONREGISTRY_H
