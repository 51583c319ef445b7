#include "ConnectionRegistry.h"

ControlError ConnectionRegistry::registerConnection(const QString &botId, const std::shared_ptr<ControlChannel> &channel)
{
    QMutexLocker locker(&mutex);

    auto existing = connections.constFind(botId);
    if (existing != connections.constEnd()) {
        if (existing->channel == channel) {
            return ControlError::None;
        }
        return ControlError::RegistryConflict;
    }

    for (auto it = connections.constBegin(); it != connections.constEnd(); ++it) {
        if (it->channel == channel) {
            return ControlError::RegistryConflict;
        }
    }

    ConnectionRecord record;
    record.botId = botId;
    record.channel = channel;
    record.registeredAt = QDateTime::currentDateTimeUtc();
    connections.insert(botId, record);
    return ControlError::None;
}

bool ConnectionRegistry::removeConnection(const QString &botId, const ControlChannel *channel)
{
    // Released after the lock so a last reference never closes a channel under it
    std::shared_ptr<ControlChannel> released;
    {
        QMutexLocker locker(&mutex);

        auto it = connections.find(botId);
        if (it == connections.end() || it->channel.get() != channel) {
            return false;
        }
        released = std::move(it->channel);
        connections.erase(it);
    }
    return true;
}

std::shared_ptr<ControlChannel> ConnectionRegistry::lookup(const QString &botId) const
{
    QMutexLocker locker(&mutex);
    auto it = connections.constFind(botId);
    if (it == connections.constEnd()) {
        return nullptr;
    }
    return it->channel;
}

QString ConnectionRegistry::botIdFor(const ControlChannel *channel) const
{
    QMutexLocker locker(&mutex);
    for (auto it = connections.constBegin(); it != connections.constEnd(); ++it) {
        if (it->channel.get() == channel) {
            return it.key();
        }
    }
    return QString();
}

bool ConnectionRegistry::contains(const QString &botId) const
{
    QMutexLocker locker(&mutex);
    return connections.contains(botId);
}

QStringList ConnectionRegistry::botIds() const
{
    QMutexLocker locker(&mutex);
    QStringList ids = connections.keys();
    ids.sort();
    return ids;
}

QList<ConnectionRecord> ConnectionRegistry::records() const
{
    QMutexLocker locker(&mutex);
    return connections.values();
}

int ConnectionRegistry::size() const
{
    QMutexLocker locker(&mutex);
    return connections.size();
}

QList<std::shared_ptr<ControlChannel>> ConnectionRegistry::takeAll()
{
    QMutexLocker locker(&mutex);
    QList<std::shared_ptr<ControlChannel>> channels;
    for (const ConnectionRecord &record : std::as_const(connections)) {
        channels.append(record.channel);
    }
    connections.clear();
    return channels;
}
