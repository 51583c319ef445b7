#ifndef BOTCAPABILITY_H
#define BOTCAPABILITY_H

#include <QString>
#include <QStringList>
#include <QJsonValue>
#include <functional>
#include "network/ControlMessage.h"
#include "network/ControlError.h"

// What a concrete bot type plugs into the worker run loop
class BotCapability
{
public:
    using ReplyFunction = std::function<ControlError(const QJsonValue &payload)>;

    explicit BotCapability(const QString &botId) : id(botId) {}
    virtual ~BotCapability() = default;

    // Delete copy constructor and assignment operator
    BotCapability(const BotCapability&) = delete;
    BotCapability& operator=(const BotCapability&) = delete;

    virtual QString typeName() const = 0;

    // Names accepted in the "command" field of custom payloads
    virtual QStringList registerCommands() = 0;

    virtual void onReady() {}
    virtual void onCommand(const QString &command, const ControlMessage &message) = 0;
    virtual void onTick() {}
    virtual void shutdown() {}

    const QString& botId() const { return id; }
    void setReplyFunction(ReplyFunction function) { replyFunction = std::move(function); }

protected:
    ControlError reply(const QJsonValue &payload) const
    {
        if (!replyFunction) {
            return ControlError::NotConnected;
        }
        return replyFunction(payload);
    }

private:
    QString id;
    ReplyFunction replyFunction;
};

#endif // BOTCAPABILITY_H
