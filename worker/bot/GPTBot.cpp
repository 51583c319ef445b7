#include "GPTBot.h"
#include "logging/LogManager.h"

#include <QJsonObject>

GPTBot::GPTBot(const QString &botId)
    : BotCapability(botId)
{
    LogManager::log("Bot initialized.", LogManager::Info);
}

QStringList GPTBot::registerCommands()
{
    return {"hello", "chat"};
}

void GPTBot::onReady()
{
    LogManager::log(QString("GPTBot '%1' is ready").arg(botId()), LogManager::Info);
}

QString GPTBot::generateResponse(const QString &message)
{
    // Model inference happens outside this process
    return QString("ChatGPT says: %1").arg(message);
}

void GPTBot::onCommand(const QString &command, const ControlMessage &message)
{
    QJsonObject response;
    response["command"] = command;

    if (command == "chat") {
        ++conversations;
        response["message"] = generateResponse(message.payload().toObject().value("message").toString());
    } else {
        response["message"] = "Hello!";
    }

    ControlError result = reply(response);
    if (result != ControlError::None) {
        LogManager::log(QString("Reply to '%1' not delivered: %2").arg(command, controlErrorName(result)),
                        LogManager::Warning);
    }
}

void GPTBot::shutdown()
{
    LogManager::log(QString("GPTBot '%1' shutting down after %2 chats").arg(botId()).arg(conversations),
                    LogManager::Info);
}
