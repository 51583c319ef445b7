#include "TestBot.h"
#include "logging/LogManager.h"

#include <QJsonObject>

TestBot::TestBot(const QString &botId)
    : BotCapability(botId)
{
}

QStringList TestBot::registerCommands()
{
    return {"hello", "echo"};
}

void TestBot::onReady()
{
    LogManager::log(QString("TestBot '%1' is ready").arg(botId()), LogManager::Info);
}

void TestBot::onCommand(const QString &command, const ControlMessage &message)
{
    QJsonObject response;
    response["command"] = command;

    if (command == "hello") {
        response["message"] = "Hello!";
    } else if (command == "echo") {
        // Respond with the same message that was received
        response["message"] = message.payload().toObject().value("message");
    }

    ControlError result = reply(response);
    if (result != ControlError::None) {
        LogManager::log(QString("Reply to '%1' not delivered: %2").arg(command, controlErrorName(result)),
                        LogManager::Warning);
    }
}

void TestBot::onTick()
{
    ++ticks;
    if (ticks % 120 == 0) {
        LogManager::log(QString("TestBot '%1' alive (%2 ticks)").arg(botId()).arg(ticks), LogManager::Debug);
    }
}

void TestBot::shutdown()
{
    LogManager::log(QString("TestBot '%1' shutting down").arg(botId()), LogManager::Info);
}
