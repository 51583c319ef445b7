#include "BotRunner.h"
#include "logging/LogManager.h"

#include <QJsonObject>

BotRunner::BotRunner(std::unique_ptr<BotCapability> capability, const WorkerClientSettings &settings,
                     QObject *parent)
    : QThread(parent)
    , bot(std::move(capability))
    , workerClient(settings, commands)
{
    setObjectName(QString("bot:%1").arg(settings.botId));
}

BotRunner::~BotRunner()
{
    if (isRunning()) {
        stop();
        wait();
    }
}

QStringList BotRunner::commandNames() const
{
    QMutexLocker locker(&commandsMutex);
    return registeredCommands;
}

void BotRunner::stop()
{
    stopping.store(true);
    commands.wake();
}

void BotRunner::run()
{
    const QStringList names = bot->registerCommands();
    {
        QMutexLocker locker(&commandsMutex);
        registeredCommands = names;
    }
    LogManager::log(QString("%1 '%2' registered commands: %3")
                        .arg(bot->typeName(), bot->botId(), names.join(", ")),
                    LogManager::Info);

    bot->setReplyFunction([this](const QJsonValue &payload) {
        return workerClient.sendToManager(ControlMessage::custom(bot->botId(), payload));
    });

    workerClient.start();
    bot->onReady();

    while (!stopping.load()) {
        const QList<ControlMessage> pending = commands.takeAll();
        for (const ControlMessage &message : pending) {
            if (!dispatch(message)) {
                managerStop.store(true);
                stopping.store(true);
                break;
            }
        }
        if (stopping.load()) {
            break;
        }

        bot->onTick();
        commands.waitForCommands(TickIntervalMs);
    }

    LogManager::log(QString("Bot '%1' is stopping").arg(bot->botId()), LogManager::Info);
    bot->shutdown();
    bot->setReplyFunction(nullptr);
    workerClient.shutdown();
}

bool BotRunner::dispatch(const ControlMessage &message)
{
    emit commandReceived(message);

    switch (message.kind()) {
        case ControlMessage::Kind::Stop:
            LogManager::log("Stop requested by manager", LogManager::Info);
            return false;

        case ControlMessage::Kind::Custom: {
            const QString command = message.payload().toObject().value("command").toString();
            if (!commandNames().contains(command)) {
                LogManager::log(QString("Unknown command '%1'").arg(command), LogManager::Warning);
                return true;
            }
            bot->onCommand(command, message);
            return true;
        }

        case ControlMessage::Kind::Connected:
        case ControlMessage::Kind::Ack:
            LogManager::log(QString("Ignoring '%1' from manager").arg(ControlMessage::kindName(message.kind())),
                            LogManager::Debug);
            return true;
    }
    return true;
}
