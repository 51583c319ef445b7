#ifndef TESTBOT_H
#define TESTBOT_H

#include "bot/BotCapability.h"

class TestBot : public BotCapability
{
public:
    explicit TestBot(const QString &botId);

    QString typeName() const override { return "TestBot"; }
    QStringList registerCommands() override;

    void onReady() override;
    void onCommand(const QString &command, const ControlMessage &message) override;
    void onTick() override;
    void shutdown() override;

    int tickCount() const { return ticks; }

private:
    int ticks = 0;
};

#endif // TESTBOT_H
