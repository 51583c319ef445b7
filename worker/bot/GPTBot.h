#ifndef GPTBOT_H
#define GPTBOT_H

#include "bot/BotCapability.h"

class GPTBot : public BotCapability
{
public:
    explicit GPTBot(const QString &botId);

    QString typeName() const override { return "GPTBot"; }
    QStringList registerCommands() override;

    void onReady() override;
    void onCommand(const QString &command, const ControlMessage &message) override;
    void shutdown() override;

    static QString generateResponse(const QString &message);

private:
    int conversations = 0;
};

#endif // GPTBOT_H
