#include "BotFactory.h"
#include "bot/GPTBot.h"
#include "bot/TestBot.h"

namespace BotFactory {

std::unique_ptr<BotCapability> create(const QString &type, const QString &botId)
{
    if (type == "TestBot") {
        return std::make_unique<TestBot>(botId);
    }
    if (type == "GPTBot") {
        return std::make_unique<GPTBot>(botId);
    }
    return nullptr;
}

QStringList availableTypes()
{
    return {"TestBot", "GPTBot"};
}

}
