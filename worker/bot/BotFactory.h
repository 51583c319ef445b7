#ifndef BOTFACTORY_H
#define BOTFACTORY_H

#include <QString>
#include <QStringList>
#include <memory>
#include "bot/BotCapability.h"

namespace BotFactory {

// nullptr for an unknown type
std::unique_ptr<BotCapability> create(const QString &type, const QString &botId);

QStringList availableTypes();

}

#endif // BOTFACTORY_H
