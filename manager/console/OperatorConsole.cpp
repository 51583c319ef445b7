#include "OperatorConsole.h"
#include "config/ManagerConfig.h"
#include "logging/LogManager.h"
#include "network/ControlServer.h"
#include "supervisor/ProcessSupervisor.h"

#include <QJsonObject>
#include <QSocketNotifier>
#include <QTextStream>

#include <unistd.h>

OperatorConsole::OperatorConsole(const ManagerConfig &config, ProcessSupervisor &supervisor, ControlServer &server,
                                 QObject *parent)
    : QObject(parent)
    , config(config)
    , supervisor(supervisor)
    , server(server)
{
}

OperatorConsole::~OperatorConsole() = default;

void OperatorConsole::start()
{
    if (notifier) {
        return;
    }
    notifier = new QSocketNotifier(STDIN_FILENO, QSocketNotifier::Read, this);
    connect(notifier, &QSocketNotifier::activated, this, &OperatorConsole::handleInput);

    QTextStream(stdout) << "Type 'help' for commands." << Qt::endl;
}

QString OperatorConsole::helpText()
{
    return QStringLiteral(
        "start <id>                      Launch a bot process\n"
        "stop <id>                       Stop a bot, force killing it after the stop timeout\n"
        "status [<id>]                   Show running/connected state\n"
        "list                            List configured bots\n"
        "log <id>                        Show the path of a bot's log file\n"
        "send <id> <command> [message]   Send a custom command to a connected bot\n"
        "quit                            Exit the manager");
}

void OperatorConsole::handleInput()
{
    char buffer[4096];
    ssize_t count = ::read(STDIN_FILENO, buffer, sizeof(buffer));
    if (count <= 0) {
        LogManager::log("Console input closed", LogManager::Info);
        notifier->setEnabled(false);
        return;
    }
    pending.append(buffer, static_cast<int>(count));

    int newline = -1;
    while ((newline = pending.indexOf('\n')) >= 0) {
        QString line = QString::fromLocal8Bit(pending.left(newline)).trimmed();
        pending.remove(0, newline + 1);

        QString output = execute(line);
        if (!output.isEmpty()) {
            QTextStream(stdout) << output << Qt::endl;
        }
    }
}

QString OperatorConsole::execute(const QString &line)
{
    const QStringList words = line.split(' ', Qt::SkipEmptyParts);
    if (words.isEmpty()) {
        return QString();
    }

    const QString command = words.first().toLower();
    const QString botId = words.value(1);

    if (command == "help") {
        return helpText();
    }
    if (command == "quit" || command == "exit") {
        emit quitRequested();
        return QString();
    }
    if (command == "list") {
        return listBots();
    }
    if (command == "status") {
        if (!botId.isEmpty()) {
            return statusLine(botId);
        }
        QStringList bots = config.botIds();
        for (const QString &tracked : supervisor.trackedBots()) {
            if (!bots.contains(tracked)) {
                bots.append(tracked);
            }
        }
        bots.sort();
        QStringList lines;
        for (const QString &id : std::as_const(bots)) {
            lines << statusLine(id);
        }
        return lines.isEmpty() ? QString("No bots configured") : lines.join('\n');
    }
    if (command == "send") {
        return sendCustom(words);
    }

    if (command != "start" && command != "stop" && command != "log") {
        return QString("Unknown command '%1'. Type 'help' for commands.").arg(command);
    }
    if (botId.isEmpty()) {
        return QString("Usage: %1 <id>").arg(command);
    }

    if (command == "start") {
        return supervisor.start(botId).reason;
    }
    if (command == "stop") {
        return supervisor.stop(botId).reason;
    }
    return LogManager::logFilePath(config.logDirectory, botId);
}

QString OperatorConsole::statusLine(const QString &botId) const
{
    BotStatus status = supervisor.status(botId);

    QString process = status.running ? QString("running (pid %1)").arg(status.pid) : QString("stopped");
    QString connection = status.connected ? "connected" : "disconnected";
    return QString("%1: %2, %3").arg(botId, process, connection);
}

QString OperatorConsole::listBots() const
{
    QStringList lines;
    for (const BotConfig &bot : config.bots) {
        lines << QString("%1 (%2)").arg(bot.botId, bot.type);
    }
    return lines.isEmpty() ? QString("No bots configured") : lines.join('\n');
}

QString OperatorConsole::sendCustom(const QStringList &words)
{
    if (words.size() < 3) {
        return "Usage: send <id> <command> [message]";
    }

    QJsonObject payload;
    payload["command"] = words.at(2);
    if (words.size() > 3) {
        payload["message"] = words.mid(3).join(' ');
    }

    ControlError result = server.sendTo(words.at(1), ControlMessage::custom(words.at(1), payload),
                                        config.ackTimeoutMs);
    if (result != ControlError::None) {
        return QString("Send to '%1' failed: %2").arg(words.at(1), controlErrorName(result));
    }
    return QString("Sent '%1' to '%2'").arg(words.at(2), words.at(1));
}
