#include "ManagerConfig.h"
#include "logging/LogManager.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QSettings>

static QString resolvePath(const QDir &base, const QString &path)
{
    if (path.isEmpty()) {
        return path;
    }
    return QDir::cleanPath(base.absoluteFilePath(path));
}

std::optional<ManagerConfig> ManagerConfig::load(const QString &path, QString *errorString)
{
    QFileInfo info(path);
    if (!info.exists()) {
        if (errorString) {
            *errorString = QString("Configuration file '%1' does not exist").arg(path);
        }
        return std::nullopt;
    }

    QSettings settings(info.absoluteFilePath(), QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        if (errorString) {
            *errorString = QString("Configuration file '%1' could not be parsed").arg(path);
        }
        return std::nullopt;
    }

    ManagerConfig config;
    config.configPath = info.absoluteFilePath();
    QDir baseDir = info.absoluteDir();

    settings.beginGroup("Manager");
    config.host = settings.value("host", config.host).toString();
    int port = settings.value("port", config.port).toInt();
    config.stopBotsOnShutdown = settings.value("stopBotsOnShutdown", config.stopBotsOnShutdown).toBool();
    config.stopTimeoutMs = settings.value("stopTimeoutMs", config.stopTimeoutMs).toInt();
    config.ackTimeoutMs = settings.value("ackTimeoutMs", config.ackTimeoutMs).toInt();
    config.retryIntervalMs = settings.value("retryIntervalMs", config.retryIntervalMs).toInt();
    config.processTablePath = resolvePath(baseDir, settings.value("processTable", "processes.json").toString());
    config.logDirectory = resolvePath(baseDir, settings.value("logDirectory", "logging").toString());
    config.workerProgram = resolvePath(baseDir, settings.value("workerProgram", "").toString());
    config.debugLogging = settings.value("debugLogging", false).toBool();
    settings.endGroup();

    if (port < 0 || port > 65535) {
        if (errorString) {
            *errorString = QString("Manager/port %1 is out of range").arg(port);
        }
        return std::nullopt;
    }
    config.port = static_cast<quint16>(port);

    if (config.workerProgram.isEmpty()) {
        QString appDir = QCoreApplication::instance() ? QCoreApplication::applicationDirPath() : QDir::currentPath();
        config.workerProgram = QDir(appDir).filePath("botworker");
    }

    settings.beginGroup("Bots");
    const QStringList botIds = settings.childGroups();
    for (const QString &botId : botIds) {
        settings.beginGroup(botId);

        BotConfig bot;
        bot.botId = botId;
        bot.type = settings.value("type").toString();
        bot.tokenEnvVar = settings.value("envtoken", settings.value("token_env_var")).toString();
        bot.program = settings.value("program").toString();
        if (bot.program.contains('/')) {
            bot.program = resolvePath(baseDir, bot.program);
        }
        bot.arguments = settings.value("arguments").toStringList();
        bot.workingDirectory = resolvePath(baseDir, settings.value("workingDirectory").toString());

        settings.endGroup();

        if (bot.type.isEmpty()) {
            LogManager::log(QString("Bot '%1' has no type configured, skipping").arg(botId), LogManager::Warning);
            continue;
        }

        config.bots.insert(botId, bot);
    }
    settings.endGroup();

    return config;
}

const BotConfig* ManagerConfig::bot(const QString &botId) const
{
    auto it = bots.constFind(botId);
    if (it == bots.constEnd()) {
        return nullptr;
    }
    return &it.value();
}

QString ManagerConfig::launchProgram(const BotConfig &bot) const
{
    return bot.program.isEmpty() ? workerProgram : bot.program;
}

QStringList ManagerConfig::launchArguments(const BotConfig &bot) const
{
    QStringList arguments;
    if (bot.program.isEmpty()) {
        arguments << "--bot-id" << bot.botId << "--config" << configPath;
    }

    for (QString argument : bot.arguments) {
        argument.replace("{bot_id}", bot.botId);
        argument.replace("{config}", configPath);
        arguments << argument;
    }
    return arguments;
}
