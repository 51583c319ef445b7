#include <QCoreApplication>
#include <QCommandLineParser>
#include "bot/BotFactory.h"
#include "bot/BotRunner.h"
#include "config/ManagerConfig.h"
#include "logging/LogManager.h"
#include "util/SignalWatcher.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("botworker");

    QCommandLineParser parser;
    parser.setApplicationDescription("Runs one bot and keeps it registered with the manager.");
    parser.addHelpOption();
    QCommandLineOption botIdOption("bot-id", "Identity of the bot to run.", "id");
    QCommandLineOption configOption("config", "Configuration file shared with the manager.", "file");
    QCommandLineOption debugOption("debug", "Enable debug logging.");
    parser.addOption(botIdOption);
    parser.addOption(configOption);
    parser.addOption(debugOption);
    parser.process(app);

    LogManager::installQtMessageHandler();

    if (!parser.isSet(botIdOption) || !parser.isSet(configOption)) {
        LogManager::log("Both --bot-id and --config are required", LogManager::Error);
        return 1;
    }
    const QString botId = parser.value(botIdOption);

    QString error;
    std::optional<ManagerConfig> config = ManagerConfig::load(parser.value(configOption), &error);
    if (!config) {
        LogManager::log(QString("Failed to load configuration: %1").arg(error), LogManager::Error);
        return 1;
    }

    if (parser.isSet(debugOption) || config->debugLogging) {
        LogManager::setMinimumLevel(LogManager::Debug);
    }
    LogManager::setLogFile(LogManager::logFilePath(config->logDirectory, botId));

    const BotConfig *bot = config->bot(botId);
    if (!bot) {
        LogManager::log(QString("Bot '%1' is not configured").arg(botId), LogManager::Error);
        return 2;
    }

    std::unique_ptr<BotCapability> capability = BotFactory::create(bot->type, botId);
    if (!capability) {
        LogManager::log(QString("Unknown bot type '%1' (available: %2)")
                            .arg(bot->type, BotFactory::availableTypes().join(", ")),
                        LogManager::Error);
        return 2;
    }

    if (bot->tokenEnvVar.isEmpty()) {
        LogManager::log(QString("No token environment variable configured for bot '%1'").arg(botId),
                        LogManager::Warning);
    } else if (qEnvironmentVariableIsEmpty(bot->tokenEnvVar.toLocal8Bit().constData())) {
        LogManager::log(QString("Environment variable %1 is not set").arg(bot->tokenEnvVar), LogManager::Warning);
    }

    WorkerClientSettings settings;
    settings.botId = botId;
    settings.host = config->host;
    settings.port = config->port;
    settings.retryIntervalMs = config->retryIntervalMs;
    settings.ackTimeoutMs = config->ackTimeoutMs;

    BotRunner runner(std::move(capability), settings);
    SignalWatcher watcher;

    QObject::connect(&watcher, &SignalWatcher::terminationRequested, &runner, [&runner](int) { runner.stop(); });
    QObject::connect(&runner, &QThread::finished, &app, &QCoreApplication::quit);

    LogManager::log(QString("Starting bot '%1' (%2)").arg(botId, bot->type), LogManager::Info);
    runner.start();
    int exitCode = app.exec();
    runner.wait();

    LogManager::log(QString("Bot '%1' exited%2")
                        .arg(botId, runner.stoppedByManager() ? " on manager request" : ""),
                    LogManager::Info);
    return exitCode;
}
