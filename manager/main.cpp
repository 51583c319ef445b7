#include <QCoreApplication>
#include <QCommandLineParser>
#include <QJsonDocument>
#include "config/ManagerConfig.h"
#include "console/OperatorConsole.h"
#include "logging/LogManager.h"
#include "network/ControlServer.h"
#include "supervisor/ProcessSupervisor.h"
#include "supervisor/ProcessTable.h"
#include "util/SignalWatcher.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("botmanager");

    QCommandLineParser parser;
    parser.setApplicationDescription("Launches, monitors and stops bot worker processes.");
    parser.addHelpOption();
    QCommandLineOption configOption("config", "Configuration file.", "file", "config.ini");
    QCommandLineOption debugOption("debug", "Enable debug logging.");
    parser.addOption(configOption);
    parser.addOption(debugOption);
    parser.process(app);

    LogManager::installQtMessageHandler();

    QString error;
    std::optional<ManagerConfig> config = ManagerConfig::load(parser.value(configOption), &error);
    if (!config) {
        LogManager::log(QString("Failed to load configuration: %1").arg(error), LogManager::Error);
        return 1;
    }

    if (parser.isSet(debugOption) || config->debugLogging) {
        LogManager::setMinimumLevel(LogManager::Debug);
    }
    LogManager::setLogFile(LogManager::logFilePath(config->logDirectory, "Manager"));
    LogManager::log(QString("Loaded %1 bot(s) from %2").arg(config->bots.size()).arg(config->configPath),
                    LogManager::Info);

    ControlServer server;
    if (!server.start(config->host, config->port, &error)) {
        LogManager::log(QString("Cannot start control server on %1:%2: %3")
                            .arg(config->host).arg(config->port).arg(error),
                        LogManager::Error);
        return 1;
    }

    QObject::connect(&server, &ControlServer::messageReceived, [](const QString &botId, const ControlMessage &message) {
        LogManager::log(QString("[%1] %2").arg(botId, QString::fromUtf8(
                            QJsonDocument(message.payload().toObject()).toJson(QJsonDocument::Compact))),
                        LogManager::Info);
    });

    ProcessTable table(config->processTablePath);
    ProcessSupervisor supervisor(*config, server, table);
    supervisor.recoverOrphans();

    OperatorConsole console(*config, supervisor, server);
    SignalWatcher watcher;

    QObject::connect(&console, &OperatorConsole::quitRequested, &app, &QCoreApplication::quit);
    QObject::connect(&watcher, &SignalWatcher::terminationRequested, &app, &QCoreApplication::quit);

    console.start();
    int exitCode = app.exec();

    if (config->stopBotsOnShutdown) {
        supervisor.shutdownAll(config->stopTimeoutMs);
    } else {
        LogManager::log("Leaving running bots in place", LogManager::Info);
    }
    server.stop();

    LogManager::log("Manager stopped", LogManager::Info);
    return exitCode;
}
