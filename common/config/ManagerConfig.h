#ifndef MANAGERCONFIG_H
#define MANAGERCONFIG_H

#include <QString>
#include <QStringList>
#include <QMap>
#include <optional>

struct BotConfig {
    QString botId;
    QString type;
    QString tokenEnvVar;
    QString program;             // empty: the botworker executable
    QStringList arguments;       // {bot_id} and {config} are substituted
    QString workingDirectory;
};

class ManagerConfig
{
public:
    ManagerConfig() = default;

    static std::optional<ManagerConfig> load(const QString &path, QString *errorString = nullptr);

    QString configPath;
    QString host = "127.0.0.1";
    quint16 port = 5000;
    bool stopBotsOnShutdown = false;
    int stopTimeoutMs = 10000;
    int ackTimeoutMs = 5000;
    int retryIntervalMs = 5000;
    QString processTablePath;
    QString logDirectory;
    QString workerProgram;
    bool debugLogging = false;

    QMap<QString, BotConfig> bots;

    const BotConfig* bot(const QString &botId) const;
    QStringList botIds() const { return bots.keys(); }

    // Program and argument list used to launch the given bot
    QString launchProgram(const BotConfig &bot) const;
    QStringList launchArguments(const BotConfig &bot) const;
};

#endif // MANAGERCONFIG_H
