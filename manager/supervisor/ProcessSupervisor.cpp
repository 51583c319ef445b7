#include "ProcessSupervisor.h"
#include "ProcessProbe.h"
#include "logging/LogManager.h"
#include "network/ControlServer.h"

#include <QDateTime>
#include <QDeadlineTimer>
#include <QProcess>
#include <QThread>

ProcessSupervisor::ProcessSupervisor(const ManagerConfig &config, ControlServer &server, ProcessTable &table,
                                     QObject *parent)
    : QObject(parent)
    , config(config)
    , server(server)
    , table(table)
{
}

SupervisorResult ProcessSupervisor::start(const QString &botId)
{
    const BotConfig *bot = config.bot(botId);
    if (!bot) {
        LogManager::log(QString("Bot '%1' not found").arg(botId), LogManager::Error);
        return SupervisorResult::failure(ControlError::UnknownBot,
                                         QString("Bot '%1' is not configured").arg(botId));
    }

    if (std::optional<ProcessRecord> record = table.value(botId)) {
        if (ProcessProbe::isRunning(record->pid, record->command)) {
            LogManager::log(QString("Bot '%1' is already running (pid %2)").arg(botId).arg(record->pid),
                            LogManager::Warning);
            return SupervisorResult::failure(ControlError::ProcessAlreadyRunning,
                                             QString("Bot '%1' is already running (pid %2)")
                                                 .arg(botId).arg(record->pid));
        }
        LogManager::log(QString("Removing stale process record for bot '%1' (pid %2)").arg(botId).arg(record->pid),
                        LogManager::Info);
        table.remove(botId);
    }

    const QString program = config.launchProgram(*bot);
    const QStringList arguments = config.launchArguments(*bot);

    QProcess process;
    process.setProgram(program);
    process.setArguments(arguments);
    if (!bot->workingDirectory.isEmpty()) {
        process.setWorkingDirectory(bot->workingDirectory);
    }
#ifdef Q_OS_UNIX
    // Own session, so a signal to the manager's process group leaves workers alone
    process.setUnixProcessParameters(QProcess::UnixProcessFlag::CreateNewSession);
#endif

    LogManager::log(QString("Executing launch command for bot '%1': %2 %3")
                        .arg(botId, program, arguments.join(' ')),
                    LogManager::Info);

    qint64 pid = 0;
    if (!process.startDetached(&pid) || pid <= 0) {
        QString reason = QString("Failed to launch bot '%1': %2").arg(botId, process.errorString());
        LogManager::log(reason, LogManager::Error);
        return SupervisorResult::failure(ControlError::LaunchFailed, reason);
    }

    ProcessRecord record;
    record.botId = botId;
    record.pid = pid;
    record.command = ProcessProbe::joinCommand(program, arguments);
    record.timestamp = QDateTime::currentSecsSinceEpoch();

    if (!table.insert(record)) {
        LogManager::log(QString("Bot '%1' started but its process record could not be saved").arg(botId),
                        LogManager::Warning);
    }

    LogManager::log(QString("Started bot '%1' (pid %2)").arg(botId).arg(pid), LogManager::Success);
    emit botStarted(botId, pid);
    return SupervisorResult::success(QString("Bot '%1' started (pid %2)").arg(botId).arg(pid));
}

bool ProcessSupervisor::waitForExit(const ProcessRecord &record, int timeoutMs) const
{
    QDeadlineTimer deadline(qMax(0, timeoutMs));
    while (ProcessProbe::isRunning(record.pid, record.command)) {
        if (deadline.hasExpired()) {
            return false;
        }
        QThread::msleep(static_cast<unsigned long>(qMin<qint64>(PollIntervalMs, qMax<qint64>(1, deadline.remainingTime()))));
    }
    return true;
}

SupervisorResult ProcessSupervisor::stop(const QString &botId, int timeoutMs)
{
    QDeadlineTimer deadline(qMax(0, timeoutMs));

    std::optional<ProcessRecord> record = table.value(botId);
    const bool connected = server.isConnected(botId);

    if (record && !ProcessProbe::isRunning(record->pid, record->command)) {
        LogManager::log(QString("Bot '%1' (pid %2) had already exited").arg(botId).arg(record->pid),
                        LogManager::Info);
        table.remove(botId);
        record.reset();
        if (!connected) {
            emit botStopped(botId);
            return SupervisorResult::success(QString("Bot '%1' had already exited").arg(botId));
        }
    }

    if (!record && !connected) {
        LogManager::log(QString("Bot '%1' is not running").arg(botId), LogManager::Warning);
        return SupervisorResult::failure(ControlError::NotRunning, QString("Bot '%1' is not running").arg(botId));
    }

    LogManager::log(QString("Stopping bot '%1'...").arg(botId), LogManager::Info);

    ControlError sent = ControlError::NotConnected;
    if (connected) {
        // Try graceful shutdown first
        int ackTimeoutMs = static_cast<int>(qMin<qint64>(config.ackTimeoutMs, deadline.remainingTime()));
        sent = server.sendTo(botId, ControlMessage::stop(botId), qMax(0, ackTimeoutMs));
    } else {
        LogManager::log(QString("Bot '%1' is not connected, sending SIGTERM to pid %2").arg(botId).arg(record->pid),
                        LogManager::Info);
        ProcessProbe::terminate(record->pid);
    }

    if (!record) {
        // Connected but not launched by this supervisor, nothing to wait on
        if (sent != ControlError::None) {
            return SupervisorResult::failure(sent, QString("Stop for bot '%1' was not confirmed: %2")
                                                       .arg(botId, controlErrorName(sent)));
        }
        return SupervisorResult::success(QString("Stop sent to bot '%1'").arg(botId));
    }

    if (waitForExit(*record, static_cast<int>(deadline.remainingTime()))) {
        table.remove(botId);
        LogManager::log(QString("Bot '%1' stopped").arg(botId), LogManager::Success);
        emit botStopped(botId);
        return SupervisorResult::success(QString("Bot '%1' stopped").arg(botId));
    }

    LogManager::log(QString("Bot '%1' didn't shut down gracefully, force killing...").arg(botId), LogManager::Warning);
    if (!ProcessProbe::forceKill(record->pid)) {
        LogManager::log(QString("SIGKILL to pid %1 failed").arg(record->pid), LogManager::Error);
    }

    if (waitForExit(*record, KillGraceMs)) {
        table.remove(botId);
        LogManager::log(QString("Bot '%1' was force killed").arg(botId), LogManager::Warning);
        emit botStopped(botId);
        return SupervisorResult::success(QString("Bot '%1' was force killed after %2 ms").arg(botId).arg(timeoutMs));
    }

    QString reason = QString("Bot '%1' (pid %2) did not exit after a forced kill").arg(botId).arg(record->pid);
    LogManager::log(reason, LogManager::Error);
    return SupervisorResult::failure(ControlError::ProcessTimeout, reason);
}

BotStatus ProcessSupervisor::status(const QString &botId) const
{
    BotStatus status;
    status.connected = server.isConnected(botId);

    if (std::optional<ProcessRecord> record = table.value(botId)) {
        status.pid = record->pid;
        status.running = ProcessProbe::isRunning(record->pid, record->command);
    }
    return status;
}

QStringList ProcessSupervisor::trackedBots() const
{
    QStringList bots = table.botIds();
    for (const QString &botId : server.connectedBots()) {
        if (!bots.contains(botId)) {
            bots.append(botId);
        }
    }
    bots.sort();
    return bots;
}

void ProcessSupervisor::recoverOrphans()
{
    const QMap<QString, ProcessRecord> records = table.records();
    for (const ProcessRecord &record : records) {
        if (ProcessProbe::isRunning(record.pid, record.command)) {
            LogManager::log(QString("Bot '%1' is still running from a previous session (pid %2)")
                                .arg(record.botId).arg(record.pid),
                            LogManager::Info);
        } else {
            LogManager::log(QString("Removing stale process record for bot '%1' (pid %2)")
                                .arg(record.botId).arg(record.pid),
                            LogManager::Info);
            table.remove(record.botId);
        }
    }
}

void ProcessSupervisor::shutdownAll(int timeoutMs)
{
    const QStringList bots = trackedBots();
    if (bots.isEmpty()) {
        return;
    }

    LogManager::log(QString("Stopping all bots (%1)...").arg(bots.size()), LogManager::Info);
    for (const QString &botId : bots) {
        SupervisorResult result = stop(botId, timeoutMs);
        if (!result.ok()) {
            LogManager::log(QString("Failed to stop bot '%1': %2").arg(botId, result.reason), LogManager::Error);
        }
    }
}
