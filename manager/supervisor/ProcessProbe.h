#ifndef PROCESSPROBE_H
#define PROCESSPROBE_H

#include <QString>
#include <QStringList>

namespace ProcessProbe {

bool isAlive(qint64 pid);

// Space-joined argv of a live process, empty when unavailable or a zombie
QString commandLine(qint64 pid);

bool commandMatches(const QString &actual, const QString &expected);

// Alive and running the recorded command, so a reused PID does not count
bool isRunning(qint64 pid, const QString &command);

bool terminate(qint64 pid);
bool forceKill(qint64 pid);

QString joinCommand(const QString &program, const QStringList &arguments);

}

#endif // PROCESSPROBE_H
