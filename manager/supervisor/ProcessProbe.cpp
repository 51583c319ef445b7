#include "ProcessProbe.h"

#include <QFile>
#include <QFileInfo>
#include <QtGlobal>

#ifdef Q_OS_UNIX
#include <signal.h>
#include <sys/types.h>
#include <errno.h>
#endif

namespace ProcessProbe {

bool isAlive(qint64 pid)
{
    if (pid <= 0) {
        return false;
    }
#ifdef Q_OS_UNIX
    if (::kill(static_cast<pid_t>(pid), 0) == 0) {
        return true;
    }
    return errno == EPERM;
#else
    return false;
#endif
}

QString commandLine(qint64 pid)
{
    if (pid <= 0) {
        return QString();
    }

    QFile file(QString("/proc/%1/cmdline").arg(pid));
    if (!file.open(QIODevice::ReadOnly)) {
        return QString();
    }

    QByteArray raw = file.readAll();
    while (raw.endsWith('\0')) {
        raw.chop(1);
    }
    raw.replace('\0', ' ');
    return QString::fromLocal8Bit(raw);
}

bool commandMatches(const QString &actual, const QString &expected)
{
    if (actual.isEmpty() || expected.isEmpty()) {
        return false;
    }
    if (actual == expected) {
        return true;
    }

    // The launcher may have resolved argv[0] through PATH
    auto split = [](const QString &command) {
        int space = command.indexOf(' ');
        return space < 0 ? qMakePair(command, QString()) : qMakePair(command.left(space), command.mid(space + 1));
    };
    const auto actualParts = split(actual);
    const auto expectedParts = split(expected);
    return actualParts.second == expectedParts.second
        && QFileInfo(actualParts.first).fileName() == QFileInfo(expectedParts.first).fileName();
}

bool isRunning(qint64 pid, const QString &command)
{
    if (!isAlive(pid)) {
        return false;
    }

#ifdef Q_OS_LINUX
    // Zombies keep their PID but report an empty command line
    return commandMatches(commandLine(pid), command);
#else
    Q_UNUSED(command);
    return true;
#endif
}

bool terminate(qint64 pid)
{
    if (pid <= 0) {
        return false;
    }
#ifdef Q_OS_UNIX
    return ::kill(static_cast<pid_t>(pid), SIGTERM) == 0;
#else
    return false;
#endif
}

bool forceKill(qint64 pid)
{
    if (pid <= 0) {
        return false;
    }
#ifdef Q_OS_UNIX
    return ::kill(static_cast<pid_t>(pid), SIGKILL) == 0;
#else
    return false;
#endif
}

QString joinCommand(const QString &program, const QStringList &arguments)
{
    QStringList parts;
    parts << program << arguments;
    return parts.join(' ');
}

}
