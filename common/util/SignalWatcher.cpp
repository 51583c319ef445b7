#include "SignalWatcher.h"
#include "logging/LogManager.h"

#include <QSocketNotifier>

#include <atomic>

#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>

static int signalPipe[2] = {-1, -1};
static std::atomic<bool> watcherInstalled{false};

static void handleUnixSignal(int signalNumber)
{
    char number = static_cast<char>(signalNumber);
    ssize_t written = ::write(signalPipe[0], &number, sizeof(number));
    (void)written;
}

SignalWatcher::SignalWatcher(QObject *parent)
    : QObject(parent)
{
    // The handler writes to one process-wide pipe
    if (watcherInstalled.exchange(true)) {
        LogManager::log("A signal watcher is already installed, ignoring the new one", LogManager::Error);
        return;
    }

    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, signalPipe) != 0) {
        LogManager::log(QString("Cannot create signal pipe: %1").arg(strerror(errno)), LogManager::Error);
        watcherInstalled = false;
        return;
    }

    notifier = new QSocketNotifier(signalPipe[1], QSocketNotifier::Read, this);
    connect(notifier, &QSocketNotifier::activated, this, &SignalWatcher::handleActivated);

    struct sigaction action {};
    action.sa_handler = handleUnixSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    // Writes to a closed control socket must fail, not kill the process
    ::signal(SIGPIPE, SIG_IGN);
}

SignalWatcher::~SignalWatcher()
{
    if (!notifier) {
        return;
    }

    ::signal(SIGINT, SIG_DFL);
    ::signal(SIGTERM, SIG_DFL);

    delete notifier;
    notifier = nullptr;
    ::close(signalPipe[0]);
    ::close(signalPipe[1]);
    signalPipe[0] = -1;
    signalPipe[1] = -1;
    watcherInstalled = false;
}

void SignalWatcher::handleActivated()
{
    notifier->setEnabled(false);
    char number = 0;
    if (::read(signalPipe[1], &number, sizeof(number)) == sizeof(number)) {
        LogManager::log(QString("Received signal %1, shutting down").arg(int(number)), LogManager::Info);
        emit terminationRequested(int(number));
    }
    notifier->setEnabled(true);
}
