#ifndef SIGNALWATCHER_H
#define SIGNALWATCHER_H

#include <QObject>

class QSocketNotifier;

// Turns SIGINT/SIGTERM into a Qt signal on the thread that created the watcher.
// Only one instance is active per process; later ones stay inactive until it
// is destroyed.
class SignalWatcher : public QObject
{
    Q_OBJECT

public:
    explicit SignalWatcher(QObject *parent = nullptr);
    ~SignalWatcher() override;

    bool isActive() const { return notifier != nullptr; }

signals:
    void terminationRequested(int signalNumber);

private:
    void handleActivated();

    QSocketNotifier *notifier = nullptr;
};

#endif // SIGNALWATCHER_H
