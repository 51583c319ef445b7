#ifndef COMMANDQUEUE_H
#define COMMANDQUEUE_H

#include <QList>
#include <QMutex>
#include <QQueue>
#include <QWaitCondition>
#include "network/ControlMessage.h"

// Messages received from the manager, drained by the run loop once per iteration
class CommandQueue
{
public:
    CommandQueue() = default;

    // Delete copy constructor and assignment operator
    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    void push(const ControlMessage &message);
    QList<ControlMessage> takeAll();

    // Returns true if commands are queued, false on timeout or wake()
    bool waitForCommands(int timeoutMs);
    void wake();

    int size() const;
    bool isEmpty() const { return size() == 0; }

private:
    mutable QMutex mutex;
    QWaitCondition condition;
    QQueue<ControlMessage> queue;
    bool woken = false;
};

#endif // COMMANDQUEUE_H
