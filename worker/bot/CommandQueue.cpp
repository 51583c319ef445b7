#include "CommandQueue.h"

#include <QDeadlineTimer>

void CommandQueue::push(const ControlMessage &message)
{
    QMutexLocker locker(&mutex);
    queue.enqueue(message);
    condition.wakeAll();
}

QList<ControlMessage> CommandQueue::takeAll()
{
    QMutexLocker locker(&mutex);
    QList<ControlMessage> commands;
    commands.reserve(queue.size());
    while (!queue.isEmpty()) {
        commands.append(queue.dequeue());
    }
    return commands;
}

bool CommandQueue::waitForCommands(int timeoutMs)
{
    QMutexLocker locker(&mutex);
    QDeadlineTimer deadline(timeoutMs);
    while (queue.isEmpty() && !woken) {
        if (!condition.wait(&mutex, deadline)) {
            break;
        }
    }
    woken = false;
    return !queue.isEmpty();
}

void CommandQueue::wake()
{
    QMutexLocker locker(&mutex);
    woken = true;
    condition.wakeAll();
}

int CommandQueue::size() const
{
    QMutexLocker locker(&mutex);
    return queue.size();
}
