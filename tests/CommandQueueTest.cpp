#include <gtest/gtest.h>
#include <QElapsedTimer>
#include <thread>
#include "bot/CommandQueue.h"

TEST(CommandQueueTest, TakeAllDrainsInArrivalOrder)
{
    CommandQueue queue;
    queue.push(ControlMessage::custom("a", QJsonValue(1)));
    queue.push(ControlMessage::stop("a"));

    QList<ControlMessage> commands = queue.takeAll();
    ASSERT_EQ(commands.size(), 2);
    EXPECT_EQ(commands.at(0).kind(), ControlMessage::Kind::Custom);
    EXPECT_EQ(commands.at(1).kind(), ControlMessage::Kind::Stop);
    EXPECT_TRUE(queue.isEmpty());
    EXPECT_TRUE(queue.takeAll().isEmpty());
}

TEST(CommandQueueTest, WaitTimesOutWhenEmpty)
{
    CommandQueue queue;
    QElapsedTimer timer;
    timer.start();
    EXPECT_FALSE(queue.waitForCommands(100));
    EXPECT_GE(timer.elapsed(), 80);
}

TEST(CommandQueueTest, PushFromAnotherThreadWakesWaiter)
{
    CommandQueue queue;
    std::thread producer([&queue]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        queue.push(ControlMessage::stop("a"));
    });

    QElapsedTimer timer;
    timer.start();
    EXPECT_TRUE(queue.waitForCommands(5000));
    EXPECT_LT(timer.elapsed(), 2000);
    producer.join();
}

TEST(CommandQueueTest, WakeReleasesWaiterWithoutCommands)
{
    CommandQueue queue;
    std::thread waker([&queue]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        queue.wake();
    });

    QElapsedTimer timer;
    timer.start();
    EXPECT_FALSE(queue.waitForCommands(5000));
    EXPECT_LT(timer.elapsed(), 2000);
    waker.join();
}
