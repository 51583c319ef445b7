#include <gtest/gtest.h>
#include <signal.h>
#include "util/SignalWatcher.h"
#include "TestHelpers.h"

using TestHelpers::waitUntil;

TEST(SignalWatcherTest, SecondWatcherStaysInactive)
{
    {
        SignalWatcher first;
        ASSERT_TRUE(first.isActive());

        SignalWatcher second;
        EXPECT_FALSE(second.isActive());
        EXPECT_TRUE(first.isActive());
    }

    SignalWatcher replacement;
    EXPECT_TRUE(replacement.isActive());
}

TEST(SignalWatcherTest, TerminationSignalIsDelivered)
{
    SignalWatcher watcher;
    ASSERT_TRUE(watcher.isActive());

    int received = 0;
    QObject::connect(&watcher, &SignalWatcher::terminationRequested, [&received](int signalNumber) {
        received = signalNumber;
    });

    ASSERT_EQ(::raise(SIGTERM), 0);
    EXPECT_TRUE(waitUntil([&received]() { return received != 0; }, 2000));
    EXPECT_EQ(received, SIGTERM);
}
