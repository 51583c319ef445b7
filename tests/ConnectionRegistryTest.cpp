#include <gtest/gtest.h>
#include <QThread>
#include <atomic>
#include <thread>
#include <vector>
#include "network/ConnectionRegistry.h"

TEST(ConnectionRegistryTest, RegisterAndLookup)
{
    ConnectionRegistry registry;
    auto channel = std::make_shared<ControlChannel>("a");

    EXPECT_EQ(registry.registerConnection("alpha", channel), ControlError::None);
    EXPECT_TRUE(registry.contains("alpha"));
    EXPECT_EQ(registry.lookup("alpha"), channel);
    EXPECT_EQ(registry.botIdFor(channel.get()), "alpha");
    EXPECT_EQ(registry.size(), 1);
    EXPECT_EQ(registry.lookup("beta"), nullptr);
}

TEST(ConnectionRegistryTest, RepeatRegistrationOnSameChannelIsIdempotent)
{
    ConnectionRegistry registry;
    auto channel = std::make_shared<ControlChannel>("a");

    ASSERT_EQ(registry.registerConnection("alpha", channel), ControlError::None);
    QDateTime registeredAt = registry.records().first().registeredAt;

    EXPECT_EQ(registry.registerConnection("alpha", channel), ControlError::None);
    EXPECT_EQ(registry.size(), 1);
    EXPECT_EQ(registry.records().first().registeredAt, registeredAt);
}

TEST(ConnectionRegistryTest, DuplicateIdFromAnotherChannelKeepsFirstMapping)
{
    ConnectionRegistry registry;
    auto first = std::make_shared<ControlChannel>("first");
    auto second = std::make_shared<ControlChannel>("second");

    ASSERT_EQ(registry.registerConnection("alpha", first), ControlError::None);
    EXPECT_EQ(registry.registerConnection("alpha", second), ControlError::RegistryConflict);
    EXPECT_EQ(registry.lookup("alpha"), first);
}

TEST(ConnectionRegistryTest, ChannelCannotHoldTwoIds)
{
    ConnectionRegistry registry;
    auto channel = std::make_shared<ControlChannel>("a");

    ASSERT_EQ(registry.registerConnection("alpha", channel), ControlError::None);
    EXPECT_EQ(registry.registerConnection("beta", channel), ControlError::RegistryConflict);
    EXPECT_FALSE(registry.contains("beta"));
}

TEST(ConnectionRegistryTest, RemoveOnlyMatchingChannel)
{
    ConnectionRegistry registry;
    auto current = std::make_shared<ControlChannel>("current");
    auto stale = std::make_shared<ControlChannel>("stale");

    ASSERT_EQ(registry.registerConnection("alpha", current), ControlError::None);
    EXPECT_FALSE(registry.removeConnection("alpha", stale.get()));
    EXPECT_TRUE(registry.contains("alpha"));

    EXPECT_TRUE(registry.removeConnection("alpha", current.get()));
    EXPECT_FALSE(registry.contains("alpha"));
    EXPECT_FALSE(registry.removeConnection("alpha", current.get()));
}

TEST(ConnectionRegistryTest, BotIdsAreSorted)
{
    ConnectionRegistry registry;
    auto c = std::make_shared<ControlChannel>("c");
    auto a = std::make_shared<ControlChannel>("a");
    auto b = std::make_shared<ControlChannel>("b");
    registry.registerConnection("gamma", c);
    registry.registerConnection("alpha", a);
    registry.registerConnection("beta", b);

    EXPECT_EQ(registry.botIds(), QStringList({"alpha", "beta", "gamma"}));

    QList<std::shared_ptr<ControlChannel>> taken = registry.takeAll();
    EXPECT_EQ(taken.size(), 3);
    EXPECT_EQ(registry.size(), 0);
}

TEST(ConnectionRegistryTest, ConcurrentRegistrationGrantsOneWinner)
{
    ConnectionRegistry registry;
    constexpr int contenders = 8;

    std::vector<std::shared_ptr<ControlChannel>> channels;
    for (int i = 0; i < contenders; ++i) {
        channels.push_back(std::make_shared<ControlChannel>(QString("c%1").arg(i)));
    }

    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < contenders; ++i) {
        threads.emplace_back([&, i]() {
            if (registry.registerConnection("alpha", channels[i]) == ControlError::None) {
                ++winners;
            }
        });
    }
    for (std::thread &thread : threads) {
        thread.join();
    }

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(registry.size(), 1);
}
