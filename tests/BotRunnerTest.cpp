#include <gtest/gtest.h>
#include <QMutex>
#include <atomic>
#include "bot/BotFactory.h"
#include "bot/BotRunner.h"
#include "bot/GPTBot.h"
#include "network/ControlServer.h"
#include "TestHelpers.h"

using TestHelpers::waitUntil;

TEST(BotFactoryTest, CreatesKnownTypes)
{
    std::unique_ptr<BotCapability> test = BotFactory::create("TestBot", "alpha");
    ASSERT_NE(test, nullptr);
    EXPECT_EQ(test->typeName(), "TestBot");
    EXPECT_EQ(test->botId(), "alpha");
    EXPECT_EQ(test->registerCommands(), QStringList({"hello", "echo"}));

    std::unique_ptr<BotCapability> gpt = BotFactory::create("GPTBot", "beta");
    ASSERT_NE(gpt, nullptr);
    EXPECT_EQ(gpt->typeName(), "GPTBot");
    EXPECT_EQ(gpt->registerCommands(), QStringList({"hello", "chat"}));
}

TEST(BotFactoryTest, UnknownTypeYieldsNull)
{
    EXPECT_EQ(BotFactory::create("DiscordBot", "alpha"), nullptr);
    EXPECT_EQ(BotFactory::create("", "alpha"), nullptr);
}

TEST(BotFactoryTest, GPTBotPlaceholderResponse)
{
    EXPECT_EQ(GPTBot::generateResponse("hi there"), "ChatGPT says: hi there");
}

class BotRunnerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        QObject::connect(&server, &ControlServer::messageReceived, &server,
                         [this](const QString &botId, const ControlMessage &message) {
            QMutexLocker locker(&repliesMutex);
            replies.append(qMakePair(botId, message.payload().toObject()));
        }, Qt::DirectConnection);
        ASSERT_TRUE(server.start("127.0.0.1", 0));
    }

    void TearDown() override
    {
        server.stop();
    }

    std::unique_ptr<BotRunner> makeRunner(const QString &type, const QString &botId)
    {
        WorkerClientSettings settings;
        settings.botId = botId;
        settings.port = server.serverPort();
        settings.retryIntervalMs = 300;
        settings.ackTimeoutMs = 2000;
        return std::make_unique<BotRunner>(BotFactory::create(type, botId), settings);
    }

    QList<QPair<QString, QJsonObject>> recordedReplies()
    {
        QMutexLocker locker(&repliesMutex);
        return replies;
    }

    ControlServer server;
    QMutex repliesMutex;
    QList<QPair<QString, QJsonObject>> replies;
};

TEST_F(BotRunnerTest, ManagerStopEndsRunLoop)
{
    std::unique_ptr<BotRunner> runner = makeRunner("TestBot", "alpha");
    runner->start();
    ASSERT_TRUE(waitUntil([this]() { return server.isConnected("alpha"); }, 5000));

    EXPECT_EQ(server.sendTo("alpha", ControlMessage::stop("alpha"), 2000), ControlError::None);
    ASSERT_TRUE(runner->wait(5000));
    EXPECT_TRUE(runner->stoppedByManager());
    EXPECT_TRUE(waitUntil([this]() { return !server.isConnected("alpha"); }, 3000));
}

TEST_F(BotRunnerTest, ExternalStopEndsRunLoop)
{
    std::unique_ptr<BotRunner> runner = makeRunner("TestBot", "alpha");
    runner->start();
    ASSERT_TRUE(waitUntil([this]() { return server.isConnected("alpha"); }, 5000));

    runner->stop();
    ASSERT_TRUE(runner->wait(5000));
    EXPECT_FALSE(runner->stoppedByManager());
}

TEST_F(BotRunnerTest, EchoCommandRepliesToManager)
{
    std::unique_ptr<BotRunner> runner = makeRunner("TestBot", "alpha");
    runner->start();
    ASSERT_TRUE(waitUntil([this]() { return server.isConnected("alpha"); }, 5000));

    QJsonObject payload{{"command", "echo"}, {"message", "ping"}};
    EXPECT_EQ(server.sendTo("alpha", ControlMessage::custom("alpha", payload), 2000), ControlError::None);
    ASSERT_TRUE(waitUntil([this]() { return !recordedReplies().isEmpty(); }, 3000));

    QPair<QString, QJsonObject> reply = recordedReplies().first();
    EXPECT_EQ(reply.first, "alpha");
    EXPECT_EQ(reply.second.value("command").toString(), "echo");
    EXPECT_EQ(reply.second.value("message").toString(), "ping");

    runner->stop();
    EXPECT_TRUE(runner->wait(5000));
}

TEST_F(BotRunnerTest, ChatCommandGetsPlaceholderReply)
{
    std::unique_ptr<BotRunner> runner = makeRunner("GPTBot", "beta");
    runner->start();
    ASSERT_TRUE(waitUntil([this]() { return server.isConnected("beta"); }, 5000));

    QJsonObject payload{{"command", "chat"}, {"message", "how are you"}};
    EXPECT_EQ(server.sendTo("beta", ControlMessage::custom("beta", payload), 2000), ControlError::None);
    ASSERT_TRUE(waitUntil([this]() { return !recordedReplies().isEmpty(); }, 3000));
    EXPECT_EQ(recordedReplies().first().second.value("message").toString(), "ChatGPT says: how are you");

    runner->stop();
    EXPECT_TRUE(runner->wait(5000));
}

TEST_F(BotRunnerTest, UnknownCommandIsIgnored)
{
    std::unique_ptr<BotRunner> runner = makeRunner("TestBot", "alpha");
    runner->start();
    ASSERT_TRUE(waitUntil([this]() { return server.isConnected("alpha"); }, 5000));

    QJsonObject payload{{"command", "chat"}, {"message", "not for a TestBot"}};
    EXPECT_EQ(server.sendTo("alpha", ControlMessage::custom("alpha", payload), 2000), ControlError::None);
    QThread::msleep(700);
    EXPECT_TRUE(recordedReplies().isEmpty());
    EXPECT_TRUE(runner->isRunning());

    runner->stop();
    EXPECT_TRUE(runner->wait(5000));
}

TEST_F(BotRunnerTest, CommandNamesAreVisibleWhileRunning)
{
    std::unique_ptr<BotRunner> runner = makeRunner("GPTBot", "beta");
    EXPECT_TRUE(runner->commandNames().isEmpty());

    runner->start();
    ASSERT_TRUE(waitUntil([&runner]() { return !runner->commandNames().isEmpty(); }, 5000));
    EXPECT_EQ(runner->commandNames(), QStringList({"hello", "chat"}));

    runner->stop();
    ASSERT_TRUE(runner->wait(5000));
    EXPECT_EQ(runner->commandNames(), QStringList({"hello", "chat"}));
}
