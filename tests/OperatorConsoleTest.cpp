#include <gtest/gtest.h>
#include <QTemporaryDir>
#include "config/ManagerConfig.h"
#include "console/OperatorConsole.h"
#include "network/ControlServer.h"
#include "supervisor/ProcessSupervisor.h"
#include "supervisor/ProcessTable.h"

class OperatorConsoleTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir.isValid());
        config.logDirectory = dir.filePath("logging");
        config.processTablePath = dir.filePath("processes.json");

        BotConfig sleeper;
        sleeper.botId = "sleeper";
        sleeper.type = "TestBot";
        sleeper.program = "/bin/sleep";
        sleeper.arguments = QStringList({"30"});
        config.bots.insert(sleeper.botId, sleeper);

        BotConfig chat;
        chat.botId = "chat";
        chat.type = "GPTBot";
        config.bots.insert(chat.botId, chat);

        table = std::make_unique<ProcessTable>(config.processTablePath);
        supervisor = std::make_unique<ProcessSupervisor>(config, server, *table);
        console = std::make_unique<OperatorConsole>(config, *supervisor, server);
    }

    void TearDown() override
    {
        supervisor->shutdownAll(500);
    }

    QTemporaryDir dir;
    ManagerConfig config;
    ControlServer server;
    std::unique_ptr<ProcessTable> table;
    std::unique_ptr<ProcessSupervisor> supervisor;
    std::unique_ptr<OperatorConsole> console;
};

TEST_F(OperatorConsoleTest, ListShowsConfiguredBots)
{
    EXPECT_EQ(console->execute("list"), "chat (GPTBot)\nsleeper (TestBot)");
}

TEST_F(OperatorConsoleTest, StatusReportsEveryBot)
{
    EXPECT_EQ(console->execute("status"), "chat: stopped, disconnected\nsleeper: stopped, disconnected");
}

TEST_F(OperatorConsoleTest, StartStatusStopRoundTrip)
{
    EXPECT_TRUE(console->execute("start sleeper").contains("started"));
    EXPECT_TRUE(console->execute("status sleeper").startsWith("sleeper: running (pid "));
    EXPECT_TRUE(console->execute("start sleeper").contains("already running"));
    EXPECT_TRUE(console->execute("stop sleeper").contains("stopped"));
    EXPECT_EQ(console->execute("status sleeper"), "sleeper: stopped, disconnected");
}

TEST_F(OperatorConsoleTest, ErrorsAreReadable)
{
    EXPECT_EQ(console->execute("start"), "Usage: start <id>");
    EXPECT_EQ(console->execute("start nobody"), "Bot 'nobody' is not configured");
    EXPECT_EQ(console->execute("stop sleeper"), "Bot 'sleeper' is not running");
    EXPECT_TRUE(console->execute("restart sleeper").startsWith("Unknown command 'restart'"));
    EXPECT_EQ(console->execute("send sleeper"), "Usage: send <id> <command> [message]");
    EXPECT_TRUE(console->execute("send chat chat hi").contains("NotConnected"));
    EXPECT_TRUE(console->execute("   ").isEmpty());
}

TEST_F(OperatorConsoleTest, LogPrintsBotLogFile)
{
    QString path = console->execute("log chat");
    EXPECT_TRUE(path.startsWith(config.logDirectory));
    EXPECT_TRUE(path.endsWith("_chat.log"));
}

TEST_F(OperatorConsoleTest, QuitRequestsExit)
{
    int requests = 0;
    QObject::connect(console.get(), &OperatorConsole::quitRequested, [&requests]() { ++requests; });
    EXPECT_TRUE(console->execute("quit").isEmpty());
    EXPECT_EQ(requests, 1);
}

TEST_F(OperatorConsoleTest, HelpListsCommands)
{
    QString help = console->execute("help");
    for (const char *command : {"start", "stop", "status", "list", "log", "send", "quit"}) {
        EXPECT_TRUE(help.contains(command)) << command;
    }
}
