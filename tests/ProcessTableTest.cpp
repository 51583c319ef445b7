#include <gtest/gtest.h>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include "supervisor/ProcessTable.h"

class ProcessTableTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir.isValid());
        path = dir.filePath("state/processes.json");
    }

    static ProcessRecord makeRecord(const QString &botId, qint64 pid)
    {
        ProcessRecord record;
        record.botId = botId;
        record.pid = pid;
        record.command = QString("/usr/bin/botworker --bot-id %1").arg(botId);
        record.timestamp = 1700000000;
        return record;
    }

    QTemporaryDir dir;
    QString path;
};

TEST_F(ProcessTableTest, MissingFileIsEmpty)
{
    ProcessTable table(path);
    EXPECT_TRUE(table.records().isEmpty());
    EXPECT_FALSE(table.value("alpha").has_value());
}

TEST_F(ProcessTableTest, InsertPersistsAcrossInstances)
{
    {
        ProcessTable table(path);
        ASSERT_TRUE(table.insert(makeRecord("alpha", 1234)));
        ASSERT_TRUE(table.insert(makeRecord("beta", 5678)));
    }

    ProcessTable reopened(path);
    std::optional<ProcessRecord> alpha = reopened.value("alpha");
    ASSERT_TRUE(alpha.has_value());
    EXPECT_EQ(alpha->pid, 1234);
    EXPECT_EQ(alpha->command, "/usr/bin/botworker --bot-id alpha");
    EXPECT_EQ(alpha->timestamp, 1700000000);
    EXPECT_EQ(reopened.botIds(), QStringList({"alpha", "beta"}));
}

TEST_F(ProcessTableTest, FileIsKeyedByBotId)
{
    ProcessTable table(path);
    ASSERT_TRUE(table.insert(makeRecord("alpha", 42)));

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    QJsonObject root = QJsonDocument::fromJson(file.readAll()).object();
    ASSERT_TRUE(root.contains("alpha"));
    EXPECT_EQ(root.value("alpha").toObject().value("pid").toInt(), 42);
    EXPECT_TRUE(root.value("alpha").toObject().contains("command"));
    EXPECT_TRUE(root.value("alpha").toObject().contains("timestamp"));
}

TEST_F(ProcessTableTest, RemoveDeletesOnlyThatRecord)
{
    ProcessTable table(path);
    table.insert(makeRecord("alpha", 1));
    table.insert(makeRecord("beta", 2));

    EXPECT_TRUE(table.remove("alpha"));
    EXPECT_FALSE(table.value("alpha").has_value());
    EXPECT_TRUE(table.value("beta").has_value());

    // Removing something absent leaves the file alone
    EXPECT_TRUE(table.remove("alpha"));
}

TEST_F(ProcessTableTest, InsertReplacesExistingRecord)
{
    ProcessTable table(path);
    table.insert(makeRecord("alpha", 1));
    table.insert(makeRecord("alpha", 2));

    EXPECT_EQ(table.records().size(), 1);
    EXPECT_EQ(table.value("alpha")->pid, 2);
}

TEST_F(ProcessTableTest, CorruptFileIsTreatedAsEmpty)
{
    ProcessTable table(path);
    table.insert(makeRecord("alpha", 1));

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write("{ this is not json");
    file.close();

    EXPECT_TRUE(table.records().isEmpty());
    ASSERT_TRUE(table.insert(makeRecord("beta", 3)));
    EXPECT_EQ(table.botIds(), QStringList({"beta"}));
}

TEST_F(ProcessTableTest, RecordsWithoutPidAreSkipped)
{
    ProcessTable table(path);
    table.insert(makeRecord("alpha", 1));

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write("{\"alpha\":{\"pid\":7,\"command\":\"x\",\"timestamp\":1},\"broken\":{\"command\":\"y\"}}");
    file.close();

    EXPECT_EQ(table.botIds(), QStringList({"alpha"}));
}
