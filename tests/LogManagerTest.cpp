#include <gtest/gtest.h>
#include <QDate>
#include <QDir>
#include <QFile>
#include <QRegularExpression>
#include <QTemporaryDir>
#include "logging/LogManager.h"

class LogManagerTest : public ::testing::Test
{
protected:
    void TearDown() override
    {
        LogManager::setLogFile(QString());
        LogManager::setConsoleOutput(true);
        LogManager::setMinimumLevel(LogManager::Error);
    }
};

TEST_F(LogManagerTest, FormatsTimestampAndLevel)
{
    QString line = LogManager::formatMessage("hello", LogManager::Warning);
    EXPECT_TRUE(QRegularExpression("^\\[\\d\\d:\\d\\d:\\d\\d\\] \\[WARN\\] hello$").match(line).hasMatch())
        << qPrintable(line);
}

TEST_F(LogManagerTest, LogFilePathIsDatedPerProcess)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    QString path = LogManager::logFilePath(dir.filePath("logs"), "alpha");
    QString expected = QString("%1_alpha.log").arg(QDate::currentDate().toString("yyyy-MM-dd"));
    EXPECT_TRUE(path.endsWith(expected)) << qPrintable(path);
    EXPECT_TRUE(QDir(dir.filePath("logs")).exists());
}

TEST_F(LogManagerTest, WritesFilteredLinesToFile)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QString path = dir.filePath("test.log");

    LogManager::setConsoleOutput(false);
    LogManager::setMinimumLevel(LogManager::Info);
    ASSERT_TRUE(LogManager::setLogFile(path));

    LogManager::log("debug line", LogManager::Debug);
    LogManager::log("info line", LogManager::Info);
    LogManager::log("done", LogManager::Success);
    LogManager::setLogFile(QString());

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    QString contents = QString::fromUtf8(file.readAll());
    EXPECT_FALSE(contents.contains("debug line"));
    EXPECT_TRUE(contents.contains("[INFO] info line"));
    EXPECT_TRUE(contents.contains("[OK] done"));
}

TEST_F(LogManagerTest, SuccessPassesAnyFilter)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QString path = dir.filePath("success.log");

    LogManager::setConsoleOutput(false);
    LogManager::setMinimumLevel(LogManager::Error);
    ASSERT_TRUE(LogManager::setLogFile(path));
    LogManager::log("registered", LogManager::Success);
    LogManager::log("ignored", LogManager::Warning);
    LogManager::setLogFile(QString());

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    QString contents = QString::fromUtf8(file.readAll());
    EXPECT_TRUE(contents.contains("registered"));
    EXPECT_FALSE(contents.contains("ignored"));
}
