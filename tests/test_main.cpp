#include <gtest/gtest.h>
#include <QCoreApplication>
#include "logging/LogManager.h"

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);

    if (qEnvironmentVariableIsEmpty("BOTMANAGER_TEST_LOGS")) {
        LogManager::setMinimumLevel(LogManager::Error);
    }
    return RUN_ALL_TESTS();
}
