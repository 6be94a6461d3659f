#include "gtest/gtest.h"

#include <locale.h>

#include <QCoreApplication>

#include "mongogui/core/mongodb/MongoInitializer.h"

int main(int argc, char *argv[], char **envp)
{
    ::testing::InitGoogleTest(&argc, argv);

    MongoGui::initializeMongoClient(argc, argv, envp);

    // Event loops of QtKeychain jobs and QSaveFile need an application object
    QCoreApplication app(argc, argv);
    setlocale(LC_NUMERIC, "C");

    return RUN_ALL_TESTS();
}
