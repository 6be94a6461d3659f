#include "gtest/gtest.h"

#include <QFile>
#include <QTemporaryDir>

#include "mongogui/core/settings/SettingsManager.h"

using namespace MongoGui;

namespace
{
    void writeFile(const QString &path, const QByteArray &contents)
    {
        QFile f(path);
        ASSERT_TRUE(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
        f.write(contents);
    }
}

TEST(SettingsManager_CoreTests, MissingFile_WritesDefaults)
{
    QTemporaryDir dir;
    SettingsManager settings(dir.path());

    EXPECT_TRUE(QFile::exists(settings.configFilePath()));
    EXPECT_EQ(50, settings.pageSize());
    EXPECT_EQ(10, settings.mongoTimeoutSec());
    EXPECT_EQ(AutoPaging, settings.aggregatePaging());
    EXPECT_EQ(20, settings.sampleSize());
    EXPECT_EQ(QString("mongogui"), settings.secretService());
    EXPECT_EQ(-1, settings.textFontPointSize());
}

TEST(SettingsManager_CoreTests, MissingDirectory_IsCreated)
{
    QTemporaryDir dir;
    const QString nested = dir.filePath("a/b/c");
    SettingsManager settings(nested);

    EXPECT_TRUE(QFile::exists(settings.configFilePath()));
    EXPECT_EQ(nested + "/connections.json", settings.connectionsFilePath());
    EXPECT_EQ(nested + "/query_templates.json", settings.queryTemplatesFilePath());
}

TEST(SettingsManager_CoreTests, InvalidValues_FallBackToDefaults)
{
    QTemporaryDir dir;
    writeFile(dir.filePath("mongogui.json"),
              "{\"pageSize\": -3, \"mongoTimeoutSec\": \"soon\", \"aggregatePaging\": \"sideways\","
              " \"sampleSize\": 0, \"secretService\": \"  \"}");

    SettingsManager settings(dir.path());
    EXPECT_EQ(50, settings.pageSize());
    EXPECT_EQ(10, settings.mongoTimeoutSec());
    EXPECT_EQ(AutoPaging, settings.aggregatePaging());
    EXPECT_EQ(20, settings.sampleSize());
    EXPECT_EQ(QString("mongogui"), settings.secretService());
}

TEST(SettingsManager_CoreTests, BrokenJson_UsesDefaults)
{
    QTemporaryDir dir;
    writeFile(dir.filePath("mongogui.json"), "{ pageSize: ");

    SettingsManager settings(dir.path());
    EXPECT_EQ(50, settings.pageSize());
}

TEST(SettingsManager_CoreTests, ValidValues_AreLoaded)
{
    QTemporaryDir dir;
    writeFile(dir.filePath("mongogui.json"),
              "{\"pageSize\": 200, \"mongoTimeoutSec\": 3, \"aggregatePaging\": \"Client\","
              " \"sampleSize\": 5, \"secretService\": \"work\", \"textFontFamily\": \"Monospace\","
              " \"textFontPointSize\": 11}");

    SettingsManager settings(dir.path());
    EXPECT_EQ(200, settings.pageSize());
    EXPECT_EQ(3, settings.mongoTimeoutSec());
    EXPECT_EQ(ClientPaging, settings.aggregatePaging());
    EXPECT_EQ(5, settings.sampleSize());
    EXPECT_EQ(QString("work"), settings.secretService());
    EXPECT_EQ(QString("Monospace"), settings.textFontFamily());
    EXPECT_EQ(11, settings.textFontPointSize());
}

TEST(SettingsManager_CoreTests, Save_PersistsChanges)
{
    QTemporaryDir dir;
    {
        SettingsManager settings(dir.path());
        settings.setPageSize(25);
        settings.setAggregatePaging(ServerPaging);
        ASSERT_TRUE(settings.save());
    }

    SettingsManager reloaded(dir.path());
    EXPECT_EQ(25, reloaded.pageSize());
    EXPECT_EQ(ServerPaging, reloaded.aggregatePaging());
}
