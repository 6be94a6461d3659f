#include "gtest/gtest.h"

#include "mongogui/core/settings/ConnectionSettings.h"
#include "mongogui/core/utils/Validators.h"

using namespace MongoGui;

TEST(Validators_CoreTests, isValidHost)
{
    EXPECT_TRUE(Validators::isValidHost("localhost"));
    EXPECT_TRUE(Validators::isValidHost("10.0.0.12"));
    EXPECT_TRUE(Validators::isValidHost("::1"));
    EXPECT_FALSE(Validators::isValidHost(""));
    EXPECT_FALSE(Validators::isValidHost("my host"));
    EXPECT_FALSE(Validators::isValidHost("host\t"));
}

TEST(Validators_CoreTests, isValidPort)
{
    EXPECT_TRUE(Validators::isValidPort(1));
    EXPECT_TRUE(Validators::isValidPort(27017));
    EXPECT_TRUE(Validators::isValidPort(65535));
    EXPECT_FALSE(Validators::isValidPort(0));
    EXPECT_FALSE(Validators::isValidPort(65536));
    EXPECT_FALSE(Validators::isValidPort(-1));
}

TEST(Validators_CoreTests, isValidDatabaseName)
{
    EXPECT_TRUE(Validators::isValidDatabaseName("inventory"));
    EXPECT_TRUE(Validators::isValidDatabaseName("my_db-2"));
    EXPECT_FALSE(Validators::isValidDatabaseName(""));
    EXPECT_FALSE(Validators::isValidDatabaseName("my db"));
    EXPECT_FALSE(Validators::isValidDatabaseName("a.b"));
    EXPECT_FALSE(Validators::isValidDatabaseName("a$b"));
    EXPECT_FALSE(Validators::isValidDatabaseName("a/b"));
    EXPECT_FALSE(Validators::isValidDatabaseName(QString(64, 'x')));
}

TEST(Validators_CoreTests, validateConnection_ReportsFirstProblem)
{
    ConnectionSettings profile;
    profile.setConnectionName("ok");
    profile.setDefaultDatabase("inventory");
    EXPECT_TRUE(Validators::validateConnection(profile).isEmpty());

    profile.setServerPort(0);
    EXPECT_FALSE(Validators::validateConnection(profile).isEmpty());

    profile.setServerPort(27017);
    profile.credential().setDatabaseName("bad name");
    EXPECT_FALSE(Validators::validateConnection(profile).isEmpty());
}
