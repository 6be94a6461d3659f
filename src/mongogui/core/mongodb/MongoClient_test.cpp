#include "gtest/gtest.h"

#include <algorithm>
#include <map>

#include <QDateTime>
#include <QStringList>

#include <mongo/bson/bsonobjbuilder.h>

#include "mongogui/core/Exceptions.h"
#include "mongogui/core/domain/QueryExecutor.h"
#include "mongogui/core/mongodb/MongoClientConnector.h"
#include "mongogui/core/settings/ConnectionSettings.h"

using namespace MongoGui;

/*
 * Runs against a live server given as MONGOGUI_TEST_MONGODB=host:port,
 * skipped otherwise.
 */
namespace
{
    class MongoClientTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            const QString address = QString::fromLocal8Bit(qgetenv("MONGOGUI_TEST_MONGODB"));
            if (address.isEmpty())
                GTEST_SKIP() << "MONGOGUI_TEST_MONGODB is not set";

            const QStringList parts = address.split(':');
            profile.setConnectionName("integration");
            profile.setServerHost(parts.value(0).toStdString());
            profile.setServerPort(parts.value(1, "27017").toInt());
            profile.setDefaultDatabase("mongogui_test");

            collection = "employees_" + std::to_string(QDateTime::currentMSecsSinceEpoch());

            session = connector.connect(profile, 10);

            const char *departments[] = {"sales", "dev", "ops"};
            mongo::BSONArrayBuilder docs;
            for (int id = 1; id <= 30; ++id) {
                docs.append(BSON("_id" << id
                                 << "status" << (id <= 25 ? "active" : "inactive")
                                 << "department" << departments[id % 3]));
            }

            mongo::BSONObjBuilder insert;
            insert.append("insert", collection);
            insert.appendArray("documents", docs.arr());
            session->runCommand(profile.defaultDatabase(), insert.obj());
        }

        void TearDown() override
        {
            if (session)
                session->runCommand(profile.defaultDatabase(), BSON("drop" << collection));
        }

        MongoClientConnector connector;
        std::unique_ptr<MongoSession> session;
        ConnectionSettings profile;
        std::string collection;
    };
}

TEST_F(MongoClientTest, collectionNames_ContainsInsertedCollection)
{
    std::vector<std::string> names = session->collectionNames(profile.defaultDatabase());
    EXPECT_NE(names.end(), std::find(names.begin(), names.end(), collection));
}

TEST_F(MongoClientTest, execute_FindSecondPage)
{
    QueryExecutor executor(connector);
    ResultPage result = executor.execute(profile, collection, "{\"status\": \"active\"}",
                                         QString(), "{\"_id\": 1}", 2, 10);

    ASSERT_EQ(10u, result._documents.size());
    EXPECT_EQ(11, result._documents.front()->bsonObj().getIntField("_id"));
    EXPECT_EQ(20, result._documents.back()->bsonObj().getIntField("_id"));
    EXPECT_TRUE(result._hasMore);
}

TEST_F(MongoClientTest, execute_GroupPipeline)
{
    QueryExecutor executor(connector);
    ResultPage result = executor.execute(profile, collection,
        "[{\"$match\": {\"status\": \"active\"}}, "
        "{\"$group\": {\"_id\": \"$department\", \"count\": {\"$sum\": 1}}}]",
        QString(), QString(), 1, 50);

    std::map<std::string, int> counts;
    for (auto const &doc : result._documents)
        counts[doc->bsonObj().getStringField("_id")] = doc->bsonObj().getIntField("count");

    ASSERT_EQ(3u, counts.size());
    EXPECT_EQ(8, counts["sales"]);
    EXPECT_EQ(9, counts["dev"]);
    EXPECT_EQ(8, counts["ops"]);
}

TEST_F(MongoClientTest, aggregate_ClientPaging_StopsEarly)
{
    std::vector<mongo::BSONObj> pipeline = { BSON("$sort" << BSON("_id" << 1)) };
    std::vector<mongo::BSONObj> docs = session->aggregate(profile.defaultDatabase(), collection, pipeline, 7);
    ASSERT_EQ(7u, docs.size());
    EXPECT_EQ(7, docs.back().getIntField("_id"));
}

TEST_F(MongoClientTest, runCommand_UnknownCommand_ThrowsDriverError)
{
    EXPECT_THROW(session->runCommand(profile.defaultDatabase(), BSON("noSuchCommand" << 1)), DriverError);
}
