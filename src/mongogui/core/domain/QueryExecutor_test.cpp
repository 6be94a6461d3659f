#include "gtest/gtest.h"

#include <limits>
#include <map>

#include <mongo/bson/bsonobjbuilder.h>

#include "mongogui/core/Exceptions.h"
#include "mongogui/core/domain/QueryExecutor.h"
#include "mongogui/core/mongodb/MongoConnector.h"
#include "mongogui/core/settings/ConnectionSettings.h"

using namespace MongoGui;

namespace
{
    typedef std::map<std::string, std::vector<mongo::BSONObj>> Collections;

    bool sameValue(const mongo::BSONElement &left, const mongo::BSONElement &right)
    {
        return left.type() == right.type() && left.toString(false) == right.toString(false);
    }

    // Top-level equality only, enough for the filters used here
    bool matches(const mongo::BSONObj &doc, const mongo::BSONObj &filter)
    {
        mongo::BSONObjIterator it(filter);
        while (it.more()) {
            mongo::BSONElement cond = it.next();
            if (!sameValue(doc.getField(cond.fieldName()), cond))
                return false;
        }
        return true;
    }

    // $group by "$field" with {count: {$sum: 1}}
    std::vector<mongo::BSONObj> groupCount(const std::vector<mongo::BSONObj> &docs, const mongo::BSONObj &spec)
    {
        const std::string field = std::string(spec.getStringField("_id")).substr(1);
        std::vector<mongo::BSONObj> keys;
        std::vector<int> counts;
        for (auto const &doc : docs) {
            mongo::BSONElement key = doc.getField(field);
            size_t i = 0;
            for (; i < keys.size(); ++i) {
                if (sameValue(keys[i].firstElement(), key))
                    break;
            }
            if (i == keys.size()) {
                mongo::BSONObjBuilder b;
                b.appendAs(key, "_id");
                keys.push_back(b.obj());
                counts.push_back(0);
            }
            ++counts[i];
        }

        std::vector<mongo::BSONObj> out;
        for (size_t i = 0; i < keys.size(); ++i) {
            mongo::BSONObjBuilder b;
            b.appendElements(keys[i]);
            b.append("count", counts[i]);
            out.push_back(b.obj());
        }
        return out;
    }

    struct SessionLog
    {
        SessionLog() : connects(0), lastTimeoutSec(0), lastMaxDocuments(-1) {}

        int connects;
        int lastTimeoutSec;
        std::string lastDb;
        std::string lastCollection;
        std::vector<mongo::BSONObj> lastPipeline;
        int lastMaxDocuments;
        std::vector<mongo::BSONObj> commands;
        mongo::BSONObj commandReply;
    };

    class InMemorySession : public MongoSession
    {
    public:
        InMemorySession(const Collections &collections, SessionLog &log) :
            _collections(collections), _log(log) {}

        void ping() override {}

        std::vector<std::string> collectionNames(const std::string &) override
        {
            std::vector<std::string> names;
            for (auto const &coll : _collections)
                names.push_back(coll.first);
            return names;
        }

        std::vector<mongo::BSONObj> find(const std::string &dbName, const std::string &collection,
                                         const mongo::BSONObj &filter, const mongo::BSONObj &,
                                         const mongo::BSONObj &, int skip, int limit) override
        {
            _log.lastDb = dbName;
            _log.lastCollection = collection;

            std::vector<mongo::BSONObj> out;
            int skipped = 0;
            for (auto const &doc : documents(collection)) {
                if (!matches(doc, filter))
                    continue;
                if (skipped++ < skip)
                    continue;
                if (limit > 0 && out.size() >= static_cast<size_t>(limit))
                    break;
                out.push_back(doc);
            }
            return out;
        }

        std::vector<mongo::BSONObj> aggregate(const std::string &dbName, const std::string &collection,
                                              const std::vector<mongo::BSONObj> &pipeline,
                                              int maxDocuments) override
        {
            _log.lastDb = dbName;
            _log.lastCollection = collection;
            _log.lastPipeline = pipeline;
            _log.lastMaxDocuments = maxDocuments;

            std::vector<mongo::BSONObj> docs = documents(collection);
            for (auto const &stage : pipeline) {
                std::vector<mongo::BSONObj> next;
                if (stage.hasField("$match")) {
                    for (auto const &doc : docs) {
                        if (matches(doc, stage.getObjectField("$match")))
                            next.push_back(doc);
                    }
                }
                else if (stage.hasField("$group")) {
                    next = groupCount(docs, stage.getObjectField("$group"));
                }
                else if (stage.hasField("$skip")) {
                    const size_t skip = static_cast<size_t>(stage.getIntField("$skip"));
                    if (skip < docs.size())
                        next.assign(docs.begin() + skip, docs.end());
                }
                else if (stage.hasField("$limit")) {
                    const size_t limit = static_cast<size_t>(stage.getIntField("$limit"));
                    next.assign(docs.begin(), docs.begin() + std::min(limit, docs.size()));
                }
                // $out and the rest produce nothing
                docs = next;
            }

            if (maxDocuments > 0 && docs.size() > static_cast<size_t>(maxDocuments))
                docs.resize(maxDocuments);
            return docs;
        }

        mongo::BSONObj runCommand(const std::string &, const mongo::BSONObj &command) override
        {
            _log.commands.push_back(command.getOwned());
            return _log.commandReply;
        }

    private:
        std::vector<mongo::BSONObj> documents(const std::string &collection) const
        {
            auto it = _collections.find(collection);
            return it == _collections.end() ? std::vector<mongo::BSONObj>() : it->second;
        }

        const Collections &_collections;
        SessionLog &_log;
    };

    class InMemoryConnector : public MongoConnector
    {
    public:
        InMemoryConnector() : _fail(false) {}

        std::unique_ptr<MongoSession> connect(const ConnectionSettings &, int timeoutSec) override
        {
            ++log.connects;
            log.lastTimeoutSec = timeoutSec;
            if (_fail)
                throw ConnectionError("Connection refused");

            return std::unique_ptr<MongoSession>(new InMemorySession(collections, log));
        }

        void setFail(bool fail) { _fail = fail; }

        Collections collections;
        SessionLog log;

    private:
        bool _fail;
    };

    class QueryExecutorTest : public ::testing::Test
    {
    protected:
        QueryExecutorTest() : executor(connector)
        {
            profile.setConnectionName("local");
            profile.setDefaultDatabase("company");

            // 25 active employees (ids 1..25) and 5 inactive ones (ids 26..30)
            const char *departments[] = {"sales", "dev", "ops"};
            std::vector<mongo::BSONObj> employees;
            for (int id = 1; id <= 30; ++id) {
                employees.push_back(BSON("_id" << id
                                         << "status" << (id <= 25 ? "active" : "inactive")
                                         << "department" << departments[id % 3]));
            }
            connector.collections["employees"] = employees;
            connector.collections["orders"] = std::vector<mongo::BSONObj>();
        }

        ResultPage run(const QString &query, int page, int pageSize)
        {
            return executor.execute(profile, "employees", query, QString(), QString(), page, pageSize);
        }

        InMemoryConnector connector;
        QueryExecutor executor;
        ConnectionSettings profile;
    };
}

TEST_F(QueryExecutorTest, execute_EqualityFilter_ReturnsOnlyMatching)
{
    ResultPage result = run("{\"status\": \"active\"}", 1, 50);

    ASSERT_EQ(25u, result._documents.size());
    for (auto const &doc : result._documents)
        EXPECT_EQ("active", std::string(doc->bsonObj().getStringField("status")));

    EXPECT_FALSE(result._hasMore);
    EXPECT_EQ(25, result._totalKnown);
    EXPECT_EQ("company", connector.log.lastDb);
}

TEST_F(QueryExecutorTest, execute_SecondPage_ReturnsDocuments11To20)
{
    ResultPage result = run("{\"status\": \"active\"}", 2, 10);

    ASSERT_EQ(10u, result._documents.size());
    EXPECT_EQ(11, result._documents.front()->bsonObj().getIntField("_id"));
    EXPECT_EQ(20, result._documents.back()->bsonObj().getIntField("_id"));
    EXPECT_TRUE(result._hasMore);
    EXPECT_EQ(2, result._page);
    EXPECT_EQ(10, result._pageSize);
    EXPECT_EQ(20, result._totalKnown);
}

TEST_F(QueryExecutorTest, execute_LastPartialPage_HasNoMore)
{
    ResultPage result = run("{\"status\": \"active\"}", 3, 10);

    ASSERT_EQ(5u, result._documents.size());
    EXPECT_EQ(21, result._documents.front()->bsonObj().getIntField("_id"));
    EXPECT_FALSE(result._hasMore);
    EXPECT_EQ(25, result._totalKnown);
}

TEST_F(QueryExecutorTest, execute_PagePastEnd_IsEmpty)
{
    ResultPage result = run("{\"status\": \"active\"}", 4, 10);

    EXPECT_TRUE(result._documents.empty());
    EXPECT_FALSE(result._hasMore);
}

TEST_F(QueryExecutorTest, execute_PageBeyondDriverRange_IsEmpty)
{
    const int page = std::numeric_limits<int>::max() / 2;

    ResultPage result = run("{\"status\": \"active\"}", page, 10);
    EXPECT_TRUE(result._documents.empty());
    EXPECT_FALSE(result._hasMore);
    EXPECT_EQ(page, result._page);
    EXPECT_EQ(0, result._totalKnown);
    EXPECT_EQ(0, connector.log.connects);

    result = run("{}", 100000, 100000);
    EXPECT_TRUE(result._documents.empty());

    result = run("[{\"$match\": {\"status\": \"active\"}}]", page, 10);
    EXPECT_TRUE(result._documents.empty());
}

TEST_F(QueryExecutorTest, execute_LastPageInDriverRange_StillQueries)
{
    // skip + pageSize + 1 == INT_MAX
    const int pageSize = 1;
    const int page = std::numeric_limits<int>::max() - 1;

    ResultPage result = run("{}", page, pageSize);
    EXPECT_TRUE(result._documents.empty());
    EXPECT_EQ(1, connector.log.connects);
}

TEST_F(QueryExecutorTest, execute_OversizedPageSize_ThrowsInvalidShape)
{
    EXPECT_THROW(run("{}", 1, std::numeric_limits<int>::max()), InvalidQueryShapeError);
    EXPECT_EQ(0, connector.log.connects);
}

TEST_F(QueryExecutorTest, setTimeoutSec_UsedByNextSession)
{
    executor.setTimeoutSec(42);
    run("{}", 1, 10);
    EXPECT_EQ(42, connector.log.lastTimeoutSec);
    EXPECT_EQ(42, executor.timeoutSec());
}

TEST_F(QueryExecutorTest, execute_GroupPipeline_CountsActivePerDepartment)
{
    ResultPage result = run(
        "[{\"$match\": {\"status\": \"active\"}}, "
        "{\"$group\": {\"_id\": \"$department\", \"count\": {\"$sum\": 1}}}]", 1, 50);

    // ids 1..25: id % 3 == 0 -> sales (8), 1 -> dev (9), 2 -> ops (8)
    std::map<std::string, int> counts;
    for (auto const &doc : result._documents)
        counts[doc->bsonObj().getStringField("_id")] = doc->bsonObj().getIntField("count");

    ASSERT_EQ(3u, counts.size());
    EXPECT_EQ(8, counts["sales"]);
    EXPECT_EQ(9, counts["dev"]);
    EXPECT_EQ(8, counts["ops"]);
}

TEST_F(QueryExecutorTest, execute_MalformedJson_ThrowsParseErrorWithoutConnecting)
{
    EXPECT_THROW(run("{\"status\":}", 1, 10), ParseError);
    EXPECT_EQ(0, connector.log.connects);
}

TEST_F(QueryExecutorTest, execute_Scalar_ThrowsInvalidShapeWithoutConnecting)
{
    EXPECT_THROW(run("\"active\"", 1, 10), InvalidQueryShapeError);
    EXPECT_EQ(0, connector.log.connects);
}

TEST_F(QueryExecutorTest, execute_InvalidPaging_ThrowsInvalidShape)
{
    EXPECT_THROW(run("{}", 0, 10), InvalidQueryShapeError);
    EXPECT_THROW(run("{}", 1, 0), InvalidQueryShapeError);
    EXPECT_EQ(0, connector.log.connects);
}

TEST_F(QueryExecutorTest, execute_ServerUnreachable_ThrowsConnectionError)
{
    connector.setFail(true);
    EXPECT_THROW(run("{}", 1, 10), ConnectionError);
}

TEST_F(QueryExecutorTest, execute_ShellForm_OverridesCollection)
{
    executor.execute(profile, "employees", "db.orders.find({})", QString(), QString(), 1, 10);
    EXPECT_EQ("orders", connector.log.lastCollection);
}

TEST_F(QueryExecutorTest, execute_NoCollection_ThrowsInvalidShape)
{
    EXPECT_THROW(executor.execute(profile, "", "{}", QString(), QString(), 1, 10), InvalidQueryShapeError);
}

TEST_F(QueryExecutorTest, execute_AutoPaging_AppendsSkipAndLimitAtEnd)
{
    ResultPage result = run("[{\"$match\": {\"status\": \"active\"}}]", 2, 10);

    const std::vector<mongo::BSONObj> &sent = connector.log.lastPipeline;
    ASSERT_EQ(3u, sent.size());
    EXPECT_TRUE(sent[0].hasField("$match"));
    EXPECT_EQ(10, sent[1].getIntField("$skip"));
    EXPECT_EQ(11, sent[2].getIntField("$limit"));

    ASSERT_EQ(10u, result._documents.size());
    EXPECT_EQ(11, result._documents.front()->bsonObj().getIntField("_id"));
    EXPECT_TRUE(result._hasMore);
}

TEST_F(QueryExecutorTest, execute_PipelineWithOwnLimit_PagesOnClient)
{
    ResultPage result = run("[{\"$match\": {\"status\": \"active\"}}, {\"$limit\": 15}]", 2, 10);

    EXPECT_EQ(2u, connector.log.lastPipeline.size());
    EXPECT_EQ(21, connector.log.lastMaxDocuments);

    ASSERT_EQ(5u, result._documents.size());
    EXPECT_EQ(11, result._documents.front()->bsonObj().getIntField("_id"));
    EXPECT_FALSE(result._hasMore);
}

TEST_F(QueryExecutorTest, execute_ClientPagingMode_LeavesPipelineUntouched)
{
    executor.setAggregatePaging(ClientPaging);
    ResultPage result = run("[{\"$match\": {\"status\": \"active\"}}]", 3, 10);

    EXPECT_EQ(1u, connector.log.lastPipeline.size());
    EXPECT_EQ(31, connector.log.lastMaxDocuments);
    EXPECT_EQ(5u, result._documents.size());
}

TEST(QueryExecutor_CoreTests, useServerPaging_DecidesByModeAndPipeline)
{
    const std::vector<mongo::BSONObj> plain = { BSON("$match" << BSON("a" << 1)) };
    const std::vector<mongo::BSONObj> limited = { BSON("$match" << BSON("a" << 1)), BSON("$limit" << 5) };
    const std::vector<mongo::BSONObj> writes = { BSON("$match" << BSON("a" << 1)), BSON("$out" << "copy") };

    EXPECT_TRUE(detail::useServerPaging(plain, AutoPaging));
    EXPECT_FALSE(detail::useServerPaging(limited, AutoPaging));
    EXPECT_TRUE(detail::useServerPaging(limited, ServerPaging));
    EXPECT_FALSE(detail::useServerPaging(plain, ClientPaging));
    EXPECT_FALSE(detail::useServerPaging(writes, ServerPaging));
}

TEST(QueryExecutor_CoreTests, appendPaging_FirstPage_AddsOnlyLimit)
{
    std::vector<mongo::BSONObj> paged = detail::appendPaging(std::vector<mongo::BSONObj>(), 0, 51);
    ASSERT_EQ(1u, paged.size());
    EXPECT_EQ(51, paged[0].getIntField("$limit"));
}

TEST(QueryExecutor_CoreTests, defaultIndexName_JoinsFieldsAndDirections)
{
    EXPECT_EQ("status_1_age_-1", detail::defaultIndexName(BSON("status" << 1 << "age" << -1)));
    EXPECT_EQ("bio_text", detail::defaultIndexName(BSON("bio" << "text")));
}

TEST_F(QueryExecutorTest, listCollections_ReturnsSessionOrder)
{
    std::vector<std::string> names = executor.listCollections(profile);
    ASSERT_EQ(2u, names.size());
    EXPECT_EQ("employees", names[0]);
    EXPECT_EQ("orders", names[1]);
}

TEST_F(QueryExecutorTest, sampleDocuments_ReturnsUpToLimit)
{
    EXPECT_EQ(3u, executor.sampleDocuments(profile, "employees", 3).size());
    EXPECT_EQ(0u, executor.sampleDocuments(profile, "orders", 3).size());
    EXPECT_EQ(0u, executor.sampleDocuments(profile, "employees", 0).size());
}

TEST_F(QueryExecutorTest, explain_Find_SendsExplainCommand)
{
    connector.log.commandReply = BSON("queryPlanner" << BSON("namespace" << "company.employees") << "ok" << 1);
    MongoDocumentPtr plan = executor.explain(profile, "employees", "{\"status\": \"active\"}", QString(), "{\"_id\": -1}");

    ASSERT_EQ(1u, connector.log.commands.size());
    mongo::BSONObj explained = connector.log.commands[0].getObjectField("explain");
    EXPECT_EQ("employees", std::string(explained.getStringField("find")));
    EXPECT_EQ(-1, explained.getObjectField("sort").getIntField("_id"));
    EXPECT_TRUE(plan->bsonObj().hasField("queryPlanner"));
}

TEST_F(QueryExecutorTest, replaceDocument_WithoutId_ThrowsDriverError)
{
    EXPECT_THROW(executor.replaceDocument(profile, "employees", BSON("name" << "x")), DriverError);
    EXPECT_EQ(0, connector.log.connects);
}

TEST_F(QueryExecutorTest, replaceDocument_NothingMatched_ThrowsDriverError)
{
    connector.log.commandReply = BSON("n" << 0 << "nModified" << 0 << "ok" << 1);
    EXPECT_THROW(executor.replaceDocument(profile, "employees", BSON("_id" << 99 << "name" << "x")), DriverError);
}

TEST_F(QueryExecutorTest, replaceDocument_Matched_SendsUpdateById)
{
    connector.log.commandReply = BSON("n" << 1 << "nModified" << 1 << "ok" << 1);
    executor.replaceDocument(profile, "employees", BSON("_id" << 7 << "name" << "x"));

    ASSERT_EQ(1u, connector.log.commands.size());
    const mongo::BSONObj &cmd = connector.log.commands[0];
    EXPECT_EQ("employees", std::string(cmd.getStringField("update")));
    mongo::BSONObj update = cmd.getField("updates").Array().front().embeddedObject();
    EXPECT_EQ(7, update.getObjectField("q").getIntField("_id"));
    EXPECT_FALSE(update.getBoolField("upsert"));
}

TEST_F(QueryExecutorTest, createIndex_EmptyName_UsesDefaultName)
{
    connector.log.commandReply = BSON("ok" << 1);
    executor.createIndex(profile, "employees", "{\"status\": 1}", "", true);

    ASSERT_EQ(1u, connector.log.commands.size());
    mongo::BSONObj index = connector.log.commands[0].getField("indexes").Array().front().embeddedObject();
    EXPECT_EQ("status_1", std::string(index.getStringField("name")));
    EXPECT_TRUE(index.getBoolField("unique"));
}

TEST_F(QueryExecutorTest, createIndex_EmptyKeys_ThrowsInvalidShape)
{
    EXPECT_THROW(executor.createIndex(profile, "employees", "{}", "x", false), InvalidQueryShapeError);
    EXPECT_EQ(0, connector.log.connects);
}

TEST_F(QueryExecutorTest, listIndexes_ReadsFirstBatch)
{
    mongo::BSONArrayBuilder batch;
    batch.append(BSON("v" << 2 << "key" << BSON("_id" << 1) << "name" << "_id_"));
    connector.log.commandReply = BSON("cursor" << BSON("id" << 0LL << "firstBatch" << batch.arr()) << "ok" << 1);

    std::vector<MongoDocumentPtr> indexes = executor.listIndexes(profile, "employees");
    ASSERT_EQ(1u, indexes.size());
    EXPECT_EQ("_id_", std::string(indexes[0]->bsonObj().getStringField("name")));
}

TEST_F(QueryExecutorTest, dropIndex_SendsDropIndexes)
{
    connector.log.commandReply = BSON("ok" << 1);
    executor.dropIndex(profile, "employees", "status_1");

    ASSERT_EQ(1u, connector.log.commands.size());
    EXPECT_EQ("status_1", std::string(connector.log.commands[0].getStringField("index")));
}
