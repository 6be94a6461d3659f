#include "gtest/gtest.h"

#include "mongogui/core/Exceptions.h"
#include "mongogui/core/engine/QueryParser.h"

using namespace MongoGui;

/* Test naming:
 *
 * TEST( [Test_Case_Name], [UnitOfWorkName_ScenarioUnderTest_ExpectedBehavior] )
 */

TEST(QueryParser_CoreTests, parse_EmptyText_IsEmptyFind)
{
    QuerySpec spec = QueryParser::parse("   ");
    EXPECT_FALSE(spec.isAggregate());
    EXPECT_TRUE(spec._filter.isEmpty());
    EXPECT_TRUE(spec._collection.empty());
}

TEST(QueryParser_CoreTests, parse_Object_IsFindFilter)
{
    QuerySpec spec = QueryParser::parse("{\"status\": \"active\"}");
    ASSERT_FALSE(spec.isAggregate());
    EXPECT_EQ(1, spec._filter.nFields());
    EXPECT_EQ("active", std::string(spec._filter.getStringField("status")));
}

TEST(QueryParser_CoreTests, parse_UnquotedKeys_Accepted)
{
    QuerySpec spec = QueryParser::parse("{status: 'active', age: {$gt: 30}}");
    ASSERT_FALSE(spec.isAggregate());
    EXPECT_EQ("active", std::string(spec._filter.getStringField("status")));
    EXPECT_EQ(30, spec._filter.getObjectField("age").getIntField("$gt"));
}

TEST(QueryParser_CoreTests, parse_ExtendedJsonObjectId_Accepted)
{
    QuerySpec spec = QueryParser::parse("{\"_id\": {\"$oid\": \"5f1d7f8e2a9b4c3d2e1f0a9b\"}}");
    EXPECT_EQ(mongo::jstOID, spec._filter.getField("_id").type());
}

TEST(QueryParser_CoreTests, parse_ArrayOfObjects_IsAggregate)
{
    QuerySpec spec = QueryParser::parse(
        "[{\"$match\": {\"status\": \"active\"}}, "
        "{\"$group\": {\"_id\": \"$department\", \"count\": {\"$sum\": 1}}}]");

    ASSERT_TRUE(spec.isAggregate());
    ASSERT_EQ(2u, spec._pipeline.size());
    EXPECT_TRUE(spec._pipeline[0].hasField("$match"));
    EXPECT_TRUE(spec._pipeline[1].hasField("$group"));
}

TEST(QueryParser_CoreTests, parse_EmptyArray_IsEmptyPipeline)
{
    QuerySpec spec = QueryParser::parse("[]");
    EXPECT_TRUE(spec.isAggregate());
    EXPECT_TRUE(spec._pipeline.empty());
}

TEST(QueryParser_CoreTests, parse_MalformedJson_ThrowsParseError)
{
    EXPECT_THROW(QueryParser::parse("{\"status\":}"), ParseError);
    EXPECT_THROW(QueryParser::parse("{\"status\": \"active\""), ParseError);
}

TEST(QueryParser_CoreTests, parse_TrailingValue_ThrowsParseError)
{
    EXPECT_THROW(QueryParser::parse("{\"a\": 1}, \"b\": 2"), ParseError);
}

TEST(QueryParser_CoreTests, parse_TextAfterClosedValue_ThrowsParseError)
{
    EXPECT_THROW(QueryParser::parse("{\"a\": 1}} x"), ParseError);
    EXPECT_THROW(QueryParser::parse("[{\"$match\": {}}]] garbage"), ParseError);
    EXPECT_THROW(QueryParser::parseObject("{\"_id\": 1}} {\"b\": 2}", "Document"), ParseError);
}

TEST(QueryParser_CoreTests, parse_TrailingWhitespace_Accepted)
{
    QuerySpec spec = QueryParser::parse("{\"a\": 1}  \n\t\n");
    EXPECT_EQ(1, spec._filter.getIntField("a"));
}

TEST(QueryParser_CoreTests, parse_Scalar_ThrowsInvalidShape)
{
    EXPECT_THROW(QueryParser::parse("\"active\""), InvalidQueryShapeError);
    EXPECT_THROW(QueryParser::parse("42"), InvalidQueryShapeError);
    EXPECT_THROW(QueryParser::parse("null"), InvalidQueryShapeError);
}

TEST(QueryParser_CoreTests, parse_ArrayWithScalar_ThrowsInvalidShape)
{
    EXPECT_THROW(QueryParser::parse("[{\"$match\": {}}, 1]"), InvalidQueryShapeError);
}

TEST(QueryParser_CoreTests, parse_ProjectionAndSort_AppliedToFind)
{
    QuerySpec spec = QueryParser::parse("{}", "{\"name\": 1}", "{\"age\": -1}");
    EXPECT_EQ(1, spec._projection.getIntField("name"));
    EXPECT_EQ(-1, spec._sort.getIntField("age"));
}

TEST(QueryParser_CoreTests, parse_ProjectionNotObject_ThrowsInvalidShape)
{
    EXPECT_THROW(QueryParser::parse("{}", "[1]"), InvalidQueryShapeError);
    EXPECT_THROW(QueryParser::parse("{}", QString(), "\"age\""), InvalidQueryShapeError);
}

TEST(QueryParser_CoreTests, parse_ProjectionWithPipeline_ThrowsInvalidShape)
{
    EXPECT_THROW(QueryParser::parse("[{\"$match\": {}}]", "{\"name\": 1}"), InvalidQueryShapeError);
    EXPECT_THROW(QueryParser::parse("[{\"$match\": {}}]", QString(), "{\"name\": 1}"), InvalidQueryShapeError);
}

TEST(QueryParser_CoreTests, parse_ShellFind_TakesCollectionAndProjection)
{
    QuerySpec spec = QueryParser::parse("db.employees.find({\"status\": \"active\"}, {\"name\": 1})");
    ASSERT_FALSE(spec.isAggregate());
    EXPECT_EQ("employees", spec._collection);
    EXPECT_EQ("active", std::string(spec._filter.getStringField("status")));
    EXPECT_EQ(1, spec._projection.getIntField("name"));
}

TEST(QueryParser_CoreTests, parse_ShellFindWithoutArguments_IsEmptyFilter)
{
    QuerySpec spec = QueryParser::parse("db.system.users.find();");
    EXPECT_EQ("system.users", spec._collection);
    EXPECT_TRUE(spec._filter.isEmpty());
}

TEST(QueryParser_CoreTests, parse_ShellAggregate_IsAggregate)
{
    QuerySpec spec = QueryParser::parse("db.orders.aggregate([{$match: {paid: true}}])");
    ASSERT_TRUE(spec.isAggregate());
    EXPECT_EQ("orders", spec._collection);
    ASSERT_EQ(1u, spec._pipeline.size());
}

TEST(QueryParser_CoreTests, parse_ShellAggregateWithObject_ThrowsInvalidShape)
{
    EXPECT_THROW(QueryParser::parse("db.orders.aggregate({$match: {}})"), InvalidQueryShapeError);
}

TEST(QueryParser_CoreTests, parseObject_EmptyText_IsEmptyObject)
{
    EXPECT_TRUE(QueryParser::parseObject("", "Keys").isEmpty());
    EXPECT_EQ(1, QueryParser::parseObject("{\"a\": 1}", "Keys").nFields());
}
