#include "gtest/gtest.h"

#include <mongo/bson/json.h>

#include "mongogui/core/domain/MongoDocument.h"
#include "mongogui/gui/widgets/workarea/BsonTableModel.h"

using namespace MongoGui;

namespace
{
    MongoDocumentPtr doc(const char *json)
    {
        return MongoDocument::fromBsonObj(mongo::fromjson(json));
    }
}

TEST(BsonTableModelTest, columnsAreUnionOfTopLevelKeys)
{
    BsonTableModel model;
    model.setDocuments({ doc("{\"_id\": 1, \"name\": \"a\"}"),
                         doc("{\"_id\": 2, \"age\": 30, \"name\": \"b\"}") }, 1);

    ASSERT_EQ(3, model.columnCount());
    EXPECT_EQ("_id", model.headerData(0, Qt::Horizontal).toString());
    EXPECT_EQ("name", model.headerData(1, Qt::Horizontal).toString());
    EXPECT_EQ("age", model.headerData(2, Qt::Horizontal).toString());
    EXPECT_EQ(2, model.rowCount());
}

TEST(BsonTableModelTest, missingFieldHasNoText)
{
    BsonTableModel model;
    model.setDocuments({ doc("{\"_id\": 1, \"name\": \"a\"}"),
                         doc("{\"_id\": 2, \"age\": 30}") }, 1);

    EXPECT_EQ("a", model.data(model.index(0, 1), Qt::DisplayRole).toString());
    EXPECT_FALSE(model.data(model.index(0, 2), Qt::DisplayRole).isValid());
    EXPECT_EQ("30", model.data(model.index(1, 2), Qt::DisplayRole).toString());
}

TEST(BsonTableModelTest, rowHeadersContinueAcrossPages)
{
    BsonTableModel model;
    model.setDocuments({ doc("{\"_id\": 11}"), doc("{\"_id\": 12}") }, 11);

    EXPECT_EQ("11", model.headerData(0, Qt::Vertical).toString());
    EXPECT_EQ("12", model.headerData(1, Qt::Vertical).toString());
    EXPECT_EQ(12, model.document(1)->bsonObj().getIntField("_id"));
    EXPECT_FALSE(model.document(2));
}

TEST(BsonTableModelTest, emptyPageResetsColumns)
{
    BsonTableModel model;
    model.setDocuments({ doc("{\"_id\": 1}") }, 1);
    model.setDocuments({}, 51);

    EXPECT_EQ(0, model.rowCount());
    EXPECT_EQ(0, model.columnCount());
}

TEST(BsonTableModelTest, rowHeadersBeyondIntRange)
{
    BsonTableModel model;
    model.setDocuments({ doc("{\"_id\": 1}"), doc("{\"_id\": 2}") }, 3000000000LL);

    EXPECT_EQ("3000000000", model.headerData(0, Qt::Vertical).toString());
    EXPECT_EQ("3000000001", model.headerData(1, Qt::Vertical).toString());
}
