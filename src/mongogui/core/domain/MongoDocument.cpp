#include "mongogui/core/domain/MongoDocument.h"

#include "mongogui/core/utils/QtUtils.h"

namespace MongoGui
{
    MongoDocument::MongoDocument()
    {

    }

    MongoDocument::MongoDocument(const mongo::BSONObj &bsonObj) :
        _bsonObj(bsonObj.getOwned())
    {

    }

    MongoDocumentPtr MongoDocument::fromBsonObj(const mongo::BSONObj &bsonObj)
    {
        return MongoDocumentPtr(new MongoDocument(bsonObj));
    }

    std::vector<MongoDocumentPtr> MongoDocument::fromBsonObj(const std::vector<mongo::BSONObj> &bsonObjs)
    {
        std::vector<MongoDocumentPtr> list;
        list.reserve(bsonObjs.size());
        for (auto const &obj : bsonObjs)
            list.push_back(fromBsonObj(obj));

        return list;
    }

    QString MongoDocument::toJson() const
    {
        return QtUtils::toQString(_bsonObj.jsonString(mongo::Strict, 1));
    }
}
