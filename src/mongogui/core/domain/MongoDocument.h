#pragma once

#include <vector>
#include <QString>
#include <mongo/bson/bsonobj.h>

#include "mongogui/core/Core.h"

namespace MongoGui
{
    /*
    ** Represents MongoDB object.
    */
    class MongoDocument
    {
        /*
        ** Owned BSONObj
        */
        const mongo::BSONObj _bsonObj;
    public:
        /*
        ** Constructs empty Document, i.e. { }
        */
        MongoDocument();

        /*
        ** Create MongoDocument from BsonObj. It will take owned version of BSONObj
        */
        explicit MongoDocument(const mongo::BSONObj &bsonObj);

        static MongoDocumentPtr fromBsonObj(const mongo::BSONObj &bsonObj);
        static std::vector<MongoDocumentPtr> fromBsonObj(const std::vector<mongo::BSONObj> &bsonObjs);

        /*
        ** Return "native" BSONObj
        */
        mongo::BSONObj bsonObj() const { return _bsonObj; }

        /*
        ** Relaxed extended JSON, indented
        */
        QString toJson() const;
    };
}
