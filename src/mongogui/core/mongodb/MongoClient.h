#pragma once

#include <memory>

#include <mongo/client/dbclientinterface.h>
#include <mongo/bson/bsonobj.h>

#include "mongogui/core/mongodb/MongoSession.h"

namespace MongoGui
{
    /**
     * @brief MongoSession over the MongoDB C++ client.
     *        Takes ownership of dbclient.
     */
    class MongoClient : public MongoSession
    {
    public:
        explicit MongoClient(mongo::DBClientBase *const dbclient);

        void ping() override;

        std::vector<std::string> collectionNames(const std::string &dbName) override;

        std::vector<mongo::BSONObj> find(const std::string &dbName, const std::string &collection,
                                         const mongo::BSONObj &filter, const mongo::BSONObj &projection,
                                         const mongo::BSONObj &sort, int skip, int limit) override;

        std::vector<mongo::BSONObj> aggregate(const std::string &dbName, const std::string &collection,
                                              const std::vector<mongo::BSONObj> &pipeline,
                                              int maxDocuments) override;

        mongo::BSONObj runCommand(const std::string &dbName, const mongo::BSONObj &command) override;

    private:
        void killCursor(const std::string &dbName, const std::string &collection, long long cursorId);

        std::unique_ptr<mongo::DBClientBase> _dbclient;
    };
}
