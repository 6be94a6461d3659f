#pragma once

#include <string>
#include <vector>

#include <mongo/bson/bsonobj.h>

namespace MongoGui
{
    /**
     * @brief Open connection to one MongoDB server.
     *        Closed when the object is destroyed.
     *
     *        Server side failures are thrown as DriverError,
     *        network failures as ConnectionError.
     */
    class MongoSession
    {
    public:
        virtual ~MongoSession() {}

        virtual void ping() = 0;

        // Collection names of dbName in the order the server returns them
        virtual std::vector<std::string> collectionNames(const std::string &dbName) = 0;

        /**
         * @param limit: maximum number of documents, 0 means no limit
         */
        virtual std::vector<mongo::BSONObj> find(const std::string &dbName, const std::string &collection,
                                                 const mongo::BSONObj &filter, const mongo::BSONObj &projection,
                                                 const mongo::BSONObj &sort, int skip, int limit) = 0;

        /**
         * @brief Runs aggregation and reads at most maxDocuments from its
         *        cursor. Server cursor is killed if it still has documents.
         * @param maxDocuments: 0 means read the whole cursor
         */
        virtual std::vector<mongo::BSONObj> aggregate(const std::string &dbName, const std::string &collection,
                                                      const std::vector<mongo::BSONObj> &pipeline,
                                                      int maxDocuments) = 0;

        // Returns server reply, throws DriverError when "ok" is not 1
        virtual mongo::BSONObj runCommand(const std::string &dbName, const mongo::BSONObj &command) = 0;
    };
}
