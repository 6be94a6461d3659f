#include "mongogui/core/mongodb/MongoClient.h"

#include <algorithm>

#include <mongo/base/error_codes.h>
#include <mongo/bson/bsonobjbuilder.h>
#include <mongo/client/dbclientcursor.h>
#include <mongo/db/namespace_string.h>
#include <mongo/util/assert_util.h>

#include "mongogui/core/Exceptions.h"
#include "mongogui/core/utils/Logger.h"
#include "mongogui/core/utils/QtUtils.h"

namespace
{
    using namespace MongoGui;

    const int DefaultBatchSize = 101;

    /**
     * @brief Driver exceptions are mapped to ConnectionError when the
     *        socket failed, to DriverError otherwise.
     */
    [[noreturn]] void rethrow(const mongo::DBException &ex)
    {
        const QString message = QtUtils::toQString(ex.reason());
        if (mongo::ErrorCodes::isNetworkError(ex.code()))
            throw ConnectionError(message);

        throw DriverError(message);
    }

    void appendBatch(std::vector<mongo::BSONObj> &docs, const mongo::BSONElement &batch, int maxDocuments)
    {
        if (batch.type() != mongo::Array)
            return;

        for (auto const &elem : batch.Array()) {
            if (maxDocuments > 0 && docs.size() >= static_cast<size_t>(maxDocuments))
                return;

            docs.push_back(elem.embeddedObject().getOwned());
        }
    }
}

namespace MongoGui
{
    MongoClient::MongoClient(mongo::DBClientBase *const dbclient) :
        _dbclient(dbclient) { }

    void MongoClient::ping()
    {
        runCommand("admin", BSON("ping" << 1));
    }

    std::vector<std::string> MongoClient::collectionNames(const std::string &dbName)
    {
        std::list<mongo::BSONObj> collList;
        try {
            collList = _dbclient->getCollectionInfos(dbName);
        }
        catch (const mongo::DBException &ex) {
            rethrow(ex);
        }

        std::vector<std::string> collNames;
        for (auto const &coll : collList)
            collNames.push_back(coll.getStringField("name"));

        return collNames;
    }

    std::vector<mongo::BSONObj> MongoClient::find(const std::string &dbName, const std::string &collection,
                                                  const mongo::BSONObj &filter, const mongo::BSONObj &projection,
                                                  const mongo::BSONObj &sort, int skip, int limit)
    {
        std::vector<mongo::BSONObj> docs;
        try {
            mongo::Query query(filter);
            if (!sort.isEmpty())
                query.sort(sort);

            const int batchSize = limit > 0 ? std::min(limit, DefaultBatchSize) : DefaultBatchSize;
            std::unique_ptr<mongo::DBClientCursor> cursor = _dbclient->query(
                mongo::NamespaceString(dbName, collection),
                query, limit, skip, projection.isEmpty() ? 0 : &projection,
                0, batchSize
            );

            // DBClientBase::query may return nullptr
            if (!cursor)
                throw ConnectionError("Network error while attempting to run query");

            while (cursor->more())
                docs.push_back(cursor->nextSafe().getOwned());
        }
        catch (const mongo::DBException &ex) {
            rethrow(ex);
        }

        return docs;
    }

    std::vector<mongo::BSONObj> MongoClient::aggregate(const std::string &dbName, const std::string &collection,
                                                       const std::vector<mongo::BSONObj> &pipeline,
                                                       int maxDocuments)
    {
        const int batchSize = maxDocuments > 0 ? std::min(maxDocuments, DefaultBatchSize) : DefaultBatchSize;

        mongo::BSONArrayBuilder stages;
        for (auto const &stage : pipeline)
            stages.append(stage);

        mongo::BSONObjBuilder cmd;
        cmd.append("aggregate", collection);
        cmd.appendArray("pipeline", stages.arr());
        cmd.append("cursor", BSON("batchSize" << batchSize));

        std::vector<mongo::BSONObj> docs;
        mongo::BSONObj cursor = runCommand(dbName, cmd.obj()).getObjectField("cursor");
        long long cursorId = cursor.getField("id").numberLong();
        appendBatch(docs, cursor.getField("firstBatch"), maxDocuments);

        while (cursorId != 0 && (maxDocuments <= 0 || docs.size() < static_cast<size_t>(maxDocuments))) {
            mongo::BSONObjBuilder getMore;
            getMore.append("getMore", cursorId);
            getMore.append("collection", collection);
            getMore.append("batchSize", batchSize);

            cursor = runCommand(dbName, getMore.obj()).getObjectField("cursor");
            cursorId = cursor.getField("id").numberLong();
            appendBatch(docs, cursor.getField("nextBatch"), maxDocuments);
        }

        if (cursorId != 0)
            killCursor(dbName, collection, cursorId);

        return docs;
    }

    mongo::BSONObj MongoClient::runCommand(const std::string &dbName, const mongo::BSONObj &command)
    {
        mongo::BSONObj result;
        bool ok = false;
        try {
            ok = _dbclient->runCommand(dbName, command, result);
        }
        catch (const mongo::DBException &ex) {
            rethrow(ex);
        }

        if (!ok) {
            std::string errStr = result.getStringField("errmsg");
            if (errStr.empty())
                errStr = "Failed to get error message.";

            throw DriverError(QtUtils::toQString(errStr));
        }

        return result.getOwned();
    }

    void MongoClient::killCursor(const std::string &dbName, const std::string &collection, long long cursorId)
    {
        mongo::BSONObjBuilder cmd;
        cmd.append("killCursors", collection);
        cmd.append("cursors", BSON_ARRAY(cursorId));

        // Server reaps idle cursors itself, the page is still valid
        try {
            runCommand(dbName, cmd.obj());
        }
        catch (const DriverError &ex) {
            LOG_MSG("Failed to kill aggregation cursor: " + ex.message(), mongo::logger::LogSeverity::Warning());
        }
    }
}
