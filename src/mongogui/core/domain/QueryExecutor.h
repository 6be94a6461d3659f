#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <QString>

#include <mongo/bson/bsonobj.h>

#include "mongogui/core/Core.h"
#include "mongogui/core/Enums.h"
#include "mongogui/core/domain/QuerySpec.h"
#include "mongogui/core/domain/ResultPage.h"

namespace MongoGui
{
    class ConnectionSettings;
    class MongoConnector;
    class MongoSession;

    namespace detail
    {
        // Pipeline already contains $skip or $limit stage
        bool pipelinePagesItself(const std::vector<mongo::BSONObj> &pipeline);

        // Last stage is $out or $merge
        bool pipelineWritesOutput(const std::vector<mongo::BSONObj> &pipeline);

        // Decides whether $skip/$limit stages may be appended to pipeline
        bool useServerPaging(const std::vector<mongo::BSONObj> &pipeline, AggregatePaging mode);

        // Appends {$skip: skip} (when positive) and {$limit: limit} to the end of pipeline
        std::vector<mongo::BSONObj> appendPaging(const std::vector<mongo::BSONObj> &pipeline, int skip, int limit);

        // Name the server would give, i.e. "status_1_age_-1"
        std::string defaultIndexName(const mongo::BSONObj &keys);
    }

    /**
     * @brief Runs queries typed by the user against the database of a
     *        resolved profile. Every call opens its own session and
     *        closes it before returning.
     *
     *        Errors: ParseError and InvalidQueryShapeError before any
     *        connection attempt, ConnectionError when the server can't be
     *        reached, DriverError when the server rejects the operation.
     *
     * @threadsafe settings may be changed while calls run in worker threads
     */
    class QueryExecutor
    {
    public:
        explicit QueryExecutor(MongoConnector &connector);

        void setTimeoutSec(int timeoutSec) { _timeoutSec.store(timeoutSec); }
        int timeoutSec() const { return _timeoutSec.load(); }
        void setAggregatePaging(AggregatePaging paging) { _aggregatePaging.store(paging); }
        AggregatePaging aggregatePaging() const { return _aggregatePaging.load(); }

        /**
         * @brief Runs find or aggregation and returns requested page.
         *        Pages are 1-based, page past the end is empty.
         *        Collection named in shell form query text overrides collection.
         */
        ResultPage execute(const ConnectionSettings &profile, const std::string &collection,
                           const QString &queryText, const QString &projectionText, const QString &sortText,
                           int page, int pageSize);

        std::vector<std::string> listCollections(const ConnectionSettings &profile);

        // Up to limit documents without filter
        std::vector<MongoDocumentPtr> sampleDocuments(const ConnectionSettings &profile,
                                                      const std::string &collection, int limit);

        // Query plan ("queryPlanner" verbosity)
        MongoDocumentPtr explain(const ConnectionSettings &profile, const std::string &collection,
                                 const QString &queryText, const QString &projectionText, const QString &sortText);

        /**
         * @brief Replaces document with the same _id.
         * @throws DriverError if document has no _id or nothing matched
         */
        void replaceDocument(const ConnectionSettings &profile, const std::string &collection,
                             const mongo::BSONObj &document);

        std::vector<MongoDocumentPtr> listIndexes(const ConnectionSettings &profile, const std::string &collection);

        /**
         * @param keysText: JSON object, i.e. {"status": 1}
         * @param name: empty means default server name
         */
        void createIndex(const ConnectionSettings &profile, const std::string &collection,
                         const QString &keysText, const QString &name, bool unique);

        void dropIndex(const ConnectionSettings &profile, const std::string &collection, const QString &name);

    private:
        std::unique_ptr<MongoSession> openSession(const ConnectionSettings &profile);
        std::vector<mongo::BSONObj> runAggregate(MongoSession &session, const std::string &db,
                                                 const std::string &collection, const QuerySpec &spec,
                                                 AggregatePaging paging, int skip, int pageSize);

        MongoConnector &_connector;
        std::atomic<int> _timeoutSec;
        std::atomic<AggregatePaging> _aggregatePaging;
    };
}
