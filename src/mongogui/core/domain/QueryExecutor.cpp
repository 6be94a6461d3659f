#include "mongogui/core/domain/QueryExecutor.h"

#include <limits>

#include <mongo/bson/bsonobjbuilder.h>

#include "mongogui/core/Exceptions.h"
#include "mongogui/core/engine/QueryParser.h"
#include "mongogui/core/mongodb/MongoConnector.h"
#include "mongogui/core/mongodb/MongoSession.h"
#include "mongogui/core/settings/ConnectionSettings.h"
#include "mongogui/core/settings/SettingsManager.h"
#include "mongogui/core/utils/Logger.h"
#include "mongogui/core/utils/QtUtils.h"

namespace
{
    using namespace MongoGui;

    /**
     * @brief Leaves domain errors as they are, turns anything else the
     *        driver throws (BSON access, assertions) into DriverError.
     */
    template<typename Func>
    auto guarded(Func func) -> decltype(func())
    {
        try {
            return func();
        }
        catch (const MongoGuiException &) {
            throw;
        }
        catch (const std::exception &ex) {
            throw DriverError(QString::fromUtf8(ex.what()));
        }
    }

    std::string resolveCollection(const QuerySpec &spec, const std::string &selected)
    {
        const std::string collection = spec._collection.empty() ? selected : spec._collection;
        if (collection.empty())
            throw InvalidQueryShapeError("No collection selected");

        return collection;
    }

    std::vector<mongo::BSONObj> firstBatch(const mongo::BSONObj &reply)
    {
        std::vector<mongo::BSONObj> docs;
        mongo::BSONElement batch = reply.getObjectField("cursor").getField("firstBatch");
        if (batch.type() != mongo::Array)
            return docs;

        for (auto const &elem : batch.Array())
            docs.push_back(elem.embeddedObject().getOwned());

        return docs;
    }

    mongo::BSONArray toArray(const std::vector<mongo::BSONObj> &pipeline)
    {
        mongo::BSONArrayBuilder stages;
        for (auto const &stage : pipeline)
            stages.append(stage);

        return stages.arr();
    }
}

namespace MongoGui
{
    namespace detail
    {
        bool pipelinePagesItself(const std::vector<mongo::BSONObj> &pipeline)
        {
            for (auto const &stage : pipeline) {
                if (stage.hasField("$skip") || stage.hasField("$limit"))
                    return true;
            }
            return false;
        }

        bool pipelineWritesOutput(const std::vector<mongo::BSONObj> &pipeline)
        {
            if (pipeline.empty())
                return false;

            const mongo::BSONObj &last = pipeline.back();
            return last.hasField("$out") || last.hasField("$merge");
        }

        bool useServerPaging(const std::vector<mongo::BSONObj> &pipeline, AggregatePaging mode)
        {
            // Nothing may follow $out/$merge
            if (pipelineWritesOutput(pipeline))
                return false;

            switch (mode) {
            case ServerPaging:
                return true;
            case ClientPaging:
                return false;
            case AutoPaging:
            default:
                return !pipelinePagesItself(pipeline);
            }
        }

        std::vector<mongo::BSONObj> appendPaging(const std::vector<mongo::BSONObj> &pipeline, int skip, int limit)
        {
            std::vector<mongo::BSONObj> paged = pipeline;
            if (skip > 0)
                paged.push_back(BSON("$skip" << skip));

            paged.push_back(BSON("$limit" << limit));
            return paged;
        }

        std::string defaultIndexName(const mongo::BSONObj &keys)
        {
            std::string name;
            mongo::BSONObjIterator it(keys);
            while (it.more()) {
                mongo::BSONElement elem = it.next();
                if (!name.empty())
                    name += "_";

                name += elem.fieldName();
                name += "_";
                if (elem.isNumber())
                    name += std::to_string(elem.numberInt());
                else
                    name += elem.str();
            }
            return name;
        }
    }

    QueryExecutor::QueryExecutor(MongoConnector &connector) :
        _connector(connector),
        _timeoutSec(SettingsManager::DefaultMongoTimeoutSec),
        _aggregatePaging(AutoPaging)
    {

    }

    ResultPage QueryExecutor::execute(const ConnectionSettings &profile, const std::string &collection,
                                      const QString &queryText, const QString &projectionText,
                                      const QString &sortText, int page, int pageSize)
    {
        if (page < 1)
            throw InvalidQueryShapeError("Page number must be 1 or greater");

        if (pageSize < 1)
            throw InvalidQueryShapeError("Page size must be 1 or greater");

        // pageSize + 1 documents are requested
        if (pageSize >= std::numeric_limits<int>::max())
            throw InvalidQueryShapeError(QString("Page size must be less than %1").arg(std::numeric_limits<int>::max()));

        // Parse before connecting, bad text never reaches the server
        const QuerySpec spec = QueryParser::parse(queryText, projectionText, sortText);
        const std::string coll = resolveCollection(spec, collection);
        const std::string db = profile.defaultDatabase();

        ResultPage result;
        result._page = page;
        result._pageSize = pageSize;

        // Driver counts skip and limit in int, nothing can be read beyond that
        const long long skip = static_cast<long long>(page - 1) * pageSize;
        if (skip + pageSize + 1 > std::numeric_limits<int>::max())
            return result;

        const AggregatePaging paging = aggregatePaging();
        std::unique_ptr<MongoSession> session = openSession(profile);
        std::vector<mongo::BSONObj> docs = guarded([&] {
            if (spec.isAggregate())
                return runAggregate(*session, db, coll, spec, paging, static_cast<int>(skip), pageSize);

            // One extra document tells whether there is a next page
            return session->find(db, coll, spec._filter, spec._projection, spec._sort,
                                 static_cast<int>(skip), pageSize + 1);
        });

        result._hasMore = docs.size() > static_cast<size_t>(pageSize);
        if (result._hasMore)
            docs.resize(pageSize);

        result._documents = MongoDocument::fromBsonObj(docs);
        result._totalKnown = docs.empty() ? 0 : skip + static_cast<long long>(docs.size());

        LOG_MSG(QString("%1 on %2.%3, page %4: %5 document(s)")
                .arg(spec.isAggregate() ? "Aggregate" : "Find")
                .arg(QtUtils::toQString(db), QtUtils::toQString(coll))
                .arg(page).arg(docs.size()),
                mongo::logger::LogSeverity::Info(), false);

        return result;
    }

    std::vector<mongo::BSONObj> QueryExecutor::runAggregate(MongoSession &session, const std::string &db,
                                                            const std::string &collection, const QuerySpec &spec,
                                                            AggregatePaging paging, int skip, int pageSize)
    {
        if (detail::useServerPaging(spec._pipeline, paging)) {
            const std::vector<mongo::BSONObj> paged = detail::appendPaging(spec._pipeline, skip, pageSize + 1);
            return session.aggregate(db, collection, paged, pageSize + 1);
        }

        // Client side: read only up to the end of the requested page
        std::vector<mongo::BSONObj> docs = session.aggregate(db, collection, spec._pipeline, skip + pageSize + 1);
        if (docs.size() <= static_cast<size_t>(skip))
            return std::vector<mongo::BSONObj>();

        return std::vector<mongo::BSONObj>(docs.begin() + skip, docs.end());
    }

    std::vector<std::string> QueryExecutor::listCollections(const ConnectionSettings &profile)
    {
        std::unique_ptr<MongoSession> session = openSession(profile);
        return guarded([&] {
            return session->collectionNames(profile.defaultDatabase());
        });
    }

    std::vector<MongoDocumentPtr> QueryExecutor::sampleDocuments(const ConnectionSettings &profile,
                                                                 const std::string &collection, int limit)
    {
        if (collection.empty())
            throw InvalidQueryShapeError("No collection selected");

        // Zero limit means "no limit" for the driver
        if (limit < 1)
            return std::vector<MongoDocumentPtr>();

        std::unique_ptr<MongoSession> session = openSession(profile);
        std::vector<mongo::BSONObj> docs = guarded([&] {
            return session->find(profile.defaultDatabase(), collection, mongo::BSONObj(),
                                 mongo::BSONObj(), mongo::BSONObj(), 0, limit);
        });
        return MongoDocument::fromBsonObj(docs);
    }

    MongoDocumentPtr QueryExecutor::explain(const ConnectionSettings &profile, const std::string &collection,
                                            const QString &queryText, const QString &projectionText,
                                            const QString &sortText)
    {
        const QuerySpec spec = QueryParser::parse(queryText, projectionText, sortText);
        const std::string coll = resolveCollection(spec, collection);

        mongo::BSONObjBuilder explained;
        if (spec.isAggregate()) {
            explained.append("aggregate", coll);
            explained.appendArray("pipeline", toArray(spec._pipeline));
            explained.append("cursor", mongo::BSONObj());
        }
        else {
            explained.append("find", coll);
            explained.append("filter", spec._filter);
            if (!spec._projection.isEmpty())
                explained.append("projection", spec._projection);
            if (!spec._sort.isEmpty())
                explained.append("sort", spec._sort);
        }

        mongo::BSONObjBuilder cmd;
        cmd.append("explain", explained.obj());
        cmd.append("verbosity", "queryPlanner");

        std::unique_ptr<MongoSession> session = openSession(profile);
        mongo::BSONObj reply = guarded([&] {
            return session->runCommand(profile.defaultDatabase(), cmd.obj());
        });
        return MongoDocument::fromBsonObj(reply);
    }

    void QueryExecutor::replaceDocument(const ConnectionSettings &profile, const std::string &collection,
                                        const mongo::BSONObj &document)
    {
        mongo::BSONElement id = document.getField("_id");
        if (id.eoo())
            throw DriverError("Document has no _id field and can't be replaced");

        mongo::BSONObjBuilder query;
        query.append(id);

        mongo::BSONObjBuilder update;
        update.append("q", query.obj());
        update.append("u", document);
        update.append("upsert", false);
        update.append("multi", false);

        mongo::BSONArrayBuilder updates;
        updates.append(update.obj());

        mongo::BSONObjBuilder cmd;
        cmd.append("update", collection);
        cmd.appendArray("updates", updates.arr());

        std::unique_ptr<MongoSession> session = openSession(profile);
        guarded([&] {
            mongo::BSONObj reply = session->runCommand(profile.defaultDatabase(), cmd.obj());

            mongo::BSONElement writeErrors = reply.getField("writeErrors");
            if (writeErrors.type() == mongo::Array && !writeErrors.Array().empty()) {
                const std::string errStr = writeErrors.Array().front().embeddedObject().getStringField("errmsg");
                throw DriverError(QtUtils::toQString(errStr));
            }

            if (reply.getField("n").numberLong() == 0)
                throw DriverError("No document matched the _id of the edited document");
        });

        LOG_MSG("Document replaced in " + QtUtils::toQString(profile.defaultDatabase() + "." + collection),
                mongo::logger::LogSeverity::Info());
    }

    std::vector<MongoDocumentPtr> QueryExecutor::listIndexes(const ConnectionSettings &profile,
                                                             const std::string &collection)
    {
        mongo::BSONObjBuilder cmd;
        cmd.append("listIndexes", collection);
        cmd.append("cursor", mongo::BSONObj());

        std::unique_ptr<MongoSession> session = openSession(profile);
        std::vector<mongo::BSONObj> indexes = guarded([&] {
            return firstBatch(session->runCommand(profile.defaultDatabase(), cmd.obj()));
        });
        return MongoDocument::fromBsonObj(indexes);
    }

    void QueryExecutor::createIndex(const ConnectionSettings &profile, const std::string &collection,
                                    const QString &keysText, const QString &name, bool unique)
    {
        const mongo::BSONObj keys = QueryParser::parseObject(keysText, "Index keys");
        if (keys.isEmpty())
            throw InvalidQueryShapeError("Index keys must not be empty");

        const std::string indexName = name.trimmed().isEmpty()
            ? detail::defaultIndexName(keys)
            : QtUtils::toStdString(name.trimmed());

        mongo::BSONObjBuilder index;
        index.append("key", keys);
        index.append("name", indexName);
        if (unique)
            index.append("unique", true);

        mongo::BSONArrayBuilder indexes;
        indexes.append(index.obj());

        mongo::BSONObjBuilder cmd;
        cmd.append("createIndexes", collection);
        cmd.appendArray("indexes", indexes.arr());

        std::unique_ptr<MongoSession> session = openSession(profile);
        guarded([&] {
            session->runCommand(profile.defaultDatabase(), cmd.obj());
        });

        LOG_MSG("Index " + QtUtils::toQString(indexName) + " created on " + QtUtils::toQString(collection),
                mongo::logger::LogSeverity::Info());
    }

    void QueryExecutor::dropIndex(const ConnectionSettings &profile, const std::string &collection,
                                  const QString &name)
    {
        mongo::BSONObjBuilder cmd;
        cmd.append("dropIndexes", collection);
        cmd.append("index", QtUtils::toStdString(name));

        std::unique_ptr<MongoSession> session = openSession(profile);
        guarded([&] {
            session->runCommand(profile.defaultDatabase(), cmd.obj());
        });

        LOG_MSG("Index " + name + " dropped from " + QtUtils::toQString(collection),
                mongo::logger::LogSeverity::Info());
    }

    std::unique_ptr<MongoSession> QueryExecutor::openSession(const ConnectionSettings &profile)
    {
        try {
            return _connector.connect(profile, timeoutSec());
        }
        catch (const MongoGuiException &) {
            throw;
        }
        catch (const std::exception &ex) {
            throw ConnectionError(QString::fromUtf8(ex.what()));
        }
    }
}
