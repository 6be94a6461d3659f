#pragma once

#include <boost/scoped_ptr.hpp>
#include <boost/shared_ptr.hpp>

/*
** Smart pointers for Mongo* staff
*/
namespace MongoGui
{
    class SettingsManager;
    typedef boost::scoped_ptr<SettingsManager> SettingsManagerScopedPtr;

    class SecretStore;
    typedef boost::scoped_ptr<SecretStore> SecretStoreScopedPtr;

    class MongoConnector;
    typedef boost::scoped_ptr<MongoConnector> MongoConnectorScopedPtr;

    class ConnectionStore;
    typedef boost::scoped_ptr<ConnectionStore> ConnectionStoreScopedPtr;

    class QueryTemplateStore;
    typedef boost::scoped_ptr<QueryTemplateStore> QueryTemplateStoreScopedPtr;

    class QueryExecutor;
    typedef boost::scoped_ptr<QueryExecutor> QueryExecutorScopedPtr;

    class MongoDocument;
    typedef boost::shared_ptr<MongoDocument> MongoDocumentPtr;
}
