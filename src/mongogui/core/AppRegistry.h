#pragma once

#include "mongogui/core/Core.h"
#include "mongogui/core/utils/SingletonPattern.hpp"

namespace MongoGui
{
    class AppRegistry: public Patterns::LazySingleton<AppRegistry>
    {
        friend class Patterns::LazySingleton<AppRegistry>;
    public:

        SettingsManager *const settingsManager() const { return _settingsManager.get(); }
        SecretStore *const secretStore() const { return _secretStore.get(); }
        ConnectionStore *const connectionStore() const { return _connectionStore.get(); }
        QueryExecutor *const queryExecutor() const { return _queryExecutor.get(); }
        QueryTemplateStore *const queryTemplateStore() const { return _queryTemplateStore.get(); }

        /**
         * @brief Pushes timeout and paging settings to the store and executor.
         *        Call after settings were changed.
         */
        void applySettings();

    private:
        AppRegistry();
        ~AppRegistry();

        // Declaration order is construction order
        const SettingsManagerScopedPtr _settingsManager;
        const SecretStoreScopedPtr _secretStore;
        const MongoConnectorScopedPtr _connector;
        const ConnectionStoreScopedPtr _connectionStore;
        const QueryExecutorScopedPtr _queryExecutor;
        const QueryTemplateStoreScopedPtr _queryTemplateStore;
    };
}
