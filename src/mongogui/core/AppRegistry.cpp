#include "mongogui/core/AppRegistry.h"

#include "mongogui/core/domain/QueryExecutor.h"
#include "mongogui/core/mongodb/MongoClientConnector.h"
#include "mongogui/core/settings/ConnectionStore.h"
#include "mongogui/core/settings/KeychainSecretStore.h"
#include "mongogui/core/settings/QueryTemplateStore.h"
#include "mongogui/core/settings/SettingsManager.h"
#include "mongogui/core/utils/QtUtils.h"

namespace MongoGui
{
    AppRegistry::AppRegistry() :
        _settingsManager(new SettingsManager(QtUtils::configDirPath())),
        _secretStore(new KeychainSecretStore(_settingsManager->secretService())),
        _connector(new MongoClientConnector()),
        _connectionStore(new ConnectionStore(_settingsManager->connectionsFilePath(), *_secretStore, *_connector)),
        _queryExecutor(new QueryExecutor(*_connector)),
        _queryTemplateStore(new QueryTemplateStore(_settingsManager->queryTemplatesFilePath()))
    {
        applySettings();
    }

    AppRegistry::~AppRegistry()
    {
    }

    void AppRegistry::applySettings()
    {
        _connectionStore->setTimeoutSec(_settingsManager->mongoTimeoutSec());
        _queryExecutor->setTimeoutSec(_settingsManager->mongoTimeoutSec());
        _queryExecutor->setAggregatePaging(_settingsManager->aggregatePaging());
    }
}
