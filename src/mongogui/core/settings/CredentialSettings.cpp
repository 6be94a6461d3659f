#include "mongogui/core/settings/CredentialSettings.h"

#include "mongogui/core/utils/QtUtils.h"

namespace MongoGui
{
    CredentialSettings::CredentialSettings() :
        _userName(),
        _userPassword(),
        _databaseName(),
        _mechanism()
    {

    }

    CredentialSettings::CredentialSettings(const QVariantMap &map) :
        _userName(QtUtils::toStdString(map.value("username").toString())),
        _userPassword(),
        _databaseName(QtUtils::toStdString(map.value("authDatabase").toString())),
        _mechanism(QtUtils::toStdString(map.value("mechanism").toString()))
    {

    }

    QVariant CredentialSettings::toVariant() const
    {
        QVariantMap map;
        map.insert("username", QtUtils::toQString(userName()));
        map.insert("authDatabase", QtUtils::toQString(databaseName()));
        map.insert("mechanism", QtUtils::toQString(mechanism()));
        return map;
    }
}
