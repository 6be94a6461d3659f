#include "mongogui/core/settings/ConnectionSettings.h"

#include <boost/algorithm/string/erase.hpp>

#include "mongogui/core/utils/QtUtils.h"

namespace
{
    const int DefaultPort = 27017;
    const char *DefaultHost = "localhost";
    const char *DefaultName = "New Connection";
    const char *DefaultDatabase = "test";
}

namespace MongoGui
{
    ConnectionSettings::ConnectionSettings() :
        _connectionName(DefaultName),
        _host(DefaultHost),
        _port(DefaultPort),
        _defaultDatabase(DefaultDatabase),
        _tls(false),
        _credential()
    {

    }

    ConnectionSettings::ConnectionSettings(const QVariantMap &map) :
        ConnectionSettings()
    {
        fromVariant(map);
    }

    QVariant ConnectionSettings::toVariant() const
    {
        QVariantMap map;
        map.insert("name", QtUtils::toQString(connectionName()));
        map.insert("host", QtUtils::toQString(serverHost()));
        map.insert("port", serverPort());
        map.insert("database", QtUtils::toQString(defaultDatabase()));
        map.insert("tls", tlsEnabled());

        // Credential fields are stored flat, next to the address
        const QVariantMap credential = _credential.toVariant().toMap();
        for (auto it = credential.constBegin(); it != credential.constEnd(); ++it)
            map.insert(it.key(), it.value());

        return map;
    }

    void ConnectionSettings::fromVariant(const QVariantMap &map)
    {
        setConnectionName(QtUtils::toStdString(map.value("name").toString()));
        setServerHost(QtUtils::toStdString(map.value("host", DefaultHost).toString()));
        setServerPort(map.value("port", DefaultPort).toInt());
        setDefaultDatabase(QtUtils::toStdString(map.value("database").toString()));
        setTlsEnabled(map.value("tls", false).toBool());
        _credential = CredentialSettings(map);
    }

    std::string ConnectionSettings::authDatabase() const
    {
        const std::string db = _credential.databaseName();
        return db.empty() ? _defaultDatabase : db;
    }

    std::string ConnectionSettings::getFullAddress() const
    {
        return hostAndPort().toString();
    }

    mongo::HostAndPort ConnectionSettings::hostAndPort() const
    {
        // If it doesn't look like IPv6 address,
        // treat it like IPv4 or literal hostname
        if (_host.find(':') == std::string::npos) {
            return mongo::HostAndPort(_host, _port);
        }

        // IPv6, square brackets are added back by HostAndPort
        std::string hostCopy = _host;
        boost::erase_all(hostCopy, "[");
        boost::erase_all(hostCopy, "]");
        return mongo::HostAndPort(hostCopy, _port);
    }

    bool ConnectionSettings::sameProfile(const ConnectionSettings &other) const
    {
        return _connectionName == other._connectionName
            && _host == other._host
            && _port == other._port
            && _defaultDatabase == other._defaultDatabase
            && _tls == other._tls
            && _credential.userName() == other._credential.userName()
            && _credential.databaseName() == other._credential.databaseName()
            && _credential.mechanism() == other._credential.mechanism();
    }
}
