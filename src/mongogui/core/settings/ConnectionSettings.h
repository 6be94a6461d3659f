#pragma once

#include <string>
#include <QMetaType>
#include <QVariant>
#include <QVariantMap>

#include <mongo/util/net/hostandport.h>

#include "mongogui/core/settings/CredentialSettings.h"

namespace MongoGui
{
    /**
     * @brief Named connection profile. The name keys both the entry in
     *        connections.json and the password in the secret store.
     */
    class ConnectionSettings
    {
    public:
        /**
         * @brief Creates ConnectionSettings with default values
         */
        ConnectionSettings();

        explicit ConnectionSettings(const QVariantMap &map);

        /**
         * @brief Converts to QVariantMap. Password is never included.
         */
        QVariant toVariant() const;
        void fromVariant(const QVariantMap &map);

        /**
         * @brief Name of connection
         */
        std::string connectionName() const { return _connectionName; }
        void setConnectionName(const std::string &connectionName) { _connectionName = connectionName; }

        /**
         * @brief Server host
         */
        std::string serverHost() const { return _host; }
        void setServerHost(const std::string &serverHost) { _host = serverHost; }

        /**
         * @brief Port of server
         */
        int serverPort() const { return _port; }
        void setServerPort(const int port) { _port = port; }

        /**
         * @brief Database the profile works with
         */
        std::string defaultDatabase() const { return _defaultDatabase; }
        void setDefaultDatabase(const std::string &defaultDatabase) { _defaultDatabase = defaultDatabase; }

        bool tlsEnabled() const { return _tls; }
        void setTlsEnabled(bool tls) { _tls = tls; }

        CredentialSettings &credential() { return _credential; }
        const CredentialSettings &credential() const { return _credential; }

        /**
         * @brief Database used to authenticate, falls back to the profile database
         */
        std::string authDatabase() const;

        /**
         * @brief Returns connection full address (i.e. localhost:27017)
         */
        std::string getFullAddress() const;

        std::string getReadableName() const
        {
            if (_connectionName.empty())
                return getFullAddress();

            return _connectionName;
        }

        mongo::HostAndPort hostAndPort() const;

        // Same non-secret fields
        bool sameProfile(const ConnectionSettings &other) const;

    private:
        std::string _connectionName;
        std::string _host;
        int _port;
        std::string _defaultDatabase;
        bool _tls;
        CredentialSettings _credential;
    };
}

Q_DECLARE_METATYPE(MongoGui::ConnectionSettings)
