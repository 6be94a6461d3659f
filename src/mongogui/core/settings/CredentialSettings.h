#pragma once

#include <string>
#include <QVariant>
#include <QVariantMap>

namespace MongoGui
{
    /**
     * @brief Authentication part of a connection profile.
     *        Password lives only in memory, it is kept in the secret
     *        store and is never part of toVariant().
     */
    class CredentialSettings
    {
    public:
        CredentialSettings();
        explicit CredentialSettings(const QVariantMap &map);

        /**
         * @brief Converts to QVariantMap (without password)
         */
        QVariant toVariant() const;

        /**
         * @brief User name. Authentication is skipped when empty.
         */
        std::string userName() const { return _userName; }
        void setUserName(const std::string &userName) { _userName = userName; }

        std::string userPassword() const { return _userPassword; }
        void setUserPassword(const std::string &userPassword) { _userPassword = userPassword; }

        /**
         * @brief Database name, on which authentication performed.
         *        Empty means the profile's database.
         */
        std::string databaseName() const { return _databaseName; }
        void setDatabaseName(const std::string &databaseName) { _databaseName = databaseName; }

        /**
         * @brief Authentication mechanism (SCRAM-SHA-1 or SCRAM-SHA-256)
         */
        std::string mechanism() const { return _mechanism.empty() ? "SCRAM-SHA-1" : _mechanism; }
        void setMechanism(const std::string &mechanism) { _mechanism = mechanism; }

        bool enabled() const { return !_userName.empty(); }

    private:
        std::string _userName;
        std::string _userPassword;
        std::string _databaseName;
        std::string _mechanism;
    };
}
