#pragma once

#include <QString>

namespace MongoGui
{
    /**
     * @brief Storage of connection passwords, keyed by profile name.
     *        Implementations throw PersistenceError when the backend fails.
     */
    class SecretStore
    {
    public:
        virtual ~SecretStore() {}

        virtual void writePassword(const QString &key, const QString &password) = 0;

        // Empty string when there is no entry for key
        virtual QString readPassword(const QString &key) = 0;

        // Missing entry is not an error
        virtual void deletePassword(const QString &key) = 0;
    };
}
