#pragma once

#include <atomic>
#include <vector>
#include <QString>

#include "mongogui/core/settings/ConnectionSettings.h"

namespace MongoGui
{
    class SecretStore;
    class MongoConnector;

    struct ConnectionTestResult
    {
        ConnectionTestResult() : _ok(false) {}
        ConnectionTestResult(bool ok, const QString &reason) : _ok(ok), _reason(reason) {}

        bool _ok;
        QString _reason;
    };

    /**
     * @brief Saved connection profiles.
     *
     *        Profiles (without passwords) are kept in a JSON array file,
     *        loaded on first access and rewritten in full on every change.
     *        Passwords go to the SecretStore under the profile name.
     *
     *        File and secret store failures are thrown as PersistenceError,
     *        unknown names as NotFoundError, rejected input as ValidationError.
     *
     * @threadsafe no
     */
    class ConnectionStore
    {
    public:
        typedef std::vector<ConnectionSettings> ConnectionSettingsContainerType;

        ConnectionStore(const QString &filePath, SecretStore &secrets, MongoConnector &connector);

        /**
         * @brief Adds profile, or replaces the one with the same name in place.
         *        Name is stored trimmed.
         *        Non-empty password is written to the secret store,
         *        empty password leaves the stored one untouched.
         */
        void save(const ConnectionSettings &profile, const QString &password);

        /**
         * @brief Replaces profile oldName, possibly renaming it.
         *        On rename the stored password moves to the new name
         *        (or is replaced by password when it is not empty).
         *        If the file can't be written the old name keeps its password.
         */
        void update(const QString &oldName, const ConnectionSettings &profile, const QString &password);

        /**
         * @brief All profiles in insertion order, passwords are empty.
         */
        ConnectionSettingsContainerType list();

        bool contains(const QString &name);

        /**
         * @brief Profile with its password from the secret store
         *        (empty if none is stored).
         */
        ConnectionSettings resolve(const QString &name);

        /**
         * @brief Removes profile and its password.
         */
        void remove(const QString &name);

        /**
         * @brief Opens short-lived connection and pings the server.
         *        Nothing is persisted, never throws.
         */
        ConnectionTestResult test(const ConnectionSettings &profile, const QString &password);

        /**
         * @brief Writes, reads back and deletes a marker entry in the secret store.
         * @return false if passwords can't be remembered on this machine.
         */
        bool verifySecretStore();

        void setTimeoutSec(int timeoutSec) { _timeoutSec.store(timeoutSec); }
        QString filePath() const { return _filePath; }

    private:
        void ensureLoaded();
        void persist(const ConnectionSettingsContainerType &profiles);
        static ConnectionSettings storedCopy(const ConnectionSettings &profile);
        int indexOf(const QString &name) const;
        void validate(const ConnectionSettings &profile) const;

        const QString _filePath;
        SecretStore &_secrets;
        MongoConnector &_connector;
        std::atomic<int> _timeoutSec;

        bool _loaded;
        ConnectionSettingsContainerType _profiles;
    };
}
