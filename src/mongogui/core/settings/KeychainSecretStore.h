#pragma once

#include "mongogui/core/settings/SecretStore.h"

namespace QKeychain
{
    class Job;
}

namespace MongoGui
{
    /**
     * @brief SecretStore backed by the OS keyring through QtKeychain
     *        (Secret Service or KWallet on Linux, Keychain on macOS,
     *        Credential Store on Windows).
     *
     *        Jobs are asynchronous in QtKeychain, each call here runs
     *        its own event loop until the job finishes, so it can be
     *        used from worker threads as well.
     */
    class KeychainSecretStore : public SecretStore
    {
    public:
        explicit KeychainSecretStore(const QString &service);

        void writePassword(const QString &key, const QString &password) override;
        QString readPassword(const QString &key) override;
        void deletePassword(const QString &key) override;

        QString service() const { return _service; }

    private:
        void runJob(QKeychain::Job *job) const;

        const QString _service;
    };
}
