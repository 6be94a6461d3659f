#include "mongogui/core/settings/KeychainSecretStore.h"

#include <QEventLoop>

#include <qt5keychain/keychain.h>

#include "mongogui/core/Exceptions.h"
#include "mongogui/core/utils/QtUtils.h"

namespace MongoGui
{
    KeychainSecretStore::KeychainSecretStore(const QString &service) :
        _service(service)
    {

    }

    void KeychainSecretStore::writePassword(const QString &key, const QString &password)
    {
        QKeychain::WritePasswordJob job(_service);
        job.setAutoDelete(false);
        job.setKey(key);
        job.setTextData(password);
        runJob(&job);

        if (job.error() != QKeychain::NoError)
            throw PersistenceError(QString("Cannot store password for \"%1\": %2").arg(key, job.errorString()));
    }

    QString KeychainSecretStore::readPassword(const QString &key)
    {
        QKeychain::ReadPasswordJob job(_service);
        job.setAutoDelete(false);
        job.setKey(key);
        runJob(&job);

        if (job.error() == QKeychain::EntryNotFound)
            return QString();

        if (job.error() != QKeychain::NoError)
            throw PersistenceError(QString("Cannot read password for \"%1\": %2").arg(key, job.errorString()));

        return job.textData();
    }

    void KeychainSecretStore::deletePassword(const QString &key)
    {
        QKeychain::DeletePasswordJob job(_service);
        job.setAutoDelete(false);
        job.setKey(key);
        runJob(&job);

        if (job.error() != QKeychain::NoError && job.error() != QKeychain::EntryNotFound)
            throw PersistenceError(QString("Cannot delete password for \"%1\": %2").arg(key, job.errorString()));
    }

    void KeychainSecretStore::runJob(QKeychain::Job *job) const
    {
        QEventLoop loop;
        VERIFY(QObject::connect(job, SIGNAL(finished(QKeychain::Job*)), &loop, SLOT(quit())));
        job->start();
        loop.exec();
    }
}
