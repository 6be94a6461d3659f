#include "mongogui/core/settings/ConnectionStore.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QVariantList>

#include <parser.h>
#include <serializer.h>

#include "mongogui/core/Exceptions.h"
#include "mongogui/core/mongodb/MongoConnector.h"
#include "mongogui/core/settings/SecretStore.h"
#include "mongogui/core/settings/SettingsManager.h"
#include "mongogui/core/utils/Logger.h"
#include "mongogui/core/utils/QtUtils.h"
#include "mongogui/core/utils/Validators.h"

namespace
{
    const QString CheckKey = "__" PROJECT_NAME_LOWERCASE "_check__";
    const QString CheckValue = "__" PROJECT_NAME_LOWERCASE "_check_value__";
}

namespace MongoGui
{
    ConnectionStore::ConnectionStore(const QString &filePath, SecretStore &secrets, MongoConnector &connector) :
        _filePath(filePath),
        _secrets(secrets),
        _connector(connector),
        _timeoutSec(SettingsManager::DefaultMongoTimeoutSec),
        _loaded(false)
    {

    }

    void ConnectionStore::save(const ConnectionSettings &profile, const QString &password)
    {
        validate(profile);
        ensureLoaded();

        ConnectionSettings stored = storedCopy(profile);
        const QString name = QtUtils::toQString(stored.connectionName());

        ConnectionSettingsContainerType profiles = _profiles;
        const int index = indexOf(name);
        if (index >= 0)
            profiles[index] = stored;
        else
            profiles.push_back(stored);

        persist(profiles);

        if (!password.isEmpty())
            _secrets.writePassword(name, password);

        LOG_MSG("Connection \"" + name + "\" saved", mongo::logger::LogSeverity::Info(), false);
    }

    void ConnectionStore::update(const QString &oldName, const ConnectionSettings &profile, const QString &password)
    {
        validate(profile);
        ensureLoaded();

        const QString currentName = oldName.trimmed();
        const int index = indexOf(currentName);
        if (index < 0)
            throw NotFoundError(QString("Connection \"%1\" does not exist").arg(currentName));

        ConnectionSettings stored = storedCopy(profile);
        const QString newName = QtUtils::toQString(stored.connectionName());
        const bool renamed = newName != currentName;
        if (renamed && indexOf(newName) >= 0)
            throw ValidationError(QString("Connection \"%1\" already exists").arg(newName));

        ConnectionSettingsContainerType profiles = _profiles;
        profiles[index] = stored;

        if (!renamed) {
            persist(profiles);
            if (!password.isEmpty())
                _secrets.writePassword(newName, password);
            return;
        }

        // Secret moves under the new name before the file refers to it,
        // the old one goes only after the rename is on disk
        const QString secret = password.isEmpty() ? _secrets.readPassword(currentName) : password;
        if (!secret.isEmpty())
            _secrets.writePassword(newName, secret);

        try {
            persist(profiles);
        }
        catch (const PersistenceError &) {
            if (!secret.isEmpty())
                _secrets.deletePassword(newName);
            throw;
        }

        _secrets.deletePassword(currentName);
        LOG_MSG("Connection \"" + currentName + "\" renamed to \"" + newName + "\"",
                mongo::logger::LogSeverity::Info(), false);
    }

    ConnectionStore::ConnectionSettingsContainerType ConnectionStore::list()
    {
        ensureLoaded();
        return _profiles;
    }

    bool ConnectionStore::contains(const QString &name)
    {
        ensureLoaded();
        return indexOf(name) >= 0;
    }

    ConnectionSettings ConnectionStore::resolve(const QString &name)
    {
        ensureLoaded();

        const int index = indexOf(name);
        if (index < 0)
            throw NotFoundError(QString("Connection \"%1\" does not exist").arg(name));

        ConnectionSettings resolved = _profiles[index];
        resolved.credential().setUserPassword(QtUtils::toStdString(_secrets.readPassword(name)));
        return resolved;
    }

    void ConnectionStore::remove(const QString &name)
    {
        ensureLoaded();

        const int index = indexOf(name);
        if (index < 0)
            throw NotFoundError(QString("Connection \"%1\" does not exist").arg(name));

        ConnectionSettingsContainerType profiles = _profiles;
        profiles.erase(profiles.begin() + index);
        persist(profiles);

        _secrets.deletePassword(name);
        LOG_MSG("Connection \"" + name + "\" removed", mongo::logger::LogSeverity::Info(), false);
    }

    ConnectionTestResult ConnectionStore::test(const ConnectionSettings &profile, const QString &password)
    {
        ConnectionSettings candidate = profile;
        candidate.credential().setUserPassword(QtUtils::toStdString(password));

        try {
            std::unique_ptr<MongoSession> session = _connector.connect(candidate, _timeoutSec.load());
            session->ping();
        }
        catch (const MongoGuiException &ex) {
            return ConnectionTestResult(false, ex.message());
        }
        catch (const std::exception &ex) {
            return ConnectionTestResult(false, QString::fromUtf8(ex.what()));
        }

        return ConnectionTestResult(true, QString());
    }

    bool ConnectionStore::verifySecretStore()
    {
        bool ok = false;
        try {
            _secrets.writePassword(CheckKey, CheckValue);
            ok = _secrets.readPassword(CheckKey) == CheckValue;
            _secrets.deletePassword(CheckKey);
        }
        catch (const PersistenceError &ex) {
            LOG_MSG("Secret store is not available, passwords will not be remembered: " + ex.message(),
                    mongo::logger::LogSeverity::Warning());
            return false;
        }

        if (!ok)
            LOG_MSG("Secret store verification failed, passwords will not be remembered",
                    mongo::logger::LogSeverity::Warning());

        return ok;
    }

    void ConnectionStore::ensureLoaded()
    {
        if (_loaded)
            return;

        ConnectionSettingsContainerType profiles;
        QFile f(_filePath);
        if (f.exists()) {
            if (!f.open(QIODevice::ReadOnly))
                throw PersistenceError(QString("Cannot read %1: %2").arg(_filePath, f.errorString()));

            bool ok;
            QJson::Parser parser;
            QVariant root = parser.parse(f.readAll(), &ok);
            if (!ok || root.type() != QVariant::List)
                throw PersistenceError(QString("%1 is not a JSON array of connections").arg(_filePath));

            const QVariantList entries = root.toList();
            for (auto const &entry : entries) {
                if (entry.type() != QVariant::Map) {
                    LOG_MSG("Skipping malformed connection entry in " + _filePath, mongo::logger::LogSeverity::Warning());
                    continue;
                }
                profiles.push_back(ConnectionSettings(entry.toMap()));
            }
        }

        _profiles = profiles;
        _loaded = true;
    }

    void ConnectionStore::persist(const ConnectionSettingsContainerType &profiles)
    {
        QVariantList list;
        for (auto const &profile : profiles)
            list.append(profile.toVariant());

        bool ok;
        QJson::Serializer s;
        s.setIndentMode(QJson::IndentFull);
        QByteArray bytes = s.serialize(list, &ok);
        if (!ok)
            throw PersistenceError("Cannot serialize connections: " + s.errorMessage());

        if (!QDir().mkpath(QFileInfo(_filePath).absolutePath()))
            throw PersistenceError("Cannot create directory for " + _filePath);

        QSaveFile f(_filePath);
        if (!f.open(QIODevice::WriteOnly))
            throw PersistenceError(QString("Cannot write %1: %2").arg(_filePath, f.errorString()));

        if (f.write(bytes) != bytes.size() || !f.commit())
            throw PersistenceError(QString("Cannot write %1: %2").arg(_filePath, f.errorString()));

        _profiles = profiles;
    }

    ConnectionSettings ConnectionStore::storedCopy(const ConnectionSettings &profile)
    {
        ConnectionSettings stored = profile;
        stored.setConnectionName(QtUtils::toStdString(QtUtils::toQString(profile.connectionName()).trimmed()));
        stored.credential().setUserPassword(std::string());
        return stored;
    }

    int ConnectionStore::indexOf(const QString &name) const
    {
        const std::string key = QtUtils::toStdString(name);
        for (size_t i = 0; i < _profiles.size(); ++i) {
            if (_profiles[i].connectionName() == key)
                return static_cast<int>(i);
        }
        return -1;
    }

    void ConnectionStore::validate(const ConnectionSettings &profile) const
    {
        const QString reason = Validators::validateConnection(profile);
        if (!reason.isEmpty())
            throw ValidationError(reason);
    }
}
