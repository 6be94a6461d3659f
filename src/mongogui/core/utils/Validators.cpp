#include "mongogui/core/utils/Validators.h"

#include "mongogui/core/settings/ConnectionSettings.h"
#include "mongogui/core/utils/QtUtils.h"

namespace
{
    const QString InvalidDatabaseChars = "/\\. \"$*<>:|?";
    const int MaxDatabaseNameBytes = 64;
}

namespace MongoGui
{
    namespace Validators
    {
        bool isValidHost(const QString &host)
        {
            if (host.isEmpty())
                return false;

            for (const QChar &ch : host) {
                if (ch.isSpace())
                    return false;
            }
            return true;
        }

        bool isValidPort(int port)
        {
            return port >= 1 && port <= 65535;
        }

        bool isValidDatabaseName(const QString &db)
        {
            if (db.isEmpty() || db.toUtf8().size() >= MaxDatabaseNameBytes)
                return false;

            for (const QChar &ch : db) {
                if (InvalidDatabaseChars.contains(ch) || ch == QChar('\0'))
                    return false;
            }
            return true;
        }

        QString validateConnection(const ConnectionSettings &profile)
        {
            if (QtUtils::toQString(profile.connectionName()).trimmed().isEmpty())
                return "Connection name is required.";

            if (!isValidHost(QtUtils::toQString(profile.serverHost())))
                return "Host must be non-empty and must not contain spaces.";

            if (!isValidPort(profile.serverPort()))
                return "Port must be an integer between 1 and 65535.";

            if (!isValidDatabaseName(QtUtils::toQString(profile.defaultDatabase())))
                return "Invalid database name.";

            const std::string authDb = profile.credential().databaseName();
            if (!authDb.empty() && !isValidDatabaseName(QtUtils::toQString(authDb)))
                return "Invalid authentication database name.";

            return QString();
        }
    }
}
