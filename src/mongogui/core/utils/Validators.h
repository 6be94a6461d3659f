#pragma once

#include <QString>

namespace MongoGui
{
    class ConnectionSettings;

    namespace Validators
    {
        // Non-empty, no whitespace
        bool isValidHost(const QString &host);

        bool isValidPort(int port);

        /**
         * @brief MongoDB naming restrictions: non-empty, none of
         *        '/', '\', '.', ' ', '"', '$', '*', '<', '>', ':', '|', '?'
         *        and shorter than 64 bytes.
         */
        bool isValidDatabaseName(const QString &db);

        /**
         * @brief Checks every field of profile.
         * @return Empty string when valid, human readable reason otherwise.
         */
        QString validateConnection(const ConnectionSettings &profile);
    }
}
