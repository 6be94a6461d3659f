#pragma once

#include <memory>

#include "mongogui/core/mongodb/MongoSession.h"

namespace MongoGui
{
    class ConnectionSettings;

    /**
     * @brief Opens sessions for resolved profiles (password included).
     */
    class MongoConnector
    {
    public:
        virtual ~MongoConnector() {}

        /**
         * @brief Connects and authenticates.
         * @throws ConnectionError if server is unreachable or rejects credentials
         */
        virtual std::unique_ptr<MongoSession> connect(const ConnectionSettings &profile, int timeoutSec) = 0;
    };
}
