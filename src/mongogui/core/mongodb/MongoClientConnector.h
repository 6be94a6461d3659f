#pragma once

#include "mongogui/core/mongodb/MongoConnector.h"

namespace MongoGui
{
    class MongoClientConnector : public MongoConnector
    {
    public:
        std::unique_ptr<MongoSession> connect(const ConnectionSettings &profile, int timeoutSec) override;
    };
}
