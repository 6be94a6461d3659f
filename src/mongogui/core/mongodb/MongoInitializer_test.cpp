#include "gtest/gtest.h"

#include <mongo/db/service_context.h>

#include "mongogui/core/mongodb/MongoInitializer.h"

// Test main() runs initializeMongoClient() like the application does
TEST(MongoInitializer_CoreTests, serviceContextHasTransportLayer)
{
    ASSERT_TRUE(mongo::hasGlobalServiceContext());
    EXPECT_NE(nullptr, mongo::getGlobalServiceContext()->getTransportLayer());
}
