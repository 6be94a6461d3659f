#pragma once

#include <QString>

namespace MongoGui
{
    /**
     * @brief Where pagination of an aggregation pipeline happens.
     */
    enum AggregatePaging
    {
        AutoPaging   = 0,  // server-side unless the pipeline pages or writes itself
        ServerPaging = 1,  // append $skip/$limit stages
        ClientPaging = 2   // read the cursor up to the end of the page
    };

    enum QueryKind
    {
        FindQuery      = 0,
        AggregateQuery = 1
    };

    const char *convertAggregatePagingToString(AggregatePaging paging);
    AggregatePaging convertStringToAggregatePaging(const QString &text);
}
