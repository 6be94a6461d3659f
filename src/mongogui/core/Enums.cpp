#include "mongogui/core/Enums.h"

namespace
{
    const char *aggregatePagingAsoc[MongoGui::ClientPaging + 1] = {"auto", "server", "client"};
}

namespace MongoGui
{
    const char *convertAggregatePagingToString(AggregatePaging paging)
    {
        return aggregatePagingAsoc[paging];
    }

    AggregatePaging convertStringToAggregatePaging(const QString &text)
    {
        const QString normalized = text.trimmed().toLower();
        for (int i = 0; i <= ClientPaging; ++i) {
            if (normalized == aggregatePagingAsoc[i])
                return static_cast<AggregatePaging>(i);
        }
        return AutoPaging;
    }
}
