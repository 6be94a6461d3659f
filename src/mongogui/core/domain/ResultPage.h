#pragma once

#include <vector>

#include "mongogui/core/Core.h"
#include "mongogui/core/domain/MongoDocument.h"

namespace MongoGui
{
    /**
     * @brief One page of query results. Pages are 1-based.
     */
    struct ResultPage
    {
        ResultPage() : _page(1), _pageSize(0), _totalKnown(0), _hasMore(false) {}

        std::vector<MongoDocumentPtr> _documents;
        int _page;
        int _pageSize;

        // Documents known to exist up to and including this page
        long long _totalKnown;

        // At least one document follows this page
        bool _hasMore;
    };
}
