#pragma once

#include <string>
#include <vector>

#include <mongo/bson/bsonobj.h>

#include "mongogui/core/Enums.h"

namespace MongoGui
{
    /**
     * @brief Parsed query, built fresh for every execution.
     *        Find uses _filter/_projection/_sort, aggregate uses _pipeline.
     */
    struct QuerySpec
    {
        QuerySpec() : _kind(FindQuery) {}

        bool isAggregate() const { return _kind == AggregateQuery; }

        QueryKind _kind;

        // Collection named in shell form "db.<name>.find(...)", empty otherwise
        std::string _collection;

        mongo::BSONObj _filter;
        mongo::BSONObj _projection;
        mongo::BSONObj _sort;
        std::vector<mongo::BSONObj> _pipeline;
    };
}
