#pragma once

#include <QString>
#include <mongo/bson/bsonobj.h>

#include "mongogui/core/domain/QuerySpec.h"

namespace MongoGui
{
    /**
     * @brief Turns query text typed by the user into a QuerySpec.
     *
     *        Text is MongoDB extended JSON (unquoted keys, ObjectId(...),
     *        ISODate(...) etc. are accepted). A JSON object is a find
     *        filter, an array of objects is an aggregation pipeline.
     *        Shell form is accepted as well:
     *          db.<collection>.find(<filter>[, <projection>])
     *          db.<collection>.findOne(<filter>[, <projection>])
     *          db.<collection>.aggregate(<pipeline>)
     *
     *        Throws ParseError for invalid JSON and InvalidQueryShapeError
     *        for valid JSON of the wrong shape.
     */
    namespace QueryParser
    {
        QuerySpec parse(const QString &queryText,
                        const QString &projectionText = QString(),
                        const QString &sortText = QString());

        /**
         * @brief Parses text that must be a single JSON object
         *        (projection, sort, index keys, edited document).
         *        Empty text gives empty object.
         * @param what: used in error messages, e.g. "Projection"
         */
        mongo::BSONObj parseObject(const QString &text, const QString &what);
    }
}
