#include "mongogui/core/engine/QueryParser.h"

#include <cctype>

#include <QRegularExpression>

#include <mongo/bson/json.h>
#include <mongo/util/assert_util.h>

#include "mongogui/core/Exceptions.h"
#include "mongogui/core/utils/QtUtils.h"

namespace
{
    using namespace MongoGui;

    const char *WrapperField = "q";

    /**
     * @brief Parses any JSON value by wrapping it into { q: <text> }.
     *        Returned element points into holder.
     */
    mongo::BSONElement parseValue(const QString &text, mongo::BSONObj &holder)
    {
        const std::string json = "{\"" + std::string(WrapperField) + "\": " + QtUtils::toStdString(text) + "\n}";
        int len = 0;
        try {
            holder = mongo::fromjson(json.c_str(), &len);
        }
        catch (const mongo::DBException &ex) {
            throw ParseError(QString("Invalid JSON: %1").arg(QtUtils::toQString(ex.toString())));
        }

        // fromjson stops at the wrapper's closing brace, the rest must be blank
        for (size_t i = static_cast<size_t>(len); i < json.size(); ++i) {
            if (!std::isspace(static_cast<unsigned char>(json[i])))
                throw ParseError("Invalid JSON: unexpected text after the first value");
        }

        // Leftovers like '{"a": 1}, {"b": 2}' end up as extra fields
        if (holder.nFields() != 1)
            throw ParseError("Invalid JSON: unexpected text after the first value");

        return holder.firstElement();
    }

    std::vector<mongo::BSONObj> toPipeline(const mongo::BSONElement &elem)
    {
        std::vector<mongo::BSONObj> pipeline;
        for (auto const &stage : elem.Array()) {
            if (stage.type() != mongo::Object)
                throw InvalidQueryShapeError("Every stage of an aggregation pipeline must be a JSON object");

            pipeline.push_back(stage.embeddedObject().getOwned());
        }
        return pipeline;
    }

    void applyShape(QuerySpec &spec, const mongo::BSONElement &elem)
    {
        if (elem.type() == mongo::Object) {
            spec._kind = FindQuery;
            spec._filter = elem.embeddedObject().getOwned();
        }
        else if (elem.type() == mongo::Array) {
            spec._kind = AggregateQuery;
            spec._pipeline = toPipeline(elem);
        }
        else {
            throw InvalidQueryShapeError(
                "Query must be a JSON object (find filter) or an array of stage objects (aggregation pipeline)");
        }
    }

    /**
     * @brief Handles db.<coll>.find(...) and db.<coll>.aggregate(...).
     * @return false if text is not in shell form.
     */
    bool parseShellForm(const QString &text, QuerySpec &spec, mongo::BSONObj &projection)
    {
        static const QRegularExpression shellForm(
            "^db\\.([^\\s.(]+(?:\\.[^\\s.(]+)*)\\.(find|findOne|aggregate)\\s*\\((.*)\\)\\s*;?$",
            QRegularExpression::DotMatchesEverythingOption);

        const QRegularExpressionMatch match = shellForm.match(text);
        if (!match.hasMatch())
            return false;

        spec._collection = QtUtils::toStdString(match.captured(1));
        const QString method = match.captured(2);
        const QString args = match.captured(3).trimmed();

        if (method == "aggregate") {
            mongo::BSONObj holder;
            mongo::BSONElement elem = parseValue(args.isEmpty() ? QString("[]") : args, holder);
            if (elem.type() != mongo::Array)
                throw InvalidQueryShapeError("aggregate() expects an array of stages");

            spec._kind = AggregateQuery;
            spec._pipeline = toPipeline(elem);
            return true;
        }

        // find(filter, projection): parse arguments as one array
        mongo::BSONObj holder;
        mongo::BSONElement elem = parseValue("[" + args + "]", holder);
        std::vector<mongo::BSONElement> params = elem.Array();
        if (params.size() > 2)
            throw InvalidQueryShapeError(QString("%1() accepts a filter and a projection only").arg(method));

        for (auto const &param : params) {
            if (param.type() != mongo::Object)
                throw InvalidQueryShapeError(QString("Arguments of %1() must be JSON objects").arg(method));
        }

        spec._kind = FindQuery;
        if (params.size() > 0)
            spec._filter = params[0].embeddedObject().getOwned();
        if (params.size() > 1)
            projection = params[1].embeddedObject().getOwned();

        return true;
    }
}

namespace MongoGui
{
    namespace QueryParser
    {
        QuerySpec parse(const QString &queryText, const QString &projectionText, const QString &sortText)
        {
            QuerySpec spec;
            const QString text = queryText.trimmed();

            mongo::BSONObj shellProjection;
            if (text.isEmpty()) {
                spec._kind = FindQuery;
                spec._filter = mongo::BSONObj();
            }
            else if (!parseShellForm(text, spec, shellProjection)) {
                mongo::BSONObj holder;
                applyShape(spec, parseValue(text, holder));
            }

            const mongo::BSONObj projection = parseObject(projectionText, "Projection");
            const mongo::BSONObj sort = parseObject(sortText, "Sort");

            if (spec.isAggregate()) {
                if (!projection.isEmpty() || !sort.isEmpty())
                    throw InvalidQueryShapeError(
                        "Projection and sort are not supported with an aggregation pipeline, use $project and $sort stages");
                return spec;
            }

            // Projection field wins over the one written in shell form
            spec._projection = projection.isEmpty() ? shellProjection : projection;
            spec._sort = sort;
            return spec;
        }

        mongo::BSONObj parseObject(const QString &text, const QString &what)
        {
            const QString trimmed = text.trimmed();
            if (trimmed.isEmpty())
                return mongo::BSONObj();

            mongo::BSONObj holder;
            mongo::BSONElement elem = parseValue(trimmed, holder);
            if (elem.type() != mongo::Object)
                throw InvalidQueryShapeError(QString("%1 must be a JSON object").arg(what));

            return elem.embeddedObject().getOwned();
        }
    }
}
