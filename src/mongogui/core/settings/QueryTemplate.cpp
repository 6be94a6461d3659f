#include "mongogui/core/settings/QueryTemplate.h"

namespace MongoGui
{
    QVariant QueryTemplate::toVariant() const
    {
        QVariantMap map;
        map.insert("name", _name);
        map.insert("kind", _kind);
        map.insert("query", _query);
        if (!_projection.isEmpty())
            map.insert("projection", _projection);
        if (!_sort.isEmpty())
            map.insert("sort", _sort);
        map.insert("description", _description);
        map.insert("tags", _tags);
        map.insert("createdAt", _createdAt.toString(Qt::ISODate));
        return map;
    }

    QueryTemplate QueryTemplate::fromVariant(const QVariantMap &map)
    {
        QueryTemplate result;
        result._name = map.value("name").toString().trimmed();
        result._kind = map.value("kind").toString();
        result._query = map.value("query").toString();
        result._projection = map.value("projection").toString();
        result._sort = map.value("sort").toString();
        result._description = map.value("description").toString();
        result._tags = map.value("tags").toStringList();
        result._createdAt = QDateTime::fromString(map.value("createdAt").toString(), Qt::ISODate);
        return result;
    }
}
