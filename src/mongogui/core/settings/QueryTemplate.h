#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVariantMap>

namespace MongoGui
{
    /**
     * @brief Saved query of a query tab: the three editor texts plus
     *        a description and tags. Kind is "find" or "aggregate".
     */
    struct QueryTemplate
    {
        QueryTemplate() {}
        QueryTemplate(const QString &name, const QString &query,
                      const QString &projection = QString(), const QString &sort = QString()) :
            _name(name), _query(query), _projection(projection), _sort(sort) {}

        bool isAggregate() const { return _kind == "aggregate"; }

        QVariant toVariant() const;

        /**
         * @brief Entry without name is returned with empty _name.
         */
        static QueryTemplate fromVariant(const QVariantMap &map);

        QString _name;
        QString _query;
        QString _projection;
        QString _sort;
        QString _kind;
        QString _description;
        QStringList _tags;
        QDateTime _createdAt;
    };
}
