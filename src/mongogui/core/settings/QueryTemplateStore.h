#pragma once

#include <vector>
#include <QString>

#include "mongogui/core/settings/QueryTemplate.h"

namespace MongoGui
{
    /**
     * @brief Named query templates kept in query_templates.json of the
     *        config directory as {"version": ..., "templates": [...]}.
     *
     *        File is loaded on first access and rewritten in full on every
     *        change. Read/write failures are thrown as PersistenceError,
     *        unknown names as NotFoundError, empty or taken names as
     *        ValidationError.
     *
     * @threadsafe no
     */
    class QueryTemplateStore
    {
    public:
        typedef std::vector<QueryTemplate> QueryTemplateContainerType;

        explicit QueryTemplateStore(const QString &filePath);

        /**
         * @brief Adds template, or replaces the one with the same name.
         *        Name is trimmed, query texts must parse
         *        (ParseError, InvalidQueryShapeError).
         */
        void save(const QueryTemplate &queryTemplate);

        /**
         * @brief All templates ordered by name, case-insensitive.
         */
        QueryTemplateContainerType list();

        /**
         * @brief Templates whose name or description contains text,
         *        case-insensitive. Empty text matches everything.
         */
        QueryTemplateContainerType search(const QString &text);

        bool contains(const QString &name);
        QueryTemplate load(const QString &name);
        void remove(const QString &name);
        void rename(const QString &oldName, const QString &newName);

        /**
         * @brief Writes all templates to another file.
         */
        void exportTo(const QString &filePath);

        /**
         * @brief Adds templates of an exported file. Existing names are
         *        kept unless overwrite is set.
         * @return number of imported templates.
         */
        int importFrom(const QString &filePath, bool overwrite);

        QString filePath() const { return _filePath; }

    private:
        void ensureLoaded();
        void persist(const QueryTemplateContainerType &templates);
        int indexOf(const QString &name) const;

        const QString _filePath;
        QueryTemplateContainerType _templates;
        bool _loaded;
    };
}
