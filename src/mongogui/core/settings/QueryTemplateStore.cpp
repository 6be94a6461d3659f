#include "mongogui/core/settings/QueryTemplateStore.h"

#include <algorithm>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QVariantList>
#include <QVariantMap>

#include <parser.h>
#include <serializer.h>

#include "mongogui/core/Exceptions.h"
#include "mongogui/core/domain/QuerySpec.h"
#include "mongogui/core/engine/QueryParser.h"
#include "mongogui/core/utils/Logger.h"

namespace
{
    using namespace MongoGui;

    const QString FileVersion = "1.0";

    typedef QueryTemplateStore::QueryTemplateContainerType QueryTemplateContainerType;

    QueryTemplateContainerType readTemplates(const QString &filePath)
    {
        QueryTemplateContainerType templates;

        QFile f(filePath);
        if (!f.open(QIODevice::ReadOnly))
            throw PersistenceError(QString("Cannot read %1: %2").arg(filePath, f.errorString()));

        bool ok;
        QJson::Parser parser;
        const QVariant root = parser.parse(f.readAll(), &ok);
        if (!ok || root.type() != QVariant::Map)
            throw PersistenceError(QString("%1 is not a JSON object of query templates").arg(filePath));

        const QVariantList entries = root.toMap().value("templates").toList();
        for (auto const &entry : entries) {
            const QueryTemplate queryTemplate = QueryTemplate::fromVariant(entry.toMap());
            if (queryTemplate._name.isEmpty()) {
                LOG_MSG("Skipping query template without name in " + filePath, mongo::logger::LogSeverity::Warning());
                continue;
            }
            templates.push_back(queryTemplate);
        }

        return templates;
    }

    void writeTemplates(const QString &filePath, const QueryTemplateContainerType &templates)
    {
        QVariantList list;
        for (auto const &queryTemplate : templates)
            list.append(queryTemplate.toVariant());

        QVariantMap root;
        root.insert("version", FileVersion);
        root.insert("templates", list);

        bool ok;
        QJson::Serializer s;
        s.setIndentMode(QJson::IndentFull);
        const QByteArray bytes = s.serialize(root, &ok);
        if (!ok)
            throw PersistenceError("Cannot serialize query templates: " + s.errorMessage());

        if (!QDir().mkpath(QFileInfo(filePath).absolutePath()))
            throw PersistenceError("Cannot create directory for " + filePath);

        QSaveFile f(filePath);
        if (!f.open(QIODevice::WriteOnly))
            throw PersistenceError(QString("Cannot write %1: %2").arg(filePath, f.errorString()));

        if (f.write(bytes) != bytes.size() || !f.commit())
            throw PersistenceError(QString("Cannot write %1: %2").arg(filePath, f.errorString()));
    }

    int indexIn(const QueryTemplateContainerType &templates, const QString &name)
    {
        for (size_t i = 0; i < templates.size(); ++i) {
            if (templates[i]._name == name)
                return static_cast<int>(i);
        }
        return -1;
    }

    bool lessByName(const QueryTemplate &left, const QueryTemplate &right)
    {
        return QString::compare(left._name, right._name, Qt::CaseInsensitive) < 0;
    }
}

namespace MongoGui
{
    QueryTemplateStore::QueryTemplateStore(const QString &filePath) :
        _filePath(filePath),
        _loaded(false)
    {

    }

    void QueryTemplateStore::save(const QueryTemplate &queryTemplate)
    {
        QueryTemplate stored = queryTemplate;
        stored._name = stored._name.trimmed();
        if (stored._name.isEmpty())
            throw ValidationError("Template name is required.");

        const QuerySpec spec = QueryParser::parse(stored._query, stored._projection, stored._sort);
        stored._kind = spec.isAggregate() ? "aggregate" : "find";
        if (!stored._createdAt.isValid())
            stored._createdAt = QDateTime::currentDateTime();

        ensureLoaded();

        QueryTemplateContainerType templates = _templates;
        const int index = indexOf(stored._name);
        if (index >= 0)
            templates[index] = stored;
        else
            templates.push_back(stored);

        persist(templates);
        LOG_MSG("Query template \"" + stored._name + "\" saved", mongo::logger::LogSeverity::Info(), false);
    }

    QueryTemplateStore::QueryTemplateContainerType QueryTemplateStore::list()
    {
        ensureLoaded();

        QueryTemplateContainerType sorted = _templates;
        std::stable_sort(sorted.begin(), sorted.end(), lessByName);
        return sorted;
    }

    QueryTemplateStore::QueryTemplateContainerType QueryTemplateStore::search(const QString &text)
    {
        const QString needle = text.trimmed();

        QueryTemplateContainerType found;
        for (auto const &queryTemplate : list()) {
            if (queryTemplate._name.contains(needle, Qt::CaseInsensitive) ||
                queryTemplate._description.contains(needle, Qt::CaseInsensitive))
                found.push_back(queryTemplate);
        }
        return found;
    }

    bool QueryTemplateStore::contains(const QString &name)
    {
        ensureLoaded();
        return indexOf(name.trimmed()) >= 0;
    }

    QueryTemplate QueryTemplateStore::load(const QString &name)
    {
        ensureLoaded();

        const int index = indexOf(name.trimmed());
        if (index < 0)
            throw NotFoundError(QString("Query template \"%1\" does not exist").arg(name));

        return _templates[index];
    }

    void QueryTemplateStore::remove(const QString &name)
    {
        ensureLoaded();

        const int index = indexOf(name.trimmed());
        if (index < 0)
            throw NotFoundError(QString("Query template \"%1\" does not exist").arg(name));

        QueryTemplateContainerType templates = _templates;
        templates.erase(templates.begin() + index);
        persist(templates);

        LOG_MSG("Query template \"" + name + "\" removed", mongo::logger::LogSeverity::Info(), false);
    }

    void QueryTemplateStore::rename(const QString &oldName, const QString &newName)
    {
        ensureLoaded();

        const int index = indexOf(oldName.trimmed());
        if (index < 0)
            throw NotFoundError(QString("Query template \"%1\" does not exist").arg(oldName));

        const QString name = newName.trimmed();
        if (name.isEmpty())
            throw ValidationError("Template name is required.");

        const int existing = indexOf(name);
        if (existing >= 0 && existing != index)
            throw ValidationError(QString("Query template \"%1\" already exists").arg(name));

        QueryTemplateContainerType templates = _templates;
        templates[index]._name = name;
        persist(templates);
    }

    void QueryTemplateStore::exportTo(const QString &filePath)
    {
        ensureLoaded();
        writeTemplates(filePath, _templates);
        LOG_MSG(QString("%1 query templates exported to %2").arg(_templates.size()).arg(filePath),
                mongo::logger::LogSeverity::Info(), false);
    }

    int QueryTemplateStore::importFrom(const QString &filePath, bool overwrite)
    {
        ensureLoaded();

        const QueryTemplateContainerType incoming = readTemplates(filePath);

        QueryTemplateContainerType templates = _templates;
        int imported = 0;
        for (auto const &queryTemplate : incoming) {
            const int index = indexIn(templates, queryTemplate._name);
            if (index >= 0 && !overwrite)
                continue;

            if (index >= 0)
                templates[index] = queryTemplate;
            else
                templates.push_back(queryTemplate);
            ++imported;
        }

        if (imported > 0)
            persist(templates);

        return imported;
    }

    void QueryTemplateStore::ensureLoaded()
    {
        if (_loaded)
            return;

        if (QFile::exists(_filePath))
            _templates = readTemplates(_filePath);

        _loaded = true;
    }

    void QueryTemplateStore::persist(const QueryTemplateContainerType &templates)
    {
        writeTemplates(_filePath, templates);
        _templates = templates;
    }

    int QueryTemplateStore::indexOf(const QString &name) const
    {
        return indexIn(_templates, name);
    }
}
