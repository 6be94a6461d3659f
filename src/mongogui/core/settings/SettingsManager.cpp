#include "mongogui/core/settings/SettingsManager.h"

#include <QDir>
#include <QFile>
#include <QSaveFile>

#include <parser.h>
#include <serializer.h>

#include "mongogui/core/utils/Logger.h"

namespace
{
    const QString SchemaVersion = "1.0";
    const QString DefaultSecretService = PROJECT_NAME_LOWERCASE;
}

namespace MongoGui
{
    SettingsManager::SettingsManager(const QString &configDir) :
        _configDir(configDir),
        _version(SchemaVersion),
        _pageSize(DefaultPageSize),
        _mongoTimeoutSec(DefaultMongoTimeoutSec),
        _aggregatePaging(AutoPaging),
        _sampleSize(DefaultSampleSize),
        _secretService(DefaultSecretService),
        _textFontFamily(""),
        _textFontPointSize(-1)
    {
        if (!QDir().mkpath(_configDir))
            LOG_MSG("Could not create settings path: " + _configDir, mongo::logger::LogSeverity::Error());

        if (!load()) {  // non-existing or broken config file
            if (!save())
                LOG_MSG("Settings are not persisted, defaults are used", mongo::logger::LogSeverity::Warning());
        }

        LOG_MSG("SettingsManager initialized in " + configFilePath(), mongo::logger::LogSeverity::Info(), false);
    }

    QString SettingsManager::configFilePath() const
    {
        return QDir(_configDir).filePath(PROJECT_NAME_LOWERCASE ".json");
    }

    QString SettingsManager::connectionsFilePath() const
    {
        return QDir(_configDir).filePath("connections.json");
    }

    QString SettingsManager::queryTemplatesFilePath() const
    {
        return QDir(_configDir).filePath("query_templates.json");
    }

    bool SettingsManager::load()
    {
        QFile f(configFilePath());
        if (!f.exists())
            return false;

        if (!f.open(QIODevice::ReadOnly))
            return false;

        bool ok;
        QJson::Parser parser;
        QVariant parsed = parser.parse(f.readAll(), &ok);
        if (!ok || parsed.type() != QVariant::Map) {
            LOG_MSG("Settings file is not valid JSON, using defaults: " + configFilePath(),
                    mongo::logger::LogSeverity::Warning());
            return false;
        }

        loadFromMap(parsed.toMap());
        return true;
    }

    bool SettingsManager::save()
    {
        QVariantMap const &map = convertToMap();

        bool ok;
        QJson::Serializer s;
        s.setIndentMode(QJson::IndentFull);
        QByteArray bytes = s.serialize(map, &ok);
        if (!ok) {
            LOG_MSG("Could not serialize settings: " + s.errorMessage(), mongo::logger::LogSeverity::Error());
            return false;
        }

        QSaveFile f(configFilePath());
        if (!f.open(QIODevice::WriteOnly) || f.write(bytes) != bytes.size() || !f.commit()) {
            LOG_MSG("Could not write settings to: " + configFilePath(), mongo::logger::LogSeverity::Error());
            return false;
        }

        LOG_MSG("Settings saved to: " + configFilePath(), mongo::logger::LogSeverity::Info(), false);
        return true;
    }

    void SettingsManager::loadFromMap(const QVariantMap &map)
    {
        // 1. Load version
        _version = map.value("version", SchemaVersion).toString();

        // 2. Load page size, zero or garbage falls back to default
        setPageSize(map.value("pageSize").toInt());

        // 3. Load mongo timeout
        setMongoTimeoutSec(map.value("mongoTimeoutSec").toInt());

        // 4. Load aggregation paging mode
        _aggregatePaging = convertStringToAggregatePaging(map.value("aggregatePaging").toString());

        // 5. Load sample size
        setSampleSize(map.value("sampleSize").toInt());

        // 6. Load secret store service name
        _secretService = map.value("secretService").toString().trimmed();
        if (_secretService.isEmpty())
            _secretService = DefaultSecretService;

        // 7. Load font
        _textFontFamily = map.value("textFontFamily").toString();
        setTextFontPointSize(map.value("textFontPointSize").toInt());
    }

    QVariantMap SettingsManager::convertToMap() const
    {
        QVariantMap map;
        map.insert("version", _version);
        map.insert("pageSize", _pageSize);
        map.insert("mongoTimeoutSec", _mongoTimeoutSec);
        map.insert("aggregatePaging", convertAggregatePagingToString(_aggregatePaging));
        map.insert("sampleSize", _sampleSize);
        map.insert("secretService", _secretService);
        map.insert("textFontFamily", _textFontFamily);
        map.insert("textFontPointSize", _textFontPointSize);
        return map;
    }
}
