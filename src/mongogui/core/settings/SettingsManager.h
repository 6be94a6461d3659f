#pragma once

#include <QString>
#include <QVariantMap>

#include "mongogui/core/Enums.h"

namespace MongoGui
{
/* ----------------------------- SettingsManager ------------------------------ */

    /**
     * @brief SettingsManager gives you access to application settings.
     *        It can load() and save() them. Config file is located here:
     *        ~/.mongogui/mongogui.json (or under $MONGOGUI_CONFIG_DIR)
     *
     *        You can access this manager via:
     *        AppRegistry::instance().settingsManager()
     *
     *        Connection profiles are not part of this file, they are kept
     *        by ConnectionStore in connections.json next to it.
     *
     * @threadsafe no
     */
    class SettingsManager
    {
    public:
        /**
         * @brief Creates SettingsManager for config file in configDir.
         *        Missing or unreadable file is replaced with defaults.
         */
        explicit SettingsManager(const QString &configDir);

        /**
         * @brief Load settings from config file.
         * @return true if success, false otherwise
         */
        bool load();

        /**
         * @brief Saves all settings to config file.
         * @return true if success, false otherwise
         */
        bool save();

        QString configDir() const { return _configDir; }
        QString configFilePath() const;
        QString connectionsFilePath() const;
        QString queryTemplatesFilePath() const;

        int pageSize() const { return _pageSize; }
        void setPageSize(int pageSize) { _pageSize = pageSize > 0 ? pageSize : DefaultPageSize; }

        int mongoTimeoutSec() const { return _mongoTimeoutSec; }
        void setMongoTimeoutSec(int seconds) { _mongoTimeoutSec = seconds > 0 ? seconds : DefaultMongoTimeoutSec; }

        AggregatePaging aggregatePaging() const { return _aggregatePaging; }
        void setAggregatePaging(AggregatePaging paging) { _aggregatePaging = paging; }

        int sampleSize() const { return _sampleSize; }
        void setSampleSize(int sampleSize) { _sampleSize = sampleSize > 0 ? sampleSize : DefaultSampleSize; }

        QString secretService() const { return _secretService; }

        QString textFontFamily() const { return _textFontFamily; }
        void setTextFontFamily(const QString &fontFamily) { _textFontFamily = fontFamily; }

        int textFontPointSize() const { return _textFontPointSize; }
        void setTextFontPointSize(int pointSize) { _textFontPointSize = pointSize > 0 ? pointSize : -1; }

        static constexpr int DefaultPageSize = 50;
        static constexpr int DefaultMongoTimeoutSec = 10;
        static constexpr int DefaultSampleSize = 20;

    private:
        /**
         * @brief Load settings from the map. Existing settings will be overwritten.
         */
        void loadFromMap(const QVariantMap &map);

        /**
         * @brief Save all settings to map.
         */
        QVariantMap convertToMap() const;

        const QString _configDir;

        QString _version;
        int _pageSize;
        int _mongoTimeoutSec;
        AggregatePaging _aggregatePaging;
        int _sampleSize;
        QString _secretService;
        QString _textFontFamily;
        int _textFontPointSize;
    };
}
