#pragma once

#include <QFile>
#include <QMutex>
#include <QObject>
#include <QString>
#include <string>

#include <mongo/logger/log_severity.h>

#include "mongogui/core/utils/SingletonPattern.hpp"

namespace MongoGui
{
    class Logger : public QObject, public Patterns::LazySingleton<Logger>
    {
        Q_OBJECT
        friend class Patterns::LazySingleton<Logger>;

    public:
        void print(const char *msg, mongo::logger::LogSeverity level, bool notify);
        void print(const std::string &msg, mongo::logger::LogSeverity level, bool notify);
        void print(const QString &msg, mongo::logger::LogSeverity level, bool notify);

        QString logFilePath() const { return _file.fileName(); }

    Q_SIGNALS:
        void printed(const QString &msg, mongo::logger::LogSeverity level);

    private:
        Logger();
        ~Logger();

        QFile _file;
        QMutex _fileLock;
    };

    // printed() is emitted on the calling thread, receivers in other threads must queue it themselves
    template<typename T>
    inline void LOG_MSG(const T &msg, mongo::logger::LogSeverity level, bool notify = true)
    {
        return Logger::instance().print(msg, level, notify);
    }
}
