#include "mongogui/core/utils/Logger.h"

#include <QDateTime>
#include <QDir>
#include <QMutexLocker>
#include <QTextStream>

#include "mongogui/core/utils/QtUtils.h"

namespace MongoGui
{
    Logger::Logger() :
        _file(QString("%1/" PROJECT_NAME_LOWERCASE ".log").arg(QDir::tempPath()))
    {
        //delete file if it size more than 5mb
        if (_file.exists() && _file.size() > 5 * 1024 * 1024)
            _file.remove();

        // Logging still goes to the log panel when the file can't be opened
        if (!_file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text))
            qWarning("Cannot open log file %s", qPrintable(_file.fileName()));
    }

    Logger::~Logger()
    {
        if (_file.isOpen())
            _file.close();
    }

    void Logger::print(const char *mess, mongo::logger::LogSeverity level, bool notify)
    {
        print(std::string(mess), level, notify);
    }

    void Logger::print(const std::string &mess, mongo::logger::LogSeverity level, bool notify)
    {
        print(QtUtils::toQString(mess), level, notify);
    }

    void Logger::print(const QString &msg, mongo::logger::LogSeverity level, bool notify)
    {
        // Make uniform log level strings e.g "Error: ", "Info: " etc...
        auto logLevelStr = QString::fromStdString(level.toStringData().toString());
        if (!logLevelStr.isEmpty()) {
            logLevelStr = logLevelStr.toLower();
            logLevelStr[0] = logLevelStr[0].toUpper();
            logLevelStr += ": ";
        }
        const QString line = logLevelStr + msg.simplified();

        {
            QMutexLocker lock(&_fileLock);
            if (_file.isOpen()) {
                QTextStream out(&_file);
                out << QDateTime::currentDateTime().toString(Qt::ISODate) << ' ' << line << '\n';
            }
        }

        if (!notify)
            return;

        emit printed(line, level);
    }
}
