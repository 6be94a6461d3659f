#include "mongogui/gui/widgets/workarea/QueryThread.h"

#include <exception>

#include "mongogui/core/utils/Logger.h"

namespace MongoGui
{
    QueryThread::QueryThread(const JobType &job, QObject *parent)
        : QThread(parent), _job(job)
    {
    }

    void QueryThread::run()
    {
        try {
            _job();
        } catch (const std::exception &ex) {
            const QString message = QString::fromUtf8(ex.what());
            LOG_MSG(message, mongo::logger::LogSeverity::Error());
            emit failed(message);
            return;
        }

        emit succeeded();
    }
}
