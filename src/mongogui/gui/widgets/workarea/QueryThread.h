#pragma once

#include <functional>
#include <QThread>

namespace MongoGui
{
    /*
    ** Runs one blocking call to the core (query, listing, test connection)
    ** outside of GUI thread. Job stores its result in state it captured,
    ** receivers read it after succeeded() arrives.
    */
    class QueryThread : public QThread
    {
        Q_OBJECT

    public:
        typedef std::function<void()> JobType;

        explicit QueryThread(const JobType &job, QObject *parent = NULL);

    Q_SIGNALS:
        void succeeded();

        /**
         * @brief Job has thrown, message is ready to be shown to user
         */
        void failed(const QString &message);

    protected:
        virtual void run();

    private:
        const JobType _job;
    };
}
