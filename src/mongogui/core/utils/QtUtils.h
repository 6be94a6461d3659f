#pragma once

#include <string>
#include <QString>

QT_BEGIN_NAMESPACE
class QThread;
QT_END_NAMESPACE

#ifdef QT_NO_DEBUG
#define VERIFY(x) (x)
#else //QT_NO_DEBUG
#define VERIFY(x) Q_ASSERT(x)
#endif //QT_NO_DEBUG

namespace MongoGui
{
    namespace QtUtils
    {
        template<typename T>
        QString toQString(const T &value);

        std::string toStdString(const QString &value);

        // Waits for a running worker thread to finish
        void cleanUpThread(QThread *const thread);

        /**
         * @brief Directory where MongoGui keeps its files.
         *        Value of MONGOGUI_CONFIG_DIR if set, ~/.mongogui otherwise.
         */
        QString configDirPath();
    }
}
