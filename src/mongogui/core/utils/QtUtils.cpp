#include "mongogui/core/utils/QtUtils.h"

#include <QDir>
#include <QThread>
#include <QtGlobal>

namespace MongoGui
{
    namespace QtUtils
    {
        template<>
        QString toQString<std::string>(const std::string &value)
        {
            return QString::fromUtf8(value.c_str(), static_cast<int>(value.size()));
        }

        std::string toStdString(const QString &value)
        {
            QByteArray sUtf8 = value.toUtf8();
            return std::string(sUtf8.constData(), sUtf8.length());
        }

        void cleanUpThread(QThread *const thread)
        {
            if (thread && thread->isRunning()) {
                thread->wait();
            }
        }

        QString configDirPath()
        {
            const QByteArray overridden = qgetenv("MONGOGUI_CONFIG_DIR");
            if (!overridden.isEmpty())
                return QDir::cleanPath(QString::fromLocal8Bit(overridden));

            return QString("%1/." PROJECT_NAME_LOWERCASE).arg(QDir::homePath());
        }
    }
}
