#pragma once

#include <QWidget>
#include <mongo/logger/log_severity.h>

QT_BEGIN_NAMESPACE
class QPlainTextEdit;
class QAction;
QT_END_NAMESPACE

namespace MongoGui
{
    /**
     * @brief Log panel of the main window. Keeps last MaxLines messages,
     *        each one prefixed with time and colored by severity.
     */
    class LogWidget : public QWidget
    {
        Q_OBJECT

    public:
        typedef QWidget BaseClass;
        enum { MaxLines = 2000, MaxMessageLength = 500 };

        explicit LogWidget(QWidget *parent = 0);

    public Q_SLOTS:
        // Connected directly to Logger::printed, may run in worker threads
        void addMessage(const QString &message, mongo::logger::LogSeverity level);

    private Q_SLOTS:
        void appendMessage(const QString &message, int severity);
        void showContextMenu(const QPoint &pt);

    private:
        QPlainTextEdit *const _logText;
        QAction *_clear;
    };
}
