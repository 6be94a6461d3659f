#include "mongogui/gui/widgets/LogWidget.h"

#include <QAction>
#include <QMenu>
#include <QPlainTextEdit>
#include <QScopedPointer>
#include <QScrollBar>
#include <QTime>
#include <QVBoxLayout>

#include "mongogui/core/utils/QtUtils.h"

namespace
{
    const char *colorOf(mongo::logger::LogSeverity level)
    {
        if (level == mongo::logger::LogSeverity::Error() || level == mongo::logger::LogSeverity::Severe())
            return "#cd0000";
        if (level == mongo::logger::LogSeverity::Warning())
            return "#cd9800";
        if (level == mongo::logger::LogSeverity::Info())
            return "#000000";
        return "#777777";
    }
}

namespace MongoGui
{
    LogWidget::LogWidget(QWidget *parent)
        : BaseClass(parent), _logText(new QPlainTextEdit(this))
    {
        _logText->setReadOnly(true);
        _logText->setMaximumBlockCount(MaxLines);
        _logText->setContextMenuPolicy(Qt::CustomContextMenu);
        VERIFY(connect(_logText, SIGNAL(customContextMenuRequested(const QPoint&)), this, SLOT(showContextMenu(const QPoint &))));

        _clear = new QAction("Clear All", this);
        VERIFY(connect(_clear, SIGNAL(triggered()), _logText, SLOT(clear())));

        QVBoxLayout *layout = new QVBoxLayout(this);
        layout->setContentsMargins(0, 0, 0, 0);
        layout->addWidget(_logText);
    }

    void LogWidget::showContextMenu(const QPoint &pt)
    {
        QScopedPointer<QMenu> menu(_logText->createStandardContextMenu());
        menu->addSeparator();
        menu->addAction(_clear);
        _clear->setEnabled(!_logText->document()->isEmpty());
        menu->exec(_logText->mapToGlobal(pt));
    }

    void LogWidget::addMessage(const QString &message, mongo::logger::LogSeverity level)
    {
        // Severity travels as int, the text widget is touched in GUI thread only
        QMetaObject::invokeMethod(this, "appendMessage", Qt::QueuedConnection,
                                  Q_ARG(QString, message), Q_ARG(int, level.toInt()));
    }

    void LogWidget::appendMessage(const QString &message, int severity)
    {
        QString text = message.trimmed();
        if (text.length() > MaxMessageLength)
            text = "(truncated) " + text.left(MaxMessageLength) + "...";

        const QString line = QString("<span style='color:#aaaaaa'>%1</span>&nbsp;&nbsp;<span style='color:%2'>%3</span>")
            .arg(QTime::currentTime().toString("hh:mm:ss"))
            .arg(colorOf(mongo::logger::LogSeverity::cast(severity)))
            .arg(text.toHtmlEscaped());
        _logText->appendHtml(line);

        QScrollBar *sb = _logText->verticalScrollBar();
        sb->setValue(sb->maximum());
    }
}
