#pragma once

#include <memory>
#include <string>
#include <vector>
#include <QDialog>
#include <QPointer>

#include "mongogui/core/Core.h"
#include "mongogui/core/settings/ConnectionSettings.h"
#include "mongogui/gui/widgets/workarea/QueryThread.h"

QT_BEGIN_NAMESPACE
class QCheckBox;
class QLineEdit;
class QPushButton;
class QTreeWidget;
QT_END_NAMESPACE

namespace MongoGui
{
    class JsonEditor;

    /**
     * @brief Lists indexes of one collection, creates and drops them.
     */
    class IndexesDialog : public QDialog
    {
        Q_OBJECT

    public:
        typedef QDialog BaseClass;
        enum { WidthWidget = 640, HeightWidget = 420 };

        IndexesDialog(const ConnectionSettings &profile, const std::string &collection, QWidget *parent = 0);
        ~IndexesDialog();

    private Q_SLOTS:
        void refresh();
        void createIndex();
        void dropIndex();

        void showIndexes();
        void indexesChanged();
        void showError(const QString &message);
        void jobFinished();

    private:
        void runJob(const QueryThread::JobType &job, const char *onSuccess);
        void setBusy(bool busy);

        const ConnectionSettings _profile;
        const std::string _collection;

        QTreeWidget *_indexesTree;
        JsonEditor *_keysText;
        QLineEdit *_indexName;
        QCheckBox *_unique;
        QPushButton *_createButton;
        QPushButton *_dropButton;

        QPointer<QueryThread> _thread;
        bool _refreshAfterJob;
        std::shared_ptr<std::vector<MongoDocumentPtr> > _pendingIndexes;
    };
}
