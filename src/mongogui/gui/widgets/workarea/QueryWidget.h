#pragma once

#include <memory>
#include <string>
#include <QPointer>
#include <QWidget>

#include "mongogui/core/Core.h"
#include "mongogui/core/domain/ResultPage.h"
#include "mongogui/core/settings/ConnectionSettings.h"
#include "mongogui/gui/widgets/workarea/QueryThread.h"

QT_BEGIN_NAMESPACE
class QAction;
class QLabel;
class QMenu;
class QPushButton;
class QTableView;
class QModelIndex;
QT_END_NAMESPACE

namespace MongoGui
{
    class BsonTableModel;
    class JsonEditor;
    class PagingWidget;

    /**
     * @brief One query tab: filter (or pipeline), projection and sort
     *        editors over a paged result table for one collection of a
     *        resolved profile.
     */
    class QueryWidget : public QWidget
    {
        Q_OBJECT

    public:
        typedef QWidget BaseClass;

        QueryWidget(const ConnectionSettings &profile, const std::string &collection, QWidget *parent = NULL);
        ~QueryWidget();

        QString title() const;
        void setQueryFocus();

    public Q_SLOTS:
        void execute();
        void explain();
        void sample();
        void showIndexes();
        void saveTemplate();

    private Q_SLOTS:
        void loadPage(int page, int pageSize);
        void previousPage(int page, int pageSize);
        void nextPage(int page, int pageSize);
        void editDocument(const QModelIndex &index);
        void fillTemplatesMenu();
        void loadTemplate(QAction *action);
        void deleteTemplate(QAction *action);
        void importTemplates();
        void exportTemplates();

        void showPage();
        void showExplain();
        void documentReplaced();
        void showError(const QString &message);
        void jobFinished();

    private:
        void runJob(const QueryThread::JobType &job, const char *onSuccess);
        void setBusy(bool busy);
        void reload();

        const ConnectionSettings _profile;
        const std::string _collection;

        JsonEditor *_queryText;
        JsonEditor *_projectionText;
        JsonEditor *_sortText;
        QPushButton *_executeButton;
        QPushButton *_explainButton;
        QPushButton *_sampleButton;
        QPushButton *_indexesButton;
        QPushButton *_templatesButton;
        QMenu *_loadTemplateMenu;
        QMenu *_deleteTemplateMenu;
        QLabel *_statusLabel;
        PagingWidget *_paging;
        QTableView *_table;
        BsonTableModel *_model;

        QPointer<QueryThread> _thread;
        bool _reloadAfterJob;
        std::shared_ptr<ResultPage> _pendingPage;
        std::shared_ptr<MongoDocumentPtr> _pendingPlan;
    };
}
