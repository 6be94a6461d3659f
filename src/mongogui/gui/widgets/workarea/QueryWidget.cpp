#include "mongogui/gui/widgets/workarea/QueryWidget.h"

#include <QFileDialog>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QInputDialog>
#include <QLabel>
#include <QLineEdit>
#include <QMenu>
#include <QMessageBox>
#include <QPushButton>
#include <QSplitter>
#include <QTableView>
#include <QVBoxLayout>

#include "mongogui/core/AppRegistry.h"
#include "mongogui/core/Exceptions.h"
#include "mongogui/core/domain/MongoDocument.h"
#include "mongogui/core/domain/QueryExecutor.h"
#include "mongogui/core/settings/QueryTemplateStore.h"
#include "mongogui/core/settings/SettingsManager.h"
#include "mongogui/core/utils/Logger.h"
#include "mongogui/core/utils/QtUtils.h"
#include "mongogui/gui/GuiRegistry.h"
#include "mongogui/gui/dialogs/DocumentTextEditor.h"
#include "mongogui/gui/dialogs/IndexesDialog.h"
#include "mongogui/gui/editors/JsonEditor.h"
#include "mongogui/gui/widgets/workarea/BsonTableModel.h"
#include "mongogui/gui/widgets/workarea/PagingWidget.h"

namespace
{
    MongoGui::JsonEditor *createOneLineEditor(QWidget *parent)
    {
        MongoGui::JsonEditor *editor = new MongoGui::JsonEditor(parent);
        editor->setVerticalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
        editor->setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
        editor->setFixedHeight(editor->fontMetrics().height() * 2);
        return editor;
    }
}

namespace MongoGui
{
    QueryWidget::QueryWidget(const ConnectionSettings &profile, const std::string &collection, QWidget *parent) :
        BaseClass(parent),
        _profile(profile),
        _collection(collection),
        _reloadAfterJob(false)
    {
        _queryText = new JsonEditor(this);
        _queryText->setLineNumbers(true);
        _queryText->setText("{}");
        _projectionText = createOneLineEditor(this);
        _sortText = createOneLineEditor(this);
        VERIFY(connect(_queryText, SIGNAL(executeRequested()), this, SLOT(execute())));
        VERIFY(connect(_projectionText, SIGNAL(executeRequested()), this, SLOT(execute())));
        VERIFY(connect(_sortText, SIGNAL(executeRequested()), this, SLOT(execute())));

        _executeButton = new QPushButton(GuiRegistry::instance().executeIcon(), "Execute");
        _executeButton->setToolTip("Execute query (Ctrl+Enter)");
        _explainButton = new QPushButton(GuiRegistry::instance().explainIcon(), "Explain");
        _sampleButton = new QPushButton("Sample");
        _sampleButton->setToolTip("Show a few documents without filter");
        _indexesButton = new QPushButton(GuiRegistry::instance().indexIcon(), "Indexes");
        VERIFY(connect(_executeButton, SIGNAL(clicked()), this, SLOT(execute())));
        VERIFY(connect(_explainButton, SIGNAL(clicked()), this, SLOT(explain())));
        VERIFY(connect(_sampleButton, SIGNAL(clicked()), this, SLOT(sample())));
        VERIFY(connect(_indexesButton, SIGNAL(clicked()), this, SLOT(showIndexes())));

        QMenu *templatesMenu = new QMenu(this);
        templatesMenu->addAction("Save as Template...", this, SLOT(saveTemplate()));
        _loadTemplateMenu = templatesMenu->addMenu("Load");
        _deleteTemplateMenu = templatesMenu->addMenu("Delete");
        templatesMenu->addSeparator();
        templatesMenu->addAction("Import...", this, SLOT(importTemplates()));
        templatesMenu->addAction("Export...", this, SLOT(exportTemplates()));
        VERIFY(connect(templatesMenu, SIGNAL(aboutToShow()), this, SLOT(fillTemplatesMenu())));
        VERIFY(connect(_loadTemplateMenu, SIGNAL(triggered(QAction *)), this, SLOT(loadTemplate(QAction *))));
        VERIFY(connect(_deleteTemplateMenu, SIGNAL(triggered(QAction *)), this, SLOT(deleteTemplate(QAction *))));
        _templatesButton = new QPushButton("Templates");
        _templatesButton->setToolTip("Save the query texts for later or load a saved query");
        _templatesButton->setMenu(templatesMenu);

        _statusLabel = new QLabel(this);
        _statusLabel->setText(QtUtils::toQString(_profile.getReadableName() + " / " +
                                                 _profile.defaultDatabase() + "." + _collection));

        _paging = new PagingWidget(this);
        VERIFY(connect(_paging, SIGNAL(leftClicked(int, int)), this, SLOT(previousPage(int, int))));
        VERIFY(connect(_paging, SIGNAL(rightClicked(int, int)), this, SLOT(nextPage(int, int))));
        VERIFY(connect(_paging, SIGNAL(refreshed(int, int)), this, SLOT(loadPage(int, int))));

        _model = new BsonTableModel(this);
        _table = new QTableView(this);
        _table->setModel(_model);
        _table->setSelectionBehavior(QAbstractItemView::SelectRows);
        _table->setEditTriggers(QAbstractItemView::NoEditTriggers);
        _table->setAlternatingRowColors(true);
        _table->horizontalHeader()->setDefaultAlignment(Qt::AlignLeft);
        _table->setToolTip("Double click a row to edit document");
        GuiRegistry::instance().setAlternatingColor(_table);
        VERIFY(connect(_table, SIGNAL(doubleClicked(const QModelIndex &)), this, SLOT(editDocument(const QModelIndex &))));

        QFormLayout *optionsLayout = new QFormLayout;
        optionsLayout->setContentsMargins(0, 0, 0, 0);
        optionsLayout->addRow("Projection:", _projectionText);
        optionsLayout->addRow("Sort:", _sortText);

        QVBoxLayout *editorsLayout = new QVBoxLayout;
        editorsLayout->setContentsMargins(0, 0, 0, 0);
        editorsLayout->addWidget(_queryText, 1);
        editorsLayout->addLayout(optionsLayout);
        QWidget *editors = new QWidget(this);
        editors->setLayout(editorsLayout);

        QHBoxLayout *toolbar = new QHBoxLayout;
        toolbar->setContentsMargins(0, 2, 0, 2);
        toolbar->addWidget(_executeButton);
        toolbar->addWidget(_explainButton);
        toolbar->addWidget(_sampleButton);
        toolbar->addWidget(_indexesButton);
        toolbar->addWidget(_templatesButton);
        toolbar->addSpacing(10);
        toolbar->addWidget(_statusLabel, 1);
        toolbar->addWidget(_paging);

        QVBoxLayout *resultLayout = new QVBoxLayout;
        resultLayout->setContentsMargins(0, 0, 0, 0);
        resultLayout->setSpacing(0);
        resultLayout->addLayout(toolbar);
        resultLayout->addWidget(_table, 1);
        QWidget *results = new QWidget(this);
        results->setLayout(resultLayout);

        QSplitter *splitter = new QSplitter(Qt::Vertical, this);
        splitter->addWidget(editors);
        splitter->addWidget(results);
        splitter->setStretchFactor(0, 1);
        splitter->setStretchFactor(1, 3);

        QVBoxLayout *mainLayout = new QVBoxLayout;
        mainLayout->setContentsMargins(0, 0, 0, 0);
        mainLayout->addWidget(splitter);
        setLayout(mainLayout);
    }

    QueryWidget::~QueryWidget()
    {
        QtUtils::cleanUpThread(_thread);
    }

    QString QueryWidget::title() const
    {
        return QtUtils::toQString(_collection);
    }

    void QueryWidget::setQueryFocus()
    {
        _queryText->setFocus();
    }

    void QueryWidget::execute()
    {
        loadPage(1, _paging->pageSize());
    }

    void QueryWidget::previousPage(int page, int pageSize)
    {
        loadPage(page > 1 ? page - 1 : 1, pageSize);
    }

    void QueryWidget::nextPage(int page, int pageSize)
    {
        loadPage(page + 1, pageSize);
    }

    void QueryWidget::reload()
    {
        loadPage(_paging->page(), _paging->pageSize());
    }

    void QueryWidget::loadPage(int page, int pageSize)
    {
        if (_thread)
            return;

        QueryExecutor *executor = AppRegistry::instance().queryExecutor();
        const ConnectionSettings profile = _profile;
        const std::string collection = _collection;
        const QString query = _queryText->text();
        const QString projection = _projectionText->text();
        const QString sort = _sortText->text();
        std::shared_ptr<ResultPage> result = std::make_shared<ResultPage>();
        _pendingPage = result;

        runJob([=]() {
            *result = executor->execute(profile, collection, query, projection, sort, page, pageSize);
        }, SLOT(showPage()));
    }

    void QueryWidget::sample()
    {
        if (_thread)
            return;

        QueryExecutor *executor = AppRegistry::instance().queryExecutor();
        const int sampleSize = AppRegistry::instance().settingsManager()->sampleSize();
        const ConnectionSettings profile = _profile;
        const std::string collection = _collection;
        std::shared_ptr<ResultPage> result = std::make_shared<ResultPage>();
        _pendingPage = result;

        runJob([=]() {
            result->_documents = executor->sampleDocuments(profile, collection, sampleSize);
            result->_page = 1;
            result->_pageSize = sampleSize;
            result->_totalKnown = static_cast<long long>(result->_documents.size());
            result->_hasMore = false;
        }, SLOT(showPage()));
    }

    void QueryWidget::explain()
    {
        if (_thread)
            return;

        QueryExecutor *executor = AppRegistry::instance().queryExecutor();
        const ConnectionSettings profile = _profile;
        const std::string collection = _collection;
        const QString query = _queryText->text();
        const QString projection = _projectionText->text();
        const QString sort = _sortText->text();
        std::shared_ptr<MongoDocumentPtr> plan = std::make_shared<MongoDocumentPtr>();
        _pendingPlan = plan;

        runJob([=]() {
            *plan = executor->explain(profile, collection, query, projection, sort);
        }, SLOT(showExplain()));
    }

    void QueryWidget::showIndexes()
    {
        IndexesDialog dlg(_profile, _collection, this);
        dlg.exec();
    }

    void QueryWidget::fillTemplatesMenu()
    {
        _loadTemplateMenu->clear();
        _deleteTemplateMenu->clear();

        QueryTemplateStore::QueryTemplateContainerType templates;
        try {
            templates = AppRegistry::instance().queryTemplateStore()->list();
        } catch (const MongoGuiException &ex) {
            LOG_MSG(ex.message(), mongo::logger::LogSeverity::Error());
        }

        for (auto const &queryTemplate : templates) {
            QAction *load = _loadTemplateMenu->addAction(QString("%1 (%2)").arg(queryTemplate._name, queryTemplate._kind));
            load->setData(queryTemplate._name);
            if (!queryTemplate._description.isEmpty())
                load->setToolTip(queryTemplate._description);
            _deleteTemplateMenu->addAction(queryTemplate._name)->setData(queryTemplate._name);
        }

        _loadTemplateMenu->setEnabled(!templates.empty());
        _deleteTemplateMenu->setEnabled(!templates.empty());
    }

    void QueryWidget::saveTemplate()
    {
        QueryTemplateStore *store = AppRegistry::instance().queryTemplateStore();

        bool ok = false;
        const QString name = QInputDialog::getText(this, "Save as Template", "Template name:",
                                                   QLineEdit::Normal, title(), &ok).trimmed();
        if (!ok || name.isEmpty())
            return;

        QueryTemplate queryTemplate(name, _queryText->text(), _projectionText->text(), _sortText->text());
        queryTemplate._description = QInputDialog::getText(this, "Save as Template", "Description (optional):",
                                                           QLineEdit::Normal, QString(), &ok);
        if (!ok)
            return;

        try {
            if (store->contains(name)) {
                const int answer = QMessageBox::question(this, "Save as Template",
                    QString("Template \"%1\" already exists. Replace it?").arg(name),
                    QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
                if (answer != QMessageBox::Yes)
                    return;
            }
            store->save(queryTemplate);
        } catch (const MongoGuiException &ex) {
            showError(ex.message());
        }
    }

    void QueryWidget::loadTemplate(QAction *action)
    {
        QueryTemplate queryTemplate;
        try {
            queryTemplate = AppRegistry::instance().queryTemplateStore()->load(action->data().toString());
        } catch (const MongoGuiException &ex) {
            showError(ex.message());
            return;
        }

        _queryText->setText(queryTemplate._query);
        _projectionText->setText(queryTemplate._projection);
        _sortText->setText(queryTemplate._sort);
        setQueryFocus();
    }

    void QueryWidget::deleteTemplate(QAction *action)
    {
        const QString name = action->data().toString();
        const int answer = QMessageBox::question(this, "Delete Template",
            QString("Delete template \"%1\"?").arg(name), QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
        if (answer != QMessageBox::Yes)
            return;

        try {
            AppRegistry::instance().queryTemplateStore()->remove(name);
        } catch (const MongoGuiException &ex) {
            showError(ex.message());
        }
    }

    void QueryWidget::importTemplates()
    {
        const QString path = QFileDialog::getOpenFileName(this, "Import Templates", QString(),
                                                          "JSON Files (*.json);;All Files (*)");
        if (path.isEmpty())
            return;

        try {
            const int count = AppRegistry::instance().queryTemplateStore()->importFrom(path, false);
            QMessageBox::information(this, "Import Templates",
                QString("%1 templates imported, existing names were kept.").arg(count));
        } catch (const MongoGuiException &ex) {
            showError(ex.message());
        }
    }

    void QueryWidget::exportTemplates()
    {
        const QString path = QFileDialog::getSaveFileName(this, "Export Templates", "query_templates.json",
                                                          "JSON Files (*.json)");
        if (path.isEmpty())
            return;

        try {
            AppRegistry::instance().queryTemplateStore()->exportTo(path);
        } catch (const MongoGuiException &ex) {
            showError(ex.message());
        }
    }

    void QueryWidget::editDocument(const QModelIndex &index)
    {
        if (_thread || !index.isValid())
            return;

        MongoDocumentPtr doc = _model->document(index.row());
        if (!doc)
            return;

        DocumentTextEditor editor(QString("Edit Document - %1").arg(title()), doc->toJson(), false, this);
        if (editor.exec() != QDialog::Accepted)
            return;

        QueryExecutor *executor = AppRegistry::instance().queryExecutor();
        const ConnectionSettings profile = _profile;
        const std::string collection = _collection;
        const mongo::BSONObj document = editor.bsonObj();

        runJob([=]() {
            executor->replaceDocument(profile, collection, document);
        }, SLOT(documentReplaced()));
    }

    void QueryWidget::showPage()
    {
        if (!_pendingPage)
            return;

        const ResultPage &page = *_pendingPage;
        _model->setDocuments(page._documents, static_cast<long long>(page._page - 1) * page._pageSize + 1);
        _table->resizeColumnsToContents();
        _paging->setResultInfo(page._page, page._pageSize, static_cast<int>(page._documents.size()),
                               page._totalKnown, page._hasMore);
        _pendingPage.reset();
    }

    void QueryWidget::showExplain()
    {
        if (!_pendingPlan || !*_pendingPlan)
            return;

        DocumentTextEditor viewer(QString("Explain - %1").arg(title()), (*_pendingPlan)->toJson(), true, this);
        _pendingPlan.reset();
        viewer.exec();
    }

    void QueryWidget::documentReplaced()
    {
        LOG_MSG(QString("Document replaced in %1").arg(title()), mongo::logger::LogSeverity::Info());
        _reloadAfterJob = true;
    }

    void QueryWidget::showError(const QString &message)
    {
        QMessageBox::critical(this, "Error", message);
    }

    void QueryWidget::jobFinished()
    {
        _thread = NULL;
        setBusy(false);

        if (_reloadAfterJob) {
            _reloadAfterJob = false;
            reload();
        }
    }

    void QueryWidget::runJob(const QueryThread::JobType &job, const char *onSuccess)
    {
        QueryThread *thread = new QueryThread(job, this);
        VERIFY(connect(thread, SIGNAL(succeeded()), this, onSuccess));
        VERIFY(connect(thread, SIGNAL(failed(const QString &)), this, SLOT(showError(const QString &))));
        VERIFY(connect(thread, SIGNAL(finished()), this, SLOT(jobFinished())));
        VERIFY(connect(thread, SIGNAL(finished()), thread, SLOT(deleteLater())));
        _thread = thread;
        setBusy(true);
        thread->start();
    }

    void QueryWidget::setBusy(bool busy)
    {
        _executeButton->setEnabled(!busy);
        _explainButton->setEnabled(!busy);
        _sampleButton->setEnabled(!busy);
        _paging->setEnabled(!busy);
        if (busy)
            setCursor(Qt::BusyCursor);
        else
            unsetCursor();
    }
}
