#include "mongogui/gui/dialogs/IndexesDialog.h"

#include <QCheckBox>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLineEdit>
#include <QMessageBox>
#include <QPushButton>
#include <QTreeWidget>
#include <QVBoxLayout>

#include "mongogui/core/AppRegistry.h"
#include "mongogui/core/domain/MongoDocument.h"
#include "mongogui/core/domain/QueryExecutor.h"
#include "mongogui/core/utils/Logger.h"
#include "mongogui/core/utils/QtUtils.h"
#include "mongogui/gui/GuiRegistry.h"
#include "mongogui/gui/editors/JsonEditor.h"

namespace MongoGui
{
    IndexesDialog::IndexesDialog(const ConnectionSettings &profile, const std::string &collection, QWidget *parent) :
        BaseClass(parent),
        _profile(profile),
        _collection(collection),
        _refreshAfterJob(false)
    {
        setWindowTitle(QString("Indexes - %1").arg(QtUtils::toQString(_collection)));

        _indexesTree = new QTreeWidget(this);
        _indexesTree->setHeaderLabels(QStringList() << "Name" << "Keys" << "Unique");
        _indexesTree->setRootIsDecorated(false);
        _indexesTree->setSelectionMode(QAbstractItemView::SingleSelection);
        _indexesTree->setAlternatingRowColors(true);
        GuiRegistry::instance().setAlternatingColor(_indexesTree);

        _dropButton = new QPushButton(GuiRegistry::instance().deleteIcon(), "Drop");
        VERIFY(connect(_dropButton, SIGNAL(clicked()), this, SLOT(dropIndex())));

        _keysText = new JsonEditor(this);
        _keysText->setFixedHeight(_keysText->fontMetrics().height() * 2);
        _keysText->setText("{\"field\": 1}");
        _indexName = new QLineEdit(this);
        _indexName->setPlaceholderText("Default name");
        _unique = new QCheckBox("Unique", this);
        _createButton = new QPushButton("Create");
        VERIFY(connect(_createButton, SIGNAL(clicked()), this, SLOT(createIndex())));

        QFormLayout *createLayout = new QFormLayout;
        createLayout->addRow("Keys:", _keysText);
        createLayout->addRow("Name:", _indexName);
        createLayout->addRow("", _unique);

        QHBoxLayout *buttons = new QHBoxLayout;
        buttons->addWidget(_dropButton);
        buttons->addStretch(1);
        buttons->addWidget(_createButton);

        QDialogButtonBox *buttonBox = new QDialogButtonBox(QDialogButtonBox::Close, this);
        VERIFY(connect(buttonBox, SIGNAL(rejected()), this, SLOT(reject())));

        QVBoxLayout *vlayout = new QVBoxLayout;
        vlayout->setContentsMargins(5, 5, 5, 5);
        vlayout->addWidget(_indexesTree, 1);
        vlayout->addLayout(createLayout);
        vlayout->addLayout(buttons);
        vlayout->addWidget(buttonBox);
        setLayout(vlayout);
        resize(WidthWidget, HeightWidget);

        refresh();
    }

    IndexesDialog::~IndexesDialog()
    {
        QtUtils::cleanUpThread(_thread);
    }

    void IndexesDialog::refresh()
    {
        if (_thread)
            return;

        QueryExecutor *executor = AppRegistry::instance().queryExecutor();
        const ConnectionSettings profile = _profile;
        const std::string collection = _collection;
        std::shared_ptr<std::vector<MongoDocumentPtr> > indexes = std::make_shared<std::vector<MongoDocumentPtr> >();
        _pendingIndexes = indexes;

        runJob([=]() {
            *indexes = executor->listIndexes(profile, collection);
        }, SLOT(showIndexes()));
    }

    void IndexesDialog::createIndex()
    {
        if (_thread)
            return;

        QueryExecutor *executor = AppRegistry::instance().queryExecutor();
        const ConnectionSettings profile = _profile;
        const std::string collection = _collection;
        const QString keys = _keysText->text();
        const QString name = _indexName->text().trimmed();
        const bool unique = _unique->isChecked();
        _refreshAfterJob = true;

        runJob([=]() {
            executor->createIndex(profile, collection, keys, name, unique);
        }, SLOT(indexesChanged()));
    }

    void IndexesDialog::dropIndex()
    {
        QTreeWidgetItem *item = _indexesTree->currentItem();
        if (_thread || !item)
            return;

        const QString name = item->text(0);
        if (name == "_id_") {
            QMessageBox::warning(this, "Drop Index", "Index _id_ can't be dropped.");
            return;
        }

        int answer = QMessageBox::question(this, "Drop Index",
            QString("Drop index <b>%1</b>?").arg(name),
            QMessageBox::Yes, QMessageBox::No, QMessageBox::NoButton);

        if (answer != QMessageBox::Yes)
            return;

        QueryExecutor *executor = AppRegistry::instance().queryExecutor();
        const ConnectionSettings profile = _profile;
        const std::string collection = _collection;
        _refreshAfterJob = true;

        runJob([=]() {
            executor->dropIndex(profile, collection, name);
        }, SLOT(indexesChanged()));
    }

    void IndexesDialog::showIndexes()
    {
        if (!_pendingIndexes)
            return;

        _indexesTree->clear();
        for (auto const &index : *_pendingIndexes) {
            const mongo::BSONObj obj = index->bsonObj();
            QTreeWidgetItem *item = new QTreeWidgetItem(_indexesTree);
            item->setIcon(0, GuiRegistry::instance().indexIcon());
            item->setText(0, QtUtils::toQString(std::string(obj.getStringField("name"))));
            item->setText(1, QtUtils::toQString(obj.getObjectField("key").jsonString(mongo::Strict, 0)));
            item->setText(2, obj.getBoolField("unique") ? "yes" : "");
        }
        _indexesTree->header()->resizeSections(QHeaderView::ResizeToContents);
        _pendingIndexes.reset();
    }

    void IndexesDialog::showError(const QString &message)
    {
        _refreshAfterJob = false;
        QMessageBox::critical(this, "Error", message);
    }

    void IndexesDialog::indexesChanged()
    {
        LOG_MSG(QString("Indexes of %1 changed").arg(QtUtils::toQString(_collection)),
                mongo::logger::LogSeverity::Info());
    }

    void IndexesDialog::jobFinished()
    {
        _thread = NULL;
        setBusy(false);

        if (_refreshAfterJob) {
            _refreshAfterJob = false;
            refresh();
        }
    }

    void IndexesDialog::runJob(const QueryThread::JobType &job, const char *onSuccess)
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

    void IndexesDialog::setBusy(bool busy)
    {
        _createButton->setEnabled(!busy);
        _dropButton->setEnabled(!busy);
        if (busy)
            setCursor(Qt::BusyCursor);
        else
            unsetCursor();
    }
}
