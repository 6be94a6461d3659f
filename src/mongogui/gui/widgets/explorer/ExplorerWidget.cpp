#include "mongogui/gui/widgets/explorer/ExplorerWidget.h"

#include <QAction>
#include <QHBoxLayout>
#include <QKeyEvent>
#include <QMenu>
#include <QMessageBox>
#include <QTreeWidget>

#include "mongogui/core/AppRegistry.h"
#include "mongogui/core/domain/QueryExecutor.h"
#include "mongogui/core/settings/ConnectionStore.h"
#include "mongogui/core/utils/Logger.h"
#include "mongogui/core/utils/QtUtils.h"
#include "mongogui/gui/GuiRegistry.h"
#include "mongogui/gui/widgets/workarea/QueryThread.h"

namespace
{
    enum ItemKind { ProfileItem = QTreeWidgetItem::UserType + 1, CollectionItem, PlaceholderItem };

    void setPlaceholder(QTreeWidgetItem *profileItem, const QString &text)
    {
        qDeleteAll(profileItem->takeChildren());
        QTreeWidgetItem *placeholder = new QTreeWidgetItem(profileItem, PlaceholderItem);
        placeholder->setText(0, text);
        placeholder->setForeground(0, QBrush(Qt::gray));
    }
}

namespace MongoGui
{
    ExplorerWidget::ExplorerWidget(QWidget *parent) : BaseClass(parent)
    {
        _treeWidget = new QTreeWidget(this);
        _treeWidget->setHeaderHidden(true);
        _treeWidget->setIndentation(15);
        _treeWidget->setContextMenuPolicy(Qt::CustomContextMenu);

        QHBoxLayout *vlaout = new QHBoxLayout();
        vlaout->setContentsMargins(0, 0, 0, 0);
        vlaout->addWidget(_treeWidget, Qt::AlignJustify);

        VERIFY(connect(_treeWidget, SIGNAL(itemExpanded(QTreeWidgetItem *)), this, SLOT(ui_itemExpanded(QTreeWidgetItem *))));
        VERIFY(connect(_treeWidget, SIGNAL(itemDoubleClicked(QTreeWidgetItem *, int)),
                       this, SLOT(ui_itemDoubleClicked(QTreeWidgetItem *, int))));
        VERIFY(connect(_treeWidget, SIGNAL(customContextMenuRequested(const QPoint &)),
                       this, SLOT(ui_showContextMenu(const QPoint &))));

        setLayout(vlaout);
        refresh();
    }

    ExplorerWidget::~ExplorerWidget()
    {
        for (QueryThread *thread : findChildren<QueryThread *>()) {
            QtUtils::cleanUpThread(thread);
        }
    }

    QSize ExplorerWidget::sizeHint() const
    {
        return QSize(250, 500);
    }

    void ExplorerWidget::refresh()
    {
        _treeWidget->clear();

        ConnectionStore::ConnectionSettingsContainerType profiles;
        try {
            profiles = AppRegistry::instance().connectionStore()->list();
        } catch (const std::exception &ex) {
            LOG_MSG(QString("Cannot read connections: %1").arg(QString::fromUtf8(ex.what())),
                    mongo::logger::LogSeverity::Error());
            return;
        }

        for (auto const &profile : profiles) {
            QTreeWidgetItem *item = new QTreeWidgetItem(_treeWidget, ProfileItem);
            const QString name = QtUtils::toQString(profile.connectionName());
            item->setText(0, name);
            item->setData(0, Qt::UserRole, name);
            item->setToolTip(0, QtUtils::toQString(profile.getFullAddress() + "/" + profile.defaultDatabase()));
            item->setIcon(0, GuiRegistry::instance().serverIcon());
            item->setChildIndicatorPolicy(QTreeWidgetItem::ShowIndicator);
        }
    }

    void ExplorerWidget::openProfile(const QString &name)
    {
        QTreeWidgetItem *item = findProfileItem(name);
        if (!item)
            return;

        _treeWidget->setCurrentItem(item);
        if (item->isExpanded())
            loadCollections(item);
        else
            item->setExpanded(true);
    }

    void ExplorerWidget::ui_itemExpanded(QTreeWidgetItem *item)
    {
        if (item->type() != ProfileItem)
            return;

        // Loaded already
        if (item->childCount() > 0 && item->child(0)->type() == CollectionItem)
            return;

        loadCollections(item);
    }

    void ExplorerWidget::ui_itemDoubleClicked(QTreeWidgetItem *item, int column)
    {
        if (!item || item->type() != CollectionItem)
            return;

        QTreeWidgetItem *profileItem = item->parent();
        emit collectionActivated(profileItem->data(0, Qt::UserRole).toString(), item->text(0));
    }

    void ExplorerWidget::ui_showContextMenu(const QPoint &pt)
    {
        QTreeWidgetItem *item = _treeWidget->itemAt(pt);

        QMenu menu(this);
        if (item && item->type() == ProfileItem) {
            QAction *reloadAction = menu.addAction("Refresh Collections");
            VERIFY(connect(reloadAction, SIGNAL(triggered()), this, SLOT(reloadSelectedProfile())));
        }
        QAction *refreshAction = menu.addAction("Refresh Connections");
        VERIFY(connect(refreshAction, SIGNAL(triggered()), this, SLOT(refresh())));
        menu.exec(_treeWidget->viewport()->mapToGlobal(pt));
    }

    void ExplorerWidget::reloadSelectedProfile()
    {
        QTreeWidgetItem *item = _treeWidget->currentItem();
        if (item && item->type() == ProfileItem)
            loadCollections(item);
    }

    void ExplorerWidget::loadCollections(QTreeWidgetItem *profileItem)
    {
        const QString name = profileItem->data(0, Qt::UserRole).toString();
        for (auto const &load : _pending) {
            if (load.second._profileName == name)
                return;
        }

        ConnectionSettings profile;
        try {
            profile = AppRegistry::instance().connectionStore()->resolve(name);
        } catch (const std::exception &ex) {
            setPlaceholder(profileItem, "Not available");
            QMessageBox::critical(this, "Error", QString::fromUtf8(ex.what()));
            return;
        }

        setPlaceholder(profileItem, "Loading...");

        QueryExecutor *executor = AppRegistry::instance().queryExecutor();
        std::shared_ptr<std::vector<std::string> > collections = std::make_shared<std::vector<std::string> >();
        QueryThread *thread = new QueryThread([=]() {
            *collections = executor->listCollections(profile);
        }, this);

        PendingLoad load;
        load._profileName = name;
        load._collections = collections;
        _pending[thread] = load;

        VERIFY(connect(thread, SIGNAL(succeeded()), this, SLOT(collectionsLoaded())));
        VERIFY(connect(thread, SIGNAL(failed(const QString &)), this, SLOT(collectionsFailed(const QString &))));
        VERIFY(connect(thread, SIGNAL(finished()), thread, SLOT(deleteLater())));
        thread->start();
    }

    void ExplorerWidget::collectionsLoaded()
    {
        QueryThread *thread = qobject_cast<QueryThread *>(sender());
        auto it = _pending.find(thread);
        if (it == _pending.end())
            return;

        const PendingLoad load = it->second;
        _pending.erase(it);

        QTreeWidgetItem *profileItem = findProfileItem(load._profileName);
        if (!profileItem)
            return;

        qDeleteAll(profileItem->takeChildren());
        if (load._collections->empty()) {
            setPlaceholder(profileItem, "No collections");
            return;
        }

        for (auto const &collection : *load._collections) {
            QTreeWidgetItem *item = new QTreeWidgetItem(profileItem, CollectionItem);
            item->setText(0, QtUtils::toQString(collection));
            item->setIcon(0, GuiRegistry::instance().collectionIcon());
        }
    }

    void ExplorerWidget::collectionsFailed(const QString &message)
    {
        QueryThread *thread = qobject_cast<QueryThread *>(sender());
        auto it = _pending.find(thread);
        if (it == _pending.end())
            return;

        const QString name = it->second._profileName;
        _pending.erase(it);

        QTreeWidgetItem *profileItem = findProfileItem(name);
        if (profileItem) {
            setPlaceholder(profileItem, "Not available");
            profileItem->setExpanded(false);
        }

        QMessageBox::critical(this, "Error", message);
    }

    QTreeWidgetItem *ExplorerWidget::findProfileItem(const QString &name) const
    {
        for (int i = 0; i < _treeWidget->topLevelItemCount(); ++i) {
            QTreeWidgetItem *item = _treeWidget->topLevelItem(i);
            if (item->data(0, Qt::UserRole).toString() == name)
                return item;
        }
        return NULL;
    }

    void ExplorerWidget::keyPressEvent(QKeyEvent *event)
    {
        if ((event->key() == Qt::Key_Return) || (event->key() == Qt::Key_Enter))
        {
            QTreeWidgetItem *item = _treeWidget->currentItem();
            if (item) {
                ui_itemDoubleClicked(item, 0);
                return;
            }
        }

        BaseClass::keyPressEvent(event);
    }
}
