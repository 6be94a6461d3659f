#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <QWidget>
QT_BEGIN_NAMESPACE
class QTreeWidget;
class QTreeWidgetItem;
QT_END_NAMESPACE

namespace MongoGui
{
    class QueryThread;

    /**
     * @brief Explorer widget (usually you'll see it at the left of main window).
     *        Top level items are saved profiles, children are collections of
     *        the profile database, loaded when the profile is expanded.
     */
    class ExplorerWidget : public QWidget
    {
        Q_OBJECT

    public:
        typedef QWidget BaseClass;
        explicit ExplorerWidget(QWidget *parent = 0);
        ~ExplorerWidget();

    Q_SIGNALS:
        void collectionActivated(const QString &profileName, const QString &collection);

    public Q_SLOTS:
        // Rebuilds profile list from the connection store
        void refresh();

        // Selects profile and loads its collections
        void openProfile(const QString &name);

    private Q_SLOTS:
        void ui_itemExpanded(QTreeWidgetItem *item);
        void ui_itemDoubleClicked(QTreeWidgetItem *item, int column);
        void ui_showContextMenu(const QPoint &pt);
        void reloadSelectedProfile();

        void collectionsLoaded();
        void collectionsFailed(const QString &message);

    protected:
        void keyPressEvent(QKeyEvent *event) override;

    private:
        struct PendingLoad
        {
            QString _profileName;
            std::shared_ptr<std::vector<std::string> > _collections;
        };

        void loadCollections(QTreeWidgetItem *profileItem);
        QTreeWidgetItem *findProfileItem(const QString &name) const;
        QSize sizeHint() const override;

        QTreeWidget *_treeWidget;
        std::map<QueryThread *, PendingLoad> _pending;
    };
}
