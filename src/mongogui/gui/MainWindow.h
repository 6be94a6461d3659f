#pragma once

#include <QMainWindow>

QT_BEGIN_NAMESPACE
class QDockWidget;
class QMenu;
QT_END_NAMESPACE

namespace MongoGui
{
    class ExplorerWidget;
    class WorkAreaTabWidget;

    class MainWindow : public QMainWindow
    {
        Q_OBJECT

    public:
        typedef QMainWindow BaseClass;
        MainWindow();

    public Q_SLOTS:
        void manageConnections();
        void openPreferences();
        void executeCurrentQuery();
        void openCollection(const QString &profileName, const QString &collection);
        void showLogFile();

    protected:
        void closeEvent(QCloseEvent *event) override;

    private:
        void createActions();
        QDockWidget *addDock(const QString &title, QWidget *content, Qt::DockWidgetArea area,
                             const QKeySequence &toggleShortcut);
        void checkSecretStore();
        void restoreWindowSettings();
        void saveWindowSettings() const;

        QMenu *_viewMenu;
        WorkAreaTabWidget *const _workArea;
        ExplorerWidget *const _explorer;
    };
}
