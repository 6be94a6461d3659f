#include "mongogui/gui/MainWindow.h"

#include <QAction>
#include <QApplication>
#include <QCloseEvent>
#include <QDesktopServices>
#include <QDesktopWidget>
#include <QDockWidget>
#include <QMenuBar>
#include <QMessageBox>
#include <QSettings>
#include <QStatusBar>
#include <QToolBar>
#include <QUrl>

#include "mongogui/core/AppRegistry.h"
#include "mongogui/core/Exceptions.h"
#include "mongogui/core/settings/ConnectionStore.h"
#include "mongogui/core/settings/SettingsManager.h"
#include "mongogui/core/utils/Logger.h"
#include "mongogui/core/utils/QtUtils.h"
#include "mongogui/gui/GuiRegistry.h"
#include "mongogui/gui/dialogs/ConnectionsDialog.h"
#include "mongogui/gui/dialogs/PreferencesDialog.h"
#include "mongogui/gui/widgets/LogWidget.h"
#include "mongogui/gui/widgets/explorer/ExplorerWidget.h"
#include "mongogui/gui/widgets/workarea/QueryWidget.h"
#include "mongogui/gui/widgets/workarea/WorkAreaTabWidget.h"

namespace
{
    const QString GeometryKey("MainWindow/geometry");
    const QString StateKey("MainWindow/state");

    QAction *createAction(const QString &text, const QKeySequence &shortcut, QObject *parent)
    {
        QAction *action = new QAction(text, parent);
        if (!shortcut.isEmpty())
            action->setShortcut(shortcut);
        return action;
    }
}

namespace MongoGui
{
    MainWindow::MainWindow()
        : BaseClass(),
        _viewMenu(nullptr),
        _workArea(new WorkAreaTabWidget(this)),
        _explorer(new ExplorerWidget(this))
    {
        setWindowTitle(PROJECT_NAME " " PROJECT_VERSION);
        setWindowIcon(GuiRegistry::instance().mainWindowIcon());
        setCentralWidget(_workArea);

        createActions();

        VERIFY(connect(_explorer, SIGNAL(collectionActivated(const QString &, const QString &)),
                       this, SLOT(openCollection(const QString &, const QString &))));
        addDock("Database Explorer", _explorer, Qt::LeftDockWidgetArea, QKeySequence(Qt::CTRL + Qt::Key_E));

        LogWidget *log = new LogWidget(this);
        VERIFY(connect(&Logger::instance(), SIGNAL(printed(const QString&, mongo::logger::LogSeverity)),
                       log, SLOT(addMessage(const QString&, mongo::logger::LogSeverity)), Qt::DirectConnection));
        addDock("Logs", log, Qt::BottomDockWidgetArea, QKeySequence(Qt::CTRL + Qt::Key_L))->hide();

        restoreWindowSettings();
        checkSecretStore();
    }

    void MainWindow::createActions()
    {
        QAction *connectAction = createAction("&Connect...", QKeySequence(Qt::CTRL + Qt::Key_O), this);
        connectAction->setIcon(GuiRegistry::instance().connectIcon());
        connectAction->setToolTip("Manage connections <b>(Ctrl + O)</b>");
        VERIFY(connect(connectAction, SIGNAL(triggered()), this, SLOT(manageConnections())));

        QAction *executeAction = createAction("&Execute", QKeySequence(Qt::Key_F5), this);
        executeAction->setIcon(GuiRegistry::instance().executeIcon());
        executeAction->setToolTip("Execute query of the current tab <b>(F5)</b>");
        VERIFY(connect(executeAction, SIGNAL(triggered()), this, SLOT(executeCurrentQuery())));

        QAction *exitAction = createAction("E&xit", QKeySequence::Quit, this);
        VERIFY(connect(exitAction, SIGNAL(triggered()), this, SLOT(close())));

        QMenu *fileMenu = menuBar()->addMenu("&File");
        fileMenu->addAction(connectAction);
        fileMenu->addAction(executeAction);
        fileMenu->addSeparator();
        fileMenu->addAction(exitAction);

        _viewMenu = menuBar()->addMenu("&View");

        QAction *preferencesAction = createAction("&Preferences...", QKeySequence(), this);
        VERIFY(connect(preferencesAction, SIGNAL(triggered()), this, SLOT(openPreferences())));
        QAction *logFileAction = createAction("Open &Log File", QKeySequence(), this);
        VERIFY(connect(logFileAction, SIGNAL(triggered()), this, SLOT(showLogFile())));

        QMenu *optionsMenu = menuBar()->addMenu("&Options");
        optionsMenu->addAction(preferencesAction);
        optionsMenu->addAction(logFileAction);

        QAction *closeTabAction = createAction("&Close Tab", QKeySequence(), this);
        closeTabAction->setShortcuts(QList<QKeySequence>()
            << QKeySequence(Qt::CTRL + Qt::Key_W) << QKeySequence(Qt::CTRL + Qt::Key_F4));
        VERIFY(connect(closeTabAction, SIGNAL(triggered()), _workArea, SLOT(closeCurrentTab())));
        QAction *nextTabAction = createAction("&Next Tab", QKeySequence(Qt::CTRL + Qt::Key_PageDown), this);
        VERIFY(connect(nextTabAction, SIGNAL(triggered()), _workArea, SLOT(nextTab())));
        QAction *previousTabAction = createAction("&Previous Tab", QKeySequence(Qt::CTRL + Qt::Key_PageUp), this);
        VERIFY(connect(previousTabAction, SIGNAL(triggered()), _workArea, SLOT(previousTab())));

        QMenu *windowMenu = menuBar()->addMenu("&Window");
        windowMenu->addAction(closeTabAction);
        windowMenu->addSeparator();
        windowMenu->addAction(nextTabAction);
        windowMenu->addAction(previousTabAction);

        QToolBar *toolBar = addToolBar("Main");
        toolBar->setObjectName("mainToolBar");
        toolBar->setMovable(false);
        toolBar->addAction(connectAction);
        toolBar->addAction(executeAction);
    }

    QDockWidget *MainWindow::addDock(const QString &title, QWidget *content, Qt::DockWidgetArea area,
                                     const QKeySequence &toggleShortcut)
    {
        QDockWidget *dock = new QDockWidget(title, this);
        // objectName is the key of saveState()
        dock->setObjectName(content->metaObject()->className());
        dock->setWidget(content);
        dock->setFeatures(QDockWidget::DockWidgetClosable | QDockWidget::DockWidgetMovable);
        addDockWidget(area, dock);

        QAction *toggle = dock->toggleViewAction();
        toggle->setShortcut(toggleShortcut);
        _viewMenu->addAction(toggle);

        return dock;
    }

    void MainWindow::checkSecretStore()
    {
        if (AppRegistry::instance().connectionStore()->verifySecretStore())
            return;

        statusBar()->showMessage("System keychain is not available, passwords can't be saved");
    }

    void MainWindow::manageConnections()
    {
        ConnectionsDialog dialog(AppRegistry::instance().connectionStore(), this);
        const int result = dialog.exec();

        if (dialog.connectionsChanged())
            _explorer->refresh();

        if (result != QDialog::Accepted)
            return;

        _explorer->openProfile(dialog.selectedConnectionName());
    }

    void MainWindow::openPreferences()
    {
        PreferencesDialog dialog(this);
        dialog.exec();
    }

    void MainWindow::executeCurrentQuery()
    {
        if (QueryWidget *query = _workArea->currentQueryWidget())
            query->execute();
    }

    void MainWindow::openCollection(const QString &profileName, const QString &collection)
    {
        ConnectionSettings profile;
        try {
            // Password comes from the keychain here, query tab keeps the resolved copy
            profile = AppRegistry::instance().connectionStore()->resolve(profileName);
        } catch (const MongoGuiException &ex) {
            LOG_MSG(ex.message(), mongo::logger::LogSeverity::Error());
            QMessageBox::critical(this, "Open Collection", ex.message());
            return;
        }

        _workArea->openQueryTab(profile, collection);
    }

    void MainWindow::showLogFile()
    {
        QDesktopServices::openUrl(QUrl::fromLocalFile(Logger::instance().logFilePath()));
    }

    void MainWindow::closeEvent(QCloseEvent *event)
    {
        saveWindowSettings();
        BaseClass::closeEvent(event);
    }

    void MainWindow::restoreWindowSettings()
    {
        QSettings settings(PROJECT_NAME, PROJECT_NAME);
        if (settings.contains(GeometryKey)) {
            restoreGeometry(settings.value(GeometryKey).toByteArray());
            restoreState(settings.value(StateKey).toByteArray());
            return;
        }

        // First start: 90% of the available screen, centered
        const QRect screen = QApplication::desktop()->availableGeometry(this);
        const QSize size = screen.size() * 0.9;
        setGeometry(QRect(screen.topLeft() + QPoint((screen.width() - size.width()) / 2,
                                                    (screen.height() - size.height()) / 2), size));
    }

    void MainWindow::saveWindowSettings() const
    {
        QSettings settings(PROJECT_NAME, PROJECT_NAME);
        settings.setValue(GeometryKey, saveGeometry());
        settings.setValue(StateKey, saveState());
    }
}
