#include "mongogui/gui/dialogs/ConnectionsDialog.h"

#include <QDialogButtonBox>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QMessageBox>
#include <QPushButton>
#include <QSettings>
#include <QTreeWidget>
#include <QVBoxLayout>

#include "mongogui/core/Exceptions.h"
#include "mongogui/core/settings/ConnectionSettings.h"
#include "mongogui/core/settings/ConnectionStore.h"
#include "mongogui/core/utils/QtUtils.h"
#include "mongogui/gui/GuiRegistry.h"
#include "mongogui/gui/dialogs/ConnectionDialog.h"

namespace
{
    const QString SizeKey("ConnectionsDialog/size");

    enum Column { NameColumn, AddressColumn, DatabaseColumn, TlsColumn, AuthColumn };

    QPushButton *createSideButton(const QString &text, QWidget *parent)
    {
        QPushButton *button = new QPushButton(text, parent);
        button->setAutoDefault(false);
        return button;
    }
}

namespace MongoGui
{
    ConnectionsDialog::ConnectionsDialog(ConnectionStore *store, QWidget *parent)
        : BaseClass(parent), _store(store), _changed(false)
    {
        setWindowTitle("Connections");
        setWindowIcon(GuiRegistry::instance().connectIcon());
        setWindowFlags(windowFlags() & ~Qt::WindowContextHelpButtonHint);

        _listWidget = new QTreeWidget;
        _listWidget->setRootIsDecorated(false);
        _listWidget->setAlternatingRowColors(true);
        _listWidget->setSelectionMode(QAbstractItemView::SingleSelection);
        _listWidget->setHeaderLabels(QStringList() << "Name" << "Address" << "Database" << "TLS" << "Authentication");
        _listWidget->header()->setStretchLastSection(false);
        _listWidget->header()->setSectionResizeMode(QHeaderView::ResizeToContents);
        _listWidget->header()->setSectionResizeMode(NameColumn, QHeaderView::Stretch);
        _listWidget->setMinimumSize(600, 280);
        GuiRegistry::instance().setAlternatingColor(_listWidget);
        VERIFY(connect(_listWidget, SIGNAL(itemDoubleClicked(QTreeWidgetItem*, int)), this, SLOT(accept())));
        VERIFY(connect(_listWidget, SIGNAL(itemSelectionChanged()), this, SLOT(updateButtons())));

        QPushButton *addButton = createSideButton("&Add...", this);
        _editButton = createSideButton("&Edit...", this);
        _cloneButton = createSideButton("&Clone...", this);
        _removeButton = createSideButton("&Remove", this);
        VERIFY(connect(addButton, SIGNAL(clicked()), this, SLOT(add())));
        VERIFY(connect(_editButton, SIGNAL(clicked()), this, SLOT(edit())));
        VERIFY(connect(_cloneButton, SIGNAL(clicked()), this, SLOT(clone())));
        VERIFY(connect(_removeButton, SIGNAL(clicked()), this, SLOT(remove())));

        QVBoxLayout *sideLayout = new QVBoxLayout;
        sideLayout->addWidget(addButton);
        sideLayout->addWidget(_editButton);
        sideLayout->addWidget(_cloneButton);
        sideLayout->addSpacing(12);
        sideLayout->addWidget(_removeButton);
        sideLayout->addStretch(1);

        QHBoxLayout *listLayout = new QHBoxLayout;
        listLayout->addWidget(_listWidget, 1);
        listLayout->addLayout(sideLayout);

        QDialogButtonBox *buttonBox = new QDialogButtonBox(QDialogButtonBox::Cancel, Qt::Horizontal, this);
        _connectButton = buttonBox->addButton("C&onnect", QDialogButtonBox::AcceptRole);
        _connectButton->setIcon(GuiRegistry::instance().serverIcon());
        _connectButton->setDefault(true);
        VERIFY(connect(buttonBox, SIGNAL(accepted()), this, SLOT(accept())));
        VERIFY(connect(buttonBox, SIGNAL(rejected()), this, SLOT(reject())));

        QLabel *hint = new QLabel("Passwords are kept in the system keychain, not in the connections file.");
        hint->setWordWrap(true);

        QVBoxLayout *mainLayout = new QVBoxLayout(this);
        mainLayout->addLayout(listLayout, 1);
        mainLayout->addWidget(hint);
        mainLayout->addWidget(buttonBox);

        reload(QString());
        if (!_listWidget->currentItem() && _listWidget->topLevelItemCount() > 0)
            _listWidget->setCurrentItem(_listWidget->topLevelItem(0));
        updateButtons();
        _listWidget->setFocus();

        restoreWindowSettings();
    }

    QString ConnectionsDialog::currentName() const
    {
        QTreeWidgetItem *item = _listWidget->currentItem();
        return item ? item->text(NameColumn) : QString();
    }

    void ConnectionsDialog::reload(const QString &current)
    {
        _listWidget->clear();

        ConnectionStore::ConnectionSettingsContainerType profiles;
        try {
            profiles = _store->list();
        } catch (const MongoGuiException &ex) {
            QMessageBox::critical(this, windowTitle(), ex.message());
            return;
        }

        for (auto const &profile : profiles) {
            QTreeWidgetItem *item = new QTreeWidgetItem(_listWidget);
            item->setIcon(NameColumn, GuiRegistry::instance().serverIcon());
            item->setText(NameColumn, QtUtils::toQString(profile.connectionName()));
            item->setText(AddressColumn, QtUtils::toQString(profile.getFullAddress()));
            item->setText(DatabaseColumn, QtUtils::toQString(profile.defaultDatabase()));
            item->setText(TlsColumn, profile.tlsEnabled() ? "yes" : "");

            const CredentialSettings &credential = profile.credential();
            if (credential.enabled()) {
                item->setText(AuthColumn, QString("%1@%2")
                    .arg(QtUtils::toQString(credential.userName()))
                    .arg(QtUtils::toQString(profile.authDatabase())));
            }

            if (item->text(NameColumn) == current)
                _listWidget->setCurrentItem(item);
        }

        updateButtons();
    }

    void ConnectionsDialog::updateButtons()
    {
        const bool selected = !currentName().isEmpty();
        _editButton->setEnabled(selected);
        _cloneButton->setEnabled(selected);
        _removeButton->setEnabled(selected);
        _connectButton->setEnabled(selected);
    }

    bool ConnectionsDialog::editProfile(const ConnectionSettings &profile, const QString &originalName)
    {
        ConnectionDialog editDialog(_store, profile, originalName, this);
        const bool accepted = editDialog.exec() == QDialog::Accepted;

        // Focus goes to main window on some window managers
        activateWindow();
        if (!accepted)
            return false;

        _changed = true;
        reload(QtUtils::toQString(editDialog.connection().connectionName()));
        return true;
    }

    void ConnectionsDialog::add()
    {
        editProfile(ConnectionSettings(), QString());
    }

    void ConnectionsDialog::edit()
    {
        const QString name = currentName();
        if (name.isEmpty())
            return;

        try {
            editProfile(_store->resolve(name), name);
        } catch (const MongoGuiException &ex) {
            QMessageBox::critical(this, windowTitle(), ex.message());
        }
    }

    void ConnectionsDialog::clone()
    {
        const QString name = currentName();
        if (name.isEmpty())
            return;

        ConnectionSettings copy;
        try {
            copy = _store->resolve(name);
        } catch (const MongoGuiException &ex) {
            QMessageBox::critical(this, windowTitle(), ex.message());
            return;
        }

        // Clone is a new profile, its password is typed again
        copy.setConnectionName("Copy of " + copy.connectionName());
        copy.credential().setUserPassword(std::string());
        editProfile(copy, QString());
    }

    void ConnectionsDialog::remove()
    {
        const QString name = currentName();
        if (name.isEmpty())
            return;

        const int answer = QMessageBox::question(this, windowTitle(),
            QString("Remove connection \"%1\" and its saved password?").arg(name),
            QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
        if (answer != QMessageBox::Yes)
            return;

        try {
            _store->remove(name);
        } catch (const MongoGuiException &ex) {
            QMessageBox::critical(this, windowTitle(), ex.message());
        }

        // Profile file may be rewritten even if the keychain failed
        _changed = true;
        reload(QString());
    }

    void ConnectionsDialog::accept()
    {
        const QString name = currentName();
        if (name.isEmpty())
            return;

        _selectedConnectionName = name;
        BaseClass::accept();
    }

    void ConnectionsDialog::done(int result)
    {
        saveWindowSettings();
        BaseClass::done(result);
    }

    void ConnectionsDialog::saveWindowSettings() const
    {
        QSettings settings(PROJECT_NAME, PROJECT_NAME);
        settings.setValue(SizeKey, size());
    }

    void ConnectionsDialog::restoreWindowSettings()
    {
        QSettings settings(PROJECT_NAME, PROJECT_NAME);
        if (settings.contains(SizeKey))
            resize(settings.value(SizeKey).toSize());
    }
}
