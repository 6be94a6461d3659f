#pragma once

#include <QDialog>

QT_BEGIN_NAMESPACE
class QPushButton;
class QTreeWidget;
QT_END_NAMESPACE

namespace MongoGui
{
    class ConnectionStore;
    class ConnectionSettings;

    /**
     * @brief Connection manager: lists saved profiles, lets user add, edit,
     *        clone and remove them, and pick one to connect to.
     */
    class ConnectionsDialog : public QDialog
    {
        Q_OBJECT

    public:
        typedef QDialog BaseClass;
        explicit ConnectionsDialog(ConnectionStore *store, QWidget *parent = 0);

        /**
         * @brief Name of profile selected with "Connect" button
         */
        QString selectedConnectionName() const { return _selectedConnectionName; }

        /**
         * @brief Profiles were added, edited or removed while dialog was open
         */
        bool connectionsChanged() const { return _changed; }

    public Q_SLOTS:
        void accept() override;
        void done(int result) override;

    private Q_SLOTS:
        void add();
        void edit();
        void remove();
        void clone();
        void updateButtons();

    private:
        QString currentName() const;
        bool editProfile(const ConnectionSettings &profile, const QString &originalName);
        void reload(const QString &currentName);
        void restoreWindowSettings();
        void saveWindowSettings() const;

        ConnectionStore *const _store;
        QTreeWidget *_listWidget;
        QPushButton *_editButton;
        QPushButton *_cloneButton;
        QPushButton *_removeButton;
        QPushButton *_connectButton;
        QString _selectedConnectionName;
        bool _changed;
    };
}
