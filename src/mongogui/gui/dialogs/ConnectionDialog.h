#pragma once

#include <memory>
#include <QDialog>
#include <QPointer>

#include "mongogui/core/settings/ConnectionSettings.h"

QT_BEGIN_NAMESPACE
class QCheckBox;
class QComboBox;
class QLabel;
class QLineEdit;
class QPushButton;
QT_END_NAMESPACE

namespace MongoGui
{
    class ConnectionStore;
    class QueryThread;
    struct ConnectionTestResult;

    /**
     * @brief Creates or edits one connection profile and saves it to the
     *        connection store on accept.
     */
    class ConnectionDialog : public QDialog
    {
        Q_OBJECT

    public:
        /**
         * @param originalName: name of edited profile, empty for a new one
         */
        ConnectionDialog(ConnectionStore *store, const ConnectionSettings &connection,
                         const QString &originalName, QWidget *parent = 0);
        ~ConnectionDialog();

        /**
         * @brief Profile as it was saved, valid after accept
         */
        ConnectionSettings connection() const { return _connection; }

    public Q_SLOTS:
        void accept() override;

    private Q_SLOTS:
        void testConnection();
        void showTestResult();
        void testFinished();
        void authChanged();

    private:
        ConnectionSettings collectConnection() const;

        ConnectionStore *const _store;
        ConnectionSettings _connection;
        const QString _originalName;

        QLineEdit *_connectionName;
        QLineEdit *_serverHost;
        QLineEdit *_serverPort;
        QLineEdit *_defaultDatabase;
        QCheckBox *_tls;

        QLineEdit *_userName;
        QLineEdit *_userPassword;
        QLineEdit *_authDatabase;
        QComboBox *_mechanism;

        QPushButton *_testButton;
        QLabel *_testResult;

        QPointer<QueryThread> _thread;
        std::shared_ptr<ConnectionTestResult> _pendingResult;
    };
}
