#include "mongogui/gui/dialogs/ConnectionDialog.h"

#include <QCheckBox>
#include <QComboBox>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QIntValidator>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QPushButton>
#include <QTabWidget>
#include <QVBoxLayout>

#include "mongogui/core/Exceptions.h"
#include "mongogui/core/settings/ConnectionStore.h"
#include "mongogui/core/utils/Logger.h"
#include "mongogui/core/utils/QtUtils.h"
#include "mongogui/core/utils/Validators.h"
#include "mongogui/gui/GuiRegistry.h"
#include "mongogui/gui/widgets/workarea/QueryThread.h"

namespace MongoGui
{
    ConnectionDialog::ConnectionDialog(ConnectionStore *store, const ConnectionSettings &connection,
                                       const QString &originalName, QWidget *parent) :
        QDialog(parent),
        _store(store),
        _connection(connection),
        _originalName(originalName)
    {
        setWindowTitle("Connection Settings");
        setWindowIcon(GuiRegistry::instance().serverIcon());
        setWindowFlags(windowFlags() & ~Qt::WindowContextHelpButtonHint);

        // Connection tab
        _connectionName = new QLineEdit(QtUtils::toQString(_connection.connectionName()));
        _serverHost = new QLineEdit(QtUtils::toQString(_connection.serverHost()));
        _serverPort = new QLineEdit(QString::number(_connection.serverPort()));
        _serverPort->setValidator(new QIntValidator(1, 65535, this));
        _serverPort->setFixedWidth(_serverPort->fontMetrics().boundingRect("000000").width() + 10);
        _defaultDatabase = new QLineEdit(QtUtils::toQString(_connection.defaultDatabase()));
        _tls = new QCheckBox("Use TLS/SSL protocol");
        _tls->setChecked(_connection.tlsEnabled());

        QHBoxLayout *addressLayout = new QHBoxLayout;
        addressLayout->addWidget(_serverHost, 1);
        addressLayout->addWidget(new QLabel(":"));
        addressLayout->addWidget(_serverPort);

        QFormLayout *basicLayout = new QFormLayout;
        basicLayout->addRow("Name:", _connectionName);
        basicLayout->addRow("Address:", addressLayout);
        basicLayout->addRow("Database:", _defaultDatabase);
        basicLayout->addRow("", _tls);
        QWidget *basicTab = new QWidget;
        basicTab->setLayout(basicLayout);

        // Authentication tab
        const CredentialSettings &credential = _connection.credential();
        _userName = new QLineEdit(QtUtils::toQString(credential.userName()));
        _userPassword = new QLineEdit;
        _userPassword->setEchoMode(QLineEdit::Password);
        if (!_originalName.isEmpty())
            _userPassword->setPlaceholderText("Leave empty to keep stored password");
        _authDatabase = new QLineEdit(QtUtils::toQString(credential.databaseName()));
        _authDatabase->setPlaceholderText("Same as connection database");
        _mechanism = new QComboBox;
        _mechanism->addItems(QStringList() << "SCRAM-SHA-1" << "SCRAM-SHA-256");
        _mechanism->setCurrentText(QtUtils::toQString(credential.mechanism()));
        VERIFY(connect(_userName, SIGNAL(textChanged(const QString &)), this, SLOT(authChanged())));

        QFormLayout *authLayout = new QFormLayout;
        authLayout->addRow("User Name:", _userName);
        authLayout->addRow("Password:", _userPassword);
        authLayout->addRow("Auth Database:", _authDatabase);
        authLayout->addRow("Mechanism:", _mechanism);
        QWidget *authTab = new QWidget;
        authTab->setLayout(authLayout);

        QTabWidget *tabWidget = new QTabWidget;
        tabWidget->addTab(basicTab, "Connection");
        tabWidget->addTab(authTab, "Authentication");

        _testButton = new QPushButton("&Test");
        _testButton->setIcon(GuiRegistry::instance().connectIcon());
        VERIFY(connect(_testButton, SIGNAL(clicked()), this, SLOT(testConnection())));
        _testResult = new QLabel;
        _testResult->setWordWrap(true);

        QDialogButtonBox *buttonBox = new QDialogButtonBox(this);
        buttonBox->setOrientation(Qt::Horizontal);
        buttonBox->setStandardButtons(QDialogButtonBox::Cancel | QDialogButtonBox::Save);
        VERIFY(connect(buttonBox, SIGNAL(accepted()), this, SLOT(accept())));
        VERIFY(connect(buttonBox, SIGNAL(rejected()), this, SLOT(reject())));

        QHBoxLayout *bottomLayout = new QHBoxLayout;
        bottomLayout->addWidget(_testButton, 0, Qt::AlignLeft);
        bottomLayout->addWidget(_testResult, 1);
        bottomLayout->addWidget(buttonBox, 0, Qt::AlignRight);

        QVBoxLayout *mainLayout = new QVBoxLayout;
        mainLayout->addWidget(tabWidget);
        mainLayout->addLayout(bottomLayout);
        setLayout(mainLayout);

        authChanged();
        _connectionName->setFocus();
        _connectionName->selectAll();
        setMinimumWidth(480);
    }

    ConnectionDialog::~ConnectionDialog()
    {
        QtUtils::cleanUpThread(_thread);
    }

    ConnectionSettings ConnectionDialog::collectConnection() const
    {
        ConnectionSettings result = _connection;
        result.setConnectionName(QtUtils::toStdString(_connectionName->text().trimmed()));
        result.setServerHost(QtUtils::toStdString(_serverHost->text().trimmed()));
        result.setServerPort(_serverPort->text().toInt());
        result.setDefaultDatabase(QtUtils::toStdString(_defaultDatabase->text().trimmed()));
        result.setTlsEnabled(_tls->isChecked());

        CredentialSettings &credential = result.credential();
        credential.setUserName(QtUtils::toStdString(_userName->text().trimmed()));
        credential.setUserPassword(std::string());
        credential.setDatabaseName(QtUtils::toStdString(_authDatabase->text().trimmed()));
        credential.setMechanism(QtUtils::toStdString(_mechanism->currentText()));
        return result;
    }

    void ConnectionDialog::accept()
    {
        const ConnectionSettings candidate = collectConnection();
        const QString problem = Validators::validateConnection(candidate);
        if (!problem.isEmpty()) {
            QMessageBox::warning(this, "Invalid connection", problem);
            return;
        }

        const QString password = _userName->text().trimmed().isEmpty() ? QString() : _userPassword->text();

        try {
            if (_originalName.isEmpty()) {
                if (_store->contains(QtUtils::toQString(candidate.connectionName()))) {
                    QMessageBox::warning(this, "Invalid connection",
                        QString("Connection \"%1\" already exists.").arg(QtUtils::toQString(candidate.connectionName())));
                    return;
                }
                _store->save(candidate, password);
            } else {
                _store->update(_originalName, candidate, password);
            }
        } catch (const MongoGuiException &ex) {
            QMessageBox::critical(this, "Cannot save connection", ex.message());
            return;
        }

        _connection = candidate;
        QDialog::accept();
    }

    void ConnectionDialog::testConnection()
    {
        if (_thread)
            return;

        const ConnectionSettings candidate = collectConnection();
        const QString problem = Validators::validateConnection(candidate);
        if (!problem.isEmpty()) {
            _testResult->setText(QString("<span style='color: #CD0000;'>%1</span>").arg(problem.toHtmlEscaped()));
            return;
        }

        QString password = _userPassword->text();
        if (password.isEmpty() && !_originalName.isEmpty() && candidate.credential().enabled()) {
            try {
                password = QtUtils::toQString(_store->resolve(_originalName).credential().userPassword());
            } catch (const MongoGuiException &ex) {
                LOG_MSG(ex.message(), mongo::logger::LogSeverity::Warning());
            }
        }

        ConnectionStore *store = _store;
        std::shared_ptr<ConnectionTestResult> result = std::make_shared<ConnectionTestResult>();
        _pendingResult = result;

        QueryThread *thread = new QueryThread([=]() {
            *result = store->test(candidate, password);
        }, this);
        VERIFY(connect(thread, SIGNAL(succeeded()), this, SLOT(showTestResult())));
        VERIFY(connect(thread, SIGNAL(finished()), this, SLOT(testFinished())));
        VERIFY(connect(thread, SIGNAL(finished()), thread, SLOT(deleteLater())));
        _thread = thread;

        _testButton->setEnabled(false);
        _testResult->setText("Connecting...");
        thread->start();
    }

    void ConnectionDialog::showTestResult()
    {
        if (!_pendingResult)
            return;

        if (_pendingResult->_ok) {
            _testResult->setText("<span style='color: #00A000;'>Connected and pinged the server.</span>");
        } else {
            _testResult->setText(QString("<span style='color: #CD0000;'>%1</span>")
                .arg(_pendingResult->_reason.toHtmlEscaped()));
        }
        _pendingResult.reset();
    }

    void ConnectionDialog::testFinished()
    {
        _thread = NULL;
        _testButton->setEnabled(true);
    }

    void ConnectionDialog::authChanged()
    {
        const bool enabled = !_userName->text().trimmed().isEmpty();
        _userPassword->setEnabled(enabled);
        _authDatabase->setEnabled(enabled);
        _mechanism->setEnabled(enabled);
    }
}
