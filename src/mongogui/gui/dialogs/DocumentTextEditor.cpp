#include "mongogui/gui/dialogs/DocumentTextEditor.h"

#include <QDialogButtonBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QMessageBox>
#include <QPushButton>
#include <QSettings>
#include <QVBoxLayout>

#include "mongogui/core/Exceptions.h"
#include "mongogui/core/engine/QueryParser.h"
#include "mongogui/core/utils/QtUtils.h"
#include "mongogui/gui/editors/JsonEditor.h"

namespace
{
    const QSize DefaultSize(800, 400);
    const QString SizeKey("DocumentTextEditor/size");
}

namespace MongoGui
{
    DocumentTextEditor::DocumentTextEditor(const QString &title, const QString &json, bool readonly, QWidget *parent) :
        BaseClass(parent),
        _documentText(new JsonEditor(this)),
        _status(new QLabel(this)),
        _readonly(readonly)
    {
        setWindowTitle(title);
        setWindowFlags(Qt::Window | Qt::WindowMaximizeButtonHint | Qt::WindowCloseButtonHint);
        setMinimumSize(DefaultSize / 2);

        _documentText->setLineNumbers(true);
        _documentText->setText(json);
        _documentText->setModified(false);
        _documentText->setReadOnly(_readonly);

        QDialogButtonBox *buttonBox = new QDialogButtonBox(Qt::Horizontal, this);
        VERIFY(connect(buttonBox, SIGNAL(accepted()), this, SLOT(accept())));
        VERIFY(connect(buttonBox, SIGNAL(rejected()), this, SLOT(reject())));

        QHBoxLayout *bottomLayout = new QHBoxLayout;
        if (_readonly) {
            buttonBox->setStandardButtons(QDialogButtonBox::Close);
        } else {
            buttonBox->setStandardButtons(QDialogButtonBox::Save | QDialogButtonBox::Cancel);

            QPushButton *check = new QPushButton("Check");
            check->setToolTip("Parse the document without saving it");
            VERIFY(connect(check, SIGNAL(clicked()), this, SLOT(checkDocument())));

            QPushButton *format = new QPushButton("Format");
            VERIFY(connect(format, SIGNAL(clicked()), this, SLOT(formatDocument())));

            bottomLayout->addWidget(check);
            bottomLayout->addWidget(format);

            // _id is the key of the replace, it has to survive editing
            QString error;
            if (parse(error))
                _original = _obj;
        }
        bottomLayout->addWidget(_status, 1);
        bottomLayout->addWidget(buttonBox);

        QVBoxLayout *layout = new QVBoxLayout(this);
        layout->addWidget(_documentText, 1);
        layout->addLayout(bottomLayout);

        restoreWindowSettings();
    }

    QString DocumentTextEditor::jsonText() const
    {
        return _documentText->text().trimmed();
    }

    bool DocumentTextEditor::parse(QString &error)
    {
        try {
            _obj = QueryParser::parseObject(jsonText(), "Document");
        } catch (const MongoGuiException &ex) {
            error = ex.message();
            return false;
        }

        if (!_original.isEmpty()) {
            const mongo::BSONElement before = _original["_id"];
            const mongo::BSONElement after = _obj["_id"];
            if (after.eoo() || before.toString(false, true) != after.toString(false, true)) {
                error = QString("_id can't be changed, it must stay %1")
                    .arg(QtUtils::toQString(before.toString(false, true)));
                return false;
            }
        }

        return true;
    }

    void DocumentTextEditor::setStatus(const QString &text, bool ok)
    {
        _status->setText(text);
        _status->setToolTip(text);
        _status->setStyleSheet(ok ? "color: #2f7d32" : "color: #cd0000");
    }

    bool DocumentTextEditor::checkDocument()
    {
        QString error;
        const bool ok = parse(error);
        setStatus(ok ? "Document is valid" : error, ok);
        _documentText->setFocus();
        return ok;
    }

    void DocumentTextEditor::formatDocument()
    {
        if (!checkDocument())
            return;

        _documentText->setText(QtUtils::toQString(_obj.jsonString(mongo::Strict, 1)));
    }

    void DocumentTextEditor::accept()
    {
        if (_readonly) {
            saveWindowSettings();
            BaseClass::accept();
            return;
        }

        if (!checkDocument())
            return;

        saveWindowSettings();
        BaseClass::accept();
    }

    bool DocumentTextEditor::confirmDiscard()
    {
        if (_readonly || !_documentText->isModified())
            return true;

        int const answer = QMessageBox::question(this, windowTitle(),
            "Changes to the document are not saved. Discard them?",
            QMessageBox::Discard | QMessageBox::Cancel, QMessageBox::Cancel);

        return answer == QMessageBox::Discard;
    }

    void DocumentTextEditor::reject()
    {
        if (!confirmDiscard())
            return;

        saveWindowSettings();
        BaseClass::reject();
    }

    void DocumentTextEditor::saveWindowSettings() const
    {
        QSettings settings(PROJECT_NAME, PROJECT_NAME);
        settings.setValue(SizeKey, size());
    }

    void DocumentTextEditor::restoreWindowSettings()
    {
        QSettings settings(PROJECT_NAME, PROJECT_NAME);
        resize(settings.value(SizeKey, DefaultSize).toSize());
    }
}
