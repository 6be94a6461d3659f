#pragma once

#include <QDialog>
#include <mongo/bson/bsonobj.h>

QT_BEGIN_NAMESPACE
class QLabel;
QT_END_NAMESPACE

namespace MongoGui
{
    class JsonEditor;

    /**
     * @brief Shows one document as JSON. In editable mode text must parse
     *        to a single object keeping the original _id before the dialog
     *        can be accepted.
     */
    class DocumentTextEditor : public QDialog
    {
        Q_OBJECT

    public:
        typedef QDialog BaseClass;

        DocumentTextEditor(const QString &title, const QString &json, bool readonly = false, QWidget *parent = 0);

        QString jsonText() const;

        /**
         * @brief Use returned BSONObj only if Dialog exec() method returns QDialog::Accepted
         */
        mongo::BSONObj bsonObj() const { return _obj; }

    public Q_SLOTS:
        void accept() override;
        void reject() override;

    private Q_SLOTS:
        bool checkDocument();
        void formatDocument();

    private:
        bool parse(QString &error);
        void setStatus(const QString &text, bool ok);
        bool confirmDiscard();
        void restoreWindowSettings();
        void saveWindowSettings() const;

        JsonEditor *_documentText;
        QLabel *_status;
        const bool _readonly;
        mongo::BSONObj _original;
        mongo::BSONObj _obj;
    };
}
