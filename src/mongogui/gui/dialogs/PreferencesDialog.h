#pragma  once

#include <QDialog>
QT_BEGIN_NAMESPACE
class QComboBox;
class QFontComboBox;
class QSpinBox;
QT_END_NAMESPACE

namespace MongoGui
{
    class PreferencesDialog : public QDialog
    {
        Q_OBJECT

    public:
        typedef QDialog BaseClass;
        explicit PreferencesDialog(QWidget *parent);
    public Q_SLOTS:
        virtual void accept();
    private:
        void syncWithSettings();
    private:
        QSpinBox *_pageSizeSpinBox;
        QSpinBox *_timeoutSpinBox;
        QSpinBox *_sampleSizeSpinBox;
        QComboBox *_aggregatePagingComboBox;
        QFontComboBox *_fontComboBox;
        QSpinBox *_fontSizeSpinBox;
    };
}
