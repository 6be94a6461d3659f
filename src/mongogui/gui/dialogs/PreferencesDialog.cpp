#include "mongogui/gui/dialogs/PreferencesDialog.h"

#include <QComboBox>
#include <QDialogButtonBox>
#include <QFontComboBox>
#include <QFormLayout>
#include <QMessageBox>
#include <QPushButton>
#include <QSpinBox>
#include <QVBoxLayout>

#include "mongogui/gui/GuiRegistry.h"
#include "mongogui/core/utils/QtUtils.h"
#include "mongogui/core/AppRegistry.h"
#include "mongogui/core/settings/SettingsManager.h"

namespace MongoGui
{
    PreferencesDialog::PreferencesDialog(QWidget *parent)
        : BaseClass(parent)
    {
        setWindowIcon(GuiRegistry::instance().mainWindowIcon());

        setWindowTitle("Preferences");
        setWindowFlags(windowFlags() & ~Qt::WindowContextHelpButtonHint);

        _pageSizeSpinBox = new QSpinBox;
        _pageSizeSpinBox->setRange(1, 10000);

        _timeoutSpinBox = new QSpinBox;
        _timeoutSpinBox->setRange(1, 3600);
        _timeoutSpinBox->setSuffix(" sec");

        _sampleSizeSpinBox = new QSpinBox;
        _sampleSizeSpinBox->setRange(1, 10000);

        _aggregatePagingComboBox = new QComboBox;
        for (int i = AutoPaging; i <= ClientPaging; ++i) {
            _aggregatePagingComboBox->addItem(convertAggregatePagingToString(static_cast<AggregatePaging>(i)));
        }
        _aggregatePagingComboBox->setToolTip(
            "auto: $skip/$limit stages are appended unless the pipeline pages or writes its output itself\n"
            "server: stages are always appended\n"
            "client: documents are skipped while reading the cursor");

        _fontComboBox = new QFontComboBox;
        _fontComboBox->setFontFilters(QFontComboBox::MonospacedFonts);
        _fontSizeSpinBox = new QSpinBox;
        _fontSizeSpinBox->setRange(0, 72);
        _fontSizeSpinBox->setSpecialValueText("Default");

        QFormLayout *form = new QFormLayout;
        form->addRow("Page size:", _pageSizeSpinBox);
        form->addRow("Connection timeout:", _timeoutSpinBox);
        form->addRow("Aggregation paging:", _aggregatePagingComboBox);
        form->addRow("Sample size:", _sampleSizeSpinBox);
        form->addRow("Editor font:", _fontComboBox);
        form->addRow("Editor font size:", _fontSizeSpinBox);

        QDialogButtonBox *buttonBox = new QDialogButtonBox(this);
        buttonBox->setOrientation(Qt::Horizontal);
        buttonBox->setStandardButtons(QDialogButtonBox::Cancel | QDialogButtonBox::Save);
        VERIFY(connect(buttonBox, SIGNAL(accepted()), this, SLOT(accept())));
        VERIFY(connect(buttonBox, SIGNAL(rejected()), this, SLOT(reject())));

        QVBoxLayout *layout = new QVBoxLayout(this);
        layout->addLayout(form);
        layout->addWidget(buttonBox);
        setLayout(layout);

        syncWithSettings();
    }

    void PreferencesDialog::syncWithSettings()
    {
        const SettingsManager *settings = AppRegistry::instance().settingsManager();
        _pageSizeSpinBox->setValue(settings->pageSize());
        _timeoutSpinBox->setValue(settings->mongoTimeoutSec());
        _sampleSizeSpinBox->setValue(settings->sampleSize());
        _aggregatePagingComboBox->setCurrentText(convertAggregatePagingToString(settings->aggregatePaging()));
        if (!settings->textFontFamily().isEmpty())
            _fontComboBox->setCurrentFont(QFont(settings->textFontFamily()));
        _fontSizeSpinBox->setValue(settings->textFontPointSize() > 0 ? settings->textFontPointSize() : 0);
    }

    void PreferencesDialog::accept()
    {
        SettingsManager *settings = AppRegistry::instance().settingsManager();
        settings->setPageSize(_pageSizeSpinBox->value());
        settings->setMongoTimeoutSec(_timeoutSpinBox->value());
        settings->setSampleSize(_sampleSizeSpinBox->value());
        settings->setAggregatePaging(convertStringToAggregatePaging(_aggregatePagingComboBox->currentText()));
        settings->setTextFontFamily(_fontComboBox->currentFont().family());
        settings->setTextFontPointSize(_fontSizeSpinBox->value());

        if (!settings->save()) {
            QMessageBox::warning(this, "Preferences",
                QString("Settings could not be written to %1").arg(settings->configFilePath()));
        }

        AppRegistry::instance().applySettings();

        return BaseClass::accept();
    }
}
