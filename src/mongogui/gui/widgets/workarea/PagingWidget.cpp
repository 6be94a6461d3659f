#include "mongogui/gui/widgets/workarea/PagingWidget.h"

#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QRegExpValidator>

#include "mongogui/core/utils/QtUtils.h"
#include "mongogui/core/AppRegistry.h"
#include "mongogui/core/settings/SettingsManager.h"
#include "mongogui/gui/GuiRegistry.h"

namespace
{
    QPushButton *createButtonWithIcon(const QIcon &icon)
    {
        QPushButton *button = new QPushButton;
        button->setIcon(icon);
        button->setFixedSize(24, 24);
        button->setFlat(true);
        return button;
    }
}

namespace MongoGui
{
    PagingWidget::PagingWidget(QWidget *parent)
        :BaseClass(parent)
    {
        _pageEdit = new QLineEdit;
        _pageSizeEdit = new QLineEdit;
        _pageEdit->setAlignment(Qt::AlignHCenter);
        _pageEdit->setToolTip("Page");
        _pageSizeEdit->setAlignment(Qt::AlignHCenter);
        _pageSizeEdit->setToolTip("Page Size (number of documents shown at once)");

        QFontMetrics metrics = _pageEdit->fontMetrics();
        int width = metrics.boundingRect("00000000").width();
        // Both stay far below INT_MAX, larger offsets are answered with an empty page
        _pageEdit->setValidator(new QRegExpValidator(QRegExp("[1-9]\\d{0,8}"), this));
        _pageSizeEdit->setValidator(new QRegExpValidator(QRegExp("[1-9]\\d{0,4}"), this));
        _pageEdit->setFixedWidth(width);
        _pageSizeEdit->setFixedWidth(width);

        _summary = new QLabel;
        _summary->setContentsMargins(6, 0, 6, 0);

        _leftButton = createButtonWithIcon(GuiRegistry::instance().leftIcon());
        _rightButton = createButtonWithIcon(GuiRegistry::instance().rightIcon());
        VERIFY(connect(_leftButton, SIGNAL(clicked()), this, SLOT(leftButton_clicked())));
        VERIFY(connect(_rightButton, SIGNAL(clicked()), this, SLOT(rightButton_clicked())));

        VERIFY(connect(_pageSizeEdit, SIGNAL(returnPressed()), this, SLOT(refresh())));
        VERIFY(connect(_pageEdit, SIGNAL(returnPressed()), this, SLOT(refresh())));

        QHBoxLayout *layout = new QHBoxLayout();
        layout->setSpacing(0);
        layout->setContentsMargins(0, 0, 0, 0);

        layout->addWidget(_summary);
        layout->addWidget(_leftButton);
        layout->addWidget(_pageEdit);
        layout->addSpacing(1);
        layout->addWidget(_pageSizeEdit);
        layout->addWidget(_rightButton);
        setLayout(layout);

        setPage(1);
        setPageSize(AppRegistry::instance().settingsManager()->pageSize());
        _leftButton->setEnabled(false);
        _rightButton->setEnabled(false);
    }

    void PagingWidget::setPage(int page)
    {
        _pageEdit->setText(QString::number(page < 1 ? 1 : page));
    }

    void PagingWidget::setPageSize(int pageSize)
    {
        if (pageSize <= 0)
            pageSize = AppRegistry::instance().settingsManager()->pageSize();

        _pageSizeEdit->setText(QString::number(pageSize));
    }

    void PagingWidget::setResultInfo(int page, int pageSize, int documentsOnPage, long long totalKnown, bool hasMore)
    {
        setPage(page);
        setPageSize(pageSize);
        _leftButton->setEnabled(page > 1);
        _rightButton->setEnabled(hasMore);

        if (documentsOnPage == 0) {
            _summary->setText("No documents");
            return;
        }

        const long long first = totalKnown - documentsOnPage + 1;
        _summary->setText(QString("%1 - %2%3").arg(first).arg(totalKnown).arg(hasMore ? " (more)" : ""));
    }

    int PagingWidget::page() const
    {
        const int page = _pageEdit->text().toInt();
        return page < 1 ? 1 : page;
    }

    int PagingWidget::pageSize() const
    {
        const int pageSize = _pageSizeEdit->text().toInt();
        return pageSize < 1 ? AppRegistry::instance().settingsManager()->pageSize() : pageSize;
    }

    void PagingWidget::refresh()
    {
        emit refreshed(page(), pageSize());
    }

    void PagingWidget::leftButton_clicked()
    {
        emit leftClicked(page(), pageSize());
    }

    void PagingWidget::rightButton_clicked()
    {
        emit rightClicked(page(), pageSize());
    }
}
