#pragma once

#include <QWidget>
QT_BEGIN_NAMESPACE
class QLineEdit;
class QLabel;
class QPushButton;
QT_END_NAMESPACE

namespace MongoGui
{
    class PagingWidget : public QWidget
    {
        Q_OBJECT

    public:
        typedef QWidget BaseClass;
        PagingWidget(QWidget *parent = NULL);

        // page is 1-based
        void setPage(int page);
        void setPageSize(int pageSize);

        /**
         * @brief Updates buttons and summary for the page just shown.
         */
        void setResultInfo(int page, int pageSize, int documentsOnPage, long long totalKnown, bool hasMore);

        int page() const;
        int pageSize() const;

    Q_SIGNALS:
        void leftClicked(int page, int pageSize);
        void rightClicked(int page, int pageSize);
        void refreshed(int page, int pageSize);

    private Q_SLOTS:
        void leftButton_clicked();
        void rightButton_clicked();
        void refresh();

    private:
        QLineEdit *_pageEdit;
        QLineEdit *_pageSizeEdit;
        QLabel *_summary;
        QPushButton *_leftButton;
        QPushButton *_rightButton;
    };
}
