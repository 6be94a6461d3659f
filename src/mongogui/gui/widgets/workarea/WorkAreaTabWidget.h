#pragma once

#include <QTabWidget>

namespace MongoGui
{
    class ConnectionSettings;
    class QueryWidget;

    /**
     * @brief Central widget of the main window. Each tab is a query over
     *        one collection of one profile.
     */
    class WorkAreaTabWidget : public QTabWidget
    {
        Q_OBJECT

    public:
        typedef QTabWidget BaseClass;
        explicit WorkAreaTabWidget(QWidget *parent = 0);

        QueryWidget *currentQueryWidget() const;
        QueryWidget *queryWidget(int index) const;

    public Q_SLOTS:
        // profile is resolved, password included
        void openQueryTab(const MongoGui::ConnectionSettings &profile, const QString &collection);
        void closeTab(int index);
        void closeCurrentTab();
        void nextTab();
        void previousTab();
    };
}
