#include "mongogui/gui/widgets/workarea/WorkAreaTabWidget.h"

#include "mongogui/core/settings/ConnectionSettings.h"
#include "mongogui/core/utils/QtUtils.h"
#include "mongogui/gui/GuiRegistry.h"
#include "mongogui/gui/widgets/workarea/QueryWidget.h"

namespace MongoGui
{
    WorkAreaTabWidget::WorkAreaTabWidget(QWidget *parent) :
        BaseClass(parent)
    {
        setTabsClosable(true);
        setMovable(true);
        setDocumentMode(true);
        setElideMode(Qt::ElideRight);

        VERIFY(connect(this, SIGNAL(tabCloseRequested(int)), this, SLOT(closeTab(int))));
    }

    void WorkAreaTabWidget::openQueryTab(const ConnectionSettings &profile, const QString &collection)
    {
        QueryWidget *query = new QueryWidget(profile, QtUtils::toStdString(collection), this);
        const QString location = QtUtils::toQString(profile.connectionName() + " / " + profile.defaultDatabase());

        const int index = addTab(query, GuiRegistry::instance().collectionIcon(), query->title());
        setTabToolTip(index, QString("%1 / %2").arg(location).arg(collection));
        setCurrentIndex(index);

        query->setQueryFocus();
        query->execute();
    }

    void WorkAreaTabWidget::closeTab(int index)
    {
        QueryWidget *query = queryWidget(index);
        if (!query)
            return;

        removeTab(index);
        delete query;
    }

    void WorkAreaTabWidget::closeCurrentTab()
    {
        closeTab(currentIndex());
    }

    void WorkAreaTabWidget::nextTab()
    {
        if (count() > 1)
            setCurrentIndex((currentIndex() + 1) % count());
    }

    void WorkAreaTabWidget::previousTab()
    {
        if (count() > 1)
            setCurrentIndex((currentIndex() + count() - 1) % count());
    }

    QueryWidget *WorkAreaTabWidget::currentQueryWidget() const
    {
        return qobject_cast<QueryWidget *>(currentWidget());
    }

    QueryWidget *WorkAreaTabWidget::queryWidget(int index) const
    {
        return qobject_cast<QueryWidget *>(widget(index));
    }
}
