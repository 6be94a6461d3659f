#include "mongogui/gui/GuiRegistry.h"

#include <QApplication>
#include <QPalette>
#include <QStyle>

namespace MongoGui
{
    GuiRegistry::GuiRegistry()
    {
        QStyle *style = QApplication::style();
        _serverIcon = style->standardIcon(QStyle::SP_DriveNetIcon);
        _collectionIcon = style->standardIcon(QStyle::SP_FileDialogDetailedView);
        _indexIcon = style->standardIcon(QStyle::SP_FileDialogListView);
        _connectIcon = style->standardIcon(QStyle::SP_DialogApplyButton);
        _executeIcon = style->standardIcon(QStyle::SP_MediaPlay);
        _explainIcon = style->standardIcon(QStyle::SP_FileDialogInfoView);
        _deleteIcon = style->standardIcon(QStyle::SP_TrashIcon);
        _leftIcon = style->standardIcon(QStyle::SP_ArrowLeft);
        _rightIcon = style->standardIcon(QStyle::SP_ArrowRight);
        _mainWindowIcon = style->standardIcon(QStyle::SP_ComputerIcon);
    }

    GuiRegistry::~GuiRegistry()
    {
    }

    void GuiRegistry::setAlternatingColor(QAbstractItemView *view)
    {
        QPalette p = view->palette();
        p.setColor(QPalette::AlternateBase, QColor(243, 248, 250));
        view->setPalette(p);
    }

    const QIcon &GuiRegistry::serverIcon() const { return _serverIcon; }
    const QIcon &GuiRegistry::collectionIcon() const { return _collectionIcon; }
    const QIcon &GuiRegistry::indexIcon() const { return _indexIcon; }
    const QIcon &GuiRegistry::connectIcon() const { return _connectIcon; }
    const QIcon &GuiRegistry::executeIcon() const { return _executeIcon; }
    const QIcon &GuiRegistry::explainIcon() const { return _explainIcon; }
    const QIcon &GuiRegistry::deleteIcon() const { return _deleteIcon; }
    const QIcon &GuiRegistry::leftIcon() const { return _leftIcon; }
    const QIcon &GuiRegistry::rightIcon() const { return _rightIcon; }
    const QIcon &GuiRegistry::mainWindowIcon() const { return _mainWindowIcon; }
}
