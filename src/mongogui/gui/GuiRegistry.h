#pragma once

#include <QIcon>
#include <QAbstractItemView>

namespace MongoGui
{
    /**
     * @brief GuiRegistry is a simple registry-like singleton, that provides
     *        access to icons shared by windows and caches them.
     *        Icons come from the current QStyle.
     */
    class GuiRegistry
    {
    public:
        /**
         * @brief Returns single instance of GuiRegistry
         */
        static GuiRegistry &instance()
        {
            static GuiRegistry _instance;
            return _instance;
        }

        void setAlternatingColor(QAbstractItemView *view);

        const QIcon &serverIcon() const;
        const QIcon &collectionIcon() const;
        const QIcon &indexIcon() const;
        const QIcon &connectIcon() const;
        const QIcon &executeIcon() const;
        const QIcon &explainIcon() const;
        const QIcon &deleteIcon() const;
        const QIcon &leftIcon() const;
        const QIcon &rightIcon() const;
        const QIcon &mainWindowIcon() const;

    private:
        GuiRegistry();
        ~GuiRegistry();

        QIcon _serverIcon;
        QIcon _collectionIcon;
        QIcon _indexIcon;
        QIcon _connectIcon;
        QIcon _executeIcon;
        QIcon _explainIcon;
        QIcon _deleteIcon;
        QIcon _leftIcon;
        QIcon _rightIcon;
        QIcon _mainWindowIcon;
    };
}
