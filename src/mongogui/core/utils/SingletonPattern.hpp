#pragma once

namespace Patterns
{
    /**
     * @brief Meyers singleton. Instance is created on first use and
     *        destroyed at program exit.
     */
    template <class T>
    class LazySingleton
    {
    public:
        typedef LazySingleton<T> class_type;
        static T &instance();

    protected:
        LazySingleton() {}
        ~LazySingleton() {}

    private:
        LazySingleton(class_type const &) = delete;
        LazySingleton &operator=(class_type const &rhs) = delete;
    };

    template <class T>
    T &LazySingleton<T>::instance()
    {
        static T self;
        return self;
    }
}
