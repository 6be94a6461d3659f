#pragma once

#include <exception>
#include <QByteArray>
#include <QString>

namespace MongoGui
{
    /**
     * @brief Base of all errors raised by the connection store and the
     *        query executor. Message is kept as QString for the UI.
     */
    class MongoGuiException : public std::exception
    {
    public:
        explicit MongoGuiException(const QString &s) : std::exception(), _msg(s)
        {
            _bytes = _msg.toUtf8();
        }
        ~MongoGuiException() throw() {}

        virtual const char *what() const throw()
        {
            return _bytes.data();
        }

        const QString &message() const { return _msg; }

    private:
        QString _msg;
        QByteArray _bytes;
    };

    // Profile file, template file or secret store could not be read or written
    class PersistenceError : public MongoGuiException
    {
    public:
        explicit PersistenceError(const QString &s) : MongoGuiException(s) {}
    };

    // No profile or template with the requested name
    class NotFoundError : public MongoGuiException
    {
    public:
        explicit NotFoundError(const QString &s) : MongoGuiException(s) {}
    };

    // Profile fields or template name rejected before anything is written
    class ValidationError : public MongoGuiException
    {
    public:
        explicit ValidationError(const QString &s) : MongoGuiException(s) {}
    };

    // Query text is not valid JSON
    class ParseError : public MongoGuiException
    {
    public:
        explicit ParseError(const QString &s) : MongoGuiException(s) {}
    };

    // JSON is valid but neither a filter object nor an array of stages
    class InvalidQueryShapeError : public MongoGuiException
    {
    public:
        explicit InvalidQueryShapeError(const QString &s) : MongoGuiException(s) {}
    };

    class ConnectionError : public MongoGuiException
    {
    public:
        explicit ConnectionError(const QString &s) : MongoGuiException(s) {}
    };

    // Server rejected the operation, message is the server's one
    class DriverError : public MongoGuiException
    {
    public:
        explicit DriverError(const QString &s) : MongoGuiException(s) {}
    };
}
