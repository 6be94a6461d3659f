#pragma once

#include <Qsci/qsciscintilla.h>

namespace MongoGui
{
    /**
     * @brief Scintilla editor for JSON text (queries, projections,
     *        documents). Highlighting comes from the JavaScript lexer.
     */
    class JsonEditor : public QsciScintilla
    {
        Q_OBJECT
    public:
        typedef QsciScintilla BaseClass;
        enum { rowNumberWidth = 6, indentationWidth = 4 };
        static const QColor caretForegroundColor;
        static const QColor matchedBraceForegroundColor;

        explicit JsonEditor(QWidget *parent = NULL);

        // Shows line numbers margin, hidden by default for one-line editors
        void setLineNumbers(bool displayNumbers);
        int lineNumberMarginWidth() const;

    Q_SIGNALS:
        // Ctrl+Enter
        void executeRequested();

    protected:
        void keyPressEvent(QKeyEvent *e);

    private Q_SLOTS:
        void updateLineNumbersMarginWidth();

    private:
        int textWidth(int style, const QString &text);
        int _lineNumberMarginWidth;
        int _lineNumberDigitWidth;
    };
}
