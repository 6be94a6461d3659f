#include "mongogui/gui/editors/JsonEditor.h"

#include <QFont>
#include <QFontDatabase>
#include <QKeyEvent>
#include <Qsci/qscilexerjavascript.h>

#include "mongogui/core/AppRegistry.h"
#include "mongogui/core/settings/SettingsManager.h"
#include "mongogui/core/utils/QtUtils.h"

namespace
{
    int getNumberOfDigits(int x)
    {
        int digits = 1;
        while (x >= 10) {
            x /= 10;
            ++digits;
        }
        return digits;
    }

    QFont editorFont()
    {
        const MongoGui::SettingsManager *settings = MongoGui::AppRegistry::instance().settingsManager();
        QFont font = QFontDatabase::systemFont(QFontDatabase::FixedFont);
        if (!settings->textFontFamily().isEmpty())
            font.setFamily(settings->textFontFamily());
        if (settings->textFontPointSize() > 0)
            font.setPointSize(settings->textFontPointSize());
        return font;
    }
}

namespace MongoGui
{
    const QColor JsonEditor::caretForegroundColor = QColor("#000000");
    const QColor JsonEditor::matchedBraceForegroundColor = QColor("#FF8861");

    JsonEditor::JsonEditor(QWidget *parent) : BaseClass(parent),
        _lineNumberMarginWidth(0),
        _lineNumberDigitWidth(0)
    {
        const QFont font = editorFont();

        QsciLexerJavaScript *lexer = new QsciLexerJavaScript(this);
        lexer->setDefaultFont(font);
        lexer->setFont(font);
        setLexer(lexer);

        setAutoIndent(true);
        setIndentationsUseTabs(false);
        setIndentationWidth(indentationWidth);
        setUtf8(true);
        setMarginWidth(1, 0);
        setCaretForegroundColor(caretForegroundColor);
        setMatchedBraceForegroundColor(matchedBraceForegroundColor);
        setBraceMatching(QsciScintilla::StrictBraceMatch);
        setContentsMargins(0, 0, 0, 0);
        setMarginsFont(font);
        setMarginLineNumbers(0, true);
        setMarginsForegroundColor(QColor(173, 176, 178));
        setWrapMode(QsciScintilla::WrapNone);

        _lineNumberDigitWidth = textWidth(STYLE_LINENUMBER, "0");
        updateLineNumbersMarginWidth();
        setLineNumbers(false);

        VERIFY(connect(this, SIGNAL(linesChanged()), this, SLOT(updateLineNumbersMarginWidth())));
    }

    int JsonEditor::lineNumberMarginWidth() const
    {
        return marginWidth(0);
    }

    int JsonEditor::textWidth(int style, const QString &text)
    {
        const QByteArray utf8 = text.toUtf8();
        return SendScintilla(SCI_TEXTWIDTH, style, utf8.constData());
    }

    void JsonEditor::setLineNumbers(bool displayNumbers)
    {
        setMarginWidth(0, displayNumbers ? _lineNumberMarginWidth : 0);
    }

    void JsonEditor::keyPressEvent(QKeyEvent *keyEvent)
    {
        if ((keyEvent->modifiers() & Qt::ControlModifier) &&
            (keyEvent->key() == Qt::Key_Return || keyEvent->key() == Qt::Key_Enter)) {
            keyEvent->accept();
            emit executeRequested();
            return;
        }

        if (keyEvent->key() == Qt::Key_F11) {
            keyEvent->accept();
            setLineNumbers(!lineNumberMarginWidth());
            return;
        }

        BaseClass::keyPressEvent(keyEvent);
    }

    void JsonEditor::updateLineNumbersMarginWidth()
    {
        int numberOfDigits = getNumberOfDigits(lines());
        _lineNumberMarginWidth = numberOfDigits * _lineNumberDigitWidth + rowNumberWidth;

        // If line numbers margin already displayed, update its width
        if (lineNumberMarginWidth()) {
            setMarginWidth(0, _lineNumberMarginWidth);
        }
    }
}
