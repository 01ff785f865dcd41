#include "PythonLexer.hpp"

#include <QtCore/QLatin1String>

namespace Enclave {

namespace {

const char* const keywords[] = {
    "False", "None", "True", "and", "as", "assert", "async", "await",
    "break", "class", "continue", "def", "del", "elif", "else", "except",
    "finally", "for", "from", "global", "if", "import", "in", "is",
    "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
    "while", "with", "yield", nullptr
};

// Longest spellings first so that greedy matching is correct
const char* const operators[] = {
    "**=", "//=", ">>=", "<<=", "...",
    "!=", "%=", "&=", "**", "*=", "+=", "-=", "->", "//", "/=", ":=",
    "<<", "<=", "==", ">=", ">>", "@=", "^=", "|=",
    "%", "&", "(", ")", "*", "+", ",", "-", ".", "/", ":", ";",
    "<", "=", ">", "@", "[", "]", "^", "{", "|", "}", "~",
    nullptr
};

bool isStringPrefix(const QString& word) {
    const QString lower = word.toLower();
    return lower == "r" || lower == "u" || lower == "b" || lower == "f" ||
           lower == "br" || lower == "rb" || lower == "fr" || lower == "rf";
}

bool isIdentifierStart(QChar c) {
    return c == QLatin1Char('_') || c.isLetter();
}

bool isIdentifierPart(QChar c) {
    return c == QLatin1Char('_') || c.isLetterOrNumber() ||
           c.category() == QChar::Mark_NonSpacing ||
           c.category() == QChar::Mark_SpacingCombining;
}

QChar closerFor(QChar opener) {
    switch (opener.unicode()) {
    case '(': return QLatin1Char(')');
    case '[': return QLatin1Char(']');
    default: return QLatin1Char('}');
    }
}

class Tokenizer {
public:
    explicit Tokenizer(const QString& source) : src_(source) {
        src_.replace(QLatin1String("\r\n"), QLatin1String("\n"));
        src_.replace(QLatin1Char('\r'), QLatin1Char('\n'));
    }

    Expected<QList<Token>, SyntaxError> run() {
        while (!failed_ && pos_ < src_.size()) {
            if (atLineStart_ && brackets_.isEmpty()) {
                handleIndentation();
                continue;
            }
            scanToken();
        }

        if (!failed_ && !brackets_.isEmpty()) {
            const Bracket& open = brackets_.last();
            fail(QString("'%1' was never closed").arg(open.ch), open.line, open.column);
        }
        if (failed_) {
            return makeUnexpected(error_);
        }

        if (!tokens_.isEmpty() && tokens_.last().type != TokenType::Newline &&
            tokens_.last().type != TokenType::Dedent) {
            push(TokenType::Newline, QString(), line_, column());
        }
        while (indents_.size() > 1) {
            indents_.removeLast();
            push(TokenType::Dedent, QString(), line_, 1);
        }
        push(TokenType::EndMarker, QString(), line_, column());
        return tokens_;
    }

private:
    struct Bracket {
        QChar ch;
        int line;
        int column;
    };

    QChar peek(int offset = 0) const {
        const int index = pos_ + offset;
        return index < src_.size() ? src_.at(index) : QChar();
    }

    void advance() {
        if (src_.at(pos_) == QLatin1Char('\n')) {
            ++line_;
            lineStart_ = pos_ + 1;
        }
        ++pos_;
    }

    int column() const { return pos_ - lineStart_ + 1; }

    void push(TokenType type, const QString& text, int line, int col) {
        Token token;
        token.type = type;
        token.text = text;
        token.line = line;
        token.column = col;
        tokens_.append(token);
    }

    void fail(const QString& message, int line, int col) {
        if (failed_) {
            return;
        }
        failed_ = true;
        error_.message = message;
        error_.line = line;
        error_.column = col;
    }

    void skipComment() {
        while (pos_ < src_.size() && peek() != QLatin1Char('\n')) {
            advance();
        }
    }

    // Measures the indentation of a physical line and emits INDENT/DEDENT.
    // Blank and comment-only lines are consumed without producing tokens.
    void handleIndentation() {
        int width = 0;
        while (pos_ < src_.size()) {
            const QChar c = peek();
            if (c == QLatin1Char(' ')) {
                ++width;
            } else if (c == QLatin1Char('\t')) {
                width = (width / 8 + 1) * 8;
            } else if (c == QLatin1Char('\f')) {
                width = 0;
            } else {
                break;
            }
            advance();
        }

        if (pos_ >= src_.size()) {
            return;
        }
        if (peek() == QLatin1Char('#')) {
            skipComment();
        }
        if (pos_ < src_.size() && peek() == QLatin1Char('\n')) {
            advance();
            return;
        }
        if (pos_ >= src_.size()) {
            return;
        }

        if (width > indents_.last()) {
            indents_.append(width);
            push(TokenType::Indent, QString(), line_, column());
        } else {
            while (width < indents_.last()) {
                indents_.removeLast();
                push(TokenType::Dedent, QString(), line_, column());
            }
            if (width != indents_.last()) {
                fail("unindent does not match any outer indentation level", line_, column());
                return;
            }
        }
        atLineStart_ = false;
    }

    void scanToken() {
        const QChar c = peek();

        if (c == QLatin1Char('\n')) {
            const int line = line_;
            const int col = column();
            advance();
            if (brackets_.isEmpty()) {
                if (!tokens_.isEmpty() && tokens_.last().type != TokenType::Newline) {
                    push(TokenType::Newline, QString(), line, col);
                }
                atLineStart_ = true;
            }
            return;
        }

        if (c == QLatin1Char(' ') || c == QLatin1Char('\t') || c == QLatin1Char('\f')) {
            advance();
            return;
        }

        if (c == QLatin1Char('#')) {
            skipComment();
            return;
        }

        if (c == QLatin1Char('\\')) {
            if (peek(1) == QLatin1Char('\n')) {
                advance();
                advance();
            } else if (pos_ + 1 >= src_.size()) {
                fail("unexpected EOF while parsing", line_, column());
            } else {
                fail("unexpected character after line continuation character", line_, column());
            }
            return;
        }

        if (isIdentifierStart(c)) {
            scanName();
            return;
        }

        if (c.isDigit() || (c == QLatin1Char('.') && peek(1).isDigit())) {
            scanNumber();
            return;
        }

        if (c == QLatin1Char('\'') || c == QLatin1Char('"')) {
            scanString(pos_, line_, column());
            return;
        }

        scanOperator();
    }

    void scanName() {
        const int start = pos_;
        const int line = line_;
        const int col = column();
        while (pos_ < src_.size() && isIdentifierPart(peek())) {
            advance();
        }

        const QString word = src_.mid(start, pos_ - start);
        if (isStringPrefix(word) && (peek() == QLatin1Char('\'') || peek() == QLatin1Char('"'))) {
            scanString(start, line, col);
            return;
        }
        push(TokenType::Name, word, line, col);
    }

    void scanNumber() {
        const int start = pos_;
        const int line = line_;
        const int col = column();

        auto consumeDigits = [this](bool hex) {
            while (pos_ < src_.size()) {
                const QChar d = peek();
                const bool hexDigit = hex && ((d >= QLatin1Char('a') && d <= QLatin1Char('f')) ||
                                              (d >= QLatin1Char('A') && d <= QLatin1Char('F')));
                if (!d.isDigit() && d != QLatin1Char('_') && !hexDigit) {
                    break;
                }
                advance();
            }
        };

        const QChar radix = peek(1).toLower();
        if (peek() == QLatin1Char('0') &&
            (radix == QLatin1Char('x') || radix == QLatin1Char('o') || radix == QLatin1Char('b'))) {
            advance();
            advance();
            consumeDigits(radix == QLatin1Char('x'));
        } else {
            consumeDigits(false);
            if (peek() == QLatin1Char('.')) {
                advance();
                consumeDigits(false);
            }
            if (peek() == QLatin1Char('e') || peek() == QLatin1Char('E')) {
                const QChar sign = peek(1);
                if (sign.isDigit() ||
                    ((sign == QLatin1Char('+') || sign == QLatin1Char('-')) && peek(2).isDigit())) {
                    advance();
                    if (!peek().isDigit()) {
                        advance();
                    }
                    consumeDigits(false);
                }
            }
            if (peek() == QLatin1Char('j') || peek() == QLatin1Char('J')) {
                advance();
            }
        }

        if (pos_ < src_.size() && isIdentifierStart(peek())) {
            fail("invalid decimal literal", line_, column());
            return;
        }
        push(TokenType::Number, src_.mid(start, pos_ - start), line, col);
    }

    // start points at the prefix (if any); pos_ at the opening quote
    void scanString(int start, int line, int col) {
        const QChar quote = peek();
        const bool triple = peek(1) == quote && peek(2) == quote;
        advance();
        if (triple) {
            advance();
            advance();
        }

        while (true) {
            if (pos_ >= src_.size()) {
                if (triple) {
                    fail(QString("unterminated triple-quoted string literal (detected at line %1)").arg(line_),
                         line, col);
                } else {
                    fail("unterminated string literal", line, col);
                }
                return;
            }

            const QChar c = peek();
            if (c == QLatin1Char('\\')) {
                advance();
                if (pos_ < src_.size()) {
                    advance();
                }
                continue;
            }
            if (c == QLatin1Char('\n') && !triple) {
                fail("unterminated string literal", line, col);
                return;
            }
            if (c == quote) {
                if (!triple) {
                    advance();
                    break;
                }
                if (peek(1) == quote && peek(2) == quote) {
                    advance();
                    advance();
                    advance();
                    break;
                }
            }
            advance();
        }

        push(TokenType::String, src_.mid(start, pos_ - start), line, col);
    }

    void scanOperator() {
        const int line = line_;
        const int col = column();

        for (int i = 0; operators[i]; ++i) {
            const QLatin1String op(operators[i]);
            if (src_.mid(pos_, op.size()) != op) {
                continue;
            }

            const QChar first = op.at(0);
            if (op.size() == 1 && (first == QLatin1Char('(') || first == QLatin1Char('[') ||
                                   first == QLatin1Char('{'))) {
                brackets_.append(Bracket{first, line, col});
            } else if (op.size() == 1 && (first == QLatin1Char(')') || first == QLatin1Char(']') ||
                                          first == QLatin1Char('}'))) {
                if (brackets_.isEmpty()) {
                    fail(QString("unmatched '%1'").arg(first), line, col);
                    return;
                }
                const Bracket open = brackets_.takeLast();
                if (closerFor(open.ch) != first) {
                    fail(QString("closing parenthesis '%1' does not match opening parenthesis '%2'")
                             .arg(first).arg(open.ch),
                         line, col);
                    return;
                }
            }

            for (int n = 0; n < op.size(); ++n) {
                advance();
            }
            push(TokenType::Operator, QString(op), line, col);
            return;
        }

        const QChar c = peek();
        fail(QString("invalid character '%1' (U+%2)")
                 .arg(c)
                 .arg(static_cast<uint>(c.unicode()), 4, 16, QLatin1Char('0')),
             line, col);
    }

    QString src_;
    int pos_ = 0;
    int line_ = 1;
    int lineStart_ = 0;
    bool atLineStart_ = true;
    bool failed_ = false;
    SyntaxError error_;
    QList<Token> tokens_;
    QList<int> indents_{0};
    QList<Bracket> brackets_;
};

} // namespace

QString SyntaxError::describe() const {
    return QString("%1 (line %2, column %3)").arg(message).arg(line).arg(column);
}

Expected<QList<Token>, SyntaxError> PythonLexer::tokenize(const QString& source) {
    Tokenizer tokenizer(source);
    return tokenizer.run();
}

bool PythonLexer::isKeyword(const QString& word) {
    for (int i = 0; keywords[i]; ++i) {
        if (word == QLatin1String(keywords[i])) {
            return true;
        }
    }
    return false;
}

} // namespace Enclave
