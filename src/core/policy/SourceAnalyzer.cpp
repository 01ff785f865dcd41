#include "SourceAnalyzer.hpp"

#include <QtCore/QSet>

namespace Enclave {

namespace {

const QSet<QString>& binaryOperators() {
    static const QSet<QString> ops = {
        "+", "-", "*", "/", "//", "%", "**", "@", "<<", ">>", "&", "|", "^", "~",
        "<", ">", "<=", ">=", "==", "!=", "=", "+=", "-=", "*=", "/=", "//=",
        "%=", "**=", ">>=", "<<=", "&=", "^=", "|=", "@=", "->", ":=", "."
    };
    return ops;
}

// Operators that may legitimately open a simple statement
const QSet<QString>& leadingOperators() {
    static const QSet<QString> ops = {"(", "[", "{", "-", "+", "~", "*", "..."};
    return ops;
}

const QSet<QString>& compoundKeywords() {
    static const QSet<QString> words = {
        "if", "elif", "else", "for", "while", "def", "class", "with", "try",
        "except", "finally"
    };
    return words;
}

bool isOpener(const Token& t) {
    return t.isOperator("(") || t.isOperator("[") || t.isOperator("{");
}

bool isCloser(const Token& t) {
    return t.isOperator(")") || t.isOperator("]") || t.isOperator("}");
}

bool isConstantName(const Token& t) {
    return t.isName("None") || t.isName("True") || t.isName("False");
}

bool isPlainName(const Token& t) {
    return t.type == TokenType::Name && !PythonLexer::isKeyword(t.text);
}

bool endsOperand(const Token& t) {
    return isPlainName(t) || isConstantName(t) || t.type == TokenType::Number ||
           t.type == TokenType::String || isCloser(t) || t.isOperator("...");
}

bool startsOperand(const Token& t) {
    return isPlainName(t) || isConstantName(t) || t.type == TokenType::Number ||
           t.type == TokenType::String;
}

bool isBinaryOperator(const Token& t) {
    return t.type == TokenType::Operator && binaryOperators().contains(t.text);
}

class StatementChecker {
public:
    explicit StatementChecker(const QList<Token>& tokens) : tokens_(tokens) {}

    Expected<SourceAnalysis, SyntaxError> run() {
        blockHistory_.append(QString());

        int i = 0;
        while (!failed_ && tokens_.at(i).type != TokenType::EndMarker) {
            const Token& t = tokens_.at(i);

            if (t.type == TokenType::Indent) {
                if (!expectIndent_) {
                    fail("unexpected indent", t);
                    break;
                }
                expectIndent_ = false;
                blockHistory_.append(QString());
                ++i;
                continue;
            }

            if (expectIndent_) {
                failMissingBlock(t);
                break;
            }

            if (t.type == TokenType::Dedent) {
                blockHistory_.removeLast();
                ++i;
                continue;
            }

            if (t.type == TokenType::Newline) {
                ++i;
                continue;
            }

            int end = i;
            while (tokens_.at(end).type != TokenType::Newline &&
                   tokens_.at(end).type != TokenType::EndMarker) {
                ++end;
            }
            checkLine(i, end);
            i = tokens_.at(end).type == TokenType::Newline ? end + 1 : end;
        }

        if (!failed_ && expectIndent_) {
            failMissingBlock(tokens_.last());
        }

        if (failed_) {
            return makeUnexpected(error_);
        }

        collectDynamicImports();
        return analysis_;
    }

private:
    void fail(const QString& message, const Token& at) {
        if (failed_) {
            return;
        }
        failed_ = true;
        error_.message = message;
        error_.line = at.line;
        error_.column = at.column;
    }

    void failMissingBlock(const Token& at) {
        fail(QString("expected an indented block after '%1' statement on line %2")
                 .arg(headerKeyword_).arg(headerLine_),
             at);
    }

    QString& lastStatement() { return blockHistory_.last(); }

    void checkLine(int begin, int end) {
        const Token& first = tokens_.at(begin);

        if (first.isOperator("@")) {
            if (end - begin < 2) {
                fail("invalid syntax", first);
                return;
            }
            checkExpression(begin + 1, end);
            lastStatement() = QStringLiteral("@");
            return;
        }

        int keywordIndex = begin;
        if (first.isName("async") && begin + 1 < end &&
            (tokens_.at(begin + 1).isName("def") || tokens_.at(begin + 1).isName("for") ||
             tokens_.at(begin + 1).isName("with"))) {
            keywordIndex = begin + 1;
        }

        const Token& keyword = tokens_.at(keywordIndex);
        if (keyword.type == TokenType::Name && compoundKeywords().contains(keyword.text)) {
            checkCompound(begin, keywordIndex, end);
            return;
        }

        if (isSoftKeywordHeader(begin, end)) {
            lastStatement() = QString();
            expectBlock(first);
            return;
        }

        if (lastStatement() == QLatin1String("@")) {
            fail("invalid syntax", first);
            return;
        }
        lastStatement() = QString();
        checkSimpleStatements(begin, end);
    }

    // "match subject:" and "case pattern:" lines
    bool isSoftKeywordHeader(int begin, int end) const {
        const Token& first = tokens_.at(begin);
        if (!(first.isName("match") || first.isName("case")) || end - begin < 3) {
            return false;
        }
        const Token& second = tokens_.at(begin + 1);
        if (second.type == TokenType::Operator && !isOpener(second) && !second.isOperator("-") &&
            !second.isOperator("*")) {
            return false;
        }
        return tokens_.at(end - 1).isOperator(":");
    }

    void expectBlock(const Token& header) {
        expectIndent_ = true;
        headerKeyword_ = header.text;
        headerLine_ = header.line;
    }

    void checkCompound(int begin, int keywordIndex, int end) {
        const Token& keyword = tokens_.at(keywordIndex);
        const QString word = keyword.text;
        const QString previous = lastStatement();

        if (previous == QLatin1String("@") && word != QLatin1String("def") &&
            word != QLatin1String("class")) {
            fail("invalid syntax", keyword);
            return;
        }

        if (word == QLatin1String("elif") &&
            previous != QLatin1String("if") && previous != QLatin1String("elif")) {
            fail("invalid syntax", keyword);
            return;
        }
        if (word == QLatin1String("else") &&
            previous != QLatin1String("if") && previous != QLatin1String("elif") &&
            previous != QLatin1String("for") && previous != QLatin1String("while") &&
            previous != QLatin1String("except")) {
            fail("invalid syntax", keyword);
            return;
        }
        if (word == QLatin1String("except") &&
            previous != QLatin1String("try") && previous != QLatin1String("except")) {
            fail("invalid syntax", keyword);
            return;
        }
        if (word == QLatin1String("finally") &&
            previous != QLatin1String("try") && previous != QLatin1String("except") &&
            previous != QLatin1String("try-else")) {
            fail("invalid syntax", keyword);
            return;
        }

        const int colon = findHeaderColon(keywordIndex + 1, end);
        if (colon < 0) {
            fail("expected ':'", tokens_.at(end - 1));
            return;
        }

        const int headerBegin = keywordIndex + 1;
        const bool bareHeader = word == QLatin1String("else") || word == QLatin1String("try") ||
                                word == QLatin1String("finally");
        if (bareHeader && colon != headerBegin) {
            fail("expected ':'", tokens_.at(headerBegin));
            return;
        }
        if (!bareHeader && word != QLatin1String("except") && colon == headerBegin) {
            fail("invalid syntax", tokens_.at(colon));
            return;
        }

        if (word == QLatin1String("def")) {
            if (!isPlainName(tokens_.at(headerBegin)) || headerBegin + 1 >= colon ||
                !tokens_.at(headerBegin + 1).isOperator("(")) {
                fail("invalid syntax", tokens_.at(headerBegin));
                return;
            }
        } else if (word == QLatin1String("class")) {
            if (!isPlainName(tokens_.at(headerBegin)) ||
                (headerBegin + 1 < colon && !tokens_.at(headerBegin + 1).isOperator("("))) {
                fail("invalid syntax", tokens_.at(headerBegin));
                return;
            }
        } else if (word == QLatin1String("for")) {
            bool hasIn = false;
            int depth = 0;
            for (int k = headerBegin; k < colon; ++k) {
                const Token& t = tokens_.at(k);
                if (isOpener(t)) ++depth;
                else if (isCloser(t)) --depth;
                else if (depth == 0 && t.isName("in")) hasIn = true;
            }
            if (!hasIn) {
                fail("invalid syntax", tokens_.at(colon));
                return;
            }
        }

        if (headerBegin < colon) {
            checkExpression(headerBegin, colon);
            if (failed_) {
                return;
            }
        }

        if (word == QLatin1String("else") && (previous == QLatin1String("except"))) {
            lastStatement() = QStringLiteral("try-else");
        } else {
            lastStatement() = word;
        }

        if (colon + 1 < end) {
            checkSimpleStatements(colon + 1, end);
        } else {
            expectBlock(tokens_.at(begin).isName("async") ? keyword : tokens_.at(begin));
        }
    }

    // First ':' at bracket depth zero that does not belong to a lambda
    int findHeaderColon(int begin, int end) const {
        int depth = 0;
        int pendingLambdas = 0;
        for (int k = begin; k < end; ++k) {
            const Token& t = tokens_.at(k);
            if (isOpener(t)) {
                ++depth;
            } else if (isCloser(t)) {
                --depth;
            } else if (depth == 0 && t.isName("lambda")) {
                ++pendingLambdas;
            } else if (depth == 0 && t.isOperator(":")) {
                if (pendingLambdas > 0) {
                    --pendingLambdas;
                } else {
                    return k;
                }
            }
        }
        return -1;
    }

    void checkSimpleStatements(int begin, int end) {
        int depth = 0;
        int segmentStart = begin;
        for (int k = begin; k < end && !failed_; ++k) {
            const Token& t = tokens_.at(k);
            if (isOpener(t)) {
                ++depth;
            } else if (isCloser(t)) {
                --depth;
            } else if (depth == 0 && t.isOperator(";")) {
                if (k == segmentStart) {
                    fail("invalid syntax", t);
                    return;
                }
                checkSimpleStatement(segmentStart, k);
                segmentStart = k + 1;
            }
        }
        if (!failed_ && segmentStart < end) {
            checkSimpleStatement(segmentStart, end);
        }
    }

    void checkSimpleStatement(int begin, int end) {
        const Token& first = tokens_.at(begin);

        if (first.type == TokenType::Name &&
            (compoundKeywords().contains(first.text) || first.text == QLatin1String("async"))) {
            fail("invalid syntax", first);
            return;
        }

        if (first.isName("import")) {
            parseImport(begin, end);
            return;
        }
        if (first.isName("from")) {
            parseFromImport(begin, end);
            return;
        }

        if ((first.isName("pass") || first.isName("break") || first.isName("continue")) &&
            end - begin > 1) {
            fail("invalid syntax", tokens_.at(begin + 1));
            return;
        }

        if (first.type == TokenType::Operator && !leadingOperators().contains(first.text)) {
            fail("invalid syntax", first);
            return;
        }

        if (tokens_.at(end - 1).isOperator(":")) {
            fail("invalid syntax", tokens_.at(end - 1));
            return;
        }

        checkExpression(begin, end);
    }

    void checkExpression(int begin, int end) {
        for (int k = begin; k < end; ++k) {
            const Token& t = tokens_.at(k);
            const Token* next = k + 1 < end ? &tokens_.at(k + 1) : nullptr;

            if (t.isName("import")) {
                fail("invalid syntax", t);
                return;
            }

            if (next && endsOperand(t) && startsOperand(*next) &&
                !(t.type == TokenType::String && next->type == TokenType::String)) {
                fail("invalid syntax", *next);
                return;
            }

            if (isBinaryOperator(t)) {
                if (!next) {
                    fail("invalid syntax", t);
                    return;
                }
                // Bare "*" and "/" mark keyword-only and positional-only parameters
                if (t.isOperator("/") && (next->isOperator(",") || next->isOperator(")"))) {
                    continue;
                }
                if (isCloser(*next) || (next->isOperator(",") && !t.isOperator("*"))) {
                    fail("invalid syntax", *next);
                    return;
                }
            }
        }
    }

    // Returns the dotted path starting at k and moves k past it; empty on error
    QString parseDottedName(int& k, int end) {
        if (k >= end || !isPlainName(tokens_.at(k))) {
            fail("invalid syntax", tokens_.at(qMin(k, end - 1)));
            return QString();
        }
        QString name = tokens_.at(k).text;
        ++k;
        while (k + 1 < end && tokens_.at(k).isOperator(".") && isPlainName(tokens_.at(k + 1))) {
            name += QLatin1Char('.') + tokens_.at(k + 1).text;
            k += 2;
        }
        if (k < end && tokens_.at(k).isOperator(".")) {
            fail("invalid syntax", tokens_.at(k));
            return QString();
        }
        return name;
    }

    // Consumes "as NAME" when present
    bool parseAlias(int& k, int end) {
        if (k < end && tokens_.at(k).isName("as")) {
            ++k;
            if (k >= end || !isPlainName(tokens_.at(k))) {
                fail("invalid syntax", tokens_.at(qMin(k, end - 1)));
                return false;
            }
            ++k;
        }
        return true;
    }

    void parseImport(int begin, int end) {
        int k = begin + 1;
        if (k >= end) {
            fail("Expected one or more names after 'import'", tokens_.at(begin));
            return;
        }

        while (true) {
            const QString name = parseDottedName(k, end);
            if (failed_ || !parseAlias(k, end)) {
                return;
            }

            ImportStatement statement;
            statement.module = name;
            statement.line = tokens_.at(begin).line;
            analysis_.imports.append(statement);

            if (k == end) {
                return;
            }
            if (!tokens_.at(k).isOperator(",")) {
                fail("invalid syntax", tokens_.at(k));
                return;
            }
            ++k;
            if (k == end) {
                fail("trailing comma not allowed without surrounding parentheses", tokens_.at(k - 1));
                return;
            }
        }
    }

    void parseFromImport(int begin, int end) {
        ImportStatement statement;
        statement.fromImport = true;
        statement.line = tokens_.at(begin).line;

        int k = begin + 1;
        while (k < end && (tokens_.at(k).isOperator(".") || tokens_.at(k).isOperator("..."))) {
            statement.level += tokens_.at(k).text.size();
            ++k;
        }

        if (k < end && isPlainName(tokens_.at(k))) {
            statement.module = parseDottedName(k, end);
            if (failed_) {
                return;
            }
        }

        if (statement.level == 0 && statement.module.isEmpty()) {
            fail("invalid syntax", tokens_.at(qMin(k, end - 1)));
            return;
        }

        if (k >= end || !tokens_.at(k).isName("import")) {
            fail("invalid syntax", tokens_.at(qMin(k, end - 1)));
            return;
        }
        ++k;

        if (k < end && tokens_.at(k).isOperator("*")) {
            statement.names.append(QStringLiteral("*"));
            ++k;
            if (k != end) {
                fail("invalid syntax", tokens_.at(k));
                return;
            }
        } else {
            const bool parenthesized = k < end && tokens_.at(k).isOperator("(");
            if (parenthesized) {
                ++k;
            }
            const int namesEnd = parenthesized ? end - 1 : end;
            if (parenthesized && !tokens_.at(end - 1).isOperator(")")) {
                fail("invalid syntax", tokens_.at(end - 1));
                return;
            }
            if (k >= namesEnd) {
                fail("Expected one or more names after 'import'", tokens_.at(k - 1));
                return;
            }

            while (k < namesEnd) {
                if (!isPlainName(tokens_.at(k))) {
                    fail("invalid syntax", tokens_.at(k));
                    return;
                }
                statement.names.append(tokens_.at(k).text);
                ++k;
                if (!parseAlias(k, namesEnd)) {
                    return;
                }
                if (k == namesEnd) {
                    break;
                }
                if (!tokens_.at(k).isOperator(",")) {
                    fail("invalid syntax", tokens_.at(k));
                    return;
                }
                ++k;
                if (k == namesEnd && !parenthesized) {
                    fail("trailing comma not allowed without surrounding parentheses",
                         tokens_.at(k - 1));
                    return;
                }
            }
        }

        analysis_.imports.append(statement);
    }

    void collectDynamicImports() {
        for (int k = 0; k + 1 < tokens_.size(); ++k) {
            const Token& t = tokens_.at(k);
            if (t.isName("__import__") && tokens_.at(k + 1).isOperator("(")) {
                DynamicImportCall call;
                call.callee = t.text;
                call.line = t.line;
                call.column = t.column;
                analysis_.dynamicImports.append(call);
            }
        }
    }

    const QList<Token>& tokens_;
    SourceAnalysis analysis_;
    QStringList blockHistory_;
    bool expectIndent_ = false;
    QString headerKeyword_;
    int headerLine_ = 0;
    bool failed_ = false;
    SyntaxError error_;
};

} // namespace

QString ImportStatement::spelledModule() const {
    return QString(level, QLatin1Char('.')) + module;
}

QString ImportStatement::topLevelModule() const {
    return module.section(QLatin1Char('.'), 0, 0);
}

Expected<SourceAnalysis, SyntaxError> SourceAnalyzer::analyze(const QString& source) {
    auto tokens = PythonLexer::tokenize(source);
    if (tokens.hasError()) {
        return makeUnexpected(tokens.error());
    }

    StatementChecker checker(tokens.value());
    return checker.run();
}

} // namespace Enclave
