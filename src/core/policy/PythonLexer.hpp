#pragma once

#include <QtCore/QList>
#include <QtCore/QString>

#include "core/common/Expected.hpp"

namespace Enclave {

enum class TokenType {
    Name,
    Number,
    String,
    Operator,
    Newline,
    Indent,
    Dedent,
    EndMarker
};

struct Token {
    TokenType type = TokenType::EndMarker;
    QString text;
    int line = 0;
    int column = 0;

    bool is(TokenType t, const QString& value) const { return type == t && text == value; }
    bool isOperator(const QString& value) const { return is(TokenType::Operator, value); }
    bool isName(const QString& value) const { return is(TokenType::Name, value); }
};

struct SyntaxError {
    QString message;
    int line = 0;
    int column = 0;

    QString describe() const;
};

/**
 * @brief Python 3 tokenizer
 *
 * Produces the token stream of a module: names, numbers, strings (every
 * prefix form, single and triple quoted), operators, and the NEWLINE,
 * INDENT and DEDENT markers derived from physical lines. Newlines inside
 * brackets and after a backslash continuation are joined. Lexical faults
 * (unterminated strings, unbalanced brackets, inconsistent dedents,
 * characters Python rejects) are reported as a SyntaxError.
 */
class PythonLexer {
public:
    static Expected<QList<Token>, SyntaxError> tokenize(const QString& source);

    static bool isKeyword(const QString& word);
};

} // namespace Enclave
