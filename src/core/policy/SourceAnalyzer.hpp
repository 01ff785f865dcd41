#pragma once

#include <QtCore/QList>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include "core/common/Expected.hpp"
#include "core/policy/PythonLexer.hpp"

namespace Enclave {

struct ImportStatement {
    QString module;           // dotted path without leading dots, empty for "from . import x"
    int level = 0;            // leading dots of a relative from-import
    bool fromImport = false;
    QStringList names;        // names bound by a from-import, "*" for star imports
    int line = 0;

    bool isRelative() const { return level > 0; }

    // Module path as written, including the leading dots
    QString spelledModule() const;

    // First segment of the dotted module path
    QString topLevelModule() const;
};

struct DynamicImportCall {
    QString callee;
    int line = 0;
    int column = 0;
};

struct SourceAnalysis {
    QList<ImportStatement> imports;
    QList<DynamicImportCall> dynamicImports;
};

/**
 * @brief Statement-level checker and import collector for Python source
 *
 * Runs on the PythonLexer token stream. Validates block structure (indented
 * blocks after compound headers, no stray indents, elif/else/except/finally
 * attached to a matching statement), compound headers, import grammar, and
 * the expression shapes a parser rejects outright (adjacent operands,
 * dangling operators). Every import statement of the module is collected,
 * including ones nested inside functions, classes and conditional blocks.
 */
class SourceAnalyzer {
public:
    static Expected<SourceAnalysis, SyntaxError> analyze(const QString& source);
};

} // namespace Enclave
