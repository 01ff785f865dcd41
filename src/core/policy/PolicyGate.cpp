#include "PolicyGate.hpp"
#include "core/policy/SourceAnalyzer.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QSet>

#include <algorithm>

namespace Enclave {

PolicyGate::PolicyGate(AllowList allowList)
    : allowList_(std::move(allowList)) {
}

AllowListVerdict PolicyGate::validate(const QString& source) const {
    AllowListVerdict verdict;

    auto analysis = SourceAnalyzer::analyze(source);
    if (analysis.hasError()) {
        const SyntaxError& error = analysis.error();
        verdict.accepted = false;
        verdict.kind = AllowListVerdict::Kind::ParseError;
        verdict.line = error.line;
        verdict.column = error.column;
        verdict.message = "Syntax error in code: " + error.describe();
        ENCLAVE_DEBUG("Policy gate: {}", verdict.message.toStdString());
        return verdict;
    }

    QSet<QString> rejected;
    for (const ImportStatement& statement : analysis.value().imports) {
        if (statement.isRelative()) {
            if (!allowList_.allowRelativeImports()) {
                rejected.insert(statement.spelledModule());
                continue;
            }
            // "from . import x" names nothing that can be checked
            if (statement.module.isEmpty()) {
                continue;
            }
        }

        if (!allowList_.permits(statement.topLevelModule())) {
            rejected.insert(statement.module);
        }
    }

    if (allowList_.detectDynamicImports() && !analysis.value().dynamicImports.isEmpty()) {
        rejected.insert(QStringLiteral("__import__"));
    }

    if (rejected.isEmpty()) {
        return verdict;
    }

    verdict.violations = QStringList(rejected.begin(), rejected.end());
    std::sort(verdict.violations.begin(), verdict.violations.end());
    verdict.accepted = false;
    verdict.kind = AllowListVerdict::Kind::PolicyViolation;
    verdict.message = "Import restriction violation: The following imports are not allowed: " +
                      verdict.violations.join(", ") + "\n\n" + allowList_.categorySummary();

    ENCLAVE_INFO("Policy gate rejected imports: {}", verdict.violations.join(", ").toStdString());
    return verdict;
}

} // namespace Enclave
