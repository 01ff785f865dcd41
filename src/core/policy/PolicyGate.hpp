#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>

#include "core/policy/AllowList.hpp"

namespace Enclave {

struct AllowListVerdict {
    enum class Kind {
        Accepted,
        ParseError,
        PolicyViolation
    };

    bool accepted = true;
    Kind kind = Kind::Accepted;
    QStringList violations;   // sorted, no duplicates
    QString message;          // empty when accepted
    int line = 0;             // position of a parse error
    int column = 0;
};

/**
 * @brief Static import check run before any snippet reaches a container
 *
 * validate() tokenizes and syntax-checks the source, then compares the
 * top-level segment of every imported module against the allow-list. The
 * gate never executes the snippet. It narrows what can be attempted; the
 * container remains the isolation boundary.
 */
class PolicyGate {
public:
    explicit PolicyGate(AllowList allowList = AllowList::defaults());

    AllowListVerdict validate(const QString& source) const;

    const AllowList& allowList() const { return allowList_; }

private:
    AllowList allowList_;
};

} // namespace Enclave
