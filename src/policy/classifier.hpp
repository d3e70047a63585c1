#pragma once

#include "policy/pattern_rule.hpp"
#include "protocol/decision_contract.hpp"
#include "protocol/invocation_contract.hpp"

namespace hookguard::policy {

// Classifies one invocation against one domain. Precedence is fixed:
//   1. escape rules allow unconditionally,
//   2. safe (read-only) rules allow,
//   3. the first gated occurrence decides: Warn when an exception rule
//      also matches, otherwise the domain's enforcement level,
//   4. anything else is allowed.
// Escape and safe rules with MatchSubject::Token are not checked against
// the command. They exempt individual gated occurrences by token instead.
// Deterministic and total: every call yields exactly one verdict.
protocol::Decision classify(const PolicyDomain& domain,
                            const protocol::Invocation& invocation);

}  // namespace hookguard::policy
