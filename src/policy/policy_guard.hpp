#pragma once

#include <istream>
#include <string>
#include <vector>
#include "core/errors/hook_errors.hpp"
#include "policy/pattern_rule.hpp"
#include "protocol/decision_contract.hpp"
#include "protocol/invocation_contract.hpp"

namespace hookguard::policy {

struct GuardOutcome {
    int exit_code = protocol::kExitAllow;
    std::vector<protocol::Decision> decisions;  // one per domain evaluated
    std::string text;                           // accumulated warnings or the block
};

// Runs every applicable domain against one invocation, in table order.
// Stops at the first Block; Warn text accumulates and never changes the
// exit status.
class PolicyGuard {
public:
    explicit PolicyGuard(std::vector<PolicyDomain> domains);

    GuardOutcome evaluate(const protocol::Invocation& invocation) const;

    // Parses and normalizes a payload, then evaluates it. Only a malformed
    // payload is an error; an unrecognized tool is allowed.
    core::errors::Result<GuardOutcome> check(std::istream& payload) const;

    const std::vector<PolicyDomain>& domains() const { return domains_; }

private:
    std::vector<PolicyDomain> domains_;
};

}  // namespace hookguard::policy
