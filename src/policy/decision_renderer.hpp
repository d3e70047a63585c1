#pragma once

#include <map>
#include <string>
#include "policy/pattern_rule.hpp"
#include "protocol/decision_contract.hpp"

namespace hookguard::policy {

struct RenderedDecision {
    int exit_code = protocol::kExitAllow;
    std::string text;  // empty for Allow
};

// Maps a decision to the hook host's exit status and operator text.
// Allow renders nothing, Warn renders the message with status 0 and Block
// renders it with status 2. The exception template is used when an
// exception rule downgraded the verdict.
RenderedDecision render(const protocol::Decision& decision,
                        const PolicyDomain& domain);

// Replaces {key} placeholders with values from `context`; unknown keys are
// left as written.
std::string expand_placeholders(const std::string& line,
                                const std::map<std::string, std::string>& context);

}  // namespace hookguard::policy
