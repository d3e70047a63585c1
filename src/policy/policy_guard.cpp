#include "policy/policy_guard.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "policy/classifier.hpp"
#include "policy/decision_renderer.hpp"
#include "policy/invocation_normalizer.hpp"

namespace hookguard::policy {

using protocol::Verdict;

PolicyGuard::PolicyGuard(std::vector<PolicyDomain> domains)
    : domains_(std::move(domains)) {}

GuardOutcome PolicyGuard::evaluate(const protocol::Invocation& invocation) const {
    GuardOutcome outcome;
    for (const auto& domain : domains_) {
        if (!domain.applies_to(invocation.kind)) {
            continue;
        }

        auto decision = classify(domain, invocation);
        LOG_DEBUG(protocol::to_string(domain.id) + ": " +
                  protocol::to_string(decision.verdict) + " (" +
                  protocol::to_string(decision.basis) +
                  (decision.matched_rule ? ", rule '" + decision.matched_rule->name + "'"
                                         : std::string()) +
                  ")");

        const RenderedDecision rendered = render(decision, domain);
        outcome.decisions.push_back(std::move(decision));
        outcome.text += rendered.text;

        if (outcome.decisions.back().verdict == Verdict::Block) {
            outcome.exit_code = rendered.exit_code;
            LOG_INFO("Blocked by " + protocol::to_string(domain.id));
            break;
        }
    }
    return outcome;
}

core::errors::Result<GuardOutcome> PolicyGuard::check(std::istream& payload) const {
    auto parsed = parse_payload(payload);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }

    const auto invocation = normalize(core::errors::get_value(parsed));
    if (!invocation) {
        LOG_DEBUG("No policy domain applies to tool '" +
                  core::errors::get_value(parsed).name + "'");
        return GuardOutcome{};
    }
    LOG_DEBUG("Evaluating " + protocol::to_string(invocation->kind) + ": " +
              invocation->raw_text);
    return evaluate(*invocation);
}

}  // namespace hookguard::policy
