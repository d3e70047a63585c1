#include "policy/classifier.hpp"

#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace hookguard::policy {

using protocol::Decision;
using protocol::DecisionBasis;
using protocol::Verdict;

namespace {

// Text windows a rule can be searched in, computed once per classification.
struct MatchWindows {
    const std::string* text = nullptr;
    std::optional<std::string> verb;
    std::optional<std::string> verb_phrase;
    std::optional<std::string> verb_token;

    const std::string* select(const MatchSubject subject) const {
        switch (subject) {
            case MatchSubject::Text:
                return text;
            case MatchSubject::Verb:
                return verb ? &verb.value() : nullptr;
            case MatchSubject::VerbPhrase:
                return verb_phrase ? &verb_phrase.value() : nullptr;
            case MatchSubject::Token:
                return nullptr;
        }
        return nullptr;
    }
};

// A trailing flag is not part of the verb: "apply -n" displays as "apply".
std::string display_verb(const std::string& phrase) {
    const auto space = phrase.find_first_of(" \t");
    if (space == std::string::npos) {
        return phrase;
    }
    const auto next = phrase.find_first_not_of(" \t", space);
    if (next != std::string::npos && phrase[next] == '-') {
        return phrase.substr(0, space);
    }
    return phrase;
}

MatchWindows build_windows(const PolicyDomain& domain, const std::string& text) {
    MatchWindows windows;
    windows.text = &text;
    if (!domain.verbs.has_value()) {
        return windows;
    }

    std::smatch match;
    if (std::regex_search(text, match, domain.verbs->head)) {
        windows.verb = match.str(0);
    }
    if (std::regex_search(text, match, domain.verbs->phrase)) {
        windows.verb_phrase = match.str(0);
        windows.verb_token = display_verb(match.str(1));
    }
    return windows;
}

const PatternRule* first_match(const std::vector<PatternRule>& rules,
                               const MatchWindows& windows) {
    for (const auto& rule : rules) {
        const std::string* subject = windows.select(rule.subject);
        if (subject == nullptr) {
            continue;
        }
        if (std::regex_search(*subject, rule.matcher)) {
            return &rule;
        }
    }
    return nullptr;
}

std::string token_of(const PatternRule& rule, const std::smatch& match) {
    if (rule.token_group > 0 && rule.token_group < match.size() &&
        match[rule.token_group].matched) {
        return match.str(rule.token_group);
    }
    return match.str(0);
}

const PatternRule* first_token_match(const std::vector<PatternRule>& rules,
                                     const std::string& token) {
    for (const auto& rule : rules) {
        if (rule.subject == MatchSubject::Token &&
            std::regex_search(token, rule.matcher)) {
            return &rule;
        }
    }
    return nullptr;
}

// First gated occurrence whose token no token rule exempts. Every
// occurrence of every gated rule is visited, so one exempt segment of a
// compound command cannot cover another.
struct GatedScan {
    const PatternRule* gated = nullptr;
    std::smatch match;
    const PatternRule* exempted_by = nullptr;
    DecisionBasis exempt_basis = DecisionBasis::NoMatch;
};

GatedScan scan_gated(const PolicyDomain& domain, const MatchWindows& windows) {
    GatedScan scan;
    for (const auto& rule : domain.gated_rules) {
        const std::string* subject = windows.select(rule.subject);
        if (subject == nullptr) {
            continue;
        }
        const std::sregex_iterator end;
        for (std::sregex_iterator it(subject->begin(), subject->end(), rule.matcher);
             it != end; ++it) {
            const std::string token = token_of(rule, *it);
            DecisionBasis basis = DecisionBasis::EscapeRule;
            const PatternRule* exempt = first_token_match(domain.escape_rules, token);
            if (exempt == nullptr) {
                basis = DecisionBasis::SafeRule;
                exempt = first_token_match(domain.safe_rules, token);
            }
            if (exempt != nullptr) {
                if (scan.exempted_by == nullptr) {
                    scan.exempted_by = exempt;
                    scan.exempt_basis = basis;
                }
                continue;
            }
            scan.gated = &rule;
            scan.match = *it;
            return scan;
        }
    }
    return scan;
}

}  // namespace

Decision classify(const PolicyDomain& domain,
                  const protocol::Invocation& invocation) {
    Decision decision;
    decision.domain = domain.id;
    decision.verdict = Verdict::Allow;

    if (!domain.applies_to(invocation.kind)) {
        decision.basis = DecisionBasis::NotApplicable;
        return decision;
    }

    const std::string& text = invocation.raw_text;
    if (protocol::is_file_operation(invocation.kind)) {
        decision.context["file"] = invocation.target_path.value_or(text);
    } else {
        decision.context["command"] = text;
    }

    if (!domain.scope_rules.empty()) {
        const MatchWindows text_only{&text, std::nullopt, std::nullopt, std::nullopt};
        if (first_match(domain.scope_rules, text_only) == nullptr) {
            decision.basis = DecisionBasis::OutOfScope;
            return decision;
        }
    }

    const MatchWindows windows = build_windows(domain, text);
    if (domain.verbs.has_value()) {
        decision.context["verb"] = windows.verb_token.value_or("unknown");
    }

    if (const PatternRule* escape = first_match(domain.escape_rules, windows)) {
        decision.basis = DecisionBasis::EscapeRule;
        decision.matched_rule = escape->describe();
        return decision;
    }

    if (const PatternRule* safe = first_match(domain.safe_rules, windows)) {
        decision.basis = DecisionBasis::SafeRule;
        decision.matched_rule = safe->describe();
        return decision;
    }

    const GatedScan scan = scan_gated(domain, windows);
    if (scan.gated == nullptr) {
        if (scan.exempted_by != nullptr) {
            decision.basis = scan.exempt_basis;
            decision.matched_rule = scan.exempted_by->describe();
            return decision;
        }
        decision.basis = DecisionBasis::NoMatch;
        return decision;
    }

    decision.matched_rule = scan.gated->describe();
    decision.context["matched"] = scan.match.str(0);
    decision.context["token"] = token_of(*scan.gated, scan.match);

    if (const PatternRule* exception = first_match(domain.exception_rules, windows)) {
        decision.basis = DecisionBasis::ExceptionRule;
        decision.exception_rule = exception->describe();
        decision.verdict = Verdict::Warn;
        return decision;
    }

    decision.basis = DecisionBasis::GatedRule;
    decision.verdict = domain.enforcement == protocol::Enforcement::Block
                           ? Verdict::Block
                           : Verdict::Warn;
    return decision;
}

}  // namespace hookguard::policy
