#pragma once

#include <map>
#include <optional>
#include <string>

namespace hookguard::protocol {

// Exit statuses the hook host relies on.
constexpr int kExitAllow = 0;
constexpr int kExitInternalError = 1;
constexpr int kExitBlocked = 2;

enum class DomainId {
    BranchPrefix,
    CommitGate,
    DestructiveCommand,
    KubectlMutation,
    ProtectedFile
};

enum class Enforcement {
    Warn,
    Block
};

enum class Verdict {
    Allow,
    Warn,
    Block
};

enum class RuleCategory {
    Escape,
    ReadOnly,
    Mutation,
    Destructive,
    Protected,
    Exception
};

// Which step of the classification produced the verdict.
enum class DecisionBasis {
    NotApplicable,
    OutOfScope,
    EscapeRule,
    SafeRule,
    GatedRule,
    ExceptionRule,
    NoMatch
};

struct MatchedRule {
    std::string name;
    RuleCategory category = RuleCategory::Mutation;
    std::string explanation;

    bool operator==(const MatchedRule& other) const {
        return name == other.name && category == other.category &&
               explanation == other.explanation;
    }
};

struct Decision {
    DomainId domain = DomainId::BranchPrefix;
    Verdict verdict = Verdict::Allow;
    DecisionBasis basis = DecisionBasis::NoMatch;
    std::optional<MatchedRule> matched_rule;
    std::optional<MatchedRule> exception_rule;
    std::map<std::string, std::string> context;

    bool operator==(const Decision& other) const {
        return domain == other.domain && verdict == other.verdict &&
               basis == other.basis && matched_rule == other.matched_rule &&
               exception_rule == other.exception_rule &&
               context == other.context;
    }
};

inline std::string to_string(const DomainId domain) {
    switch (domain) {
        case DomainId::BranchPrefix:
            return "branch-prefix";
        case DomainId::CommitGate:
            return "commit-gate";
        case DomainId::DestructiveCommand:
            return "destructive-command";
        case DomainId::KubectlMutation:
            return "kubectl-mutation";
        case DomainId::ProtectedFile:
            return "protected-file";
        default:
            return "unknown";
    }
}

inline std::optional<DomainId> domain_from_string(const std::string& name) {
    for (const DomainId domain :
         {DomainId::BranchPrefix, DomainId::CommitGate,
          DomainId::DestructiveCommand, DomainId::KubectlMutation,
          DomainId::ProtectedFile}) {
        if (to_string(domain) == name) {
            return domain;
        }
    }
    return std::nullopt;
}

inline std::string to_string(const Enforcement enforcement) {
    switch (enforcement) {
        case Enforcement::Warn:
            return "warn";
        case Enforcement::Block:
            return "block";
        default:
            return "unknown";
    }
}

inline std::optional<Enforcement> enforcement_from_string(const std::string& name) {
    if (name == "warn") {
        return Enforcement::Warn;
    }
    if (name == "block") {
        return Enforcement::Block;
    }
    return std::nullopt;
}

inline std::string to_string(const Verdict verdict) {
    switch (verdict) {
        case Verdict::Allow:
            return "allow";
        case Verdict::Warn:
            return "warn";
        case Verdict::Block:
            return "block";
        default:
            return "unknown";
    }
}

inline std::string to_string(const RuleCategory category) {
    switch (category) {
        case RuleCategory::Escape:
            return "escape";
        case RuleCategory::ReadOnly:
            return "read_only";
        case RuleCategory::Mutation:
            return "mutation";
        case RuleCategory::Destructive:
            return "destructive";
        case RuleCategory::Protected:
            return "protected";
        case RuleCategory::Exception:
            return "exception";
        default:
            return "unknown";
    }
}

inline std::string to_string(const DecisionBasis basis) {
    switch (basis) {
        case DecisionBasis::NotApplicable:
            return "not_applicable";
        case DecisionBasis::OutOfScope:
            return "out_of_scope";
        case DecisionBasis::EscapeRule:
            return "escape_rule";
        case DecisionBasis::SafeRule:
            return "safe_rule";
        case DecisionBasis::GatedRule:
            return "gated_rule";
        case DecisionBasis::ExceptionRule:
            return "exception_rule";
        case DecisionBasis::NoMatch:
            return "no_match";
        default:
            return "unknown";
    }
}

}  // namespace hookguard::protocol
