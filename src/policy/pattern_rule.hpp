#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>
#include "protocol/decision_contract.hpp"
#include "protocol/invocation_contract.hpp"

namespace hookguard::policy {

// The text a rule is searched in.
enum class MatchSubject {
    Text,        // whole command string or file path
    Verb,        // program name, flags and the first bare word
    VerbPhrase,  // the verb window plus one following word
    Token        // significant token of each gated match
};

struct PatternRule {
    std::string name;
    std::string pattern;
    std::regex matcher;
    protocol::RuleCategory category = protocol::RuleCategory::Mutation;
    std::string explanation;
    MatchSubject subject = MatchSubject::Text;
    // Capture group reported as the significant token; 0 = whole match.
    std::size_t token_group = 0;

    protocol::MatchedRule describe() const;
};

// Compiles `pattern` as a case-insensitive ECMAScript expression.
// Throws std::regex_error for an invalid pattern; the rule tables only
// ever pass literals or escaped configuration values.
PatternRule make_rule(std::string name, std::string pattern,
                      protocol::RuleCategory category,
                      std::string explanation = "",
                      MatchSubject subject = MatchSubject::Text,
                      std::size_t token_group = 0);

// Escape or safe rule checked against the token of every gated match
// rather than the command. Compiled case-sensitively: branch names and
// short flags differ by case.
PatternRule make_token_rule(std::string name, std::string pattern,
                            protocol::RuleCategory category,
                            std::string explanation = "");

// Escapes regular-expression metacharacters in a literal.
std::string escape_regex(const std::string& literal);

// Locates a sub-program verb, e.g. `kubectl [flags] <verb> [<word>]`.
// Group 0 of each expression is the window, group 1 the verb.
struct VerbExtractor {
    std::regex head;
    std::regex phrase;
};

VerbExtractor make_verb_extractor(const std::string& program);

enum class DomainTarget {
    ShellCommands,
    FileWrites
};

// Operator-facing text for one outcome of a domain. Lines may contain
// {command}, {file}, {matched}, {token} and {verb} placeholders.
struct MessageTemplate {
    std::string title;
    std::string subject_label;
    std::string subject_format;
    std::vector<std::string> reason;
    std::vector<std::string> rationale;
    std::vector<std::string> remediation;
    std::vector<std::string> examples;
};

struct PolicyDomain {
    protocol::DomainId id = protocol::DomainId::BranchPrefix;
    DomainTarget target = DomainTarget::ShellCommands;
    protocol::Enforcement enforcement = protocol::Enforcement::Block;
    std::vector<PatternRule> scope_rules;
    std::optional<VerbExtractor> verbs;
    std::vector<PatternRule> escape_rules;
    std::vector<PatternRule> safe_rules;
    std::vector<PatternRule> gated_rules;
    std::vector<PatternRule> exception_rules;
    MessageTemplate gated_message;
    std::optional<MessageTemplate> exception_message;

    bool applies_to(protocol::OperationKind kind) const;
};

}  // namespace hookguard::policy
