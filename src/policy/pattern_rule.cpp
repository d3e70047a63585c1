#include "policy/pattern_rule.hpp"

#include <utility>

namespace hookguard::policy {

namespace {

constexpr auto kRuleFlags = std::regex::ECMAScript | std::regex::icase;
constexpr auto kTokenFlags = std::regex::ECMAScript;

}  // namespace

protocol::MatchedRule PatternRule::describe() const {
    return protocol::MatchedRule{name, category, explanation};
}

PatternRule make_rule(std::string name, std::string pattern,
                      const protocol::RuleCategory category,
                      std::string explanation, const MatchSubject subject,
                      const std::size_t token_group) {
    PatternRule rule;
    rule.matcher = std::regex(pattern, kRuleFlags);
    rule.name = std::move(name);
    rule.pattern = std::move(pattern);
    rule.category = category;
    rule.explanation = std::move(explanation);
    rule.subject = subject;
    rule.token_group = token_group;
    return rule;
}

PatternRule make_token_rule(std::string name, std::string pattern,
                            const protocol::RuleCategory category,
                            std::string explanation) {
    PatternRule rule;
    rule.matcher = std::regex(pattern, kTokenFlags);
    rule.name = std::move(name);
    rule.pattern = std::move(pattern);
    rule.category = category;
    rule.explanation = std::move(explanation);
    rule.subject = MatchSubject::Token;
    return rule;
}

std::string escape_regex(const std::string& literal) {
    static const std::string kSpecial = R"(\^$.|?*+()[]{})";
    std::string escaped;
    escaped.reserve(literal.size() * 2);
    for (const char c : literal) {
        if (kSpecial.find(c) != std::string::npos) {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}

VerbExtractor make_verb_extractor(const std::string& program) {
    const std::string prefix = "\\b" + escape_regex(program) + R"(\s+(?:(?:--?\S+\s+)*))";
    return VerbExtractor{
        std::regex(prefix + R"(([a-z-]+))", kRuleFlags),
        std::regex(prefix + R"(([a-z-]+(?:\s+[a-z-]+)?))", kRuleFlags)};
}

bool PolicyDomain::applies_to(const protocol::OperationKind kind) const {
    switch (kind) {
        case protocol::OperationKind::ShellCommand:
            return target == DomainTarget::ShellCommands;
        case protocol::OperationKind::FileEdit:
        case protocol::OperationKind::FileWrite:
            return target == DomainTarget::FileWrites;
    }
    return false;
}

}  // namespace hookguard::policy
