#include <string>
#include <gtest/gtest.h>
#include "policy/classifier.hpp"
#include "policy/pattern_rule.hpp"

namespace {

using hookguard::policy::classify;
using hookguard::policy::DomainTarget;
using hookguard::policy::make_rule;
using hookguard::policy::make_token_rule;
using hookguard::policy::make_verb_extractor;
using hookguard::policy::MatchSubject;
using hookguard::policy::PolicyDomain;
using hookguard::protocol::DecisionBasis;
using hookguard::protocol::DomainId;
using hookguard::protocol::Enforcement;
using hookguard::protocol::Invocation;
using hookguard::protocol::OperationKind;
using hookguard::protocol::RuleCategory;
using hookguard::protocol::Verdict;

Invocation shell(const std::string& command) {
    return Invocation{OperationKind::ShellCommand, command, std::nullopt};
}

// A small "widget" tool: `widget show` is read-only, `widget drop` is gated,
// `--preview` escapes and the "sandbox" target downgrades to a warning.
PolicyDomain widget_domain(Enforcement enforcement = Enforcement::Block) {
    PolicyDomain domain;
    domain.id = DomainId::DestructiveCommand;
    domain.target = DomainTarget::ShellCommands;
    domain.enforcement = enforcement;
    domain.escape_rules.push_back(
        make_rule("preview", R"(--preview\b)", RuleCategory::Escape, "Preview only"));
    domain.safe_rules.push_back(
        make_rule("show", R"(\bwidget\s+show\b)", RuleCategory::ReadOnly, "Reads only"));
    domain.gated_rules.push_back(make_rule("drop", R"(\bwidget\s+drop\s+(\S+))",
                                           RuleCategory::Destructive, "Drops widgets",
                                           MatchSubject::Text, 1));
    domain.exception_rules.push_back(
        make_rule("sandbox", R"(\bsandbox\b)", RuleCategory::Exception, "Sandbox is disposable"));
    return domain;
}

TEST(ClassifierTest, GatedMatchUsesEnforcement) {
    const auto blocked = classify(widget_domain(), shell("widget drop prod"));
    EXPECT_EQ(blocked.verdict, Verdict::Block);
    EXPECT_EQ(blocked.basis, DecisionBasis::GatedRule);
    ASSERT_TRUE(blocked.matched_rule.has_value());
    EXPECT_EQ(blocked.matched_rule->name, "drop");
    EXPECT_EQ(blocked.context.at("token"), "prod");
    EXPECT_EQ(blocked.context.at("matched"), "widget drop prod");
    EXPECT_EQ(blocked.context.at("command"), "widget drop prod");

    const auto warned = classify(widget_domain(Enforcement::Warn), shell("widget drop prod"));
    EXPECT_EQ(warned.verdict, Verdict::Warn);
    EXPECT_EQ(warned.basis, DecisionBasis::GatedRule);
}

TEST(ClassifierTest, EscapeWinsOverEverything) {
    const auto decision = classify(widget_domain(), shell("widget drop prod --preview"));
    EXPECT_EQ(decision.verdict, Verdict::Allow);
    EXPECT_EQ(decision.basis, DecisionBasis::EscapeRule);
    ASSERT_TRUE(decision.matched_rule.has_value());
    EXPECT_EQ(decision.matched_rule->category, RuleCategory::Escape);
}

TEST(ClassifierTest, SafeRuleWinsOverGated) {
    const auto decision = classify(widget_domain(), shell("widget show && widget drop prod"));
    EXPECT_EQ(decision.verdict, Verdict::Allow);
    EXPECT_EQ(decision.basis, DecisionBasis::SafeRule);
}

TEST(ClassifierTest, ExceptionDowngradesToWarn) {
    const auto decision = classify(widget_domain(), shell("widget drop sandbox"));
    EXPECT_EQ(decision.verdict, Verdict::Warn);
    EXPECT_EQ(decision.basis, DecisionBasis::ExceptionRule);
    ASSERT_TRUE(decision.exception_rule.has_value());
    EXPECT_EQ(decision.exception_rule->name, "sandbox");
}

TEST(ClassifierTest, ExceptionAloneAllows) {
    const auto decision = classify(widget_domain(), shell("ls sandbox"));
    EXPECT_EQ(decision.verdict, Verdict::Allow);
    EXPECT_EQ(decision.basis, DecisionBasis::NoMatch);
    EXPECT_FALSE(decision.exception_rule.has_value());
}

TEST(ClassifierTest, MatchingIsCaseInsensitive) {
    EXPECT_EQ(classify(widget_domain(), shell("WIDGET DROP prod")).verdict, Verdict::Block);
}

TEST(ClassifierTest, FileOperationsAreNotApplicableToShellDomains) {
    const Invocation edit{OperationKind::FileEdit, "widget drop prod", "widget drop prod"};
    const auto decision = classify(widget_domain(), edit);
    EXPECT_EQ(decision.verdict, Verdict::Allow);
    EXPECT_EQ(decision.basis, DecisionBasis::NotApplicable);
}

TEST(ClassifierTest, ScopeRulesGateTheWholeDomain) {
    auto domain = widget_domain();
    domain.scope_rules.push_back(
        make_rule("widget first", R"(^widget\b)", RuleCategory::Mutation));

    const auto out_of_scope = classify(domain, shell("echo widget drop prod"));
    EXPECT_EQ(out_of_scope.verdict, Verdict::Allow);
    EXPECT_EQ(out_of_scope.basis, DecisionBasis::OutOfScope);

    EXPECT_EQ(classify(domain, shell("widget drop prod")).verdict, Verdict::Block);
}

TEST(ClassifierTest, VerbWindowsLimitWhereRulesSearch) {
    PolicyDomain domain;
    domain.id = DomainId::KubectlMutation;
    domain.verbs = make_verb_extractor("tool");
    domain.safe_rules.push_back(make_rule("list", R"(\blist\b)", RuleCategory::ReadOnly,
                                          "", MatchSubject::Verb));
    domain.gated_rules.push_back(make_rule("remove", R"(\bremove\b)", RuleCategory::Mutation,
                                           "", MatchSubject::VerbPhrase));

    const auto gated = classify(domain, shell("tool --quiet remove item"));
    EXPECT_EQ(gated.verdict, Verdict::Block);
    EXPECT_EQ(gated.context.at("verb"), "remove item");

    EXPECT_EQ(classify(domain, shell("tool list remove")).basis, DecisionBasis::SafeRule);

    // "remove" appears only past the verb phrase, so nothing matches.
    const auto later = classify(domain, shell("tool show items remove"));
    EXPECT_EQ(later.basis, DecisionBasis::NoMatch);

    const auto embedded = classify(domain, shell("tool apply -f removed.yaml"));
    EXPECT_EQ(embedded.verdict, Verdict::Allow);
    EXPECT_EQ(embedded.basis, DecisionBasis::NoMatch);

    const auto no_verb = classify(domain, shell("echo hi"));
    EXPECT_EQ(no_verb.context.at("verb"), "unknown");
}

TEST(ClassifierTest, TokenRulesExemptSingleOccurrences) {
    auto domain = widget_domain();
    domain.escape_rules.push_back(
        make_token_rule("scratch", R"(^scratch-)", RuleCategory::Escape, "Scratch widgets"));

    const auto exempt = classify(domain, shell("widget drop scratch-1"));
    EXPECT_EQ(exempt.verdict, Verdict::Allow);
    EXPECT_EQ(exempt.basis, DecisionBasis::EscapeRule);
    ASSERT_TRUE(exempt.matched_rule.has_value());
    EXPECT_EQ(exempt.matched_rule->name, "scratch");

    const auto mixed = classify(domain, shell("widget drop scratch-1; widget drop prod"));
    EXPECT_EQ(mixed.verdict, Verdict::Block);
    EXPECT_EQ(mixed.context.at("token"), "prod");
    EXPECT_EQ(mixed.context.at("matched"), "widget drop prod");

    // Token rules never look at the command itself, and compare case.
    EXPECT_EQ(classify(domain, shell("widget drop SCRATCH-1")).verdict, Verdict::Block);
    EXPECT_EQ(classify(domain, shell("echo scratch-1 && widget drop prod")).verdict,
              Verdict::Block);
}

TEST(ClassifierTest, ClassificationIsIdempotent) {
    const auto domain = widget_domain();
    const auto invocation = shell("widget drop sandbox");
    EXPECT_EQ(classify(domain, invocation), classify(domain, invocation));
}

}  // namespace
