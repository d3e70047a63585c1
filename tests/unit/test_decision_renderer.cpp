#include <string>
#include <gtest/gtest.h>
#include "policy/classifier.hpp"
#include "policy/decision_renderer.hpp"
#include "policy/pattern_tables.hpp"

namespace {

using hookguard::policy::classify;
using hookguard::policy::expand_placeholders;
using hookguard::policy::kubectl_mutation_domain;
using hookguard::policy::PolicyDomain;
using hookguard::policy::protected_file_domain;
using hookguard::policy::render;
using hookguard::protocol::Decision;
using hookguard::protocol::Invocation;
using hookguard::protocol::OperationKind;
using hookguard::protocol::Verdict;

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

Decision classify_command(const PolicyDomain& domain, const std::string& command) {
    return classify(domain, Invocation{OperationKind::ShellCommand, command, std::nullopt});
}

TEST(DecisionRendererTest, AllowRendersNothing) {
    const auto domain = kubectl_mutation_domain();
    const auto rendered = render(classify_command(domain, "kubectl get pods"), domain);
    EXPECT_EQ(rendered.exit_code, 0);
    EXPECT_TRUE(rendered.text.empty());
}

TEST(DecisionRendererTest, BlockRendersAllSectionsWithExitTwo) {
    const auto domain = kubectl_mutation_domain();
    const auto rendered = render(classify_command(domain, "kubectl delete pod foo"), domain);
    EXPECT_EQ(rendered.exit_code, 2);

    const std::string banner(70, '=');
    EXPECT_EQ(rendered.text.rfind("\n" + banner + "\nKUBECTL MUTATION BLOCKED - GITOPS REQUIRED\n" +
                                      banner + "\n\n",
                                  0),
              0u);
    EXPECT_TRUE(contains(rendered.text, "Command: kubectl delete pod\n"));
    EXPECT_TRUE(contains(rendered.text, "Reason:\n  kubectl delete removes resources\n"));
    EXPECT_TRUE(contains(rendered.text, "Remediation:\n  1. Use the gitops-apply skill\n"));
    EXPECT_TRUE(contains(rendered.text, "Examples:\n"));
    EXPECT_TRUE(contains(rendered.text, "  kubectl apply --dry-run=client\n"));
    EXPECT_FALSE(contains(rendered.text, "Override available because:"));
    EXPECT_EQ(rendered.text.substr(rendered.text.size() - banner.size() - 1), banner + "\n");
}

TEST(DecisionRendererTest, ExceptionUsesOverrideTemplate) {
    const auto domain = kubectl_mutation_domain();
    const auto decision = classify_command(domain, "kubectl apply -n argocd -f install.yaml");
    ASSERT_EQ(decision.verdict, Verdict::Warn);

    const auto rendered = render(decision, domain);
    EXPECT_EQ(rendered.exit_code, 0);
    EXPECT_TRUE(contains(rendered.text, "ARGOCD BOOTSTRAP DETECTED - OVERRIDE AVAILABLE"));
    EXPECT_TRUE(contains(rendered.text, "Command: kubectl apply\n"));
    EXPECT_TRUE(contains(rendered.text,
                         "Override available because:\n"
                         "  ArgoCD cannot sync itself - bootstrap exception applies.\n"));
    EXPECT_TRUE(contains(rendered.text, "ONE-OFF"));
    EXPECT_TRUE(contains(rendered.text, "RECOVERY-NEEDED"));
}

TEST(DecisionRendererTest, ProtectedFileNamesFileAndReason) {
    const auto domain = protected_file_domain();
    const auto decision =
        classify(domain, Invocation{OperationKind::FileWrite, "app/.env", "app/.env"});
    const auto rendered = render(decision, domain);
    EXPECT_EQ(rendered.exit_code, 2);
    EXPECT_TRUE(contains(rendered.text, "File: app/.env\n"));
    EXPECT_TRUE(contains(rendered.text, "Environment files contain secrets"));
    EXPECT_TRUE(contains(rendered.text, "Edit manually outside of the agent session"));
}

TEST(DecisionRendererTest, BlankTemplateLinesStayBlank) {
    const auto domain = kubectl_mutation_domain();
    const auto rendered = render(classify_command(domain, "kubectl apply -f x.yaml"), domain);
    EXPECT_TRUE(contains(rendered.text, "in this environment.\n  All cluster changes"));
    EXPECT_TRUE(contains(rendered.text, "GitOps workflow.\n\n  WHY: GitOps ensures:\n"));
    EXPECT_FALSE(contains(rendered.text, "\n  \n"));
}

TEST(DecisionRendererTest, ExpandsKnownPlaceholdersOnly) {
    const std::map<std::string, std::string> context = {{"token", "feature-x"},
                                                        {"verb", "apply"}};
    EXPECT_EQ(expand_placeholders("branch {token} via {verb}", context),
              "branch feature-x via apply");
    EXPECT_EQ(expand_placeholders("patch -p '{...}' {missing}", context),
              "patch -p '{...}' {missing}");
    EXPECT_EQ(expand_placeholders("no braces", context), "no braces");
    EXPECT_EQ(expand_placeholders("dangling {token", context), "dangling {token");
}

}  // namespace
