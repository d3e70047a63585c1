#include "policy/pattern_tables.hpp"

#include <utility>

namespace hookguard::policy {

using protocol::DomainId;
using protocol::Enforcement;
using protocol::RuleCategory;

namespace {

PatternRule verb_rule(const std::string& verb_pattern, RuleCategory category,
                      std::string explanation) {
    return make_rule("kubectl " + verb_pattern, "\\b" + verb_pattern + "\\b",
                     category, std::move(explanation), MatchSubject::VerbPhrase);
}

PatternRule read_only_verb(const std::string& verb_pattern) {
    return make_rule("kubectl " + verb_pattern + " (read-only)",
                     "\\b" + verb_pattern + "\\b", RuleCategory::ReadOnly,
                     "Read-only kubectl operation", MatchSubject::Verb);
}

std::string join_alternatives(const std::vector<std::string>& literals) {
    std::string joined;
    for (const auto& literal : literals) {
        if (!joined.empty()) {
            joined += "|";
        }
        joined += escape_regex(literal);
    }
    return joined;
}

}  // namespace

PolicyDomain branch_prefix_domain(const std::string& required_prefix,
                                  const std::vector<std::string>& allowed_branches) {
    const std::string explanation =
        "Branch names must start with '" + required_prefix + "'";

    PolicyDomain domain;
    domain.id = DomainId::BranchPrefix;
    domain.target = DomainTarget::ShellCommands;
    domain.enforcement = Enforcement::Block;

    // Checked against each created branch name, exactly as git compares them.
    domain.escape_rules.push_back(make_token_rule(
        "required prefix", "^" + escape_regex(required_prefix),
        RuleCategory::Escape, "Branch already carries the required prefix"));
    if (!allowed_branches.empty()) {
        domain.escape_rules.push_back(make_token_rule(
            "allow-listed branch", "^(?:" + join_alternatives(allowed_branches) + ")$",
            RuleCategory::Escape, "Long-lived branch names need no prefix"));
    }

    // `git branch <flag>` lists branches; the flag lands in the token.
    domain.safe_rules.push_back(make_token_rule(
        "git branch listing",
        R"(^(?:-a|-r|-v|-vv|-l|--list|--all|--remotes|--verbose|--show-current|--merged|--no-merged|--contains)$)",
        RuleCategory::ReadOnly, "Listing branches creates nothing"));

    domain.gated_rules = {
        make_rule("git checkout -b", R"(\bgit\s+checkout\s+-b\s+(\S+))",
                  RuleCategory::Mutation, explanation, MatchSubject::Text, 1),
        make_rule("git branch", R"(\bgit\s+branch\s+(?!-[dD])\s*(\S+))",
                  RuleCategory::Mutation, explanation, MatchSubject::Text, 1),
        make_rule("git switch -c", R"(\bgit\s+switch\s+-c\s+(\S+))",
                  RuleCategory::Mutation, explanation, MatchSubject::Text, 1),
    };

    domain.gated_message.title =
        "BLOCKED: BRANCH NAME MUST START WITH '" + required_prefix + "'";
    domain.gated_message.subject_label = "Invalid branch";
    domain.gated_message.subject_format = "{token}";
    domain.gated_message.reason = {"Expected format: " + required_prefix +
                                   "<type>/<description>"};
    domain.gated_message.remediation = {"Use the manage-branch skill:",
                                        "  /manage-branch"};
    domain.gated_message.examples = {required_prefix + "feat/new-feature",
                                     required_prefix + "fix/bug-description",
                                     required_prefix + "refactor/cleanup"};
    return domain;
}

PolicyDomain commit_gate_domain() {
    const std::string explanation =
        "Direct git commits bypass the safe-commit workflow";

    PolicyDomain domain;
    domain.id = DomainId::CommitGate;
    domain.target = DomainTarget::ShellCommands;
    domain.enforcement = Enforcement::Warn;

    domain.escape_rules = {
        make_rule("dry run", R"(--dry-run)", RuleCategory::Escape,
                  "Dry runs record nothing"),
        make_rule("no commit", R"(--no-commit)", RuleCategory::Escape,
                  "Merge without commit"),
    };
    domain.safe_rules = {
        make_rule("git log", R"(git\s+log.*commit)", RuleCategory::ReadOnly,
                  "Viewing commits"),
        make_rule("git show", R"(git\s+show.*commit)", RuleCategory::ReadOnly,
                  "Showing commits"),
        make_rule("git rev-parse", R"(git\s+rev-parse)", RuleCategory::ReadOnly,
                  "Parsing commit refs"),
    };
    domain.gated_rules = {
        make_rule("git commit", R"(\bgit\s+commit\b)", RuleCategory::Mutation,
                  explanation),
        make_rule("git ... commit", R"(\bgit\s+.*\bcommit\b)",
                  RuleCategory::Mutation, explanation),
    };

    domain.gated_message.title = "REMINDER: USE SAFE-COMMIT SKILL FOR COMMITS";
    domain.gated_message.subject_label = "Command";
    domain.gated_message.subject_format = "{command}";
    domain.gated_message.reason = {
        "The safe-commit skill ensures security scan, quality check, and tests pass."};
    domain.gated_message.remediation = {
        "Commit through the safe-commit skill instead of calling git commit directly."};
    domain.gated_message.examples = {"/safe-commit",
                                     "git commit --dry-run   (preview, allowed)"};
    return domain;
}

PolicyDomain destructive_command_domain() {
    PolicyDomain domain;
    domain.id = DomainId::DestructiveCommand;
    domain.target = DomainTarget::ShellCommands;
    domain.enforcement = Enforcement::Warn;

    domain.escape_rules = {
        make_rule("dry run", R"(--dry-run)", RuleCategory::Escape,
                  "Dry runs change nothing"),
        make_rule("dry run (short)", R"(-n\b)", RuleCategory::Escape,
                  "Short dry-run flag"),
    };

    const auto destructive = [](std::string name, std::string pattern,
                                std::string explanation) {
        return make_rule(std::move(name), std::move(pattern),
                         RuleCategory::Destructive, std::move(explanation));
    };
    domain.gated_rules = {
        // git
        destructive("git reset --hard", R"(\bgit\s+reset\s+--hard\b)",
                    "git reset --hard destroys uncommitted changes"),
        destructive("git clean", R"(\bgit\s+clean\s+-[fd]+\b)",
                    "git clean permanently deletes untracked files"),
        destructive("git checkout -- .", R"(\bgit\s+checkout\s+--\s+\.)",
                    "git checkout -- . discards all changes"),
        destructive("git restore .", R"(\bgit\s+restore\s+\.)",
                    "git restore . discards all changes"),
        destructive("git push --force", R"(\bgit\s+push\s+.*--force\b)",
                    "git push --force can overwrite remote history"),
        destructive("git push -f", R"(\bgit\s+push\s+.*-f\b)",
                    "git push -f can overwrite remote history"),
        // file system
        destructive("rm -rf", R"(\brm\s+-rf\b)", "rm -rf permanently deletes files"),
        destructive("rm -fr", R"(\brm\s+-fr\b)", "rm -fr permanently deletes files"),
        destructive("rm -r -f", R"(\brm\s+.*-r.*-f\b)",
                    "rm with -rf permanently deletes files"),
        // docker
        destructive("docker system prune", R"(\bdocker\s+system\s+prune\b)",
                    "docker system prune removes unused data"),
        destructive("docker volume prune", R"(\bdocker\s+volume\s+prune\b)",
                    "docker volume prune removes volumes"),
        // kubernetes
        destructive("kubectl delete", R"(\bkubectl\s+delete\b)",
                    "kubectl delete removes resources"),
    };

    domain.gated_message.title = "DESTRUCTIVE COMMAND WARNING";
    domain.gated_message.subject_label = "Command";
    domain.gated_message.subject_format = "{command}";
    domain.gated_message.remediation = {
        "Ensure the safe-destroy skill was used for confirmation.",
        "Preview the effect with --dry-run (or -n) where the tool supports it."};
    domain.gated_message.examples = {"git clean -n", "git push --force-with-lease",
                                     "kubectl delete pod nginx --dry-run=server"};
    return domain;
}

PolicyDomain kubectl_mutation_domain() {
    PolicyDomain domain;
    domain.id = DomainId::KubectlMutation;
    domain.target = DomainTarget::ShellCommands;
    domain.enforcement = Enforcement::Block;
    domain.verbs = make_verb_extractor("kubectl");

    // kubectl at the start of the command or of a piped/chained segment.
    domain.scope_rules.push_back(make_rule("kubectl invocation",
                                           R"((^\s*|[|;&]\s*)kubectl\b)",
                                           RuleCategory::Mutation));

    domain.escape_rules = {
        make_rule("--dry-run", R"(--dry-run\b)", RuleCategory::Escape,
                  "Dry runs only validate"),
        make_rule("--dry-run=client", R"(--dry-run=client\b)", RuleCategory::Escape,
                  "Client-side dry run"),
        make_rule("--dry-run=server", R"(--dry-run=server\b)", RuleCategory::Escape,
                  "Server-side dry run"),
    };

    for (const char* verb :
         {"get", "describe", "logs", "explain", "diff", "api-resources",
          "api-versions", "version", "cluster-info", "top", R"(auth\s+can-i)",
          R"(config\s+view)", R"(rollout\s+status)", R"(rollout\s+history)",
          "wait"}) {
        domain.safe_rules.push_back(read_only_verb(verb));
    }

    const auto mutation = RuleCategory::Mutation;
    domain.gated_rules = {
        verb_rule("apply", mutation, "kubectl apply changes cluster state"),
        verb_rule("create", mutation, "kubectl create adds resources"),
        verb_rule("edit", mutation, "kubectl edit changes live resources"),
        verb_rule("patch", mutation, "kubectl patch changes live resources"),
        verb_rule("delete", RuleCategory::Destructive, "kubectl delete removes resources"),
        verb_rule("replace", mutation, "kubectl replace overwrites resources"),
        verb_rule("scale", mutation, "kubectl scale changes replica counts"),
        verb_rule("autoscale", mutation, "kubectl autoscale creates autoscalers"),
        verb_rule(R"(rollout\s+(restart|undo|pause|resume))", mutation,
                  "kubectl rollout changes rollout state"),
        verb_rule("set", mutation, "kubectl set changes resource fields"),
        verb_rule("label", mutation, "kubectl label changes resource labels"),
        verb_rule("annotate", mutation, "kubectl annotate changes annotations"),
        verb_rule("expose", mutation, "kubectl expose creates services"),
        verb_rule("run", mutation, "kubectl run starts workloads"),
        verb_rule("drain", RuleCategory::Destructive, "kubectl drain evicts workloads"),
        verb_rule("cordon", mutation, "kubectl cordon changes node scheduling"),
        verb_rule("uncordon", mutation, "kubectl uncordon changes node scheduling"),
        verb_rule("taint", mutation, "kubectl taint changes node taints"),
        verb_rule("attach", mutation, "kubectl attach can modify container state"),
        verb_rule("exec", mutation, "kubectl exec can modify container state"),
        verb_rule("cp", mutation, "kubectl cp can modify files in containers"),
        verb_rule("port-forward", mutation,
                  "kubectl port-forward can be used for state modification"),
        make_rule("kubectl --force", R"(\bkubectl\s+.*--force\b)", mutation,
                  "Forced kubectl operations skip safety checks"),
        make_rule("kubectl --grace-period=0", R"(\bkubectl\s+.*--grace-period=0\b)",
                  RuleCategory::Destructive, "--grace-period=0 deletes immediately"),
        make_rule("kubectl --now", R"(\bkubectl\s+.*--now\b)", mutation,
                  "--now performs the operation immediately"),
    };

    const std::string bootstrap = "ArgoCD cannot sync itself - bootstrap exception applies.";
    domain.exception_rules = {
        make_rule("argocd namespace (-n)", R"(-n\s+(argocd|argo-cd|argocd-system)\b)",
                  RuleCategory::Exception, bootstrap),
        make_rule("argocd namespace (--namespace)",
                  R"(--namespace[=\s]+(argocd|argo-cd|argocd-system)\b)",
                  RuleCategory::Exception, bootstrap),
        make_rule("argocd application CRD", R"(applications?\.argoproj\.io)",
                  RuleCategory::Exception, bootstrap),
        make_rule("argocd applicationset CRD", R"(applicationsets?\.argoproj\.io)",
                  RuleCategory::Exception, bootstrap),
        make_rule("argocd appproject CRD", R"(appprojects?\.argoproj\.io)",
                  RuleCategory::Exception, bootstrap),
        make_rule("argocd manifest path", R"(argocd/)", RuleCategory::Exception,
                  bootstrap),
    };

    MessageTemplate& gated = domain.gated_message;
    gated.title = "KUBECTL MUTATION BLOCKED - GITOPS REQUIRED";
    gated.subject_label = "Command";
    gated.subject_format = "kubectl {verb}";
    gated.reason = {
        "Direct kubectl mutations are FORBIDDEN in this environment.",
        "All cluster changes MUST go through GitOps workflow.",
        "",
        "WHY: GitOps ensures:",
        "  - Auditable change history (git log)",
        "  - Peer review (pull requests)",
        "  - Rollback capability (git revert)",
        "  - Disaster recovery (git clone)",
        "  - Infrastructure as Code (declarative manifests)"};
    gated.remediation = {
        "1. Use the gitops-apply skill",
        "2. Update manifest in git repository",
        "3. Commit changes with conventional format",
        "4. ArgoCD/Flux will sync to cluster",
        "",
        "To proceed with GitOps workflow, say:",
        "  'Use gitops-apply skill to make this change'"};
    gated.examples = {
        "READ-ONLY OPERATIONS (allowed):",
        "  kubectl get, describe, logs, explain, diff, top, etc.",
        "DRY-RUN OPERATIONS (allowed):",
        "  kubectl apply --dry-run=client",
        "  kubectl create --dry-run=server"};

    MessageTemplate exception;
    exception.title = "ARGOCD BOOTSTRAP DETECTED - OVERRIDE AVAILABLE";
    exception.subject_label = "Command";
    exception.subject_format = "kubectl {verb}";
    exception.reason = {
        "Direct kubectl mutations normally go through the GitOps workflow."};
    exception.rationale = {
        "QUESTION: Is this a one-off or needed for future deployments?"};
    exception.remediation = {
        "ONE-OFF (debugging, temporary, won't repeat):",
        "  Say \"one-off bootstrap\" to proceed with kubectl directly",
        "",
        "RECOVERY-NEEDED (new clusters, disaster recovery, repeatable):",
        "  1. Add command to scripts/bootstrap.sh (initial setup)",
        "  2. Add command to scripts/bootstrap-idempotent.sh (re-runnable)",
        "  3. Commit the bootstrap script changes",
        "  4. Then say \"bootstrap updated\" to proceed with kubectl",
        "",
        "For detailed bootstrap workflow, see:",
        "  gitops-apply skill > references/BOOTSTRAP-WORKFLOW.md"};
    exception.examples = {
        "IDEMPOTENT PATTERN:",
        "  kubectl apply -f argocd/install.yaml || true",
        "  kubectl wait --for=condition=available deployment/argocd-server \\",
        "    -n argocd --timeout=300s"};
    domain.exception_message = std::move(exception);
    return domain;
}

PolicyDomain protected_file_domain() {
    PolicyDomain domain;
    domain.id = DomainId::ProtectedFile;
    domain.target = DomainTarget::FileWrites;
    domain.enforcement = Enforcement::Block;

    domain.escape_rules = {
        make_rule(".env.example", R"(\.env\.example$)", RuleCategory::Escape,
                  "Example environment files hold no secrets"),
        make_rule(".env.sample", R"(\.env\.sample$)", RuleCategory::Escape,
                  "Sample environment files hold no secrets"),
        make_rule(".env.template", R"(\.env\.template$)", RuleCategory::Escape,
                  "Template environment files hold no secrets"),
    };

    const auto protect = [](std::string name, std::string pattern,
                            std::string explanation) {
        return make_rule(std::move(name), std::move(pattern),
                         RuleCategory::Protected, std::move(explanation));
    };
    domain.gated_rules = {
        // environment files
        protect(".env", R"(\.env($|\.))", "Environment files contain secrets"),
        protect(".env.local", R"(\.env\.local$)", "Local environment files contain secrets"),
        protect(".env.*", R"(\.env\..*$)", "Environment files contain secrets"),
        // generated lock files
        protect("package-lock.json", R"(package-lock\.json$)", "Lock file is auto-generated"),
        protect("yarn.lock", R"(yarn\.lock$)", "Lock file is auto-generated"),
        protect("pnpm-lock.yaml", R"(pnpm-lock\.yaml$)", "Lock file is auto-generated"),
        protect("Cargo.lock", R"(Cargo\.lock$)", "Lock file is auto-generated"),
        protect("poetry.lock", R"(poetry\.lock$)", "Lock file is auto-generated"),
        protect("go.sum", R"(go\.sum$)", "Lock file is auto-generated"),
        protect("Gemfile.lock", R"(Gemfile\.lock$)", "Lock file is auto-generated"),
        // git internals
        protect(".git/", R"(\.git/)", "Git internal files should not be edited"),
        protect(".git", R"(\.git$)", "Git internal files should not be edited"),
        // keys and certificates
        protect(".ssh/", R"(\.ssh/)", "SSH keys are sensitive"),
        protect("id_rsa", R"(id_rsa)", "SSH private keys are sensitive"),
        protect(".pem", R"(\.pem$)", "Certificate files are sensitive"),
        protect(".key", R"(\.key$)", "Key files are sensitive"),
    };

    domain.gated_message.title = "BLOCKED: PROTECTED FILE MODIFICATION";
    domain.gated_message.subject_label = "File";
    domain.gated_message.subject_format = "{file}";
    domain.gated_message.remediation = {
        "If you need to edit this file:",
        "  1. Consider if it's truly necessary",
        "  2. Edit manually outside of the agent session",
        "  3. Or request explicit override"};
    domain.gated_message.examples = {
        ".env.example, .env.sample and .env.template stay editable"};
    return domain;
}

std::vector<PolicyDomain> default_domains(const core::config::EngineConfig& config) {
    std::vector<PolicyDomain> all;
    all.push_back(branch_prefix_domain(config.branch_prefix, config.allowed_branches));
    all.push_back(commit_gate_domain());
    all.push_back(destructive_command_domain());
    all.push_back(kubectl_mutation_domain());
    all.push_back(protected_file_domain());

    std::vector<PolicyDomain> enabled;
    for (auto& domain : all) {
        if (!config.is_enabled(domain.id)) {
            continue;
        }
        const auto override_it = config.enforcement.find(domain.id);
        if (override_it != config.enforcement.end()) {
            domain.enforcement = override_it->second;
        }
        enabled.push_back(std::move(domain));
    }
    return enabled;
}

}  // namespace hookguard::policy
