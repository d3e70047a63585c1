#pragma once

#include <string>
#include <vector>
#include "core/config/engine_config.hpp"
#include "policy/pattern_rule.hpp"

namespace hookguard::policy {

/// Branch creation must use `required_prefix` unless the name is allow-listed.
PolicyDomain branch_prefix_domain(const std::string& required_prefix,
                                  const std::vector<std::string>& allowed_branches);

/// Reminds the operator to route commits through the safe-commit workflow.
PolicyDomain commit_gate_domain();

/// Commands that irreversibly discard work or data.
PolicyDomain destructive_command_domain();

/// Cluster mutations must go through GitOps; ArgoCD bootstrap may override.
PolicyDomain kubectl_mutation_domain();

/// Secrets, generated lock files and VCS internals must not be edited.
PolicyDomain protected_file_domain();

/// All enabled domains in dispatch order, with enforcement overrides applied:
/// branch-prefix, commit-gate, destructive-command, kubectl-mutation,
/// protected-file.
std::vector<PolicyDomain> default_domains(const core::config::EngineConfig& config);

}  // namespace hookguard::policy
