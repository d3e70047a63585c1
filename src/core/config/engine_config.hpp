#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "core/errors/hook_errors.hpp"
#include "protocol/cli_request.hpp"
#include "protocol/decision_contract.hpp"

namespace hookguard::core::config {

struct EngineConfig {
    std::string branch_prefix = "mriley/";
    std::vector<std::string> allowed_branches = {"main", "master", "develop",
                                                 "dev"};
    std::map<protocol::DomainId, protocol::Enforcement> enforcement;
    std::set<protocol::DomainId> disabled_domains;

    bool is_enabled(protocol::DomainId domain) const;
};

// Parses a JSON config document. Keys absent from the document keep the
// defaults of EngineConfig.
errors::Result<EngineConfig> parse_engine_config(const std::string& text);

errors::Result<EngineConfig> load_engine_config(
    const std::filesystem::path& config_file);

// Defaults, then the --config file, then command-line overrides.
errors::Result<EngineConfig> resolve_engine_config(
    const protocol::CliRequest& request);

}  // namespace hookguard::core::config
