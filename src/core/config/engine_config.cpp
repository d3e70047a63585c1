#include "core/config/engine_config.hpp"

#include <fstream>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace hookguard::core::config {

using errors::ErrorCategory;
using errors::HookError;
using nlohmann::json;

namespace {

HookError config_error(const std::string& message) {
    return HookError{ErrorCategory::Input, message, "invalid_config",
                     "Accepted keys: branch_prefix, allowed_branches, "
                     "enforcement, disabled_domains."};
}

errors::Result<protocol::DomainId> parse_domain(const json& value) {
    if (!value.is_string()) {
        return config_error("Domain names must be strings.");
    }
    const auto domain = protocol::domain_from_string(value.get<std::string>());
    if (!domain.has_value()) {
        return config_error("Unknown policy domain: " + value.get<std::string>());
    }
    return domain.value();
}

}  // namespace

bool EngineConfig::is_enabled(const protocol::DomainId domain) const {
    return disabled_domains.count(domain) == 0;
}

errors::Result<EngineConfig> parse_engine_config(const std::string& text) {
    const json document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return config_error("Config file is not valid JSON.");
    }
    if (!document.is_object()) {
        return config_error("Config document must be a JSON object.");
    }

    EngineConfig config;

    if (document.contains("branch_prefix")) {
        const auto& prefix = document.at("branch_prefix");
        if (!prefix.is_string() || prefix.get<std::string>().empty()) {
            return config_error("branch_prefix must be a non-empty string.");
        }
        config.branch_prefix = prefix.get<std::string>();
    }

    if (document.contains("allowed_branches")) {
        const auto& branches = document.at("allowed_branches");
        if (!branches.is_array()) {
            return config_error("allowed_branches must be an array of strings.");
        }
        config.allowed_branches.clear();
        for (const auto& branch : branches) {
            if (!branch.is_string()) {
                return config_error("allowed_branches must be an array of strings.");
            }
            config.allowed_branches.push_back(branch.get<std::string>());
        }
    }

    if (document.contains("enforcement")) {
        const auto& enforcement = document.at("enforcement");
        if (!enforcement.is_object()) {
            return config_error("enforcement must map domain names to levels.");
        }
        for (auto it = enforcement.begin(); it != enforcement.end(); ++it) {
            const std::string& name = it.key();
            const json& level = it.value();
            auto domain = parse_domain(json(name));
            if (errors::is_error(domain)) {
                return errors::get_error(domain);
            }
            if (!level.is_string()) {
                return config_error("Enforcement level for " + name +
                                    " must be \"warn\" or \"block\".");
            }
            const auto parsed = protocol::enforcement_from_string(level.get<std::string>());
            if (!parsed.has_value()) {
                return config_error("Unknown enforcement level for " + name + ": " +
                                    level.get<std::string>());
            }
            config.enforcement[errors::get_value(domain)] = parsed.value();
        }
    }

    if (document.contains("disabled_domains")) {
        const auto& disabled = document.at("disabled_domains");
        if (!disabled.is_array()) {
            return config_error("disabled_domains must be an array of domain names.");
        }
        for (const auto& name : disabled) {
            auto domain = parse_domain(name);
            if (errors::is_error(domain)) {
                return errors::get_error(domain);
            }
            config.disabled_domains.insert(errors::get_value(domain));
        }
    }

    return config;
}

errors::Result<EngineConfig> load_engine_config(
    const std::filesystem::path& config_file) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_file, ec) || ec) {
        return HookError{ErrorCategory::Input,
                         "Config file does not exist: " + config_file.string(),
                         "missing_config"};
    }

    std::ifstream in(config_file);
    if (!in.is_open()) {
        return HookError{ErrorCategory::Input,
                         "Unable to open config file: " + config_file.string(),
                         "missing_config"};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_engine_config(buffer.str());
}

errors::Result<EngineConfig> resolve_engine_config(
    const protocol::CliRequest& request) {
    EngineConfig config;
    if (request.config_file.has_value()) {
        auto loaded = load_engine_config(request.config_file.value());
        if (errors::is_error(loaded)) {
            return errors::get_error(loaded);
        }
        config = errors::get_value(loaded);
    }

    if (request.branch_prefix.has_value()) {
        config.branch_prefix = request.branch_prefix.value();
    }
    for (const auto& [domain, level] : request.enforcement) {
        config.enforcement[domain] = level;
    }
    for (const auto domain : request.disabled_domains) {
        config.disabled_domains.insert(domain);
    }
    return config;
}

}  // namespace hookguard::core::config
