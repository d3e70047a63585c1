#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "decision_contract.hpp"

namespace hookguard::protocol {

    enum class HookCommand {
        Check,      // policy gate, reads the invocation payload
        Format,     // post-edit formatter dispatch
        Resolve,    // print skill documents for a path
        Inject,     // print skill document contents for the payload's file
        Validate    // post-write lint, prints skills when it fails
    };

    // Validated command-line input for one hook run.
    struct CliRequest {
        HookCommand command = HookCommand::Check;
        std::optional<std::filesystem::path> config_file;
        std::map<DomainId, Enforcement> enforcement;
        std::set<DomainId> disabled_domains;
        std::optional<std::string> branch_prefix;
        std::optional<std::filesystem::path> skills_dir;
        std::optional<std::string> target_path;
        std::vector<std::string> extensions;
        bool verbose = false;
    };

    inline std::string to_string(const HookCommand command) {
        switch (command) {
            case HookCommand::Check:   return "check";
            case HookCommand::Format:  return "format";
            case HookCommand::Resolve: return "resolve";
            case HookCommand::Inject:  return "inject";
            case HookCommand::Validate: return "validate";
            default: return "unknown";
        }
    }

} // namespace hookguard::protocol
