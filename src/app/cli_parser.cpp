#include "cli_parser.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace hookguard::app::cli {

    using namespace hookguard::core::errors;
    using hookguard::protocol::CliRequest;
    using hookguard::protocol::HookCommand;

    namespace {

        constexpr const char* kUsage =
            "Usage: hookguard check [--config FILE] [--enforce DOMAIN=warn|block] "
            "[--disable DOMAIN] [--branch-prefix PREFIX] [--verbose]\n"
            "       hookguard format [--verbose]\n"
            "       hookguard resolve --skills-dir DIR <file>\n"
            "       hookguard inject --skills-dir DIR [--extension EXT]\n"
            "       hookguard validate [--skills-dir DIR]";

        constexpr const char* kDomainHint =
            "Domains: branch-prefix, commit-gate, destructive-command, "
            "kubectl-mutation, protected-file.";

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> config;
            std::vector<std::string> enforce;
            std::vector<std::string> disable;
            std::optional<std::string> branch_prefix;
            std::optional<std::string> skills_dir;
            std::vector<std::string> extensions;
            std::vector<std::string> positional;
            bool verbose = false;
        };

        std::optional<HookCommand> command_from_string(const std::string& name) {
            if (name == "check") return HookCommand::Check;
            if (name == "format") return HookCommand::Format;
            if (name == "resolve") return HookCommand::Resolve;
            if (name == "inject") return HookCommand::Inject;
            if (name == "validate") return HookCommand::Validate;
            return std::nullopt;
        }

        HookError missing_value(const std::string& flag) {
            return HookError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
        }

        HookError unsupported_flag(const std::string& flag, HookCommand command) {
            return HookError{ErrorCategory::Input,
                             flag + " is not accepted by '" + protocol::to_string(command) + "'",
                             "unsupported_flag", kUsage};
        }

        std::string normalize_extension(std::string ext) {
            std::transform(ext.begin(), ext.end(), ext.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (!ext.empty() && ext.front() != '.') {
                ext.insert(ext.begin(), '.');
            }
            return ext;
        }

    } // namespace

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return HookError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        const std::string command_name = argv[1];
        const auto command = command_from_string(command_name);
        if (!command) {
            return HookError{ErrorCategory::Input, "Unknown command: " + command_name, "unknown_command", kUsage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and the command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config = args[++i];
                else return missing_value("--config");
            } else if (args[i] == "--enforce") {
                if (i + 1 < args.size()) raw.enforce.push_back(args[++i]);
                else return missing_value("--enforce");
            } else if (args[i] == "--disable") {
                if (i + 1 < args.size()) raw.disable.push_back(args[++i]);
                else return missing_value("--disable");
            } else if (args[i] == "--branch-prefix") {
                if (i + 1 < args.size()) raw.branch_prefix = args[++i];
                else return missing_value("--branch-prefix");
            } else if (args[i] == "--skills-dir") {
                if (i + 1 < args.size()) raw.skills_dir = args[++i];
                else return missing_value("--skills-dir");
            } else if (args[i] == "--extension") {
                if (i + 1 < args.size()) raw.extensions.push_back(args[++i]);
                else return missing_value("--extension");
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else if (args[i].rfind("--", 0) == 0) {
                return HookError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", kUsage};
            } else {
                raw.positional.push_back(args[i]);
            }
        }

        // 3. Validator Phase: Enforce per-command flags and values
        CliRequest req;
        req.command = *command;
        req.verbose = raw.verbose;

        const bool policy_flags = raw.config || !raw.enforce.empty() || !raw.disable.empty() || raw.branch_prefix;
        const bool skill_flags = raw.skills_dir || !raw.extensions.empty();

        if (req.command != HookCommand::Check && policy_flags) {
            return unsupported_flag("Policy configuration", req.command);
        }
        const bool uses_skills = req.command == HookCommand::Resolve ||
                                 req.command == HookCommand::Inject ||
                                 req.command == HookCommand::Validate;
        if (!uses_skills && skill_flags) {
            return unsupported_flag("--skills-dir/--extension", req.command);
        }
        if (req.command != HookCommand::Inject && !raw.extensions.empty()) {
            return unsupported_flag("--extension", req.command);
        }

        if (req.command == HookCommand::Resolve) {
            if (raw.positional.size() != 1) {
                return HookError{ErrorCategory::Input, "resolve takes exactly one file path", "missing_target", kUsage};
            }
            req.target_path = raw.positional.front();
        } else if (!raw.positional.empty()) {
            return HookError{ErrorCategory::Input, "Unexpected argument: " + raw.positional.front(), "unknown_argument", kUsage};
        }

        if (req.command == HookCommand::Resolve || req.command == HookCommand::Inject) {
            if (!raw.skills_dir || raw.skills_dir->empty()) {
                return HookError{ErrorCategory::Input, "Missing required flag --skills-dir", "missing_required_flag", kUsage};
            }
            req.skills_dir = std::filesystem::path(raw.skills_dir.value());
        } else if (raw.skills_dir) {
            if (raw.skills_dir->empty()) {
                return missing_value("--skills-dir");
            }
            req.skills_dir = std::filesystem::path(raw.skills_dir.value());
        }

        for (const auto& ext : raw.extensions) {
            const std::string normalized = normalize_extension(ext);
            if (normalized.size() < 2) {
                return HookError{ErrorCategory::Input, "Invalid value for --extension: '" + ext + "'", "invalid_extension"};
            }
            req.extensions.push_back(normalized);
        }

        if (raw.config) {
            std::filesystem::path p(raw.config.value());
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return HookError{ErrorCategory::Input, "Config file does not exist or is not a file: " + p.string(), "invalid_path"};
            }
            req.config_file = std::move(p);
        }

        for (const auto& entry : raw.enforce) {
            const auto eq = entry.find('=');
            if (eq == std::string::npos) {
                return HookError{ErrorCategory::Input, "Expected DOMAIN=LEVEL for --enforce, got '" + entry + "'", "invalid_enforcement"};
            }
            const auto domain = protocol::domain_from_string(entry.substr(0, eq));
            if (!domain) {
                return HookError{ErrorCategory::Input, "Unknown policy domain: " + entry.substr(0, eq), "unknown_domain", kDomainHint};
            }
            const auto level = protocol::enforcement_from_string(entry.substr(eq + 1));
            if (!level) {
                return HookError{ErrorCategory::Input, "Unknown enforcement level: " + entry.substr(eq + 1), "invalid_enforcement", "Use 'warn' or 'block'."};
            }
            req.enforcement[*domain] = *level;
        }

        for (const auto& name : raw.disable) {
            const auto domain = protocol::domain_from_string(name);
            if (!domain) {
                return HookError{ErrorCategory::Input, "Unknown policy domain: " + name, "unknown_domain", kDomainHint};
            }
            req.disabled_domains.insert(*domain);
        }

        if (raw.branch_prefix) {
            if (raw.branch_prefix->empty()) {
                return HookError{ErrorCategory::Input, "--branch-prefix cannot be empty", "invalid_branch_prefix"};
            }
            req.branch_prefix = raw.branch_prefix.value();
        }

        return req;
    }

} // namespace hookguard::app::cli
