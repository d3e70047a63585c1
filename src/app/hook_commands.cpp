#include "app/hook_commands.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include "core/config/engine_config.hpp"
#include "core/errors/hook_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/invocation_normalizer.hpp"
#include "policy/pattern_tables.hpp"
#include "policy/policy_guard.hpp"
#include "skills/skill_resolver.hpp"
#include "tools/formatter_dispatch.hpp"
#include "tools/lint_dispatch.hpp"

namespace hookguard::app {

using core::errors::HookError;
using protocol::CliRequest;
using protocol::HookCommand;

namespace {

constexpr int kExitLintFailed = 1;

int report_error(std::ostream& err, const HookError& error) {
    err << "hookguard: " << error.message << "\n";
    if (!error.hint.empty()) {
        err << "hookguard: " << error.hint << "\n";
    }
    LOG_DEBUG("Failed with " + core::errors::to_string(error.category) + " error [" +
              error.code + "]");
    return protocol::kExitInternalError;
}

bool extension_selected(const CliRequest& request, const std::string& file_path) {
    if (request.extensions.empty()) {
        return true;
    }
    std::string ext = std::filesystem::path(file_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return std::find(request.extensions.begin(), request.extensions.end(), ext) !=
           request.extensions.end();
}

}  // namespace

int run_check(const CliRequest& request, std::istream& in, std::ostream& err) {
    auto config = core::config::resolve_engine_config(request);
    if (core::errors::is_error(config)) {
        return report_error(err, core::errors::get_error(config));
    }

    const policy::PolicyGuard guard(
        policy::default_domains(core::errors::get_value(config)));
    auto outcome = guard.check(in);
    if (core::errors::is_error(outcome)) {
        return report_error(err, core::errors::get_error(outcome));
    }

    const auto& result = core::errors::get_value(outcome);
    err << result.text;
    return result.exit_code;
}

int run_format(std::istream& in, std::ostream& out, std::ostream& err) {
    auto call = policy::parse_payload(in);
    if (core::errors::is_error(call)) {
        return report_error(err, core::errors::get_error(call));
    }

    const tools::FormatterDispatch dispatch;
    const auto report = dispatch.format(core::errors::get_value(call));
    LOG_DEBUG("Format " + tools::to_string(report.status));
    switch (report.status) {
        case tools::FormatStatus::Skipped:
            break;
        case tools::FormatStatus::Formatted:
            out << report.message << "\n";
            break;
        case tools::FormatStatus::Failed:
        case tools::FormatStatus::TimedOut:
        case tools::FormatStatus::SpawnFailed:
            err << report.message << "\n";
            break;
    }
    return protocol::kExitAllow;
}

int run_resolve(const CliRequest& request, std::ostream& out, std::ostream& err) {
    if (!request.skills_dir || !request.target_path) {
        return report_error(err, HookError{core::errors::ErrorCategory::Input,
                                           "resolve needs --skills-dir and a file path",
                                           "missing_target"});
    }

    auto resolver = skills::SkillResolver::from_directory(*request.skills_dir);
    if (core::errors::is_error(resolver)) {
        return report_error(err, core::errors::get_error(resolver));
    }
    for (const auto& skill : core::errors::get_value(resolver).resolve(*request.target_path)) {
        out << skill.string() << "\n";
    }
    return protocol::kExitAllow;
}

int run_inject(const CliRequest& request, std::istream& in, std::ostream& out,
               std::ostream& err) {
    auto call = policy::parse_payload(in);
    if (core::errors::is_error(call)) {
        return report_error(err, core::errors::get_error(call));
    }

    const std::string& file_path = core::errors::get_value(call).file_path;
    if (file_path.empty() || !extension_selected(request, file_path)) {
        return protocol::kExitAllow;
    }
    if (!request.skills_dir) {
        return report_error(err, HookError{core::errors::ErrorCategory::Input,
                                           "inject needs --skills-dir",
                                           "missing_required_flag"});
    }

    auto resolver = skills::SkillResolver::from_directory(*request.skills_dir);
    if (core::errors::is_error(resolver)) {
        const auto& error = core::errors::get_error(resolver);
        LOG_WARN("Skill injection skipped [" + error.code + "]: " + error.message);
        return protocol::kExitAllow;
    }

    out << skills::render_skill_bundle(core::errors::get_value(resolver).resolve(file_path));
    return protocol::kExitAllow;
}

int run_validate(const CliRequest& request, const tools::LintDispatch& dispatch,
                 std::istream& in, std::ostream& out, std::ostream& err) {
    auto call = policy::parse_payload(in);
    if (core::errors::is_error(call)) {
        return report_error(err, core::errors::get_error(call));
    }

    const std::string& file_path = core::errors::get_value(call).file_path;
    const auto report = dispatch.lint(core::errors::get_value(call));
    LOG_DEBUG("Lint " + tools::to_string(report.status));
    switch (report.status) {
        case tools::LintStatus::Skipped:
        case tools::LintStatus::Passed:
            out << report.output;
            return protocol::kExitAllow;
        case tools::LintStatus::TimedOut:
        case tools::LintStatus::SpawnFailed:
            LOG_WARN(report.output);
            return protocol::kExitAllow;
        case tools::LintStatus::Failed:
            break;
    }

    out << report.output;
    err << "Lint check failed for: " << file_path << "\n";
    out << "---\n# Lint Failure - Review Style Guidelines\n---\n";
    if (request.skills_dir) {
        auto resolver = skills::SkillResolver::from_directory(*request.skills_dir);
        if (core::errors::is_error(resolver)) {
            const auto& error = core::errors::get_error(resolver);
            LOG_WARN("Skill lookup skipped [" + error.code + "]: " + error.message);
        } else {
            out << skills::render_skill_bundle(
                core::errors::get_value(resolver).resolve(file_path));
        }
    }
    return kExitLintFailed;
}

int run_validate(const CliRequest& request, std::istream& in, std::ostream& out,
                 std::ostream& err) {
    const tools::LintDispatch dispatch;
    return run_validate(request, dispatch, in, out, err);
}

int run_command(const CliRequest& request, std::istream& in, std::ostream& out,
                std::ostream& err) {
    LOG_DEBUG("Running '" + protocol::to_string(request.command) + "'");
    switch (request.command) {
        case HookCommand::Check:
            return run_check(request, in, err);
        case HookCommand::Format:
            return run_format(in, out, err);
        case HookCommand::Resolve:
            return run_resolve(request, out, err);
        case HookCommand::Inject:
            return run_inject(request, in, out, err);
        case HookCommand::Validate:
            return run_validate(request, in, out, err);
    }
    return protocol::kExitInternalError;
}

}  // namespace hookguard::app
